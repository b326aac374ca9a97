/**
 * @file step_template.hpp
 * @brief Reusable step definitions, their configuration and invocation.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/common/payload.hpp"
#include "stepdag/config/step_configuration.hpp"
#include "stepdag/steps/artifacts.hpp"
#include "stepdag/steps/materializer.hpp"
#include "stepdag/steps/step_interface.hpp"

namespace stepdag
{

class Pipeline;

/**
 * @brief Options applied when a step template is declared.
 *
 * @details
 * `name` defaults to the entrypoint function name. A null
 * `materializer_registry` selects `MaterializerRegistry::default_registry()`.
 */
struct StepOptions
{
    std::optional<std::string> name;
    std::optional<bool> enable_cache;
    std::optional<bool> enable_artifact_metadata;
    std::optional<bool> enable_artifact_visualization;
    std::optional<std::string> experiment_tracker;
    std::optional<std::string> step_operator;
    Json parameters = Json::object();
    std::map<std::string, Json> settings;
    OutputConfigurations output_materializers;
    Json extra = Json::object();
    std::optional<Source> on_failure;
    std::optional<Source> on_success;
    std::shared_ptr<MaterializerRegistry> materializer_registry;
};

/**
 * @brief One call argument: a JSON parameter, a raw value, or an artifact.
 */
using StepArgument = std::variant<Json, Payload, StepArtifactPtr, ExternalArtifactPtr>;

/**
 * @brief Arguments of a step call, bound against the entrypoint signature.
 *
 * @details
 * Positional arguments bind in signature order, skipping the context
 * parameter. Named arguments bind by parameter name.
 */
struct StepCallArguments
{
    std::vector<StepArgument> positional;
    std::map<std::string, StepArgument> named;
};

/**
 * @brief Per-call options of a step invocation inside a pipeline.
 *
 * @details
 * `id` replaces the template name as the invocation identifier and disables
 * suffixing. `after` lists invocations that must run before this one.
 */
struct InvocationOptions
{
    std::optional<std::string> id;
    std::vector<InvocationId> after;
};

/**
 * @brief Result of calling a step: artifacts inside a pipeline build,
 *        entrypoint outputs otherwise.
 */
struct StepCallResult
{
    std::vector<StepArtifactPtr> artifacts;
    std::map<std::string, Payload> values;
    bool in_pipeline{false};
};

/**
 * @brief A named, reusable unit of computation with a typed interface.
 *
 * @details
 * The interface is derived from the entrypoint signature at construction.
 * The template owns a partial configuration that is changed only through
 * `configure()`. Templates are long-lived definitions and must be owned by
 * a `std::shared_ptr` to be invoked inside a pipeline.
 *
 * @par Thread safety
 * - No internal synchronization. Declaration and pipeline building are
 *   single-threaded.
 */
class StepTemplate : public std::enable_shared_from_this<StepTemplate>
{
public:
    virtual ~StepTemplate() = default;

    /**
     * @brief Run the step logic on bound inputs.
     * @param inputs Values keyed by parameter name, context excluded.
     * @return Output values keyed by output name.
     */
    virtual std::map<std::string, Payload> entrypoint(const std::map<std::string, Payload>& inputs) = 0;

    /**
     * @brief Implementation source text, hashed into the caching fingerprint.
     */
    virtual std::string source_code() const = 0;

    const std::string& name() const noexcept
    {
        return m_configuration.name;
    }

    const StepInterface& step_interface() const noexcept
    {
        return m_interface;
    }

    const PartialStepConfiguration& configuration() const noexcept
    {
        return m_configuration;
    }

    const MaterializerRegistry& materializer_registry() const noexcept
    {
        return *m_registry;
    }

    /**
     * @brief Validate and apply a configuration update.
     *
     * @param update Fields to change.
     * @param merge Deep-merge mapping fields when true, replace them when false.
     *
     * @throws StepDagError with `UnknownSetting` for unrecognized settings
     *         keys, `InputValidation` for non-object settings or parameter
     *         values of the wrong type, `InterfaceError` for parameters that
     *         are not inputs when no parameter object is declared or for
     *         outputs that do not exist, and `MaterializerNotFound` for
     *         output sources that are not materializers.
     */
    StepTemplate& configure(const StepConfigurationUpdate& update, bool merge = true);

    /**
     * @brief Use the same materializer sources for every output.
     */
    StepTemplate& set_output_materializers(const std::vector<Source>& sources);

    /**
     * @brief Require this step to run after another step in every pipeline.
     *
     * @details
     * The hint is attached to the template. It becomes ambiguous, and fails
     * at finalization, if either template is invoked more than once.
     */
    void after(const std::shared_ptr<StepTemplate>& step);

    /**
     * @brief Templates registered through `after()`.
     */
    const std::vector<std::weak_ptr<StepTemplate>>& upstream_steps() const noexcept
    {
        return m_upstream_steps;
    }

    /**
     * @brief Add an invocation of this template to a pipeline.
     *
     * @return One artifact per declared output, in declaration order.
     *
     * @throws StepDagError with `InterfaceError` for arguments that do not
     *         bind, `InputValidation` for parameter values of the wrong type,
     *         `InvalidArtifact` for artifacts of another pipeline, plus the
     *         errors of `Pipeline::add_invocation()`.
     */
    std::vector<StepArtifactPtr> invoke(Pipeline& pipeline,
                                        const StepCallArguments& args,
                                        const InvocationOptions& options = {});

    /**
     * @brief Run the entrypoint directly with type-checked arguments.
     *
     * @details
     * Unbound inputs take their declared default, then the configured
     * parameter value.
     *
     * @throws StepDagError with `InterfaceError` for arguments that do not
     *         bind, `InvalidArtifact` for artifact arguments, `MissingInput`
     *         for unbound inputs and `InputValidation` for type mismatches.
     */
    std::map<std::string, Payload> call_entrypoint(const StepCallArguments& args);

    /**
     * @brief Invoke inside the active pipeline build, or run directly.
     */
    StepCallResult operator()(const StepCallArguments& args, const InvocationOptions& options = {});

    /**
     * @brief Complete a configuration for one invocation.
     *
     * @param config Template configuration with the invocation parameters applied.
     * @param input_artifacts Artifacts bound to inputs.
     * @param external_artifacts Resolved external artifact ids bound to inputs.
     *
     * @details
     * Resolves output materializers, finalizes parameters, fills unbound
     * inputs from their declared defaults, checks that every input is bound
     * and computes the caching parameters.
     *
     * @throws StepDagError with `MaterializerRequired`, `MaterializerNotFound`,
     *         `MissingParameter` or `MissingInput`.
     */
    StepConfiguration finalize_configuration(PartialStepConfiguration config,
                                             const std::map<std::string, StepArtifactPtr>& input_artifacts,
                                             const std::map<std::string, ArtifactId>& external_artifacts) const;

protected:
    /**
     * @throws StepDagError with `InterfaceError` if the signature is invalid.
     */
    StepTemplate(const EntrypointSignature& signature, StepOptions options);

private:
    std::map<std::string, StepArgument> bind_arguments(const StepCallArguments& args, bool apply_defaults) const;
    void validate_parameters(const Json& parameters) const;
    void validate_outputs(const OutputConfigurations& outputs) const;
    Json finalize_parameters(const PartialStepConfiguration& config) const;
    Json finalize_legacy_parameters(const PartialStepConfiguration& config) const;

    StepInterface m_interface;
    PartialStepConfiguration m_configuration;
    std::shared_ptr<MaterializerRegistry> m_registry;
    std::vector<std::weak_ptr<StepTemplate>> m_upstream_steps;
};

using StepTemplatePtr = std::shared_ptr<StepTemplate>;

/**
 * @brief Step logic supplied as a callable.
 */
using EntrypointFunction = std::function<std::map<std::string, Payload>(const std::map<std::string, Payload>&)>;

/**
 * @brief Step template whose logic is a callable and whose source text is
 *        supplied by the caller.
 */
class FunctionStep : public StepTemplate
{
public:
    FunctionStep(const EntrypointSignature& signature,
                 std::string source_code,
                 EntrypointFunction function,
                 StepOptions options = {});

    std::map<std::string, Payload> entrypoint(const std::map<std::string, Payload>& inputs) override;

    std::string source_code() const override
    {
        return m_source_code;
    }

private:
    std::string m_source_code;
    EntrypointFunction m_function;
};

/**
 * @brief Declare a function step.
 */
std::shared_ptr<FunctionStep> make_step(const EntrypointSignature& signature,
                                        std::string source_code,
                                        EntrypointFunction function,
                                        StepOptions options = {});

} // namespace stepdag
