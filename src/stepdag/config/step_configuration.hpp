/**
 * @file step_configuration.hpp
 * @brief Step configuration value objects and layered configuration merge.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/config/source.hpp"

namespace stepdag
{

/// Fixed caching-parameter key holding the hash of the step source code.
inline constexpr const char* kStepSourceParameterName = "step_source";

/// Suffix of caching-parameter keys holding materializer source hashes.
inline constexpr const char* kMaterializerSourceSuffix = "_materializer_source";

/**
 * @brief Per-output configuration. An empty list means "infer from type".
 */
struct PartialArtifactConfiguration
{
    std::vector<Source> materializer_source;

    friend bool operator==(const PartialArtifactConfiguration& lhs, const PartialArtifactConfiguration& rhs)
    {
        return lhs.materializer_source == rhs.materializer_source;
    }
};

using OutputConfigurations = std::map<std::string, PartialArtifactConfiguration>;

/**
 * @brief Patch holding an optional value for every configurable field.
 *
 * @details
 * A configuration update is ephemeral: it is built by the caller, validated
 * and consumed immediately by `update_configuration()`. An engaged optional
 * is a field that is present in the update.
 */
struct StepConfigurationUpdate
{
    std::optional<std::string> name;
    std::optional<bool> enable_cache;
    std::optional<bool> enable_artifact_metadata;
    std::optional<bool> enable_artifact_visualization;
    std::optional<std::string> experiment_tracker;
    std::optional<std::string> step_operator;
    std::optional<Json> parameters;
    std::optional<std::map<std::string, Json>> settings;
    std::optional<OutputConfigurations> outputs;
    std::optional<Json> extra;
    std::optional<Source> failure_hook_source;
    std::optional<Source> success_hook_source;

    /**
     * @brief Check whether no field is present.
     */
    bool empty() const noexcept;

    /**
     * @brief Build an update from a JSON object.
     *
     * @details
     * Recognized keys are the field names of this struct; `outputs` maps
     * output names to `{"materializer_source": [import paths]}` and hook
     * sources are import path strings.
     *
     * @throws StepDagError with `UnknownSetting` for unrecognized keys, and
     *         `InputValidation` for values of the wrong JSON kind.
     */
    static StepConfigurationUpdate from_json(const Json& value);
};

/**
 * @brief Mutable configuration of a step template before finalization.
 */
struct PartialStepConfiguration
{
    std::string name;
    std::optional<bool> enable_cache;
    std::optional<bool> enable_artifact_metadata;
    std::optional<bool> enable_artifact_visualization;
    std::optional<std::string> experiment_tracker;
    std::optional<std::string> step_operator;
    Json parameters = Json::object();
    std::map<std::string, Json> settings;
    Json extra = Json::object();
    std::optional<Source> failure_hook_source;
    std::optional<Source> success_hook_source;
    OutputConfigurations outputs;
    std::map<std::string, std::string> caching_parameters;
    std::map<std::string, ArtifactId> external_input_artifacts;

    friend bool operator==(const PartialStepConfiguration& lhs, const PartialStepConfiguration& rhs);
    friend bool operator!=(const PartialStepConfiguration& lhs, const PartialStepConfiguration& rhs)
    {
        return !(lhs == rhs);
    }
};

/**
 * @brief Finalized, immutable configuration of one step invocation.
 *
 * @details
 * Created exactly once per invocation at finalization time. Every output
 * carries at least one materializer source, parameters are JSON values and
 * the caching parameters hold the code-identity fingerprint.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 */
class StepConfiguration
{
public:
    /**
     * @brief Freeze a partial configuration.
     * @throws StepDagError with `MaterializerRequired` if an output has no
     *         materializer source.
     */
    explicit StepConfiguration(PartialStepConfiguration partial);

    const std::string& name() const noexcept { return m_config.name; }
    std::optional<bool> enable_cache() const noexcept { return m_config.enable_cache; }
    std::optional<bool> enable_artifact_metadata() const noexcept { return m_config.enable_artifact_metadata; }
    std::optional<bool> enable_artifact_visualization() const noexcept { return m_config.enable_artifact_visualization; }
    const std::optional<std::string>& experiment_tracker() const noexcept { return m_config.experiment_tracker; }
    const std::optional<std::string>& step_operator() const noexcept { return m_config.step_operator; }
    const Json& parameters() const noexcept { return m_config.parameters; }
    const std::map<std::string, Json>& settings() const noexcept { return m_config.settings; }
    const Json& extra() const noexcept { return m_config.extra; }
    const std::optional<Source>& failure_hook_source() const noexcept { return m_config.failure_hook_source; }
    const std::optional<Source>& success_hook_source() const noexcept { return m_config.success_hook_source; }
    const OutputConfigurations& outputs() const noexcept { return m_config.outputs; }

    const std::map<std::string, std::string>& caching_parameters() const noexcept
    {
        return m_config.caching_parameters;
    }

    const std::map<std::string, ArtifactId>& external_input_artifacts() const noexcept
    {
        return m_config.external_input_artifacts;
    }

    /**
     * @brief Copy of the underlying values, for deriving a new configuration.
     */
    PartialStepConfiguration to_partial() const
    {
        return m_config;
    }

private:
    PartialStepConfiguration m_config;
};

/**
 * @brief Apply an update to a configuration, returning a new configuration.
 *
 * @details
 * With `recursive == false`, every field present in `update` fully replaces
 * the corresponding field of `base`, mappings included.
 *
 * With `recursive == true`, scalar and flag fields are replaced if present.
 * `parameters` and `extra` merge key by key with the update winning on
 * collision. `settings` merge per settings key and then per field of the
 * settings object. `outputs` merge per output name and then per key of the
 * output configuration (a non-empty `materializer_source` replaces).
 *
 * `base` is never modified.
 *
 * @throws StepDagError with `UnknownSetting` if the update carries a settings
 *         key outside the recognized namespace.
 */
PartialStepConfiguration update_configuration(const PartialStepConfiguration& base,
                                              const StepConfigurationUpdate& update,
                                              bool recursive);

/**
 * @brief Apply an update to a finalized configuration.
 * @see update_configuration(const PartialStepConfiguration&, const StepConfigurationUpdate&, bool)
 */
StepConfiguration update_configuration(const StepConfiguration& base,
                                       const StepConfigurationUpdate& update,
                                       bool recursive);

void to_json(Json& j, const PartialArtifactConfiguration& config);
void to_json(Json& j, const PartialStepConfiguration& config);
void to_json(Json& j, const StepConfiguration& config);

} // namespace stepdag
