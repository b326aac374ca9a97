/**
 * @file pipeline.hpp
 * @brief Pipeline graph builder and its build scope.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/pipeline/invocation_graph.hpp"
#include "stepdag/pipeline/step_invocation.hpp"
#include "stepdag/steps/finalization_context.hpp"
#include "stepdag/steps/step_template.hpp"

namespace stepdag
{

/**
 * @brief Exception thrown when the upstream relationships form a cycle.
 */
class PipelineValidationError : public std::runtime_error
{
public:
    PipelineValidationError(const std::string& msg, std::vector<InvocationId> invocations)
        : std::runtime_error(msg)
        , m_invocations(std::move(invocations))
    {}

    /**
     * @brief Invocations that could not be ordered.
     */
    const std::vector<InvocationId>& invocations() const noexcept
    {
        return m_invocations;
    }

private:
    std::vector<InvocationId> m_invocations;
};

/**
 * @brief Builds the invocation graph of one pipeline.
 *
 * @details
 * Invocations are added by `StepTemplate::invoke()`. Every upstream
 * reference made at that point names an invocation that already exists, so
 * these edges cannot form a cycle. Ordering hints on templates are resolved
 * at `finalize()`, which also rejects any cycle they introduce.
 *
 * @par Usage
 * 1. Create a Pipeline.
 * 2. Call `build()` with a function that invokes step templates, or invoke
 *    them directly while a `PipelineBuildScope` is alive.
 * 3. Call `finalize()` to obtain the immutable `InvocationGraph`.
 *
 * @par Thread Safety
 * - No internal synchronization. Graph building is single-threaded.
 */
class Pipeline
{
public:
    explicit Pipeline(std::string name);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    const std::string& name() const noexcept
    {
        return m_name;
    }

    /**
     * @brief Register an invocation.
     *
     * @param step The invoked template.
     * @param input_artifacts In-graph artifacts by input name.
     * @param external_artifacts External artifacts by input name.
     * @param parameters JSON parameters by input name.
     * @param upstream_steps Invocations that must run first.
     * @param custom_id Identifier to use instead of the template name.
     * @param allow_suffix Append `_2`, `_3`, ... to a taken identifier.
     * @return The identifier of the new invocation.
     *
     * @throws StepDagError with `DuplicateInvocation` if the identifier is
     *         taken and suffixing is not allowed, or `UnknownUpstream` if an
     *         upstream identifier is not registered.
     */
    InvocationId add_invocation(const StepTemplatePtr& step,
                                std::map<std::string, StepArtifactPtr> input_artifacts,
                                std::map<std::string, ExternalArtifactPtr> external_artifacts,
                                Json parameters,
                                std::set<InvocationId> upstream_steps,
                                const std::optional<std::string>& custom_id,
                                bool allow_suffix);

    /**
     * @brief Invocations in insertion order.
     */
    const std::vector<StepInvocationPtr>& invocations() const noexcept
    {
        return m_invocations;
    }

    /**
     * @brief Invocation by id, or nullptr.
     */
    const StepInvocation* find_invocation(const InvocationId& id) const;

    /**
     * @brief Ids of all invocations of a template, in insertion order.
     */
    std::vector<InvocationId> invocations_of(const StepTemplate& step) const;

    size_t invocation_count() const noexcept
    {
        return m_invocations.size();
    }

    /**
     * @brief Discard all invocations.
     */
    void clear() noexcept;

    /**
     * @brief Rebuild the graph by running `connect` inside a build scope.
     *
     * @details
     * Previous invocations are discarded first. If `connect` throws, the
     * partial graph is discarded, the scope is released and the exception
     * propagates.
     *
     * @throws StepDagError with `InvalidState` if another build is active.
     */
    void build(const std::function<void(Pipeline&)>& connect);

    /**
     * @brief Finalize every invocation and produce the invocation graph.
     *
     * @details
     * The graph structure is validated before any configuration is
     * finalized, so a cycle or an ambiguous ordering hint fails before any
     * external artifact is uploaded.
     *
     * @throws PipelineValidationError if the upstream relationships form a cycle.
     * @throws StepDagError for ordering and configuration failures.
     */
    std::shared_ptr<const InvocationGraph> finalize(const FinalizationContext& context) const;

    /**
     * @brief The pipeline of the active build scope, or nullptr.
     */
    static Pipeline* active() noexcept;

private:
    friend class PipelineBuildScope;

    std::string m_name;
    std::vector<StepInvocationPtr> m_invocations;
    std::map<InvocationId, size_t> m_index;
};

/**
 * @brief Marks a pipeline as the active build for its lifetime.
 *
 * @details
 * At most one build is active per process. The scope is released on every
 * exit path, including exceptions.
 */
class PipelineBuildScope
{
public:
    /**
     * @throws StepDagError with `InvalidState` if another build is active.
     */
    explicit PipelineBuildScope(Pipeline& pipeline);

    ~PipelineBuildScope();

    PipelineBuildScope(const PipelineBuildScope&) = delete;
    PipelineBuildScope& operator=(const PipelineBuildScope&) = delete;

    Pipeline& pipeline() const noexcept
    {
        return m_pipeline;
    }

private:
    Pipeline& m_pipeline;
};

} // namespace stepdag
