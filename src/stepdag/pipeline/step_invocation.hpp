/**
 * @file step_invocation.hpp
 * @brief One use of a step template as a node of a pipeline graph.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/config/step_configuration.hpp"
#include "stepdag/steps/artifacts.hpp"
#include "stepdag/steps/finalization_context.hpp"
#include "stepdag/steps/step_template.hpp"

namespace stepdag
{

class Pipeline;

/**
 * @brief A node of the invocation graph.
 *
 * @details
 * Holds the inputs bound at call time and the upstream invocations known at
 * that point. Upstream relationships declared on the template with
 * `StepTemplate::after()` are resolved lazily, once every invocation of the
 * pipeline is known.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class StepInvocation
{
public:
    StepInvocation(InvocationId id,
                   StepTemplatePtr step,
                   std::map<std::string, StepArtifactPtr> input_artifacts,
                   std::map<std::string, ExternalArtifactPtr> external_artifacts,
                   Json parameters,
                   std::set<InvocationId> upstream_steps,
                   const Pipeline* pipeline);

    const InvocationId& id() const noexcept { return m_id; }
    const StepTemplatePtr& step() const noexcept { return m_step; }

    const std::map<std::string, StepArtifactPtr>& input_artifacts() const noexcept
    {
        return m_input_artifacts;
    }

    const std::map<std::string, ExternalArtifactPtr>& external_artifacts() const noexcept
    {
        return m_external_artifacts;
    }

    const Json& parameters() const noexcept { return m_parameters; }

    /**
     * @brief Upstream invocations given at call time.
     */
    const std::set<InvocationId>& invocation_upstream_steps() const noexcept
    {
        return m_upstream_steps;
    }

    /**
     * @brief All upstream invocations, including those from ordering hints.
     * @throws StepDagError with `AmbiguousOrdering`.
     */
    std::set<InvocationId> upstream_steps() const;

    /**
     * @brief Produce the final configuration of this invocation.
     *
     * @details
     * Re-validates ordering hints, replaces the template parameters with the
     * invocation parameters (when any were given), resolves external
     * artifacts and completes the configuration through the template.
     */
    StepConfiguration finalize(const FinalizationContext& context) const;

private:
    /**
     * @throws StepDagError with `AmbiguousOrdering` if this template carries
     *         ordering hints and is invoked more than once, or if an upstream
     *         template is invoked more than once.
     */
    std::set<InvocationId> template_upstream_steps() const;

    InvocationId m_id;
    StepTemplatePtr m_step;
    std::map<std::string, StepArtifactPtr> m_input_artifacts;
    std::map<std::string, ExternalArtifactPtr> m_external_artifacts;
    Json m_parameters;
    std::set<InvocationId> m_upstream_steps;
    const Pipeline* m_pipeline;
};

using StepInvocationPtr = std::shared_ptr<StepInvocation>;

} // namespace stepdag
