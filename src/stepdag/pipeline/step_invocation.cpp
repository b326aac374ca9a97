/**
 * @file step_invocation.cpp
 */
#include "stepdag/pipeline/step_invocation.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"
#include "stepdag/pipeline/pipeline.hpp"

namespace stepdag
{

StepInvocation::StepInvocation(InvocationId id,
                               StepTemplatePtr step,
                               std::map<std::string, StepArtifactPtr> input_artifacts,
                               std::map<std::string, ExternalArtifactPtr> external_artifacts,
                               Json parameters,
                               std::set<InvocationId> upstream_steps,
                               const Pipeline* pipeline)
    : m_id(std::move(id))
    , m_step(std::move(step))
    , m_input_artifacts(std::move(input_artifacts))
    , m_external_artifacts(std::move(external_artifacts))
    , m_parameters(std::move(parameters))
    , m_upstream_steps(std::move(upstream_steps))
    , m_pipeline(pipeline)
{
}

std::set<InvocationId> StepInvocation::upstream_steps() const
{
    std::set<InvocationId> result = m_upstream_steps;
    for (const auto& id : template_upstream_steps())
    {
        result.insert(id);
    }
    return result;
}

std::set<InvocationId> StepInvocation::template_upstream_steps() const
{
    static const char* kAmbiguous =
        "Setting upstream steps for a step using the `after()` method is not allowed in combination "
        "with calling the step multiple times.";

    const auto& hints = m_step->upstream_steps();
    if (hints.empty())
    {
        return {};
    }
    if (m_pipeline->invocations_of(*m_step).size() > 1)
    {
        throw StepDagError(
            StepDagErrorCode::AmbiguousOrdering,
            std::string(kAmbiguous) + " Step '" + m_step->name() + "' is invoked more than once.");
    }

    std::set<InvocationId> result;
    for (const auto& hint : hints)
    {
        std::shared_ptr<StepTemplate> upstream = hint.lock();
        if (!upstream)
        {
            continue;
        }
        std::vector<InvocationId> ids = m_pipeline->invocations_of(*upstream);
        if (ids.size() > 1)
        {
            throw StepDagError(
                StepDagErrorCode::AmbiguousOrdering,
                std::string(kAmbiguous) + " Upstream step '" + upstream->name() + "' is invoked more than once.");
        }
        if (ids.size() == 1)
        {
            result.insert(ids.front());
        }
    }
    return result;
}

StepConfiguration StepInvocation::finalize(const FinalizationContext& context) const
{
    template_upstream_steps();

    PartialStepConfiguration config = m_step->configuration();
    if (!m_parameters.empty())
    {
        config.parameters = m_parameters;
    }

    std::map<std::string, ArtifactId> external_ids;
    for (const auto& [key, artifact] : m_external_artifacts)
    {
        m_step->step_interface().validate_artifact_input(key, artifact->type(context.metadata_store.get()));
        external_ids.emplace(key, artifact->upload_or_verify(context));
    }

    return m_step->finalize_configuration(std::move(config), m_input_artifacts, external_ids);
}

} // namespace stepdag
