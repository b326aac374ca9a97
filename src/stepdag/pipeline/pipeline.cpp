/**
 * @file pipeline.cpp
 */
#include "stepdag/pipeline/pipeline.hpp"
#include "stepdag/common/logging.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"

#include <deque>

namespace stepdag
{

namespace
{

std::mutex g_active_mutex;
Pipeline* g_active_pipeline = nullptr;

} // namespace

// ============================================================================
// Graph building
// ============================================================================

Pipeline::Pipeline(std::string name)
    : m_name(std::move(name))
{
}

InvocationId Pipeline::add_invocation(const StepTemplatePtr& step,
                                      std::map<std::string, StepArtifactPtr> input_artifacts,
                                      std::map<std::string, ExternalArtifactPtr> external_artifacts,
                                      Json parameters,
                                      std::set<InvocationId> upstream_steps,
                                      const std::optional<std::string>& custom_id,
                                      bool allow_suffix)
{
    if (!step)
    {
        throw std::invalid_argument("Pipeline::add_invocation requires a step");
    }

    InvocationId id = custom_id ? *custom_id : step->name();
    if (m_index.count(id) > 0)
    {
        if (!allow_suffix)
        {
            throw StepDagError(
                StepDagErrorCode::DuplicateInvocation,
                "Duplicate step ID '" + id + "' in pipeline '" + m_name + "'");
        }
        InvocationId base = id;
        for (size_t suffix = 2; m_index.count(id) > 0; ++suffix)
        {
            id = base + "_" + std::to_string(suffix);
        }
    }

    for (const auto& upstream : upstream_steps)
    {
        if (m_index.count(upstream) == 0)
        {
            throw StepDagError(
                StepDagErrorCode::UnknownUpstream,
                "Invocation '" + id + "' depends on unknown invocation '" + upstream + "' in pipeline '" +
                    m_name + "'");
        }
    }

    m_index.emplace(id, m_invocations.size());
    m_invocations.push_back(std::make_shared<StepInvocation>(
        id, step, std::move(input_artifacts), std::move(external_artifacts), std::move(parameters),
        std::move(upstream_steps), this));
    return id;
}

const StepInvocation* Pipeline::find_invocation(const InvocationId& id) const
{
    auto it = m_index.find(id);
    if (it == m_index.end())
    {
        return nullptr;
    }
    return m_invocations[it->second].get();
}

std::vector<InvocationId> Pipeline::invocations_of(const StepTemplate& step) const
{
    std::vector<InvocationId> ids;
    for (const auto& invocation : m_invocations)
    {
        if (invocation->step().get() == &step)
        {
            ids.push_back(invocation->id());
        }
    }
    return ids;
}

void Pipeline::clear() noexcept
{
    m_invocations.clear();
    m_index.clear();
}

void Pipeline::build(const std::function<void(Pipeline&)>& connect)
{
    PipelineBuildScope scope(*this);
    clear();
    try
    {
        connect(*this);
    }
    catch (...)
    {
        clear();
        throw;
    }
}

// ============================================================================
// Finalization
// ============================================================================

std::shared_ptr<const InvocationGraph> Pipeline::finalize(const FinalizationContext& context) const
{
    auto graph = std::make_shared<InvocationGraph>();
    graph->pipeline_name = m_name;

    const size_t num_invocations = m_invocations.size();
    graph->invocations.resize(num_invocations);
    graph->predecessor_counts.resize(num_invocations, 0);
    graph->successors.resize(num_invocations);

    // Structure first: ordering hints are resolved and the edges checked for
    // cycles before any configuration is finalized.
    for (size_t index = 0; index < num_invocations; ++index)
    {
        const StepInvocation& invocation = *m_invocations[index];
        FinalizedInvocation& node = graph->invocations[index];
        node.id = invocation.id();
        node.step_name = invocation.step()->name();
        node.upstream_steps = invocation.upstream_steps();
        for (const auto& [input_name, artifact] : invocation.input_artifacts())
        {
            node.input_artifacts.emplace(input_name, InputArtifactBinding{artifact->invocation_id(), artifact->output_name()});
        }

        for (const auto& upstream : node.upstream_steps)
        {
            size_t before = m_index.at(upstream);
            graph->predecessor_counts[index]++;
            graph->successors[before].push_back(index);
        }
    }

    // Kahn's algorithm, seeded in insertion order.
    std::vector<size_t> remaining = graph->predecessor_counts;
    std::deque<size_t> ready;
    for (size_t index = 0; index < num_invocations; ++index)
    {
        if (remaining[index] == 0)
        {
            ready.push_back(index);
        }
    }
    while (!ready.empty())
    {
        size_t index = ready.front();
        ready.pop_front();
        graph->topological_order.push_back(index);
        for (size_t next : graph->successors[index])
        {
            if (--remaining[next] == 0)
            {
                ready.push_back(next);
            }
        }
    }
    if (graph->topological_order.size() != num_invocations)
    {
        std::vector<InvocationId> cyclic;
        for (size_t index = 0; index < num_invocations; ++index)
        {
            if (remaining[index] > 0)
            {
                cyclic.push_back(m_invocations[index]->id());
            }
        }
        std::string names;
        for (const auto& id : cyclic)
        {
            names += names.empty() ? id : ", " + id;
        }
        throw PipelineValidationError(
            "Upstream relationships of pipeline '" + m_name + "' form a cycle between: " + names, cyclic);
    }

    for (size_t index = 0; index < num_invocations; ++index)
    {
        FinalizedInvocation& node = graph->invocations[index];
        node.configuration = std::make_shared<const StepConfiguration>(m_invocations[index]->finalize(context));
        node.external_artifacts = node.configuration->external_input_artifacts();
        STEPDAG_LOG_DEBUG("Finalized invocation '" << node.id << "' of pipeline '" << m_name << "'");
    }

    return graph;
}

// ============================================================================
// Build scope
// ============================================================================

Pipeline* Pipeline::active() noexcept
{
    std::lock_guard<std::mutex> lock(g_active_mutex);
    return g_active_pipeline;
}

PipelineBuildScope::PipelineBuildScope(Pipeline& pipeline)
    : m_pipeline(pipeline)
{
    std::lock_guard<std::mutex> lock(g_active_mutex);
    if (g_active_pipeline != nullptr)
    {
        throw StepDagError(
            StepDagErrorCode::InvalidState,
            "Cannot build pipeline '" + pipeline.name() + "' while pipeline '" + g_active_pipeline->name() +
                "' is being built");
    }
    g_active_pipeline = &pipeline;
}

PipelineBuildScope::~PipelineBuildScope()
{
    std::lock_guard<std::mutex> lock(g_active_mutex);
    if (g_active_pipeline == &m_pipeline)
    {
        g_active_pipeline = nullptr;
    }
}

} // namespace stepdag
