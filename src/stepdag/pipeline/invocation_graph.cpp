/**
 * @file invocation_graph.cpp
 */
#include "stepdag/pipeline/invocation_graph.hpp"

namespace stepdag
{

std::optional<size_t> InvocationGraph::index_of(const InvocationId& id) const
{
    for (size_t i = 0; i < invocations.size(); ++i)
    {
        if (invocations[i].id == id)
        {
            return i;
        }
    }
    return std::nullopt;
}

const FinalizedInvocation& InvocationGraph::at(const InvocationId& id) const
{
    std::optional<size_t> index = index_of(id);
    if (!index)
    {
        throw std::out_of_range("No invocation '" + id + "' in pipeline '" + pipeline_name + "'");
    }
    return invocations[*index];
}

std::vector<size_t> InvocationGraph::get_initial_ready_invocations() const
{
    std::vector<size_t> result;
    for (size_t i = 0; i < predecessor_counts.size(); ++i)
    {
        if (predecessor_counts[i] == 0)
        {
            result.push_back(i);
        }
    }
    return result;
}

void to_json(Json& j, const InvocationGraph& graph)
{
    Json steps = Json::object();
    for (const auto& invocation : graph.invocations)
    {
        Json inputs = Json::object();
        for (const auto& [input_name, binding] : invocation.input_artifacts)
        {
            inputs[input_name] = Json{{"invocation_id", binding.invocation_id}, {"output_name", binding.output_name}};
        }
        steps[invocation.id] = Json{
            {"step_name", invocation.step_name},
            {"upstream_steps", invocation.upstream_steps},
            {"inputs", inputs},
            {"external_artifacts", invocation.external_artifacts},
            {"config", invocation.configuration ? Json(*invocation.configuration) : Json()},
        };
    }

    Json order = Json::array();
    for (size_t index : graph.topological_order)
    {
        order.push_back(graph.invocations[index].id);
    }

    j = Json{
        {"name", graph.pipeline_name},
        {"steps", steps},
        {"execution_order", order},
    };
}

} // namespace stepdag
