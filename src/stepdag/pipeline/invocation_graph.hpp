/**
 * @file invocation_graph.hpp
 * @brief Finalized invocation graph handed to the orchestrator.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/config/step_configuration.hpp"

namespace stepdag
{

/**
 * @brief An input bound to the output of another invocation.
 */
struct InputArtifactBinding
{
    InvocationId invocation_id;
    std::string output_name;
};

/**
 * @brief One finalized node of the graph.
 */
struct FinalizedInvocation
{
    InvocationId id;
    std::string step_name;
    std::shared_ptr<const StepConfiguration> configuration;

    /**
     * @brief Invocations that must complete before this one, from artifacts,
     *        explicit `after` ids and template ordering hints.
     */
    std::set<InvocationId> upstream_steps;

    std::map<std::string, InputArtifactBinding> input_artifacts;

    /**
     * @brief Resolved external artifact ids, by input name.
     */
    std::map<std::string, ArtifactId> external_artifacts;
};

/**
 * @brief Immutable result of `Pipeline::finalize()`.
 *
 * @details
 * Invocations are stored in insertion order; the index of an invocation in
 * `invocations` is used by `predecessor_counts`, `successors` and
 * `topological_order`.
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe.
 */
struct InvocationGraph
{
    std::string pipeline_name;

    std::vector<FinalizedInvocation> invocations;

    /**
     * @brief predecessor_counts[i] is the number of distinct upstream
     *        invocations of invocation i.
     */
    std::vector<size_t> predecessor_counts;

    /**
     * @brief successors[i] lists the invocations that depend on invocation i.
     */
    std::vector<std::vector<size_t>> successors;

    /**
     * @brief An execution order in which every invocation follows its upstreams.
     *
     * @details
     * Among invocations that are ready at the same time, insertion order wins.
     */
    std::vector<size_t> topological_order;

    /**
     * @brief Index of an invocation, if present.
     */
    std::optional<size_t> index_of(const InvocationId& id) const;

    /**
     * @brief Invocation by id.
     * @throws std::out_of_range if absent.
     */
    const FinalizedInvocation& at(const InvocationId& id) const;

    /**
     * @brief Indices of invocations with no upstream invocations.
     */
    std::vector<size_t> get_initial_ready_invocations() const;

    size_t invocation_count() const noexcept
    {
        return invocations.size();
    }
};

void to_json(Json& j, const InvocationGraph& graph);

} // namespace stepdag
