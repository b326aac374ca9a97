/**
 * @file materializer_resolver.hpp
 * @brief Resolution of output materializers from explicit sources or types.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/common/data_type.hpp"
#include "stepdag/config/source.hpp"
#include "stepdag/steps/materializer.hpp"

namespace stepdag
{

/**
 * @brief Decompose a declared output type into the types to look up.
 *
 * @details
 * Unions yield their members in declaration order, with an explicit `None`
 * member mapped to the null placeholder type. Other types yield themselves.
 */
std::vector<DataType> materializer_lookup_types(const DataType& declared_type);

/**
 * @brief Resolve the ordered materializer sources for one step output.
 *
 * @param step_name Name of the step, for diagnostics.
 * @param output_name Name of the output.
 * @param declared_type Declared type of the output.
 * @param explicit_sources Configured sources; used as-is when non-empty.
 * @param registry Registry used for validation and type lookup.
 * @return Materializer sources in resolution order.
 *
 * @throws StepDagError with `MaterializerNotFound` if an explicit source is
 *         not a materializer or a looked-up type has no materializer, and
 *         `MaterializerRequired` if the output is typed `Any` and no explicit
 *         source is configured.
 */
std::vector<Source> resolve_output_materializers(const std::string& step_name,
                                                 const std::string& output_name,
                                                 const DataType& declared_type,
                                                 const std::vector<Source>& explicit_sources,
                                                 const MaterializerRegistry& registry);

} // namespace stepdag
