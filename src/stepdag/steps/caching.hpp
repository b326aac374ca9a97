/**
 * @file caching.hpp
 * @brief Code-identity caching fingerprint of a step invocation.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/config/step_configuration.hpp"
#include "stepdag/steps/materializer.hpp"

namespace stepdag
{

/**
 * @brief Compute the caching parameters of a step.
 *
 * @details
 * The result always holds `step_source` mapped to the MD5 of the step source
 * code. For every output with resolved materializer sources it holds
 * `<output>_materializer_source` mapped to the MD5 over the concatenated MD5
 * hex digests of each materializer's source code, in resolution order.
 *
 * Artifact values and parameter values are not part of the fingerprint; the
 * orchestrator combines them with these entries when it builds cache keys.
 *
 * @throws StepDagError with `MaterializerNotFound` if a source cannot be loaded.
 */
std::map<std::string, std::string> compute_caching_parameters(const std::string& step_source_code,
                                                              const OutputConfigurations& outputs,
                                                              const MaterializerRegistry& registry);

} // namespace stepdag
