/**
 * @file caching.cpp
 */
#include "stepdag/steps/caching.hpp"
#include "stepdag/common/content_hash.hpp"

namespace stepdag
{

std::map<std::string, std::string> compute_caching_parameters(const std::string& step_source_code,
                                                              const OutputConfigurations& outputs,
                                                              const MaterializerRegistry& registry)
{
    std::map<std::string, std::string> parameters;
    parameters[kStepSourceParameterName] = hash_source_code(step_source_code);

    for (const auto& [output_name, output] : outputs)
    {
        if (output.materializer_source.empty())
        {
            continue;
        }
        Md5Hasher hasher;
        for (const auto& source : output.materializer_source)
        {
            hasher.update(hash_source_code(registry.load(source)->source_code()));
        }
        parameters[output_name + kMaterializerSourceSuffix] = hasher.hexdigest();
    }
    return parameters;
}

} // namespace stepdag
