/**
 * @file materializer_resolver.cpp
 */
#include "stepdag/steps/materializer_resolver.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"

namespace stepdag
{

std::vector<DataType> materializer_lookup_types(const DataType& declared_type)
{
    if (declared_type.is_union())
    {
        return declared_type.members();
    }
    return {declared_type};
}

std::vector<Source> resolve_output_materializers(const std::string& step_name,
                                                 const std::string& output_name,
                                                 const DataType& declared_type,
                                                 const std::vector<Source>& explicit_sources,
                                                 const MaterializerRegistry& registry)
{
    std::vector<Source> sources;

    if (!explicit_sources.empty())
    {
        for (const auto& source : explicit_sources)
        {
            if (!registry.is_materializer_source(source))
            {
                throw StepDagError(
                    StepDagErrorCode::MaterializerNotFound,
                    "Materializer source `" + source.import_path() + "` for output '" + output_name +
                        "' of step '" + step_name + "' does not resolve to a materializer.");
            }
            sources.push_back(registry.load(source)->source());
        }
        return sources;
    }

    if (declared_type.is_any())
    {
        throw StepDagError(
            StepDagErrorCode::MaterializerRequired,
            "An explicit materializer needs to be specified for output '" + output_name +
                "' of step '" + step_name + "' because it is annotated with `Any`.");
    }

    for (const auto& type : materializer_lookup_types(declared_type))
    {
        if (!registry.is_registered(type))
        {
            throw StepDagError(
                StepDagErrorCode::MaterializerNotFound,
                "Unable to find materializer for output '" + output_name + "' of type `" +
                    type.to_string() + "` in step '" + step_name +
                    "'. Either set a materializer for the output explicitly or register a "
                    "default materializer for the type.");
        }
        sources.push_back(registry.lookup(type)->source());
    }
    return sources;
}

} // namespace stepdag
