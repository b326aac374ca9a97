/**
 * @file finalization_context.hpp
 * @brief Collaborators handed to pipeline finalization.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/steps/materializer.hpp"
#include "stepdag/stores/collaborators.hpp"

namespace stepdag
{

/**
 * @brief Everything finalization needs from outside the graph.
 *
 * @details
 * The artifact and metadata stores are only touched while resolving
 * external artifacts; pipelines without external artifacts may leave them
 * empty. A null `materializers` means the process-wide default registry.
 */
struct FinalizationContext
{
    std::shared_ptr<MaterializerRegistry> materializers;
    std::shared_ptr<IArtifactStore> artifact_store;
    std::shared_ptr<IMetadataStore> metadata_store;
    RunContext run;

    const MaterializerRegistry& registry() const
    {
        return materializers ? *materializers : *MaterializerRegistry::default_registry();
    }
};

} // namespace stepdag
