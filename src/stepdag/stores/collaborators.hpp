/**
 * @file collaborators.hpp
 * @brief Interfaces of the external collaborators used during finalization.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/common/data_type.hpp"
#include "stepdag/config/source.hpp"

namespace stepdag
{

/**
 * @brief Byte-level artifact persistence, as seen by external artifact upload.
 *
 * @par Thread Safety
 * - Implementations must tolerate concurrent calls for different locations.
 */
class IArtifactStore
{
public:
    virtual ~IArtifactStore() = 0;

    /**
     * @brief Return a fresh location for an artifact.
     * @param scope Grouping below the store root, e.g. `external_artifacts`.
     * @param name Artifact name, unique within the scope.
     */
    virtual std::string allocate_location(const std::string& scope, const std::string& name) = 0;

    virtual bool exists(const std::string& uri) = 0;

    virtual void make_directory(const std::string& uri) = 0;

protected:
    IArtifactStore() = default;

private:
    IArtifactStore(const IArtifactStore&) = delete;
    IArtifactStore& operator=(const IArtifactStore&) = delete;
};

/**
 * @brief Metadata record of a persisted artifact.
 */
struct ArtifactRecord
{
    ArtifactId id;
    std::string name;
    std::string artifact_type;
    std::string uri;
    Source materializer;
    DataType data_type;
    std::string user;
    std::string workspace;
    std::string artifact_store_id;
    Json metadata = Json::object();
};

/**
 * @brief Metadata/service store client.
 */
class IMetadataStore
{
public:
    virtual ~IMetadataStore() = 0;

    /**
     * @brief Register a new artifact. The `id` of the record is ignored.
     * @return The identifier assigned by the store.
     */
    virtual ArtifactId create_artifact(const ArtifactRecord& record) = 0;

    /**
     * @brief Fetch an artifact record.
     * @throws StepDagError with `InvalidArtifact` if the id is unknown.
     */
    virtual ArtifactRecord get_artifact(const ArtifactId& id) = 0;

protected:
    IMetadataStore() = default;

private:
    IMetadataStore(const IMetadataStore&) = delete;
    IMetadataStore& operator=(const IMetadataStore&) = delete;
};

/**
 * @brief Identities of the active user, workspace and artifact store.
 */
struct RunContext
{
    std::string user_id;
    std::string workspace_id;
    std::string artifact_store_id;
};

inline IArtifactStore::~IArtifactStore() = default;
inline IMetadataStore::~IMetadataStore() = default;

} // namespace stepdag
