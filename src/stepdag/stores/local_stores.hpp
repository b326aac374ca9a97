/**
 * @file local_stores.hpp
 * @brief Local reference implementations of the collaborator interfaces.
 */
#pragma once
#include "stepdag/stores/collaborators.hpp"

namespace stepdag
{

/**
 * @brief Artifact store rooted at a local directory.
 *
 * @details
 * Locations are `<root>/<scope>/<name>`. Nothing is created until
 * `make_directory()` is called.
 */
class LocalArtifactStore : public IArtifactStore
{
public:
    explicit LocalArtifactStore(std::string root);

    std::string allocate_location(const std::string& scope, const std::string& name) override;
    bool exists(const std::string& uri) override;
    void make_directory(const std::string& uri) override;

    const std::string& root() const noexcept
    {
        return m_root;
    }

private:
    std::string m_root;
};

/**
 * @brief Metadata store keeping artifact records in memory.
 *
 * @par Thread Safety
 * - All methods are internally synchronized.
 */
class InMemoryMetadataStore : public IMetadataStore
{
public:
    InMemoryMetadataStore() = default;

    ArtifactId create_artifact(const ArtifactRecord& record) override;
    ArtifactRecord get_artifact(const ArtifactId& id) override;

    /**
     * @brief Insert a record under a caller-chosen identifier.
     */
    void put_artifact(ArtifactRecord record);

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<ArtifactId, ArtifactRecord> m_records;
};

} // namespace stepdag
