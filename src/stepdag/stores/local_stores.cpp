/**
 * @file local_stores.cpp
 */
#include "stepdag/stores/local_stores.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"
#include "stepdag/common/uuid.hpp"

#include <filesystem>

namespace stepdag
{

// ============================================================================
// LocalArtifactStore
// ============================================================================

LocalArtifactStore::LocalArtifactStore(std::string root)
    : m_root(std::move(root))
{
}

std::string LocalArtifactStore::allocate_location(const std::string& scope, const std::string& name)
{
    return (std::filesystem::path(m_root) / scope / name).string();
}

bool LocalArtifactStore::exists(const std::string& uri)
{
    return std::filesystem::exists(std::filesystem::path(uri));
}

void LocalArtifactStore::make_directory(const std::string& uri)
{
    std::filesystem::create_directories(std::filesystem::path(uri));
}

// ============================================================================
// InMemoryMetadataStore
// ============================================================================

ArtifactId InMemoryMetadataStore::create_artifact(const ArtifactRecord& record)
{
    ArtifactRecord stored = record;
    stored.id = generate_uuid();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records[stored.id] = stored;
    return stored.id;
}

ArtifactRecord InMemoryMetadataStore::get_artifact(const ArtifactId& id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end())
    {
        throw StepDagError(StepDagErrorCode::InvalidArtifact, "No artifact with id '" + id + "'");
    }
    return it->second;
}

void InMemoryMetadataStore::put_artifact(ArtifactRecord record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ArtifactId id = record.id;
    m_records[id] = std::move(record);
}

size_t InMemoryMetadataStore::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

} // namespace stepdag
