#include <gtest/gtest.h>
#include "stepdag/common/stepdag_exceptions.hpp"
#include "stepdag/common/uuid.hpp"
#include "stepdag/stores/local_stores.hpp"

#include <filesystem>

using namespace stepdag;

class LocalArtifactStoreTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = std::filesystem::temp_directory_path() / ("stepdag_store_" + generate_uuid());
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    std::filesystem::path m_root;
};

TEST_F(LocalArtifactStoreTests, AllocateLocation_JoinsScopeAndName)
{
    LocalArtifactStore store(m_root.string());
    std::string uri = store.allocate_location("external_artifacts", "external_1");
    EXPECT_EQ(uri, (m_root / "external_artifacts" / "external_1").string());
    EXPECT_FALSE(store.exists(uri));
}

TEST_F(LocalArtifactStoreTests, MakeDirectory_CreatesNestedPath)
{
    LocalArtifactStore store(m_root.string());
    std::string uri = store.allocate_location("external_artifacts", "external_2");
    store.make_directory(uri);
    EXPECT_TRUE(store.exists(uri));
    EXPECT_TRUE(std::filesystem::is_directory(uri));
}

TEST(InMemoryMetadataStoreTests, CreateAndGet)
{
    InMemoryMetadataStore store;
    ArtifactRecord record;
    record.name = "external_x";
    record.data_type = DataType::dict();
    record.metadata = Json{{"size", 2}};

    ArtifactId id = store.create_artifact(record);
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(store.size(), 1u);

    ArtifactRecord stored = store.get_artifact(id);
    EXPECT_EQ(stored.id, id);
    EXPECT_EQ(stored.name, "external_x");
    EXPECT_EQ(stored.data_type, DataType::dict());
    EXPECT_EQ(stored.metadata, Json({{"size", 2}}));
}

TEST(InMemoryMetadataStoreTests, PutArtifact_KeepsId)
{
    InMemoryMetadataStore store;
    ArtifactRecord record;
    record.id = "fixed-id";
    record.artifact_store_id = "store-1";
    store.put_artifact(record);
    EXPECT_EQ(store.get_artifact("fixed-id").artifact_store_id, "store-1");
}

TEST(InMemoryMetadataStoreTests, GetUnknown_Throws)
{
    InMemoryMetadataStore store;
    EXPECT_THROW(store.get_artifact("missing"), StepDagError);
}
