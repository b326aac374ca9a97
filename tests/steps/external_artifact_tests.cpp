#include <gtest/gtest.h>
#include "stepdag/steps/artifacts.hpp"
#include "test_support.hpp"

using namespace stepdag;
using namespace stepdag_test;

class ExternalArtifactTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        context.materializers = fixture.registry;
        context.artifact_store = artifact_store;
        context.metadata_store = metadata_store;
        context.run = RunContext{"user-1", "workspace-1", "store-1"};
    }

    StepDagErrorCode resolve_error(ExternalArtifact& artifact)
    {
        try
        {
            artifact.upload_or_verify(context);
        }
        catch (const StepDagError& e)
        {
            return e.code();
        }
        ADD_FAILURE() << "expected StepDagError";
        return StepDagErrorCode::InvalidState;
    }

    RegistryFixture fixture;
    std::shared_ptr<CountingArtifactStore> artifact_store = std::make_shared<CountingArtifactStore>();
    std::shared_ptr<CountingMetadataStore> metadata_store = std::make_shared<CountingMetadataStore>();
    FinalizationContext context;
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(ExternalArtifactTests, Construct_RequiresExactlyOneOfValueAndId)
{
    Payload value = Payload::from_json(Json{{"a", 1}});
    EXPECT_THROW(std::make_shared<ExternalArtifact>(value, ArtifactId("artifact-1")), StepDagError);
    EXPECT_THROW(std::make_shared<ExternalArtifact>(std::nullopt, std::nullopt), StepDagError);
    EXPECT_THROW(ExternalArtifact::from_value(Payload()), StepDagError);
    EXPECT_THROW(ExternalArtifact::from_id(""), StepDagError);
}

TEST_F(ExternalArtifactTests, Construct_InitialStates)
{
    auto from_value = ExternalArtifact::from_value(Payload::from_json(Json(3)));
    EXPECT_EQ(from_value->state(), ExternalArtifact::State::Pending);
    EXPECT_TRUE(from_value->has_value());
    EXPECT_FALSE(from_value->id());
    EXPECT_EQ(from_value->kind(), ArtifactKind::External);

    auto from_id = ExternalArtifact::from_id("artifact-9");
    EXPECT_EQ(from_id->state(), ExternalArtifact::State::Unverified);
    EXPECT_FALSE(from_id->has_value());
    EXPECT_EQ(from_id->id(), std::optional<ArtifactId>("artifact-9"));
}

// =============================================================================
// Upload
// =============================================================================

TEST_F(ExternalArtifactTests, Upload_WritesUnderExternalScope)
{
    auto artifact = ExternalArtifact::from_value(Payload::from_json(Json{{"vocab", 10}}));
    ArtifactId id = artifact->upload_or_verify(context);

    EXPECT_EQ(id, "artifact-1");
    EXPECT_EQ(artifact->state(), ExternalArtifact::State::Resolved);
    ASSERT_EQ(fixture.builtin->saved_uris.size(), 1u);

    const ArtifactRecord& record = metadata_store->records.at(id);
    EXPECT_EQ(record.name.rfind(kExternalArtifactPrefix, 0), 0u);
    EXPECT_EQ(record.uri, std::string("memory://store/") + kExternalArtifactScope + "/" + record.name);
    EXPECT_EQ(record.uri, fixture.builtin->saved_uris[0]);
    EXPECT_EQ(record.materializer, fixture.builtin->source());
    EXPECT_EQ(record.data_type, DataType::dict());
    EXPECT_EQ(record.user, "user-1");
    EXPECT_EQ(record.workspace, "workspace-1");
    EXPECT_EQ(record.artifact_store_id, "store-1");
    EXPECT_EQ(record.metadata, Json({{"type", "dict"}}));
}

TEST_F(ExternalArtifactTests, Upload_HappensOnce)
{
    auto artifact = ExternalArtifact::from_value(Payload::from_json(Json::array({1, 2})));
    ArtifactId first = artifact->upload_or_verify(context);
    size_t store_calls = artifact_store->total_calls();
    size_t create_calls = metadata_store->create_calls;

    ArtifactId second = artifact->upload_or_verify(context);
    EXPECT_EQ(first, second);
    EXPECT_EQ(artifact_store->total_calls(), store_calls);
    EXPECT_EQ(metadata_store->create_calls, create_calls);
    EXPECT_EQ(metadata_store->get_calls, 0u);
    EXPECT_EQ(fixture.builtin->saved_uris.size(), 1u);
}

TEST_F(ExternalArtifactTests, Upload_ExistingLocation_Throws)
{
    artifact_store->report_all_existing = true;
    auto artifact = ExternalArtifact::from_value(Payload::from_json(Json(1)));
    EXPECT_EQ(resolve_error(*artifact), StepDagErrorCode::ArtifactUriExists);
    EXPECT_EQ(artifact->state(), ExternalArtifact::State::Pending);
    EXPECT_TRUE(fixture.builtin->saved_uris.empty());
}

TEST_F(ExternalArtifactTests, Upload_UnregisteredType_Throws)
{
    struct Frame
    {
    };
    auto artifact = ExternalArtifact::from_value(Payload::of(Frame{}, DataType::named("pandas.DataFrame")));
    EXPECT_EQ(resolve_error(*artifact), StepDagErrorCode::MaterializerNotFound);
    EXPECT_EQ(artifact_store->total_calls(), 0u);
}

TEST_F(ExternalArtifactTests, Upload_ExplicitMaterializerWins)
{
    auto custom = std::make_shared<FakeMaterializer>("CustomMaterializer", std::vector<DataType>{}, "custom");
    ExternalArtifactOptions options;
    options.materializer = custom;
    options.materializer_source = fixture.model->source();
    auto artifact = ExternalArtifact::from_value(Payload::from_json(Json(1)), options);

    ArtifactId id = artifact->upload_or_verify(context);
    EXPECT_EQ(custom->saved_uris.size(), 1u);
    EXPECT_EQ(metadata_store->records.at(id).materializer, custom->source());
}

TEST_F(ExternalArtifactTests, Upload_MaterializerSource_LoadedFromRegistry)
{
    ExternalArtifactOptions options;
    options.materializer_source = fixture.model->source();
    auto artifact = ExternalArtifact::from_value(Payload::from_json(Json(1)), options);
    artifact->upload_or_verify(context);
    EXPECT_EQ(fixture.model->saved_uris.size(), 1u);
    EXPECT_TRUE(fixture.builtin->saved_uris.empty());
}

TEST_F(ExternalArtifactTests, Upload_WithoutMetadata_LeavesMetadataEmpty)
{
    ExternalArtifactOptions options;
    options.store_artifact_metadata = false;
    auto artifact = ExternalArtifact::from_value(Payload::from_json(Json(1)), options);
    ArtifactId id = artifact->upload_or_verify(context);
    EXPECT_EQ(metadata_store->records.at(id).metadata, Json::object());
}

TEST_F(ExternalArtifactTests, Upload_WithoutStores_Throws)
{
    context.artifact_store.reset();
    auto artifact = ExternalArtifact::from_value(Payload::from_json(Json(1)));
    EXPECT_EQ(resolve_error(*artifact), StepDagErrorCode::InvalidState);
}

// =============================================================================
// Verification
// =============================================================================

TEST_F(ExternalArtifactTests, Verify_SameStore_Resolves)
{
    ArtifactRecord record;
    record.artifact_store_id = "store-1";
    record.data_type = DataType::integer();
    ArtifactId id = metadata_store->create_artifact(record);

    auto artifact = ExternalArtifact::from_id(id);
    EXPECT_EQ(artifact->upload_or_verify(context), id);
    EXPECT_EQ(artifact->state(), ExternalArtifact::State::Resolved);
    EXPECT_EQ(artifact_store->total_calls(), 0u);

    size_t get_calls = metadata_store->get_calls;
    artifact->upload_or_verify(context);
    EXPECT_EQ(metadata_store->get_calls, get_calls);
}

TEST_F(ExternalArtifactTests, Verify_OtherStore_Throws)
{
    ArtifactRecord record;
    record.artifact_store_id = "store-2";
    ArtifactId id = metadata_store->create_artifact(record);

    auto artifact = ExternalArtifact::from_id(id);
    EXPECT_EQ(resolve_error(*artifact), StepDagErrorCode::ArtifactStoreMismatch);
    EXPECT_EQ(artifact->state(), ExternalArtifact::State::Unverified);
}

// =============================================================================
// Type
// =============================================================================

TEST_F(ExternalArtifactTests, Type_FromValueOrRecord)
{
    auto by_value = ExternalArtifact::from_value(Payload::from_json(Json("text")));
    EXPECT_EQ(by_value->type(nullptr), DataType::string());

    ArtifactRecord record;
    record.data_type = DataType::named("pandas.DataFrame");
    auto by_id = ExternalArtifact::from_id(metadata_store->create_artifact(record));
    EXPECT_TRUE(by_id->type(nullptr).is_any());
    EXPECT_EQ(by_id->type(metadata_store.get()), DataType::named("pandas.DataFrame"));

    ExternalArtifactOptions options;
    options.skip_type_checking = true;
    auto unchecked = ExternalArtifact::from_value(Payload::from_json(Json("text")), options);
    EXPECT_TRUE(unchecked->type(nullptr).is_any());
}

TEST_F(ExternalArtifactTests, Type_OfId_ReadsRecordOnce)
{
    ArtifactRecord record;
    record.data_type = DataType::dict();
    auto artifact = ExternalArtifact::from_id(metadata_store->create_artifact(record));

    EXPECT_EQ(artifact->type(metadata_store.get()), DataType::dict());
    EXPECT_EQ(artifact->type(metadata_store.get()), DataType::dict());
    EXPECT_EQ(metadata_store->get_calls, 1u);
}

TEST_F(ExternalArtifactTests, Type_AfterVerify_TouchesNoStore)
{
    ArtifactRecord record;
    record.artifact_store_id = "store-1";
    record.data_type = DataType::integer();
    auto artifact = ExternalArtifact::from_id(metadata_store->create_artifact(record));
    artifact->upload_or_verify(context);

    size_t get_calls = metadata_store->get_calls;
    EXPECT_EQ(artifact->type(metadata_store.get()), DataType::integer());
    EXPECT_EQ(metadata_store->get_calls, get_calls);
}
