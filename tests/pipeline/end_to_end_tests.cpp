#include <gtest/gtest.h>
#include "stepdag/common/content_hash.hpp"
#include "stepdag/pipeline/pipeline.hpp"
#include "test_support.hpp"

using namespace stepdag;
using namespace stepdag_test;

// =============================================================================
// Producer/consumer pipelines, finalized against fake stores
// =============================================================================

class EndToEndTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        EntrypointSignature produce;
        produce.function_name = "produce";
        produce.return_annotation = ReturnAnnotation::named({{"x", TypeExpr(DataType::integer())}});
        producer = make_step(produce, "def produce(): return 1", echo_first, options_with(fixture.registry));

        EntrypointSignature consume;
        consume.function_name = "consume";
        consume.parameters = {
            SignatureParameter("x", TypeExpr(DataType::integer())),
            SignatureParameter("vocabulary", TypeExpr(DataType::dict()), Json::object()),
            SignatureParameter("scale", TypeExpr(DataType::floating()), Json(1.0)),
        };
        consume.return_annotation = ReturnAnnotation::single(TypeExpr::optional(DataType::floating()));
        consumer = make_step(consume, "def consume(x, vocabulary, scale): ...", echo_first,
                             options_with(fixture.registry));

        context.materializers = fixture.registry;
        context.artifact_store = artifact_store;
        context.metadata_store = metadata_store;
        context.run = RunContext{"user-1", "workspace-1", "store-1"};
    }

    StepCallArguments consume_args(const StepArtifactPtr& x)
    {
        StepCallArguments args;
        args.named.emplace("x", x);
        return args;
    }

    RegistryFixture fixture;
    std::shared_ptr<CountingArtifactStore> artifact_store = std::make_shared<CountingArtifactStore>();
    std::shared_ptr<CountingMetadataStore> metadata_store = std::make_shared<CountingMetadataStore>();
    FinalizationContext context;
    StepTemplatePtr producer;
    StepTemplatePtr consumer;
    Pipeline pipeline{"producer_consumer"};
};

TEST_F(EndToEndTests, ConsumerDependsOnProducer)
{
    pipeline.build([this](Pipeline&) {
        StepCallResult produced = (*producer)({});
        (*consumer)(consume_args(produced.artifacts[0]));
    });

    auto graph = pipeline.finalize(context);
    ASSERT_EQ(graph->invocation_count(), 2u);

    const FinalizedInvocation& consume = graph->at("consume");
    EXPECT_EQ(consume.step_name, "consume");
    EXPECT_EQ(consume.upstream_steps, (std::set<InvocationId>{"produce"}));
    ASSERT_EQ(consume.input_artifacts.count("x"), 1u);
    EXPECT_EQ(consume.input_artifacts.at("x").invocation_id, "produce");
    EXPECT_EQ(consume.input_artifacts.at("x").output_name, "x");

    const StepConfiguration& config = *consume.configuration;
    EXPECT_EQ(config.parameters(), Json({{"vocabulary", Json::object()}, {"scale", 1.0}}));
    EXPECT_EQ(config.outputs().at("output").materializer_source,
              (std::vector<Source>{fixture.builtin->source(), fixture.builtin->source()}));
    EXPECT_EQ(config.caching_parameters().at(kStepSourceParameterName),
              hash_source_code("def consume(x, vocabulary, scale): ..."));
    EXPECT_TRUE(graph->at("produce").upstream_steps.empty());
    EXPECT_EQ(graph->topological_order, (std::vector<size_t>{0, 1}));
    EXPECT_THROW(graph->at("missing"), std::out_of_range);
}

TEST_F(EndToEndTests, MissingInput_FailsAtFinalize)
{
    pipeline.build([this](Pipeline& p) {
        producer->invoke(p, {});
        consumer->invoke(p, {});
    });
    EXPECT_EQ(error_code_of([&] { pipeline.finalize(context); }), StepDagErrorCode::MissingInput);
}

TEST_F(EndToEndTests, TemplateParameterSatisfiesInput)
{
    StepConfigurationUpdate update;
    update.parameters = Json{{"x", 4}};
    consumer->configure(update);

    pipeline.build([this](Pipeline& p) { consumer->invoke(p, {}); });
    auto graph = pipeline.finalize(context);
    EXPECT_EQ(graph->at("consume").configuration->parameters().at("x"), 4);
}

TEST_F(EndToEndTests, InvocationParameters_ReplaceTemplateParameters)
{
    StepConfigurationUpdate update;
    update.parameters = Json{{"x", 4}, {"scale", 2.0}};
    consumer->configure(update);

    pipeline.build([this](Pipeline& p) {
        StepCallArguments args;
        args.named.emplace("x", Json(7));
        consumer->invoke(p, args);
        consumer->invoke(p, {});
    });
    auto graph = pipeline.finalize(context);

    const Json& replaced = graph->at("consume").configuration->parameters();
    EXPECT_EQ(replaced.at("x"), 7);
    EXPECT_EQ(replaced.at("scale"), 1.0);

    const Json& kept = graph->at("consume_2").configuration->parameters();
    EXPECT_EQ(kept.at("x"), 4);
    EXPECT_EQ(kept.at("scale"), 2.0);

    EXPECT_EQ(consumer->configuration().parameters, Json({{"x", 4}, {"scale", 2.0}}));
}

TEST_F(EndToEndTests, ExternalArtifact_UploadedOnceAndRecorded)
{
    auto vocabulary = ExternalArtifact::from_value(Payload::from_json(Json{{"a", 0}, {"b", 1}}));
    pipeline.build([&](Pipeline& p) {
        auto x = producer->invoke(p, {})[0];
        StepCallArguments args = consume_args(x);
        args.named.emplace("vocabulary", vocabulary);
        consumer->invoke(p, args);
        consumer->invoke(p, args);
    });

    auto graph = pipeline.finalize(context);
    EXPECT_EQ(metadata_store->create_calls, 1u);
    EXPECT_EQ(fixture.builtin->saved_uris.size(), 1u);
    EXPECT_EQ(graph->at("consume").external_artifacts.at("vocabulary"), "artifact-1");
    EXPECT_EQ(graph->at("consume_2").external_artifacts.at("vocabulary"), "artifact-1");
    EXPECT_EQ(graph->at("consume").configuration->external_input_artifacts().at("vocabulary"), "artifact-1");
    EXPECT_FALSE(graph->at("consume").configuration->parameters().contains("vocabulary"));
}

TEST_F(EndToEndTests, ExternalArtifact_WrongType_FailsBeforeUpload)
{
    auto vocabulary = ExternalArtifact::from_value(Payload::from_json(Json("not a dict")));
    pipeline.build([&](Pipeline& p) {
        StepCallArguments args;
        args.named.emplace("x", Json(1));
        args.named.emplace("vocabulary", vocabulary);
        consumer->invoke(p, args);
    });

    EXPECT_EQ(error_code_of([&] { pipeline.finalize(context); }), StepDagErrorCode::InputValidation);
    EXPECT_EQ(artifact_store->total_calls(), 0u);
    EXPECT_EQ(vocabulary->state(), ExternalArtifact::State::Pending);
}

TEST_F(EndToEndTests, ExternalArtifactById_FromOtherStore_Fails)
{
    ArtifactRecord record;
    record.data_type = DataType::dict();
    record.artifact_store_id = "store-2";
    ArtifactId id = metadata_store->create_artifact(record);

    pipeline.build([&](Pipeline& p) {
        StepCallArguments args;
        args.named.emplace("x", Json(1));
        args.named.emplace("vocabulary", ExternalArtifact::from_id(id));
        consumer->invoke(p, args);
    });
    EXPECT_EQ(error_code_of([&] { pipeline.finalize(context); }), StepDagErrorCode::ArtifactStoreMismatch);
}

TEST_F(EndToEndTests, ExternalArtifactById_RefinalizeTouchesNoStore)
{
    ArtifactRecord record;
    record.data_type = DataType::dict();
    record.artifact_store_id = "store-1";
    ArtifactId id = metadata_store->create_artifact(record);

    pipeline.build([&](Pipeline& p) {
        StepCallArguments args;
        args.named.emplace("x", Json(1));
        args.named.emplace("vocabulary", ExternalArtifact::from_id(id));
        consumer->invoke(p, args);
    });

    pipeline.finalize(context);
    size_t get_calls = metadata_store->get_calls;
    size_t create_calls = metadata_store->create_calls;

    auto second = pipeline.finalize(context);
    EXPECT_EQ(metadata_store->get_calls, get_calls);
    EXPECT_EQ(metadata_store->create_calls, create_calls);
    EXPECT_EQ(artifact_store->total_calls(), 0u);
    EXPECT_EQ(second->at("consume").external_artifacts.at("vocabulary"), id);
}

TEST_F(EndToEndTests, GraphToJson)
{
    pipeline.build([this](Pipeline& p) {
        auto x = producer->invoke(p, {})[0];
        consumer->invoke(p, consume_args(x));
    });
    Json j = *pipeline.finalize(context);

    EXPECT_EQ(j["name"], "producer_consumer");
    EXPECT_EQ(j["execution_order"], Json::array({"produce", "consume"}));
    EXPECT_EQ(j["steps"]["consume"]["upstream_steps"], Json::array({"produce"}));
    EXPECT_EQ(j["steps"]["consume"]["inputs"]["x"], Json({{"invocation_id", "produce"}, {"output_name", "x"}}));
    EXPECT_EQ(j["steps"]["consume"]["config"]["name"], "consume");
    EXPECT_TRUE(j["steps"]["produce"]["config"]["caching_parameters"].contains("x_materializer_source"));
}
