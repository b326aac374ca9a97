#include <gtest/gtest.h>
#include "stepdag/common/stepdag_exceptions.hpp"
#include "stepdag/config/step_configuration.hpp"

using namespace stepdag;

namespace
{

PartialStepConfiguration base_configuration()
{
    PartialStepConfiguration config;
    config.name = "trainer";
    config.enable_cache = true;
    config.parameters = Json{{"epochs", 3}, {"optimizer", {{"name", "sgd"}, {"momentum", 0.9}}}};
    config.settings["docker"] = Json{{"parent_image", "python:3.11"}, {"requirements", Json::array({"numpy"})}};
    config.outputs["model"].materializer_source = {Source("pkg.materializers", "ModelMaterializer")};
    config.extra = Json{{"owner", "ml-team"}};
    return config;
}

} // namespace

// =============================================================================
// Non-recursive merge
// =============================================================================

TEST(StepConfigurationTests, NonRecursive_ReplacesMappingsWholesale)
{
    StepConfigurationUpdate update;
    update.parameters = Json{{"optimizer", {{"name", "adam"}}}};
    update.settings = std::map<std::string, Json>{{"resources", Json{{"cpu_count", 2}}}};

    PartialStepConfiguration result = update_configuration(base_configuration(), update, false);
    EXPECT_EQ(result.parameters, Json({{"optimizer", {{"name", "adam"}}}}));
    ASSERT_EQ(result.settings.size(), 1u);
    EXPECT_EQ(result.settings.count("resources"), 1u);
    EXPECT_EQ(result.name, "trainer");
    EXPECT_EQ(result.enable_cache, std::optional<bool>(true));
}

TEST(StepConfigurationTests, NonRecursive_SameUpdateTwice_IsIdempotent)
{
    StepConfigurationUpdate update;
    update.enable_cache = false;
    update.parameters = Json{{"epochs", 10}};
    update.extra = Json{{"tag", "v2"}};

    PartialStepConfiguration once = update_configuration(base_configuration(), update, false);
    PartialStepConfiguration twice = update_configuration(once, update, false);
    EXPECT_EQ(once, twice);
}

TEST(StepConfigurationTests, EmptyUpdate_LeavesConfigurationUnchanged)
{
    StepConfigurationUpdate update;
    EXPECT_TRUE(update.empty());
    EXPECT_EQ(update_configuration(base_configuration(), update, true), base_configuration());
    EXPECT_EQ(update_configuration(base_configuration(), update, false), base_configuration());
}

// =============================================================================
// Recursive merge
// =============================================================================

TEST(StepConfigurationTests, Recursive_DisjointParameterKeys_Union)
{
    PartialStepConfiguration base;
    base.name = "s";
    base.parameters = Json{{"a", 1}};

    StepConfigurationUpdate update;
    update.parameters = Json{{"b", 2}};

    PartialStepConfiguration result = update_configuration(base, update, true);
    EXPECT_EQ(result.parameters, Json({{"a", 1}, {"b", 2}}));
}

TEST(StepConfigurationTests, Recursive_UpdateWinsOnCollision)
{
    StepConfigurationUpdate update;
    update.parameters = Json{{"epochs", 7}};
    update.extra = Json{{"owner", "platform"}, {"tier", "gold"}};

    PartialStepConfiguration result = update_configuration(base_configuration(), update, true);
    EXPECT_EQ(result.parameters["epochs"], 7);
    EXPECT_EQ(result.parameters["optimizer"]["name"], "sgd");
    EXPECT_EQ(result.extra, Json({{"owner", "platform"}, {"tier", "gold"}}));
}

TEST(StepConfigurationTests, Recursive_SettingsMergePerKeyAndField)
{
    StepConfigurationUpdate update;
    update.settings = std::map<std::string, Json>{
        {"docker", Json{{"parent_image", "python:3.12"}}},
        {"orchestrator.local", Json{{"synchronous", true}}},
    };

    PartialStepConfiguration result = update_configuration(base_configuration(), update, true);
    ASSERT_EQ(result.settings.size(), 2u);
    EXPECT_EQ(result.settings["docker"]["parent_image"], "python:3.12");
    EXPECT_EQ(result.settings["docker"]["requirements"], Json::array({"numpy"}));
    EXPECT_EQ(result.settings["orchestrator.local"], Json({{"synchronous", true}}));
}

TEST(StepConfigurationTests, Recursive_OutputsMergePerName)
{
    StepConfigurationUpdate update;
    OutputConfigurations outputs;
    outputs["metrics"].materializer_source = {Source("pkg.materializers", "JsonMaterializer")};
    outputs["model"];
    update.outputs = outputs;

    PartialStepConfiguration result = update_configuration(base_configuration(), update, true);
    ASSERT_EQ(result.outputs.size(), 2u);
    ASSERT_EQ(result.outputs["model"].materializer_source.size(), 1u);
    EXPECT_EQ(result.outputs["model"].materializer_source[0].attribute(), "ModelMaterializer");
    EXPECT_EQ(result.outputs["metrics"].materializer_source[0].attribute(), "JsonMaterializer");
}

TEST(StepConfigurationTests, Merge_DoesNotModifyBase)
{
    const PartialStepConfiguration base = base_configuration();
    StepConfigurationUpdate update;
    update.name = "renamed";
    update.parameters = Json{{"epochs", 1}};

    PartialStepConfiguration result = update_configuration(base, update, true);
    EXPECT_EQ(result.name, "renamed");
    EXPECT_EQ(base, base_configuration());
}

TEST(StepConfigurationTests, Merge_UnknownSettingsKey_Throws)
{
    StepConfigurationUpdate update;
    update.settings = std::map<std::string, Json>{{"gpu", Json::object()}};
    try
    {
        update_configuration(base_configuration(), update, true);
        FAIL() << "expected StepDagError";
    }
    catch (const StepDagError& e)
    {
        EXPECT_EQ(e.code(), StepDagErrorCode::UnknownSetting);
    }
}

// =============================================================================
// StepConfiguration
// =============================================================================

TEST(StepConfigurationTests, Construct_OutputWithoutMaterializer_Throws)
{
    PartialStepConfiguration partial = base_configuration();
    partial.outputs["metrics"];
    try
    {
        StepConfiguration config(partial);
        FAIL() << "expected StepDagError";
    }
    catch (const StepDagError& e)
    {
        EXPECT_EQ(e.code(), StepDagErrorCode::MaterializerRequired);
        EXPECT_NE(std::string(e.what()).find("metrics"), std::string::npos);
    }
}

TEST(StepConfigurationTests, UpdateFinalized_ReturnsNewConfiguration)
{
    StepConfiguration config(base_configuration());
    StepConfigurationUpdate update;
    update.enable_cache = false;

    StepConfiguration updated = update_configuration(config, update, true);
    EXPECT_EQ(updated.enable_cache(), std::optional<bool>(false));
    EXPECT_EQ(config.enable_cache(), std::optional<bool>(true));
}

TEST(StepConfigurationTests, ToJson_ContainsAllFields)
{
    Json j = StepConfiguration(base_configuration());
    EXPECT_EQ(j["name"], "trainer");
    EXPECT_EQ(j["enable_cache"], true);
    EXPECT_TRUE(j["step_operator"].is_null());
    EXPECT_EQ(j["outputs"]["model"]["materializer_source"], Json::array({"pkg.materializers.ModelMaterializer"}));
    EXPECT_TRUE(j["caching_parameters"].is_object());
}

// =============================================================================
// StepConfigurationUpdate::from_json
// =============================================================================

TEST(StepConfigurationUpdateTests, FromJson_ParsesFields)
{
    StepConfigurationUpdate update = StepConfigurationUpdate::from_json(Json{
        {"name", "trainer"},
        {"enable_cache", false},
        {"parameters", {{"epochs", 2}}},
        {"settings", {{"docker", {{"parent_image", "x"}}}}},
        {"outputs", {{"model", {{"materializer_source", "pkg.M"}}}}},
        {"failure_hook_source", "hooks.alerts.on_failure"},
    });
    EXPECT_EQ(update.name, std::optional<std::string>("trainer"));
    EXPECT_EQ(update.enable_cache, std::optional<bool>(false));
    ASSERT_TRUE(update.outputs);
    EXPECT_EQ(update.outputs->at("model").materializer_source[0], Source("pkg", "M"));
    ASSERT_TRUE(update.failure_hook_source);
    EXPECT_EQ(update.failure_hook_source->attribute(), "on_failure");
    EXPECT_FALSE(update.extra);
}

TEST(StepConfigurationUpdateTests, FromJson_UnknownKey_Throws)
{
    try
    {
        StepConfigurationUpdate::from_json(Json{{"retries", 3}});
        FAIL() << "expected StepDagError";
    }
    catch (const StepDagError& e)
    {
        EXPECT_EQ(e.code(), StepDagErrorCode::UnknownSetting);
    }
}

TEST(StepConfigurationUpdateTests, FromJson_WrongKind_Throws)
{
    try
    {
        StepConfigurationUpdate::from_json(Json{{"enable_cache", "yes"}});
        FAIL() << "expected StepDagError";
    }
    catch (const StepDagError& e)
    {
        EXPECT_EQ(e.code(), StepDagErrorCode::InputValidation);
    }
}
