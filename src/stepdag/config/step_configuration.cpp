/**
 * @file step_configuration.cpp
 */
#include "stepdag/config/step_configuration.hpp"
#include "stepdag/config/settings_keys.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"

namespace stepdag
{

// ============================================================================
// StepConfigurationUpdate
// ============================================================================

bool StepConfigurationUpdate::empty() const noexcept
{
    return !name && !enable_cache && !enable_artifact_metadata && !enable_artifact_visualization &&
           !experiment_tracker && !step_operator && !parameters && !settings && !outputs && !extra &&
           !failure_hook_source && !success_hook_source;
}

namespace
{

void require_kind(bool ok, const std::string& key, const char* expected)
{
    if (!ok)
    {
        throw StepDagError(
            StepDagErrorCode::InputValidation,
            "Configuration key '" + key + "' must be " + expected);
    }
}

std::vector<Source> parse_sources(const std::string& key, const Json& value)
{
    std::vector<Source> sources;
    if (value.is_string())
    {
        sources.push_back(Source::from_import_path(value.get<std::string>()));
        return sources;
    }
    require_kind(value.is_array(), key, "an import path or a list of import paths");
    for (const auto& item : value)
    {
        require_kind(item.is_string(), key, "a list of import paths");
        sources.push_back(Source::from_import_path(item.get<std::string>()));
    }
    return sources;
}

} // namespace

StepConfigurationUpdate StepConfigurationUpdate::from_json(const Json& value)
{
    require_kind(value.is_object(), "<root>", "an object");

    StepConfigurationUpdate update;
    for (auto it = value.begin(); it != value.end(); ++it)
    {
        const std::string& key = it.key();
        const Json& item = it.value();

        if (key == "name")
        {
            require_kind(item.is_string(), key, "a string");
            update.name = item.get<std::string>();
        }
        else if (key == "enable_cache" || key == "enable_artifact_metadata" ||
                 key == "enable_artifact_visualization")
        {
            require_kind(item.is_boolean(), key, "a boolean");
            bool flag = item.get<bool>();
            if (key == "enable_cache")
            {
                update.enable_cache = flag;
            }
            else if (key == "enable_artifact_metadata")
            {
                update.enable_artifact_metadata = flag;
            }
            else
            {
                update.enable_artifact_visualization = flag;
            }
        }
        else if (key == "experiment_tracker" || key == "step_operator")
        {
            require_kind(item.is_string(), key, "a string");
            (key == "experiment_tracker" ? update.experiment_tracker : update.step_operator) =
                item.get<std::string>();
        }
        else if (key == "parameters" || key == "extra")
        {
            require_kind(item.is_object(), key, "an object");
            (key == "parameters" ? update.parameters : update.extra) = item;
        }
        else if (key == "settings")
        {
            require_kind(item.is_object(), key, "an object");
            std::map<std::string, Json> settings;
            for (auto s = item.begin(); s != item.end(); ++s)
            {
                settings[s.key()] = s.value();
            }
            update.settings = std::move(settings);
        }
        else if (key == "outputs")
        {
            require_kind(item.is_object(), key, "an object");
            OutputConfigurations outputs;
            for (auto o = item.begin(); o != item.end(); ++o)
            {
                require_kind(o.value().is_object(), key + "." + o.key(), "an object");
                PartialArtifactConfiguration output;
                for (auto f = o.value().begin(); f != o.value().end(); ++f)
                {
                    if (f.key() != "materializer_source")
                    {
                        throw StepDagError(
                            StepDagErrorCode::UnknownSetting,
                            "Unknown output configuration key '" + f.key() + "' for output '" + o.key() + "'");
                    }
                    output.materializer_source = parse_sources(f.key(), f.value());
                }
                outputs[o.key()] = std::move(output);
            }
            update.outputs = std::move(outputs);
        }
        else if (key == "failure_hook_source" || key == "success_hook_source")
        {
            require_kind(item.is_string(), key, "an import path");
            (key == "failure_hook_source" ? update.failure_hook_source : update.success_hook_source) =
                Source::from_import_path(item.get<std::string>());
        }
        else
        {
            throw StepDagError(
                StepDagErrorCode::UnknownSetting,
                "Unknown step configuration key '" + key + "'");
        }
    }
    return update;
}

// ============================================================================
// PartialStepConfiguration
// ============================================================================

bool operator==(const PartialStepConfiguration& lhs, const PartialStepConfiguration& rhs)
{
    return lhs.name == rhs.name && lhs.enable_cache == rhs.enable_cache &&
           lhs.enable_artifact_metadata == rhs.enable_artifact_metadata &&
           lhs.enable_artifact_visualization == rhs.enable_artifact_visualization &&
           lhs.experiment_tracker == rhs.experiment_tracker && lhs.step_operator == rhs.step_operator &&
           lhs.parameters == rhs.parameters && lhs.settings == rhs.settings && lhs.extra == rhs.extra &&
           lhs.failure_hook_source == rhs.failure_hook_source &&
           lhs.success_hook_source == rhs.success_hook_source && lhs.outputs == rhs.outputs &&
           lhs.caching_parameters == rhs.caching_parameters &&
           lhs.external_input_artifacts == rhs.external_input_artifacts;
}

// ============================================================================
// StepConfiguration
// ============================================================================

StepConfiguration::StepConfiguration(PartialStepConfiguration partial)
    : m_config(std::move(partial))
{
    for (const auto& [output_name, output] : m_config.outputs)
    {
        if (output.materializer_source.empty())
        {
            throw StepDagError(
                StepDagErrorCode::MaterializerRequired,
                "Output '" + output_name + "' of step '" + m_config.name +
                    "' has no materializer source");
        }
    }
}

// ============================================================================
// Merge
// ============================================================================

namespace
{

/// Key-by-key merge of two JSON objects; `overlay` wins on collision.
Json merge_objects(const Json& base, const Json& overlay)
{
    if (!base.is_object() || !overlay.is_object())
    {
        return overlay;
    }
    Json result = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it)
    {
        result[it.key()] = it.value();
    }
    return result;
}

template <typename T>
void replace_if_present(T& target, const std::optional<T>& value)
{
    if (value)
    {
        target = *value;
    }
}

template <typename T>
void replace_if_present(std::optional<T>& target, const std::optional<T>& value)
{
    if (value)
    {
        target = value;
    }
}

std::vector<std::string> keys_of(const std::map<std::string, Json>& settings)
{
    std::vector<std::string> keys;
    keys.reserve(settings.size());
    for (const auto& entry : settings)
    {
        keys.push_back(entry.first);
    }
    return keys;
}

} // namespace

PartialStepConfiguration update_configuration(const PartialStepConfiguration& base,
                                              const StepConfigurationUpdate& update,
                                              bool recursive)
{
    if (update.settings)
    {
        validate_setting_keys(keys_of(*update.settings));
    }

    PartialStepConfiguration result = base;

    replace_if_present(result.name, update.name);
    replace_if_present(result.enable_cache, update.enable_cache);
    replace_if_present(result.enable_artifact_metadata, update.enable_artifact_metadata);
    replace_if_present(result.enable_artifact_visualization, update.enable_artifact_visualization);
    replace_if_present(result.experiment_tracker, update.experiment_tracker);
    replace_if_present(result.step_operator, update.step_operator);
    replace_if_present(result.failure_hook_source, update.failure_hook_source);
    replace_if_present(result.success_hook_source, update.success_hook_source);

    if (!recursive)
    {
        replace_if_present(result.parameters, update.parameters);
        replace_if_present(result.settings, update.settings);
        replace_if_present(result.outputs, update.outputs);
        replace_if_present(result.extra, update.extra);
        return result;
    }

    if (update.parameters)
    {
        result.parameters = merge_objects(result.parameters, *update.parameters);
    }
    if (update.extra)
    {
        result.extra = merge_objects(result.extra, *update.extra);
    }
    if (update.settings)
    {
        for (const auto& [key, value] : *update.settings)
        {
            auto it = result.settings.find(key);
            if (it == result.settings.end())
            {
                result.settings.emplace(key, value);
            }
            else
            {
                it->second = merge_objects(it->second, value);
            }
        }
    }
    if (update.outputs)
    {
        for (const auto& [output_name, output] : *update.outputs)
        {
            PartialArtifactConfiguration& target = result.outputs[output_name];
            if (!output.materializer_source.empty())
            {
                target.materializer_source = output.materializer_source;
            }
        }
    }
    return result;
}

StepConfiguration update_configuration(const StepConfiguration& base,
                                       const StepConfigurationUpdate& update,
                                       bool recursive)
{
    return StepConfiguration(update_configuration(base.to_partial(), update, recursive));
}

// ============================================================================
// Serialization
// ============================================================================

namespace
{

template <typename T>
Json optional_to_json(const std::optional<T>& value)
{
    if (!value)
    {
        return nullptr;
    }
    return Json(*value);
}

} // namespace

void to_json(Json& j, const PartialArtifactConfiguration& config)
{
    j = Json{{"materializer_source", config.materializer_source}};
}

void to_json(Json& j, const PartialStepConfiguration& config)
{
    Json settings = Json::object();
    for (const auto& [key, value] : config.settings)
    {
        settings[key] = value;
    }
    Json outputs = Json::object();
    for (const auto& [output_name, output] : config.outputs)
    {
        outputs[output_name] = output;
    }
    j = Json{
        {"name", config.name},
        {"enable_cache", optional_to_json(config.enable_cache)},
        {"enable_artifact_metadata", optional_to_json(config.enable_artifact_metadata)},
        {"enable_artifact_visualization", optional_to_json(config.enable_artifact_visualization)},
        {"experiment_tracker", optional_to_json(config.experiment_tracker)},
        {"step_operator", optional_to_json(config.step_operator)},
        {"parameters", config.parameters},
        {"settings", settings},
        {"extra", config.extra},
        {"failure_hook_source", optional_to_json(config.failure_hook_source)},
        {"success_hook_source", optional_to_json(config.success_hook_source)},
        {"outputs", outputs},
        {"caching_parameters", config.caching_parameters},
        {"external_input_artifacts", config.external_input_artifacts},
    };
}

void to_json(Json& j, const StepConfiguration& config)
{
    to_json(j, config.to_partial());
}

} // namespace stepdag
