/**
 * @file settings_keys.cpp
 */
#include "stepdag/config/settings_keys.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"

#include <algorithm>
#include <array>

namespace stepdag
{

namespace
{

constexpr std::array<const char*, 2> kGeneralKeys = {"docker", "resources"};

constexpr std::array<const char*, 12> kComponentTypes = {
    "alerter",
    "annotator",
    "artifact_store",
    "container_registry",
    "data_validator",
    "experiment_tracker",
    "feature_store",
    "image_builder",
    "model_deployer",
    "orchestrator",
    "secrets_manager",
    "step_operator",
};

bool is_flavor_name(const std::string& flavor)
{
    if (flavor.empty())
    {
        return false;
    }
    return std::all_of(flavor.begin(), flavor.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

} // namespace

bool is_general_setting_key(const std::string& key)
{
    return std::find(kGeneralKeys.begin(), kGeneralKeys.end(), key) != kGeneralKeys.end();
}

bool is_stack_component_setting_key(const std::string& key)
{
    size_t dot = key.find('.');
    std::string component_type = key.substr(0, dot);
    if (std::find(kComponentTypes.begin(), kComponentTypes.end(), component_type) == kComponentTypes.end())
    {
        return false;
    }
    if (dot == std::string::npos)
    {
        return true;
    }
    return is_flavor_name(key.substr(dot + 1));
}

bool is_valid_setting_key(const std::string& key)
{
    return is_general_setting_key(key) || is_stack_component_setting_key(key);
}

void validate_setting_keys(const std::vector<std::string>& keys)
{
    for (const auto& key : keys)
    {
        if (!is_valid_setting_key(key))
        {
            throw StepDagError(
                StepDagErrorCode::UnknownSetting,
                "Invalid setting key '" + key + "'. Setting keys must be one of "
                "the general keys (docker, resources) or a stack component key "
                "of the form '<component_type>' or '<component_type>.<flavor>'.");
        }
    }
}

} // namespace stepdag
