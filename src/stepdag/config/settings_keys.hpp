/**
 * @file settings_keys.hpp
 * @brief Validation of the recognized settings key namespace.
 */
#pragma once
#include "stepdag/common/common.hpp"

namespace stepdag
{

/**
 * @brief Check whether a key is a general settings key (`docker`, `resources`).
 */
bool is_general_setting_key(const std::string& key);

/**
 * @brief Check whether a key addresses a stack component.
 *
 * @details
 * Valid forms are `<component_type>` and `<component_type>.<flavor>`, where
 * the flavor consists of lowercase letters, digits and underscores.
 */
bool is_stack_component_setting_key(const std::string& key);

/**
 * @brief Check whether a key belongs to the recognized namespace.
 */
bool is_valid_setting_key(const std::string& key);

/**
 * @brief Validate all keys of a settings mapping.
 * @throws StepDagError with `UnknownSetting` naming the first invalid key.
 */
void validate_setting_keys(const std::vector<std::string>& keys);

} // namespace stepdag
