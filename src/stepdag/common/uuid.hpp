/**
 * @file uuid.hpp
 * @brief Random identifiers for artifact names and records.
 */
#pragma once
#include "stepdag/common/common.hpp"

namespace stepdag
{

/**
 * @brief Generate a random (version 4) UUID string.
 */
std::string generate_uuid();

} // namespace stepdag
