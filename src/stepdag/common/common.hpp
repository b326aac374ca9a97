/**
 * @file common.hpp
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace stepdag
{

/// JSON value type used for parameters, settings and extra metadata.
using Json = nlohmann::json;

/// Identifier of a persisted artifact (UUID string).
using ArtifactId = std::string;

/// Identifier of a step invocation, unique within one pipeline.
using InvocationId = std::string;

} // namespace stepdag
