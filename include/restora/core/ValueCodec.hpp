#ifndef INCLUDE_RESTORA_CORE_VALUECODEC_HPP
#define INCLUDE_RESTORA_CORE_VALUECODEC_HPP

#include "restora/core/RecoveryError.hpp"
#include "restora/core/Value.hpp"
#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>

namespace restora::core
{

constexpr std::size_t g_maxNestingDepth{ 256U };

// Returns std::nullopt when the object has no JSON form. May throw; callers map exceptions to errors.
using ObjectEncoder = std::function<std::optional<nlohmann::json>(const RecoverableObject&)>;

// Canonical structured form: scalars, arrays, string-keyed objects. UUIDs, decimals and calendar values
// become their canonical strings; domain objects are handed to `encodeObject`.
[[nodiscard]] RecoveryResult<nlohmann::json> toJson(const Value& value, const ObjectEncoder& encodeObject);

// Compact serialization. Strings that are not valid UTF-8 yield UnencodableValue.
[[nodiscard]] RecoveryResult<std::string> dumpCanonical(const nlohmann::json& json);

[[nodiscard]] RecoveryResult<nlohmann::json> parseCanonical(std::span<const std::byte> bytes) noexcept;

// Untyped conversion: arrays become List, objects become Mapping.
[[nodiscard]] RecoveryResult<Value> fromJson(const nlohmann::json& json);

// Type-directed conversion for the built-in kinds. A JSON shape that does not fit `kind`
// yields ReconstructionError.
[[nodiscard]] RecoveryResult<Value> reconstructBuiltin(ValueKind kind, const nlohmann::json& json);

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_VALUECODEC_HPP
