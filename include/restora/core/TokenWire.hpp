#ifndef INCLUDE_RESTORA_CORE_TOKENWIRE_HPP
#define INCLUDE_RESTORA_CORE_TOKENWIRE_HPP

#include "restora/core/RecoveryError.hpp"
#include "restora/core/RecoverySerializer.hpp"
#include <string>
#include <string_view>

namespace restora::core
{

// {"name": ["typeId", "payload", "signature"], ...}. UnencodableValue for names that are not UTF-8.
[[nodiscard]] RecoveryResult<std::string> encodeTokenMap(const TokenMap& tokens);

// MalformedToken for anything but an object of three-string arrays.
[[nodiscard]] RecoveryResult<TokenMap> decodeTokenMap(std::string_view text);

// Plain JSON views of a value bag; domain objects are not representable here.
[[nodiscard]] RecoveryResult<std::string> encodeValueMap(const ValueMap& values);
[[nodiscard]] RecoveryResult<ValueMap> decodeValueMap(std::string_view text);

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_TOKENWIRE_HPP
