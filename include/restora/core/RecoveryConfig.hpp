#ifndef INCLUDE_RESTORA_CORE_RECOVERYCONFIG_HPP
#define INCLUDE_RESTORA_CORE_RECOVERYCONFIG_HPP

#include "restora/core/MasterKey.hpp"
#include "restora/core/RecoveryError.hpp"
#include "restora/core/SecretSchedule.hpp"
#include "restora/core/Value.hpp"
#include "restora/core/ValueCodec.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace restora::core
{

constexpr std::size_t g_defaultMaxValues{ 256U };
constexpr std::size_t g_defaultMaxPayloadLength{ 40000U };

// Replaces the registered reconstruction for one type name. May throw; the serializer reports
// ReconstructionError.
using ValueDecoder = std::function<Value(const nlohmann::json&)>;
using DecoderMap = std::map<std::string, ValueDecoder, std::less<>>;

struct RecoveryOptions final
{
    std::string pepper;
    MasterKeySource masterKey{ DerivedKey{} };
    std::chrono::seconds interval{ g_defaultRotationInterval };
    std::size_t maxValues{ g_defaultMaxValues };
    // Bound on the canonical JSON bytes of one value.
    std::size_t maxPayloadLength{ g_defaultMaxPayloadLength };
    ObjectEncoder defaultEncoder;
    DecoderMap decoders;
};

using EnvReader = std::function<std::optional<std::string>(std::string_view)>;

// std::getenv; unset variables map to std::nullopt.
[[nodiscard]] std::optional<std::string> readEnv(std::string_view name);

// Starts from `base` and overrides whatever RESTORA_* variables are set. RESTORA_MASTER_KEY takes
// precedence over RESTORA_KEY_DIR. Malformed numbers yield ConfigurationError.
[[nodiscard]] RecoveryResult<RecoveryOptions> loadRecoveryOptionsFromEnv(RecoveryOptions base = {},
                                                                          const EnvReader& env = readEnv);

// Strict unsigned decimal; no sign, no whitespace, no trailing characters.
[[nodiscard]] std::optional<std::size_t> parseCount(std::string_view text) noexcept;

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_RECOVERYCONFIG_HPP
