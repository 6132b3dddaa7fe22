#include "restora/core/RecoveryConfig.hpp"

#include <charconv>
#include <cstdlib>
#include <utility>

namespace restora::core
{
namespace
{

constexpr std::string_view g_kEnvPepper{ "RESTORA_PEPPER" };
constexpr std::string_view g_kEnvMasterKey{ "RESTORA_MASTER_KEY" };
constexpr std::string_view g_kEnvKeyDir{ "RESTORA_KEY_DIR" };
constexpr std::string_view g_kEnvInterval{ "RESTORA_INTERVAL_SECONDS" };
constexpr std::string_view g_kEnvMaxValues{ "RESTORA_MAX_VALUES" };
constexpr std::string_view g_kEnvMaxPayload{ "RESTORA_MAX_PAYLOAD_BYTES" };

} // namespace

std::optional<std::string> readEnv(std::string_view name)
{
    const std::string key{ name };
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char* value{ std::getenv(key.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
}

std::optional<std::size_t> parseCount(std::string_view text) noexcept
{
    if (text.empty())
    {
        return std::nullopt;
    }
    std::size_t out{};
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(text.data(), last, out) };
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return out;
}

RecoveryResult<RecoveryOptions> loadRecoveryOptionsFromEnv(RecoveryOptions base, const EnvReader& env)
{
    if (auto pepper{ env(g_kEnvPepper) })
    {
        base.pepper = std::move(*pepper);
    }

    if (auto key{ env(g_kEnvMasterKey) })
    {
        base.masterKey = ExplicitKey{ std::move(*key) };
    }
    else if (auto dir{ env(g_kEnvKeyDir) })
    {
        base.masterKey = DerivedKey{ std::filesystem::path{ std::move(*dir) } };
    }

    if (const auto text{ env(g_kEnvInterval) })
    {
        const auto seconds{ parseCount(*text) };
        if (!seconds)
        {
            return RecoveryError::ConfigurationError;
        }
        base.interval = std::chrono::seconds{ static_cast<std::chrono::seconds::rep>(*seconds) };
    }

    if (const auto text{ env(g_kEnvMaxValues) })
    {
        const auto count{ parseCount(*text) };
        if (!count)
        {
            return RecoveryError::ConfigurationError;
        }
        base.maxValues = *count;
    }

    if (const auto text{ env(g_kEnvMaxPayload) })
    {
        const auto count{ parseCount(*text) };
        if (!count)
        {
            return RecoveryError::ConfigurationError;
        }
        base.maxPayloadLength = *count;
    }

    return base;
}

} // namespace restora::core
