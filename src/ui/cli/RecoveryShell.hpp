#ifndef RESTORA_UI_CLI_RECOVERYSHELL_HPP
#define RESTORA_UI_CLI_RECOVERYSHELL_HPP

#include "restora/core/RecoveryConfig.hpp"
#include "restora/core/RecoveryManager.hpp"
#include "restora/crypto/ICryptoProvider.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace restora::ui::cli
{

constexpr int g_exitOk{ 0 };
constexpr int g_exitUsage{ 1 };
constexpr int g_exitRecoveryFailed{ 2 };

// Flags given on the command line; unset ones fall back to RESTORA_* variables.
struct ShellOverrides final
{
    std::optional<std::string> pepper;
    std::optional<std::string> masterKey;
    std::optional<std::string> keyDir;
    std::optional<std::int64_t> intervalSeconds;
    std::optional<std::int64_t> maxValues;
    std::optional<std::int64_t> maxPayload;
};

class RecoveryShell final
{
public:
    RecoveryShell(const restora::crypto::ICryptoProvider& crypto, std::istream& in, std::ostream& out,
                  restora::core::EnvReader env);

    // `args` excludes the program name. Returns the process exit code.
    int run(const std::vector<std::string>& args);

private:
    const restora::crypto::ICryptoProvider& m_crypto;
    std::istream& m_in;
    std::ostream& m_out;
    restora::core::EnvReader m_env;

    [[nodiscard]] std::unique_ptr<restora::core::RecoveryManager> makeManager(const ShellOverrides& overrides);
    [[nodiscard]] restora::core::RecoveryManager::TimePoint
    resolveTime(const restora::core::RecoveryManager& manager, std::optional<std::int64_t> unixSeconds) const;
    [[nodiscard]] std::string readInput();

    int doSign(const ShellOverrides& overrides, const std::string& salt, std::optional<std::int64_t> time);
    int doRecover(const ShellOverrides& overrides, const std::string& salt, std::optional<std::int64_t> time);
    int doBucket(const ShellOverrides& overrides, std::optional<std::int64_t> time);
};

} // namespace restora::ui::cli

#endif // RESTORA_UI_CLI_RECOVERYSHELL_HPP
