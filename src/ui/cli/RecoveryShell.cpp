#include "RecoveryShell.hpp"

#include "restora/core/TokenWire.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <iterator>
#include <utility>
#include <variant>

namespace restora::ui::cli
{
namespace
{

using restora::core::RecoveryError;

// Keeps a system_clock time point representable on every standard library.
constexpr std::int64_t g_kMaxUnixSeconds{ 9'000'000'000 };
const CLI::Range g_kTimeRange{ std::int64_t{ 0 }, g_kMaxUnixSeconds };

[[nodiscard]] std::size_t toCount(std::int64_t value) noexcept
{
    return static_cast<std::size_t>(value);
}

} // namespace

RecoveryShell::RecoveryShell(const restora::crypto::ICryptoProvider& crypto, std::istream& in, std::ostream& out,
                             restora::core::EnvReader env)
    : m_crypto(crypto), m_in(in), m_out(out), m_env(std::move(env))
{
}

int RecoveryShell::run(const std::vector<std::string>& args)
{
    CLI::App app{ "Restora state recovery tool" };
    app.require_subcommand(1);

    ShellOverrides overrides{};
    app.add_option("--pepper", overrides.pepper, "Server pepper (RESTORA_PEPPER)");
    app.add_option("--master-key", overrides.masterKey, "Explicit master key (RESTORA_MASTER_KEY)");
    app.add_option("--key-dir", overrides.keyDir, "Derive the master key from this directory (RESTORA_KEY_DIR)");
    app.add_option("--interval", overrides.intervalSeconds, "Rotation interval in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-values", overrides.maxValues, "Maximum entries per batch")->check(CLI::PositiveNumber);
    app.add_option("--max-payload", overrides.maxPayload, "Maximum encoded bytes per value")
        ->check(CLI::PositiveNumber);

    std::string salt;
    std::optional<std::int64_t> time;
    int status{ g_exitOk };

    // SIGN
    auto* subSign = app.add_subcommand("sign", "Sign a JSON object of values read from stdin");
    subSign->add_option("--salt", salt, "Request context bound into every signature")->required();
    subSign->add_option("--time", time, "Unix seconds selecting the rotation bucket")->check(g_kTimeRange);
    subSign->callback([&]() { status = doSign(overrides, salt, time); });

    // RECOVER
    auto* subRecover = app.add_subcommand("recover", "Verify a token batch from stdin and print its values");
    subRecover->add_option("--salt", salt, "Request context the tokens were signed with")->required();
    subRecover->add_option("--time", time, "Unix seconds selecting the rotation bucket")->check(g_kTimeRange);
    subRecover->callback([&]() { status = doRecover(overrides, salt, time); });

    // BUCKET
    auto* subBucket = app.add_subcommand("bucket", "Print the rotation bucket index");
    subBucket->add_option("--time", time, "Unix seconds")->check(g_kTimeRange);
    subBucket->callback([&]() { status = doBucket(overrides, time); });

    try
    {
        std::vector<std::string> reversed{ args.rbegin(), args.rend() };
        app.parse(reversed);
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
        return g_exitOk;
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
        return g_exitUsage;
    }
    return status;
}

std::unique_ptr<restora::core::RecoveryManager> RecoveryShell::makeManager(const ShellOverrides& overrides)
{
    auto loaded{ restora::core::loadRecoveryOptionsFromEnv({}, m_env) };
    if (restora::core::isError(loaded))
    {
        m_out << "Error: invalid RESTORA_* environment value.\n";
        return nullptr;
    }
    auto options{ std::move(std::get<restora::core::RecoveryOptions>(loaded)) };

    if (overrides.pepper)
    {
        options.pepper = *overrides.pepper;
    }
    if (overrides.masterKey)
    {
        options.masterKey = restora::core::ExplicitKey{ *overrides.masterKey };
    }
    else if (overrides.keyDir)
    {
        options.masterKey = restora::core::DerivedKey{ *overrides.keyDir };
    }
    if (overrides.intervalSeconds)
    {
        options.interval = std::chrono::seconds{ *overrides.intervalSeconds };
    }
    if (overrides.maxValues)
    {
        options.maxValues = toCount(*overrides.maxValues);
    }
    if (overrides.maxPayload)
    {
        options.maxPayloadLength = toCount(*overrides.maxPayload);
    }

    auto created{ restora::core::RecoveryManager::create(m_crypto, {}, std::move(options)) };
    if (restora::core::isError(created))
    {
        m_out << "Error: " << restora::core::toString(std::get<RecoveryError>(created))
              << " (a pepper and a master key are required).\n";
        return nullptr;
    }
    return std::move(std::get<std::unique_ptr<restora::core::RecoveryManager>>(created));
}

restora::core::RecoveryManager::TimePoint RecoveryShell::resolveTime(const restora::core::RecoveryManager& manager,
                                                                     std::optional<std::int64_t> unixSeconds) const
{
    if (!unixSeconds)
    {
        return manager.now();
    }
    using TimePoint = restora::core::RecoveryManager::TimePoint;
    return TimePoint{ std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds{ *unixSeconds }) };
}

std::string RecoveryShell::readInput()
{
    return std::string{ std::istreambuf_iterator<char>{ m_in }, std::istreambuf_iterator<char>{} };
}

// --- Handlers ---

int RecoveryShell::doSign(const ShellOverrides& overrides, const std::string& salt, std::optional<std::int64_t> time)
{
    const auto manager{ makeManager(overrides) };
    if (!manager)
    {
        return g_exitUsage;
    }

    auto values{ restora::core::decodeValueMap(readInput()) };
    if (restora::core::isError(values))
    {
        m_out << "Error: input must be a JSON object of values.\n";
        return g_exitUsage;
    }

    auto serializer{ manager->spawnSerializer(salt, resolveTime(*manager, time)) };
    if (restora::core::isError(serializer))
    {
        m_out << "Error: " << restora::core::toString(std::get<RecoveryError>(serializer)) << "\n";
        return g_exitUsage;
    }

    const auto& signer{ std::get<restora::core::RecoverySerializer>(serializer) };
    auto tokens{ signer.serializeAll(std::get<restora::core::ValueMap>(values)) };
    if (restora::core::isError(tokens))
    {
        m_out << "Error: " << restora::core::toString(std::get<RecoveryError>(tokens)) << "\n";
        return g_exitUsage;
    }

    auto wire{ restora::core::encodeTokenMap(std::get<restora::core::TokenMap>(tokens)) };
    if (restora::core::isError(wire))
    {
        m_out << "Error: " << restora::core::toString(std::get<RecoveryError>(wire)) << "\n";
        return g_exitUsage;
    }
    m_out << std::get<std::string>(wire) << "\n";
    return g_exitOk;
}

int RecoveryShell::doRecover(const ShellOverrides& overrides, const std::string& salt,
                             std::optional<std::int64_t> time)
{
    const auto manager{ makeManager(overrides) };
    if (!manager)
    {
        return g_exitUsage;
    }

    auto serializer{ manager->spawnSerializer(salt, resolveTime(*manager, time)) };
    if (restora::core::isError(serializer))
    {
        m_out << "Error: " << restora::core::toString(std::get<RecoveryError>(serializer)) << "\n";
        return g_exitUsage;
    }

    const auto fail{ [this](RecoveryError error) {
        m_out << "Error: state could not be recovered (" << restora::core::toString(error) << ")\n";
        return g_exitRecoveryFailed;
    } };

    auto tokens{ restora::core::decodeTokenMap(readInput()) };
    if (restora::core::isError(tokens))
    {
        return fail(std::get<RecoveryError>(tokens));
    }

    const auto& verifier{ std::get<restora::core::RecoverySerializer>(serializer) };
    auto values{ verifier.deserializeAll(std::get<restora::core::TokenMap>(tokens)) };
    if (restora::core::isError(values))
    {
        return fail(std::get<RecoveryError>(values));
    }

    auto text{ restora::core::encodeValueMap(std::get<restora::core::ValueMap>(values)) };
    if (restora::core::isError(text))
    {
        return fail(std::get<RecoveryError>(text));
    }
    m_out << std::get<std::string>(text) << "\n";
    return g_exitOk;
}

int RecoveryShell::doBucket(const ShellOverrides& overrides, std::optional<std::int64_t> time)
{
    const auto manager{ makeManager(overrides) };
    if (!manager)
    {
        return g_exitUsage;
    }
    m_out << manager->schedule().bucketAt(resolveTime(*manager, time)) << "\n";
    return g_exitOk;
}

} // namespace restora::ui::cli
