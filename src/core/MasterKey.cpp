#include "restora/core/MasterKey.hpp"

#include "restora/core/TransportCodec.hpp"
#include <algorithm>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>

namespace restora::core
{
namespace
{

[[nodiscard]] bool changeTimeSeconds(const std::filesystem::path& path, std::int64_t& out) noexcept
{
#if defined(_WIN32)
    struct _stat64 st{};
    if (::_wstat64(path.c_str(), &st) != 0)
    {
        return false;
    }
#else
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
    {
        return false;
    }
#endif
    out = static_cast<std::int64_t>(st.st_ctime);
    return true;
}

} // namespace

std::filesystem::path defaultFingerprintSource()
{
    std::error_code ec{};
#if !defined(_WIN32)
    const auto self{ std::filesystem::read_symlink("/proc/self/exe", ec) };
    if (!ec && self.has_parent_path())
    {
        return self.parent_path();
    }
    ec.clear();
#endif
    auto cwd{ std::filesystem::current_path(ec) };
    if (ec)
    {
        return std::filesystem::path{ "." };
    }
    return cwd;
}

RecoveryResult<security::SecretBytes> deriveInstallationKey(const crypto::ICryptoProvider& crypto,
                                                            const std::filesystem::path& directory)
{
    std::error_code ec{};
    std::filesystem::directory_iterator it{ directory, ec };
    if (ec)
    {
        return RecoveryError::ConfigurationError;
    }

    std::vector<std::string> fingerprints{};
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec))
    {
        if (ec)
        {
            return RecoveryError::ConfigurationError;
        }
        std::int64_t ctime{};
        if (!changeTimeSeconds(it->path(), ctime))
        {
            // Entries can vanish between listing and stat.
            continue;
        }
        fingerprints.push_back(it->path().filename().string() + std::to_string(ctime));
    }
    if (ec)
    {
        return RecoveryError::ConfigurationError;
    }
    std::ranges::sort(fingerprints);

    std::vector<std::span<const std::byte>> segments{};
    segments.reserve(fingerprints.size());
    for (const auto& fp : fingerprints)
    {
        segments.push_back(std::as_bytes(std::span{ fp }));
    }

    try
    {
        const auto digest{ crypto.sha256(segments) };
        return security::secretBytesFrom(toHex(digest));
    }
    catch (const std::exception&)
    {
        return RecoveryError::CryptoError;
    }
}

RecoveryResult<security::SecretBytes> resolveMasterKey(const crypto::ICryptoProvider& crypto,
                                                       const MasterKeySource& source)
{
    if (const auto* explicitKey{ std::get_if<ExplicitKey>(&source) })
    {
        if (explicitKey->bytes.empty())
        {
            return RecoveryError::ConfigurationError;
        }
        return security::secretBytesFrom(explicitKey->bytes);
    }

    const auto& derived{ std::get<DerivedKey>(source) };
    const auto directory{ derived.fingerprintSource.empty() ? defaultFingerprintSource()
                                                            : derived.fingerprintSource };
    return deriveInstallationKey(crypto, directory);
}

} // namespace restora::core
