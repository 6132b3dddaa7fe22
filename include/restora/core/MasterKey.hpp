#ifndef INCLUDE_RESTORA_CORE_MASTERKEY_HPP
#define INCLUDE_RESTORA_CORE_MASTERKEY_HPP

#include "restora/core/RecoveryError.hpp"
#include "restora/crypto/ICryptoProvider.hpp"
#include "restora/security/SecretBytes.hpp"
#include <filesystem>
#include <string>
#include <variant>

namespace restora::core
{

struct ExplicitKey final
{
    std::string bytes;
};

// Derives the key from the names and change times of the entries of `fingerprintSource`.
// Weak: anyone able to list that directory can rebuild the key. Single-host development only.
struct DerivedKey final
{
    // Empty selects defaultFingerprintSource().
    std::filesystem::path fingerprintSource;
};

using MasterKeySource = std::variant<ExplicitKey, DerivedKey>;

// Directory holding the running executable, or the working directory when that cannot be determined.
[[nodiscard]] std::filesystem::path defaultFingerprintSource();

// Lowercase hex SHA-256 over name + ctime seconds of every entry, in name order.
[[nodiscard]] RecoveryResult<security::SecretBytes> deriveInstallationKey(const crypto::ICryptoProvider& crypto,
                                                                          const std::filesystem::path& directory);

// ConfigurationError for an empty explicit key or an unreadable fingerprint directory.
[[nodiscard]] RecoveryResult<security::SecretBytes> resolveMasterKey(const crypto::ICryptoProvider& crypto,
                                                                     const MasterKeySource& source);

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_MASTERKEY_HPP
