#include "restora/security/SecretBytes.hpp"

#include <openssl/crypto.h>

namespace restora::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
    ::OPENSSL_cleanse(bytes.data(), bytes.size());
}

} // namespace restora::security
