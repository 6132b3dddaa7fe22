#ifndef INCLUDE_RESTORA_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_RESTORA_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "restora/crypto/ICryptoProvider.hpp"
#include <memory>

namespace restora::crypto::providers
{

// Throws std::runtime_error when the default OpenSSL provider lacks SHA256 or HMAC.
[[nodiscard]] std::unique_ptr<restora::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace restora::crypto::providers

#endif // INCLUDE_RESTORA_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
