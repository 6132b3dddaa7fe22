#include "restora/crypto/providers/OpenSslProviderFactory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <span>
#include <stdexcept>

namespace restora::crypto::providers
{
namespace
{

using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

EvpMdPtr fetchSha256()
{
    if (EVP_MD * md{ EVP_MD_fetch(nullptr, "SHA256", nullptr) }; md != nullptr)
    {
        return EvpMdPtr{ md, &EVP_MD_free };
    }
    throw std::runtime_error("OpenSslCryptoProvider: SHA256 not available");
}

EvpMacPtr fetchHmac()
{
    if (EVP_MAC * mac{ EVP_MAC_fetch(nullptr, "HMAC", nullptr) }; mac != nullptr)
    {
        return EvpMacPtr{ mac, &EVP_MAC_free };
    }
    throw std::runtime_error("OpenSslCryptoProvider: HMAC not available");
}

[[nodiscard]] const unsigned char* asUChar(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const unsigned char*>(s.data());
}

class OpenSslCryptoProvider final : public restora::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_sha256{ fetchSha256() }, m_hmac{ fetchHmac() }
    {
    }

    [[nodiscard]] restora::crypto::Sha256Digest
    sha256(std::span<const std::span<const std::byte>> segments) const override
    {
        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex2(ctx.get(), m_sha256.get(), nullptr) != 1)
        {
            throw std::runtime_error("sha256: EVP_DigestInit_ex2 failed");
        }

        for (const auto segment : segments)
        {
            if (segment.empty())
            {
                continue;
            }
            if (EVP_DigestUpdate(ctx.get(), segment.data(), segment.size()) != 1)
            {
                throw std::runtime_error("sha256: EVP_DigestUpdate failed");
            }
        }

        restora::crypto::Sha256Digest out{};
        unsigned int written{ 0U };
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
        {
            throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
        }
        return out;
    }

    [[nodiscard]] restora::crypto::HmacSha1Tag hmacSha1(std::span<const std::byte> key,
                                                        std::span<const std::byte> message) const override
    {
        if (key.empty())
        {
            throw std::invalid_argument("hmacSha1: empty key");
        }

        EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(m_hmac.get()), &EVP_MAC_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("hmacSha1: EVP_MAC_CTX_new failed");
        }

        // OSSL_PARAM wants a mutable char* even for read-only strings.
        std::array<char, 5> digestName{ 'S', 'H', 'A', '1', '\0' };
        const std::array<OSSL_PARAM, 2> params{
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestName.data(), 0),
            OSSL_PARAM_construct_end(),
        };

        if (EVP_MAC_init(ctx.get(), asUChar(key), key.size(), params.data()) != 1)
        {
            throw std::runtime_error("hmacSha1: EVP_MAC_init failed");
        }
        if (!message.empty() && EVP_MAC_update(ctx.get(), asUChar(message), message.size()) != 1)
        {
            throw std::runtime_error("hmacSha1: EVP_MAC_update failed");
        }

        restora::crypto::HmacSha1Tag out{};
        std::size_t written{ out.size() };
        if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size())
        {
            throw std::runtime_error("hmacSha1: EVP_MAC_final failed");
        }
        return out;
    }

private:
    EvpMdPtr m_sha256{ nullptr, &EVP_MD_free };
    EvpMacPtr m_hmac{ nullptr, &EVP_MAC_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<restora::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace restora::crypto::providers
