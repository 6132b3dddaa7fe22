#ifndef INCLUDE_RESTORA_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_RESTORA_CRYPTO_ICRYPTOPROVIDER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace restora::crypto
{

constexpr std::size_t g_sha256Bytes{ 32 };
constexpr std::size_t g_hmacSha1Bytes{ 20 };

using Sha256Digest = std::array<std::uint8_t, g_sha256Bytes>;
using HmacSha1Tag = std::array<std::uint8_t, g_hmacSha1Bytes>;

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // SHA-256 over the concatenation of all segments, in order, with no separators.
    // Backend failures throw std::runtime_error.
    [[nodiscard]] virtual Sha256Digest sha256(std::span<const std::span<const std::byte>> segments) const = 0;

    // HMAC-SHA1 as used by RFC 4226/6238 one-time codes.
    [[nodiscard]] virtual HmacSha1Tag hmacSha1(std::span<const std::byte> key,
                                               std::span<const std::byte> message) const = 0;
};

} // namespace restora::crypto

#endif // INCLUDE_RESTORA_CRYPTO_ICRYPTOPROVIDER_HPP
