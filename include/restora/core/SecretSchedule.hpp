#ifndef INCLUDE_RESTORA_CORE_SECRETSCHEDULE_HPP
#define INCLUDE_RESTORA_CORE_SECRETSCHEDULE_HPP

#include "restora/crypto/ICryptoProvider.hpp"
#include "restora/security/SecretBytes.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace restora::core
{

constexpr std::chrono::seconds g_defaultRotationInterval{ 14400 };
constexpr std::size_t g_rotatingCodeDigits{ 6U };

// RFC 6238 time-based one-time code (HMAC-SHA1, six digits) keyed by the raw master key bytes.
class SecretSchedule final
{
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // Throws std::invalid_argument for a non-positive interval or an empty key.
    SecretSchedule(const crypto::ICryptoProvider& crypto, security::SecretBytes masterKey,
                   std::chrono::seconds interval = g_defaultRotationInterval);

    // floor(unix seconds / interval). Pre-epoch instants throw std::invalid_argument.
    [[nodiscard]] std::uint64_t bucketAt(TimePoint t) const;

    // Zero-padded decimal code; identical for every instant of one bucket.
    [[nodiscard]] security::SecretBytes codeAt(TimePoint t) const;

    [[nodiscard]] security::SecretBytes codeForBucket(std::uint64_t bucket) const;

    [[nodiscard]] std::chrono::seconds interval() const noexcept
    {
        return m_interval;
    }

private:
    const crypto::ICryptoProvider* m_crypto;
    security::SecretBytes m_masterKey;
    std::chrono::seconds m_interval;
};

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_SECRETSCHEDULE_HPP
