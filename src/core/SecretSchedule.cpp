#include "restora/core/SecretSchedule.hpp"

#include "BigEndian.hpp"
#include <array>
#include <span>
#include <stdexcept>
#include <utility>

namespace restora::core
{
namespace
{

constexpr std::uint8_t g_kOffsetMask{ 0x0FU };
constexpr std::uint32_t g_kTruncationMask{ 0x7FFFFFFFU };
constexpr std::uint32_t g_kCodeModulus{ 1'000'000U };

} // namespace

SecretSchedule::SecretSchedule(const crypto::ICryptoProvider& crypto, security::SecretBytes masterKey,
                               std::chrono::seconds interval)
    : m_crypto(&crypto), m_masterKey(std::move(masterKey)), m_interval(interval)
{
    if (m_interval.count() <= 0)
    {
        throw std::invalid_argument("SecretSchedule: interval must be positive");
    }
    if (m_masterKey.empty())
    {
        throw std::invalid_argument("SecretSchedule: master key must not be empty");
    }
}

std::uint64_t SecretSchedule::bucketAt(TimePoint t) const
{
    const auto sinceEpoch{ std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()) };
    if (sinceEpoch.count() < 0)
    {
        throw std::invalid_argument("SecretSchedule: timestamp precedes the Unix epoch");
    }
    return static_cast<std::uint64_t>(sinceEpoch.count()) / static_cast<std::uint64_t>(m_interval.count());
}

security::SecretBytes SecretSchedule::codeAt(TimePoint t) const
{
    return codeForBucket(bucketAt(t));
}

security::SecretBytes SecretSchedule::codeForBucket(std::uint64_t bucket) const
{
    std::array<std::byte, detail::g_kU64Bytes> counter{};
    detail::writeU64BE(counter, bucket);

    const auto tag{ m_crypto->hmacSha1(security::asBytes(m_masterKey), counter) };

    // RFC 4226 dynamic truncation.
    const std::size_t offset{ static_cast<std::size_t>(tag.back() & g_kOffsetMask) };
    const std::span<const std::uint8_t, detail::g_kU32Bytes> window{ tag.data() + offset, detail::g_kU32Bytes };
    std::uint32_t code{ (detail::readU32BE(window) & g_kTruncationMask) % g_kCodeModulus };

    security::SecretBytes out(g_rotatingCodeDigits, static_cast<std::uint8_t>('0'));
    for (std::size_t i{ g_rotatingCodeDigits }; i > 0U; --i)
    {
        out[i - 1U] = static_cast<std::uint8_t>('0' + (code % 10U));
        code /= 10U;
    }
    return out;
}

} // namespace restora::core
