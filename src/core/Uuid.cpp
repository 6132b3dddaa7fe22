#include "restora/core/Uuid.hpp"

#include <cstddef>

namespace restora::core
{
namespace
{

constexpr std::string_view g_kUrnPrefix{ "urn:uuid:" };
constexpr std::size_t g_kHexDigits{ g_uuidBytes * 2U };

[[nodiscard]] std::optional<std::uint8_t> hexNibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

} // namespace

std::optional<Uuid> Uuid::parse(std::string_view text) noexcept
{
    if (text.starts_with(g_kUrnPrefix))
    {
        text.remove_prefix(g_kUrnPrefix.size());
    }
    if (text.starts_with('{') && text.ends_with('}'))
    {
        text.remove_prefix(1U);
        text.remove_suffix(1U);
    }

    std::array<std::uint8_t, g_uuidBytes> bytes{};
    std::size_t digits{};
    for (const char c : text)
    {
        if (c == '-')
        {
            continue;
        }
        const auto nibble{ hexNibble(c) };
        if (!nibble || digits >= g_kHexDigits)
        {
            return std::nullopt;
        }
        const std::size_t index{ digits / 2U };
        bytes[index] = static_cast<std::uint8_t>((digits % 2U == 0U) ? (*nibble << 4U) : (bytes[index] | *nibble));
        ++digits;
    }

    if (digits != g_kHexDigits)
    {
        return std::nullopt;
    }
    return Uuid{ bytes };
}

std::string Uuid::toString() const
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(g_kHexDigits + 4U);
    for (std::size_t i{}; i < m_bytes.size(); ++i)
    {
        if (i == 4U || i == 6U || i == 8U || i == 10U)
        {
            out.push_back('-');
        }
        out.push_back(kHex[(m_bytes[i] >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[m_bytes[i] & kNibbleMask]);
    }
    return out;
}

} // namespace restora::core
