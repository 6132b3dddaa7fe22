#ifndef INCLUDE_RESTORA_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_RESTORA_SECURITY_SECUREEQUALS_HPP

#include "restora/security/SecretBytes.hpp"
#include <cstddef>
#include <span>
#include <string_view>

namespace restora::security
{

// Running time depends only on the lengths, never on where the inputs first differ.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff = static_cast<unsigned char>(diff | std::to_integer<unsigned char>(a[i] ^ b[i]));
    }
    return (diff == 0U);
}

[[nodiscard]] inline bool secureEquals(std::string_view a, std::string_view b) noexcept
{
    return secureEquals(std::as_bytes(std::span<const char>{ a.data(), a.size() }),
                        std::as_bytes(std::span<const char>{ b.data(), b.size() }));
}

[[nodiscard]] inline bool secureEquals(const SecretBytes& a, const SecretBytes& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace restora::security

#endif // INCLUDE_RESTORA_SECURITY_SECUREEQUALS_HPP
