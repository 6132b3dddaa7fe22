#ifndef INCLUDE_RESTORA_CORE_UUID_HPP
#define INCLUDE_RESTORA_CORE_UUID_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace restora::core
{

constexpr std::size_t g_uuidBytes{ 16U };

class Uuid final
{
public:
    Uuid() noexcept = default;
    explicit Uuid(const std::array<std::uint8_t, g_uuidBytes>& bytes) noexcept : m_bytes{ bytes }
    {
    }

    // Accepts 32 hex digits with optional hyphens, surrounding braces and a "urn:uuid:" prefix.
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view text) noexcept;

    // Lowercase 8-4-4-4-12 form.
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] const std::array<std::uint8_t, g_uuidBytes>& bytes() const noexcept
    {
        return m_bytes;
    }

    bool operator==(const Uuid&) const noexcept = default;

private:
    std::array<std::uint8_t, g_uuidBytes> m_bytes{};
};

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_UUID_HPP
