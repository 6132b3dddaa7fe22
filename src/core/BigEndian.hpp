#ifndef RESTORA_SRC_CORE_BIGENDIAN_HPP
#define RESTORA_SRC_CORE_BIGENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace restora::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

inline void writeU64BE(std::span<std::byte, g_kU64Bytes> out, std::uint64_t v) noexcept
{
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint64_t shiftBits{ static_cast<std::uint64_t>(out.size() - 1U - i) * g_kBitsPerByte };
        out[i] = static_cast<std::byte>((v >> shiftBits) & g_kByteMaskU64);
    }
}

[[nodiscard]] inline std::uint32_t readU32BE(std::span<const std::uint8_t, g_kU32Bytes> in) noexcept
{
    std::uint32_t v{ 0U };
    for (const std::uint8_t b : in)
    {
        v = (v << static_cast<std::uint32_t>(g_kBitsPerByte)) | static_cast<std::uint32_t>(b);
    }
    return v;
}

} // namespace restora::core::detail

#endif // RESTORA_SRC_CORE_BIGENDIAN_HPP
