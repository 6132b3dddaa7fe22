#ifndef INCLUDE_RESTORA_CORE_TRANSPORTCODEC_HPP
#define INCLUDE_RESTORA_CORE_TRANSPORTCODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace restora::core
{

// RFC 4648 section 5 alphabet ("-" and "_"), always padded with "=".
[[nodiscard]] std::string encodeBase64Url(std::span<const std::byte> bytes);

// Strict: rejects standard-alphabet characters, whitespace, missing or misplaced padding and non-zero
// trailing bits.
[[nodiscard]] std::optional<std::vector<std::byte>> decodeBase64Url(std::string_view text);

[[nodiscard]] constexpr std::size_t base64UrlEncodedLength(std::size_t rawBytes) noexcept
{
    return ((rawBytes + 2U) / 3U) * 4U;
}

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_TRANSPORTCODEC_HPP
