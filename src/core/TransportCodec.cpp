#include "restora/core/TransportCodec.hpp"

#include <algorithm>
#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace restora::core
{
namespace
{

[[nodiscard]] bool isUrlSafeSymbol(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

std::string encodeBase64Url(std::span<const std::byte> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    // EVP_EncodeBlock takes an int length.
    constexpr std::size_t kMaxInput{ (static_cast<std::size_t>(std::numeric_limits<int>::max()) / 4U) * 3U };
    if (bytes.size() > kMaxInput)
    {
        throw std::invalid_argument("encodeBase64Url: input too large");
    }

    std::string out(base64UrlEncodedLength(bytes.size()) + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                       reinterpret_cast<const unsigned char*>(bytes.data()),
                                       static_cast<int>(bytes.size())) };
    if (written < 0)
    {
        throw std::runtime_error("encodeBase64Url: EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(written));

    std::ranges::replace(out, '+', '-');
    std::ranges::replace(out, '/', '_');
    return out;
}

std::optional<std::vector<std::byte>> decodeBase64Url(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<std::byte>{};
    }
    if (text.size() % 4U != 0U || text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }

    std::size_t padding{};
    while (padding < 2U && text[text.size() - 1U - padding] == '=')
    {
        ++padding;
    }

    std::string standard{};
    standard.reserve(text.size());
    for (std::size_t i{}; i < text.size() - padding; ++i)
    {
        const char c{ text[i] };
        if (!isUrlSafeSymbol(c))
        {
            return std::nullopt;
        }
        standard.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
    }
    standard.append(padding, '=');

    std::vector<std::byte> out((standard.size() / 4U) * 3U);
    const int decoded{ EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                       reinterpret_cast<const unsigned char*>(standard.data()),
                                       static_cast<int>(standard.size())) };
    if (decoded < 0 || static_cast<std::size_t>(decoded) != out.size())
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding.
    out.resize(out.size() - padding);

    // Unused trailing bits must be zero, so each byte string has exactly one accepted spelling.
    if (encodeBase64Url(out) != text)
    {
        return std::nullopt;
    }
    return out;
}

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

} // namespace restora::core
