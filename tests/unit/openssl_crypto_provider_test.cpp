#include "restora/core/TransportCodec.hpp"
#include "restora/crypto/providers/OpenSslProviderFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include <array>
#include <gtest/gtest.h>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace
{

using restora::test_utils::bytesOf;

} // namespace

TEST(OpenSslCryptoProvider, Sha256MatchesFips180Vector)
{
    auto crypto{ restora::crypto::providers::makeOpenSslCryptoProvider() };
    const std::array<std::span<const std::byte>, 1> segments{ bytesOf("abc") };

    const auto digest{ crypto->sha256(segments) };

    EXPECT_EQ(restora::core::toHex(digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(OpenSslCryptoProvider, Sha256OfNoSegmentsIsEmptyStringDigest)
{
    auto crypto{ restora::crypto::providers::makeOpenSslCryptoProvider() };

    const auto digest{ crypto->sha256({}) };

    EXPECT_EQ(restora::core::toHex(digest), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(OpenSslCryptoProvider, Sha256SegmentsHashAsConcatenation)
{
    auto crypto{ restora::crypto::providers::makeOpenSslCryptoProvider() };
    const std::array<std::span<const std::byte>, 3> split{ bytesOf("a"), bytesOf(""), bytesOf("bc") };
    const std::array<std::span<const std::byte>, 1> whole{ bytesOf("abc") };

    EXPECT_EQ(crypto->sha256(split), crypto->sha256(whole));
}

TEST(OpenSslCryptoProvider, HmacSha1MatchesRfc2202Vector)
{
    auto crypto{ restora::crypto::providers::makeOpenSslCryptoProvider() };
    const std::vector<std::byte> key(20U, std::byte{ 0x0b });

    const auto tag{ crypto->hmacSha1(key, bytesOf("Hi There")) };

    EXPECT_EQ(restora::core::toHex(tag), "b617318655057264e28bc0b6fb378c8ef146be00");
}

TEST(OpenSslCryptoProvider, HmacSha1Rfc2202ShortKey)
{
    auto crypto{ restora::crypto::providers::makeOpenSslCryptoProvider() };

    const auto tag{ crypto->hmacSha1(bytesOf("Jefe"), bytesOf("what do ya want for nothing?")) };

    EXPECT_EQ(restora::core::toHex(tag), "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
}

TEST(OpenSslCryptoProvider, HmacSha1RejectsEmptyKey)
{
    auto crypto{ restora::crypto::providers::makeOpenSslCryptoProvider() };

    EXPECT_THROW((void)crypto->hmacSha1({}, bytesOf("message")), std::invalid_argument);
}
