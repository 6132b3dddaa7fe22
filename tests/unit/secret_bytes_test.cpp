#include "restora/security/SecretBytes.hpp"
#include <array>
#include <cstddef>
#include <gtest/gtest.h>
#include <span>

TEST(SecretBytes, FromStringKeepsBytes)
{
    const auto bytes{ restora::security::secretBytesFrom("k\xffz") };

    ASSERT_EQ(bytes.size(), 3U);
    EXPECT_EQ(bytes[0], 'k');
    EXPECT_EQ(bytes[1], 0xFFU);
    EXPECT_EQ(restora::security::asStringView(bytes), "k\xffz");
}

TEST(SecretBytes, AsStringViewOfEmptyIsEmpty)
{
    const restora::security::SecretBytes empty{};

    EXPECT_TRUE(restora::security::asStringView(empty).empty());
    EXPECT_TRUE(restora::security::asBytes(empty).empty());
}

TEST(SecretBytes, SecureReleaseEmptiesAndFreesStorage)
{
    auto bytes{ restora::security::secretBytesFrom("master-key") };

    restora::security::secureRelease(bytes);

    EXPECT_TRUE(bytes.empty());
    EXPECT_EQ(bytes.capacity(), 0U);
}

TEST(SecretBytes, SecureWipeZeroesBuffer)
{
    std::array<std::byte, 8> buffer{};
    buffer.fill(std::byte{ 0xAB });

    restora::security::secureWipe(buffer);

    for (const std::byte b : buffer)
    {
        EXPECT_EQ(b, std::byte{ 0 });
    }
}

TEST(WipingAllocator, ZeroCountAllocationReturnsNull)
{
    restora::security::WipingAllocator<std::uint8_t> allocator{};

    EXPECT_EQ(allocator.allocate(0U), nullptr);
}
