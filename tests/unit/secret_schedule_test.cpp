#include "restora/core/SecretSchedule.hpp"
#include "restora/crypto/providers/OpenSslProviderFactory.hpp"
#include "test_utils/RecoveryScenarios.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace
{

using restora::core::SecretSchedule;
using restora::test_utils::unixTime;

class SecretScheduleTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = restora::crypto::providers::makeOpenSslCryptoProvider();
    }

    // RFC 6238 appendix B: SHA1 seed, 30 second step, truncated to six digits.
    [[nodiscard]] SecretSchedule rfcSchedule() const
    {
        return SecretSchedule{ *m_crypto, restora::security::secretBytesFrom("12345678901234567890"),
                               std::chrono::seconds{ 30 } };
    }

    [[nodiscard]] static std::string text(const restora::security::SecretBytes& code)
    {
        return std::string{ restora::security::asStringView(code) };
    }

    std::unique_ptr<restora::crypto::ICryptoProvider> m_crypto; // NOLINT
};

} // namespace

TEST_F(SecretScheduleTest, MatchesRfc6238Vectors)
{
    const auto schedule{ rfcSchedule() };

    EXPECT_EQ(text(schedule.codeAt(unixTime(59))), "287082");
    EXPECT_EQ(text(schedule.codeAt(unixTime(1111111109))), "081804");
    EXPECT_EQ(text(schedule.codeAt(unixTime(1111111111))), "050471");
    EXPECT_EQ(text(schedule.codeAt(unixTime(1234567890))), "005924");
    EXPECT_EQ(text(schedule.codeAt(unixTime(2000000000))), "279037");
}

TEST_F(SecretScheduleTest, SameBucketSameCode)
{
    const SecretSchedule schedule{ *m_crypto, restora::security::secretBytesFrom("k") };

    EXPECT_EQ(schedule.bucketAt(unixTime(0)), 0U);
    EXPECT_EQ(schedule.bucketAt(unixTime(14399)), 0U);
    EXPECT_EQ(schedule.bucketAt(unixTime(14400)), 1U);
    EXPECT_EQ(text(schedule.codeAt(unixTime(1000))), text(schedule.codeAt(unixTime(14399))));
}

TEST_F(SecretScheduleTest, AdjacentBucketsDiffer)
{
    const SecretSchedule schedule{ *m_crypto, restora::security::secretBytesFrom("k") };

    EXPECT_NE(text(schedule.codeAt(unixTime(1000))), text(schedule.codeAt(unixTime(1000 + 14400))));
}

TEST_F(SecretScheduleTest, CodeIsSixDigits)
{
    const SecretSchedule schedule{ *m_crypto, restora::security::secretBytesFrom("k") };

    const auto code{ text(schedule.codeAt(unixTime(1700000000))) };

    ASSERT_EQ(code.size(), restora::core::g_rotatingCodeDigits);
    for (const char c : code)
    {
        EXPECT_TRUE(c >= '0' && c <= '9');
    }
}

TEST_F(SecretScheduleTest, DifferentKeysGiveDifferentCodes)
{
    const SecretSchedule a{ *m_crypto, restora::security::secretBytesFrom("key-a") };
    const SecretSchedule b{ *m_crypto, restora::security::secretBytesFrom("key-b") };

    EXPECT_NE(text(a.codeAt(unixTime(1000))), text(b.codeAt(unixTime(1000))));
}

TEST_F(SecretScheduleTest, RejectsPreEpochTimestamp)
{
    const SecretSchedule schedule{ *m_crypto, restora::security::secretBytesFrom("k") };

    EXPECT_THROW((void)schedule.bucketAt(unixTime(-1)), std::invalid_argument);
}

TEST_F(SecretScheduleTest, RejectsInvalidConstruction)
{
    EXPECT_THROW((SecretSchedule{ *m_crypto, restora::security::secretBytesFrom("k"), std::chrono::seconds{ 0 } }),
                 std::invalid_argument);
    EXPECT_THROW((SecretSchedule{ *m_crypto, restora::security::SecretBytes{} }), std::invalid_argument);
}
