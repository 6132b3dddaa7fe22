#include "restora/core/RecoveryConfig.hpp"
#include "test_utils/TestUtils.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <variant>

namespace
{

using restora::core::RecoveryError;
using restora::core::RecoveryOptions;
using restora::test_utils::envFrom;

} // namespace

TEST(RecoveryConfig, DefaultsMatchProtocolConstants)
{
    const RecoveryOptions options{};

    EXPECT_EQ(options.interval, std::chrono::seconds{ 14400 });
    EXPECT_EQ(options.maxValues, 256U);
    EXPECT_EQ(options.maxPayloadLength, 40000U);
    EXPECT_TRUE(options.pepper.empty());
    EXPECT_TRUE(std::holds_alternative<restora::core::DerivedKey>(options.masterKey));
}

TEST(RecoveryConfig, EmptyEnvironmentKeepsBase)
{
    RecoveryOptions base{};
    base.pepper = "base";

    const auto loaded{ restora::core::loadRecoveryOptionsFromEnv(base, envFrom({})) };

    ASSERT_FALSE(restora::core::isError(loaded));
    EXPECT_EQ(std::get<RecoveryOptions>(loaded).pepper, "base");
}

TEST(RecoveryConfig, ReadsAllVariables)
{
    const auto loaded{ restora::core::loadRecoveryOptionsFromEnv({}, envFrom({
                                                                             { "RESTORA_PEPPER", "p3pp3r" },
                                                                             { "RESTORA_MASTER_KEY", "k" },
                                                                             { "RESTORA_INTERVAL_SECONDS", "60" },
                                                                             { "RESTORA_MAX_VALUES", "8" },
                                                                             { "RESTORA_MAX_PAYLOAD_BYTES", "512" },
                                                                         })) };

    ASSERT_FALSE(restora::core::isError(loaded));
    const auto& options{ std::get<RecoveryOptions>(loaded) };
    EXPECT_EQ(options.pepper, "p3pp3r");
    ASSERT_TRUE(std::holds_alternative<restora::core::ExplicitKey>(options.masterKey));
    EXPECT_EQ(std::get<restora::core::ExplicitKey>(options.masterKey).bytes, "k");
    EXPECT_EQ(options.interval, std::chrono::seconds{ 60 });
    EXPECT_EQ(options.maxValues, 8U);
    EXPECT_EQ(options.maxPayloadLength, 512U);
}

TEST(RecoveryConfig, ExplicitKeyBeatsKeyDirectory)
{
    const auto loaded{ restora::core::loadRecoveryOptionsFromEnv(
        {}, envFrom({ { "RESTORA_MASTER_KEY", "k" }, { "RESTORA_KEY_DIR", "/tmp" } })) };

    ASSERT_FALSE(restora::core::isError(loaded));
    EXPECT_TRUE(std::holds_alternative<restora::core::ExplicitKey>(std::get<RecoveryOptions>(loaded).masterKey));
}

TEST(RecoveryConfig, KeyDirectorySelectsDerivedKey)
{
    const auto loaded{ restora::core::loadRecoveryOptionsFromEnv({}, envFrom({ { "RESTORA_KEY_DIR", "/opt/app" } })) };

    ASSERT_FALSE(restora::core::isError(loaded));
    const auto& key{ std::get<RecoveryOptions>(loaded).masterKey };
    ASSERT_TRUE(std::holds_alternative<restora::core::DerivedKey>(key));
    EXPECT_EQ(std::get<restora::core::DerivedKey>(key).fingerprintSource, std::filesystem::path{ "/opt/app" });
}

TEST(RecoveryConfig, MalformedNumberIsConfigurationError)
{
    for (const char* bad : { "", "-1", "12abc", " 5", "0x10", "99999999999999999999999" })
    {
        const auto loaded{ restora::core::loadRecoveryOptionsFromEnv({}, envFrom({ { "RESTORA_MAX_VALUES", bad } })) };

        ASSERT_TRUE(restora::core::isError(loaded)) << bad;
        EXPECT_EQ(std::get<RecoveryError>(loaded), RecoveryError::ConfigurationError);
    }
}

TEST(RecoveryConfig, ParseCountIsStrict)
{
    EXPECT_EQ(restora::core::parseCount("40000"), 40000U);
    EXPECT_FALSE(restora::core::parseCount("+1").has_value());
    EXPECT_FALSE(restora::core::parseCount("1.0").has_value());
}
