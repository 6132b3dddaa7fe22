#include "restora/core/Calendar.hpp"
#include <gtest/gtest.h>

namespace
{

using restora::core::Date;
using restora::core::DateTime;
using restora::core::Time;

} // namespace

TEST(Calendar, FormatsDate)
{
    EXPECT_EQ(restora::core::formatIso(Date{ .year = 2024, .month = 2, .day = 9 }), "2024-02-09");
    EXPECT_EQ(restora::core::formatIso(Date{ .year = 7, .month = 1, .day = 1 }), "0007-01-01");
}

TEST(Calendar, FormatsTimeWithFractionAndOffset)
{
    const Time time{ .hour = 8, .minute = 5, .second = 3, .microsecond = 120, .utcOffsetMinutes = -330 };

    EXPECT_EQ(restora::core::formatIso(time), "08:05:03.000120-05:30");
}

TEST(Calendar, OmitsZeroFraction)
{
    EXPECT_EQ(restora::core::formatIso(Time{ .hour = 23, .minute = 59, .second = 59 }), "23:59:59");
}

TEST(Calendar, FormatsDateTimeWithSeparator)
{
    const DateTime dt{ .date = Date{ .year = 2001, .month = 12, .day = 31 },
                       .time = Time{ .hour = 1, .minute = 2, .second = 3, .utcOffsetMinutes = 0 } };

    EXPECT_EQ(restora::core::formatIso(dt), "2001-12-31T01:02:03+00:00");
}

TEST(Calendar, ParsesLeapDayAndRejectsInvalidDay)
{
    EXPECT_TRUE(restora::core::parseIsoDate("2024-02-29").has_value());
    EXPECT_FALSE(restora::core::parseIsoDate("2023-02-29").has_value());
    EXPECT_FALSE(restora::core::parseIsoDate("2023-13-01").has_value());
    EXPECT_FALSE(restora::core::parseIsoDate("0000-01-01").has_value());
    EXPECT_FALSE(restora::core::parseIsoDate("2023-1-01").has_value());
}

TEST(Calendar, ParsesShortFormsOfTime)
{
    const auto minutes{ restora::core::parseIsoTime("10:30") };
    const auto fraction{ restora::core::parseIsoTime("10:30:15.5") };
    const auto utc{ restora::core::parseIsoTime("10:30:15Z") };

    ASSERT_TRUE(minutes.has_value());
    ASSERT_TRUE(fraction.has_value());
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(minutes->second, 0U);
    EXPECT_EQ(fraction->microsecond, 500000U);
    EXPECT_EQ(utc->utcOffsetMinutes, 0);
}

TEST(Calendar, RejectsMalformedTime)
{
    EXPECT_FALSE(restora::core::parseIsoTime("24:00").has_value());
    EXPECT_FALSE(restora::core::parseIsoTime("10:60").has_value());
    EXPECT_FALSE(restora::core::parseIsoTime("10:30:15.").has_value());
    EXPECT_FALSE(restora::core::parseIsoTime("10:30:15.1234567").has_value());
    EXPECT_FALSE(restora::core::parseIsoTime("10:30:15+24:00").has_value());
    EXPECT_FALSE(restora::core::parseIsoTime("10:30:15 ").has_value());
}

TEST(Calendar, DateTimeAcceptsSpaceSeparator)
{
    const auto parsed{ restora::core::parseIsoDateTime("2020-06-01 12:00:00") };

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->date, (Date{ .year = 2020, .month = 6, .day = 1 }));
    EXPECT_EQ(parsed->time.hour, 12U);
    EXPECT_FALSE(parsed->time.utcOffsetMinutes.has_value());
}

TEST(Calendar, FormatThenParseIsIdentity)
{
    const DateTime dt{ .date = Date{ .year = 1999, .month = 7, .day = 4 },
                       .time = Time{ .hour = 16, .minute = 45, .second = 9, .microsecond = 1, .utcOffsetMinutes = 60 } };

    EXPECT_EQ(restora::core::parseIsoDateTime(restora::core::formatIso(dt)), dt);
}
