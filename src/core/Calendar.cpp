#include "restora/core/Calendar.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdlib>

namespace restora::core
{
namespace
{

constexpr std::uint32_t g_kMaxFractionDigits{ 6U };
constexpr std::uint32_t g_kMicrosPerSecond{ 1000000U };

void appendPadded(std::string& out, std::uint32_t value, std::size_t width)
{
    std::array<char, 16> buffer{};
    const auto result{ std::to_chars(buffer.data(), buffer.data() + buffer.size(), value) };
    const auto digits{ static_cast<std::size_t>(result.ptr - buffer.data()) };
    if (digits < width)
    {
        out.append(width - digits, '0');
    }
    out.append(buffer.data(), digits);
}

// Reads exactly `width` decimal digits.
[[nodiscard]] std::optional<std::uint32_t> readFixed(std::string_view text, std::size_t pos, std::size_t width) noexcept
{
    if (pos + width > text.size())
    {
        return std::nullopt;
    }
    std::uint32_t value{};
    for (std::size_t i{ pos }; i < pos + width; ++i)
    {
        if (text[i] < '0' || text[i] > '9')
        {
            return std::nullopt;
        }
        value = value * 10U + static_cast<std::uint32_t>(text[i] - '0');
    }
    return value;
}

[[nodiscard]] std::optional<std::int32_t> parseOffset(std::string_view text) noexcept
{
    if (text == "Z" || text == "z")
    {
        return 0;
    }
    if (text.size() != 6U || (text[0] != '+' && text[0] != '-') || text[3] != ':')
    {
        return std::nullopt;
    }
    const auto hours{ readFixed(text, 1U, 2U) };
    const auto minutes{ readFixed(text, 4U, 2U) };
    if (!hours || !minutes || *minutes >= 60U)
    {
        return std::nullopt;
    }
    const auto magnitude{ static_cast<std::int32_t>(*hours * 60U + *minutes) };
    if (magnitude > g_maxUtcOffsetMinutes)
    {
        return std::nullopt;
    }
    return (text[0] == '-') ? -magnitude : magnitude;
}

} // namespace

bool Date::valid() const noexcept
{
    if (year < g_minYear || year > g_maxYear)
    {
        return false;
    }
    const std::chrono::year_month_day ymd{ std::chrono::year{ year }, std::chrono::month{ month },
                                           std::chrono::day{ day } };
    return ymd.ok();
}

bool Time::valid() const noexcept
{
    if (hour > 23U || minute > 59U || second > 59U || microsecond >= g_kMicrosPerSecond)
    {
        return false;
    }
    return !utcOffsetMinutes || std::abs(*utcOffsetMinutes) <= g_maxUtcOffsetMinutes;
}

std::string formatIso(const Date& date)
{
    std::string out{};
    out.reserve(10U);
    appendPadded(out, static_cast<std::uint32_t>(date.year), 4U);
    out.push_back('-');
    appendPadded(out, date.month, 2U);
    out.push_back('-');
    appendPadded(out, date.day, 2U);
    return out;
}

std::string formatIso(const Time& time)
{
    std::string out{};
    appendPadded(out, time.hour, 2U);
    out.push_back(':');
    appendPadded(out, time.minute, 2U);
    out.push_back(':');
    appendPadded(out, time.second, 2U);
    if (time.microsecond != 0U)
    {
        out.push_back('.');
        appendPadded(out, time.microsecond, g_kMaxFractionDigits);
    }
    if (time.utcOffsetMinutes)
    {
        const std::int32_t offset{ *time.utcOffsetMinutes };
        out.push_back(offset < 0 ? '-' : '+');
        const auto magnitude{ static_cast<std::uint32_t>(std::abs(offset)) };
        appendPadded(out, magnitude / 60U, 2U);
        out.push_back(':');
        appendPadded(out, magnitude % 60U, 2U);
    }
    return out;
}

std::string formatIso(const DateTime& dateTime)
{
    std::string out{ formatIso(dateTime.date) };
    out.push_back('T');
    out += formatIso(dateTime.time);
    return out;
}

std::optional<Date> parseIsoDate(std::string_view text) noexcept
{
    if (text.size() != 10U || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }
    const auto year{ readFixed(text, 0U, 4U) };
    const auto month{ readFixed(text, 5U, 2U) };
    const auto day{ readFixed(text, 8U, 2U) };
    if (!year || !month || !day)
    {
        return std::nullopt;
    }

    const Date date{ .year = static_cast<std::int32_t>(*year), .month = *month, .day = *day };
    if (!date.valid())
    {
        return std::nullopt;
    }
    return date;
}

std::optional<Time> parseIsoTime(std::string_view text) noexcept
{
    if (text.size() < 5U || text[2] != ':')
    {
        return std::nullopt;
    }
    const auto hour{ readFixed(text, 0U, 2U) };
    const auto minute{ readFixed(text, 3U, 2U) };
    if (!hour || !minute)
    {
        return std::nullopt;
    }

    Time time{ .hour = *hour, .minute = *minute };
    std::size_t pos{ 5U };
    if (pos < text.size() && text[pos] == ':')
    {
        const auto second{ readFixed(text, pos + 1U, 2U) };
        if (!second)
        {
            return std::nullopt;
        }
        time.second = *second;
        pos += 3U;

        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            std::uint32_t digits{};
            std::uint32_t fraction{};
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                if (digits == g_kMaxFractionDigits)
                {
                    return std::nullopt;
                }
                fraction = fraction * 10U + static_cast<std::uint32_t>(text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0U)
            {
                return std::nullopt;
            }
            for (std::uint32_t i{ digits }; i < g_kMaxFractionDigits; ++i)
            {
                fraction *= 10U;
            }
            time.microsecond = fraction;
        }
    }

    if (pos < text.size())
    {
        const auto offset{ parseOffset(text.substr(pos)) };
        if (!offset)
        {
            return std::nullopt;
        }
        time.utcOffsetMinutes = *offset;
    }

    if (!time.valid())
    {
        return std::nullopt;
    }
    return time;
}

std::optional<DateTime> parseIsoDateTime(std::string_view text) noexcept
{
    constexpr std::size_t kDateChars{ 10U };
    if (text.size() <= kDateChars + 1U || (text[kDateChars] != 'T' && text[kDateChars] != ' '))
    {
        return std::nullopt;
    }
    const auto date{ parseIsoDate(text.substr(0U, kDateChars)) };
    const auto time{ parseIsoTime(text.substr(kDateChars + 1U)) };
    if (!date || !time)
    {
        return std::nullopt;
    }
    return DateTime{ .date = *date, .time = *time };
}

} // namespace restora::core
