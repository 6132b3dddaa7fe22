#ifndef INCLUDE_RESTORA_CORE_CALENDAR_HPP
#define INCLUDE_RESTORA_CORE_CALENDAR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace restora::core
{

constexpr std::int32_t g_minYear{ 1 };
constexpr std::int32_t g_maxYear{ 9999 };
constexpr std::int32_t g_maxUtcOffsetMinutes{ 24 * 60 - 1 };

struct Date final
{
    std::int32_t year{ 1970 };
    std::uint32_t month{ 1U };
    std::uint32_t day{ 1U };

    [[nodiscard]] bool valid() const noexcept;
    bool operator==(const Date&) const noexcept = default;
};

struct Time final
{
    std::uint32_t hour{ 0U };
    std::uint32_t minute{ 0U };
    std::uint32_t second{ 0U };
    std::uint32_t microsecond{ 0U };
    // Naive when empty.
    std::optional<std::int32_t> utcOffsetMinutes{};

    [[nodiscard]] bool valid() const noexcept;
    bool operator==(const Time&) const noexcept = default;
};

struct DateTime final
{
    Date date{};
    Time time{};

    [[nodiscard]] bool valid() const noexcept
    {
        return date.valid() && time.valid();
    }
    bool operator==(const DateTime&) const noexcept = default;
};

// ISO 8601 extended format: YYYY-MM-DD, HH:MM:SS[.ffffff][+HH:MM], date "T" time.
[[nodiscard]] std::string formatIso(const Date& date);
[[nodiscard]] std::string formatIso(const Time& time);
[[nodiscard]] std::string formatIso(const DateTime& dateTime);

// Also accepts HH:MM without seconds, 1 to 6 fraction digits, "Z" for UTC and a space separator.
[[nodiscard]] std::optional<Date> parseIsoDate(std::string_view text) noexcept;
[[nodiscard]] std::optional<Time> parseIsoTime(std::string_view text) noexcept;
[[nodiscard]] std::optional<DateTime> parseIsoDateTime(std::string_view text) noexcept;

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_CALENDAR_HPP
