#include "restora/core/Decimal.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>

namespace restora::core
{
namespace
{

[[nodiscard]] bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0)
    {
        s.remove_prefix(1U);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0)
    {
        s.remove_suffix(1U);
    }
    return s;
}

[[nodiscard]] std::size_t skipDigits(std::string_view s, std::size_t pos) noexcept
{
    while (pos < s.size() && isDigit(s[pos]))
    {
        ++pos;
    }
    return pos;
}

[[nodiscard]] bool isSpecialValue(std::string_view body) noexcept
{
    constexpr std::array<std::string_view, 2> kInfinities{ "infinity", "inf" };
    if (std::ranges::any_of(kInfinities, [body](std::string_view name) { return equalsIgnoreCase(body, name); }))
    {
        return true;
    }

    // NaN and sNaN may carry a diagnostic payload of digits.
    for (const std::string_view nan : { std::string_view{ "snan" }, std::string_view{ "nan" } })
    {
        if (body.size() >= nan.size() && equalsIgnoreCase(body.substr(0U, nan.size()), nan))
        {
            return skipDigits(body, nan.size()) == body.size();
        }
    }
    return false;
}

[[nodiscard]] bool isFiniteNumber(std::string_view body) noexcept
{
    const std::size_t intEnd{ skipDigits(body, 0U) };
    std::size_t pos{ intEnd };
    std::size_t fractionDigits{};
    if (pos < body.size() && body[pos] == '.')
    {
        const std::size_t fractionEnd{ skipDigits(body, pos + 1U) };
        fractionDigits = fractionEnd - (pos + 1U);
        pos = fractionEnd;
    }
    if (intEnd == 0U && fractionDigits == 0U)
    {
        return false;
    }

    if (pos < body.size() && (body[pos] == 'e' || body[pos] == 'E'))
    {
        ++pos;
        if (pos < body.size() && (body[pos] == '+' || body[pos] == '-'))
        {
            ++pos;
        }
        const std::size_t exponentEnd{ skipDigits(body, pos) };
        if (exponentEnd == pos)
        {
            return false;
        }
        pos = exponentEnd;
    }
    return pos == body.size();
}

} // namespace

std::optional<Decimal> Decimal::parse(std::string_view text)
{
    const std::string_view trimmed{ trim(text) };
    std::string_view body{ trimmed };
    if (!body.empty() && (body.front() == '+' || body.front() == '-'))
    {
        body.remove_prefix(1U);
    }
    if (body.empty())
    {
        return std::nullopt;
    }

    if (!isSpecialValue(body) && !isFiniteNumber(body))
    {
        return std::nullopt;
    }
    return Decimal{ std::string{ trimmed } };
}

} // namespace restora::core
