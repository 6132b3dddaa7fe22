#ifndef INCLUDE_RESTORA_CORE_DECIMAL_HPP
#define INCLUDE_RESTORA_CORE_DECIMAL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace restora::core
{

// Arbitrary-precision decimal kept in its validated textual form. No arithmetic is offered;
// recovery only has to carry the exact digits across the round trip.
class Decimal final
{
public:
    Decimal() : m_text{ "0" }
    {
    }

    // General decimal syntax: [sign] digits [. digits] [e [sign] digits], "Infinity"/"Inf", "NaN"/"sNaN"
    // (case-insensitive). Surrounding whitespace is trimmed.
    [[nodiscard]] static std::optional<Decimal> parse(std::string_view text);

    [[nodiscard]] const std::string& text() const noexcept
    {
        return m_text;
    }

    bool operator==(const Decimal&) const noexcept = default;

private:
    explicit Decimal(std::string text) noexcept : m_text{ std::move(text) }
    {
    }

    std::string m_text;
};

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_DECIMAL_HPP
