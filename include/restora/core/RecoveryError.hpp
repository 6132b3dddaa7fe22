#ifndef INCLUDE_RESTORA_CORE_RECOVERYERROR_HPP
#define INCLUDE_RESTORA_CORE_RECOVERYERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace restora::core
{

enum class RecoveryError : std::uint8_t
{
    ConfigurationError,
    WhitelistViolation,
    UnencodableValue,
    PayloadTooLarge,
    TooManyValues,
    UnknownType,
    MalformedToken,
    SignatureMismatch,
    ReconstructionError,
    CryptoError,
};

template <class T> using RecoveryResult = std::variant<T, RecoveryError>;

[[nodiscard]] std::string_view toString(RecoveryError error) noexcept;

template <class T> [[nodiscard]] bool isError(const RecoveryResult<T>& result) noexcept
{
    return std::holds_alternative<RecoveryError>(result);
}

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_RECOVERYERROR_HPP
