#include "restora/core/RecoveryError.hpp"

namespace restora::core
{

std::string_view toString(RecoveryError error) noexcept
{
    switch (error)
    {
    case RecoveryError::ConfigurationError:
        return "configuration error";
    case RecoveryError::WhitelistViolation:
        return "type not whitelisted";
    case RecoveryError::UnencodableValue:
        return "value cannot be encoded";
    case RecoveryError::PayloadTooLarge:
        return "payload too large";
    case RecoveryError::TooManyValues:
        return "too many values";
    case RecoveryError::UnknownType:
        return "unknown type id";
    case RecoveryError::MalformedToken:
        return "malformed token";
    case RecoveryError::SignatureMismatch:
        return "signature mismatch";
    case RecoveryError::ReconstructionError:
        return "value cannot be reconstructed";
    case RecoveryError::CryptoError:
        return "crypto backend failure";
    }
    return "unknown error";
}

} // namespace restora::core
