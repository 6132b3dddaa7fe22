#include "restora/core/RecoverySerializer.hpp"

#include "restora/core/RecoveryManager.hpp"
#include "restora/core/TransportCodec.hpp"
#include "restora/core/ValueCodec.hpp"
#include "restora/security/SecureEquals.hpp"
#include <array>
#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace restora::core
{
namespace
{

[[nodiscard]] std::span<const std::byte> textBytes(std::string_view text) noexcept
{
    return std::as_bytes(std::span<const char>{ text.data(), text.size() });
}

} // namespace

RecoveryToken nullToken()
{
    return RecoveryToken{ .typeId = std::string{ g_noneTypeId }, .payload = {}, .signature = {} };
}

RecoverySerializer::RecoverySerializer(const RecoveryManager& manager, security::SecretBytes code,
                                       std::string salt) noexcept
    : m_manager(&manager), m_code(std::move(code)), m_salt(std::move(salt))
{
}

RecoveryResult<std::string> RecoverySerializer::sign(std::string_view typeId, std::span<const std::byte> json,
                                                     std::string_view name) const
{
    const std::array<std::span<const std::byte>, 6> segments{
        textBytes(typeId),
        json,
        security::asBytes(m_manager->m_pepper),
        security::asBytes(m_code),
        textBytes(m_salt),
        textBytes(name),
    };

    try
    {
        const auto digest{ m_manager->m_crypto->sha256(segments) };
        return toHex(digest);
    }
    catch (const std::exception&)
    {
        return RecoveryError::CryptoError;
    }
}

RecoveryResult<std::string> RecoverySerializer::encodeCanonical(const TypeEntry& entry, const Value& value) const
{
    const TypeRegistry& registry{ m_manager->m_registry };
    const ObjectEncoder& fallback{ m_manager->m_defaultEncoder };

    // The top-level object uses `entry`; nested objects use their own nearest registered type, if any.
    const ObjectEncoder encodeObject{ [&registry, &fallback, &entry, &value](const RecoverableObject& object)
                                          -> std::optional<nlohmann::json> {
        const auto* top{ value.getIf<ObjectPtr>() };
        const TypeEntry* owner{ (top != nullptr && top->get() == &object) ? &entry
                                                                          : registry.entryForObject(object) };
        if (owner != nullptr && owner->encode)
        {
            return owner->encode(object);
        }
        if (fallback)
        {
            return fallback(object);
        }
        return std::nullopt;
    } };

    auto json{ toJson(value, encodeObject) };
    if (isError(json))
    {
        return std::get<RecoveryError>(json);
    }
    return dumpCanonical(std::get<nlohmann::json>(json));
}

RecoveryResult<RecoveryToken> RecoverySerializer::serialize(std::string_view name, const Value& value) const
{
    if (value.isNone())
    {
        return nullToken();
    }

    const TypeEntry* entry{ m_manager->m_registry.entryFor(value) };
    if (entry == nullptr)
    {
        return RecoveryError::WhitelistViolation;
    }

    auto canonical{ encodeCanonical(*entry, value) };
    if (isError(canonical))
    {
        return std::get<RecoveryError>(canonical);
    }
    const std::string& json{ std::get<std::string>(canonical) };
    if (json.size() > m_manager->m_maxPayloadLength)
    {
        return RecoveryError::PayloadTooLarge;
    }

    auto signature{ sign(entry->id, textBytes(json), name) };
    if (isError(signature))
    {
        return std::get<RecoveryError>(signature);
    }

    return RecoveryToken{
        .typeId = entry->id,
        .payload = encodeBase64Url(textBytes(json)),
        .signature = std::move(std::get<std::string>(signature)),
    };
}

RecoveryResult<TokenMap> RecoverySerializer::serializeAll(const ValueMap& values) const
{
    if (values.size() > m_manager->m_maxValues)
    {
        return RecoveryError::TooManyValues;
    }

    TokenMap out{};
    for (const auto& [name, value] : values)
    {
        auto token{ serialize(name, value) };
        if (isError(token))
        {
            return std::get<RecoveryError>(token);
        }
        out.emplace(name, std::move(std::get<RecoveryToken>(token)));
    }
    return out;
}

RecoveryResult<Value> RecoverySerializer::reconstruct(const TypeEntry& entry, const nlohmann::json& json) const
{
    const auto& decoders{ m_manager->m_decoders };
    if (const auto it{ decoders.find(entry.name) }; it != decoders.end() && it->second)
    {
        try
        {
            return it->second(json);
        }
        catch (const std::exception&)
        {
            return RecoveryError::ReconstructionError;
        }
    }

    if (entry.kind != ValueKind::Object)
    {
        return reconstructBuiltin(entry.kind, json);
    }

    if (!json.is_string() && !json.is_object())
    {
        return fromJson(json);
    }

    try
    {
        ObjectPtr object{ entry.reconstruct(json) };
        if (!object)
        {
            return RecoveryError::ReconstructionError;
        }
        return Value{ std::move(object) };
    }
    catch (const std::exception&)
    {
        return RecoveryError::ReconstructionError;
    }
}

RecoveryResult<Value> RecoverySerializer::deserialize(std::string_view name, const RecoveryToken& token) const
{
    if (token.typeId == g_noneTypeId)
    {
        return Value{};
    }

    if (token.payload.size() > base64UrlEncodedLength(m_manager->m_maxPayloadLength))
    {
        return RecoveryError::PayloadTooLarge;
    }

    const TypeEntry* entry{ m_manager->m_registry.typeFor(token.typeId) };
    if (entry == nullptr)
    {
        return RecoveryError::UnknownType;
    }

    // Text that does not decode canonically cannot be the payload that was signed.
    const auto json{ decodeBase64Url(token.payload) };
    if (!json)
    {
        return RecoveryError::SignatureMismatch;
    }

    auto expected{ sign(entry->id, *json, name) };
    if (isError(expected))
    {
        return std::get<RecoveryError>(expected);
    }
    if (!security::secureEquals(std::string_view{ std::get<std::string>(expected) }, token.signature))
    {
        return RecoveryError::SignatureMismatch;
    }

    auto parsed{ parseCanonical(*json) };
    if (isError(parsed))
    {
        return std::get<RecoveryError>(parsed);
    }
    return reconstruct(*entry, std::get<nlohmann::json>(parsed));
}

RecoveryResult<ValueMap> RecoverySerializer::deserializeAll(const TokenMap& tokens) const
{
    if (tokens.size() > m_manager->m_maxValues)
    {
        return RecoveryError::TooManyValues;
    }

    ValueMap out{};
    for (const auto& [name, token] : tokens)
    {
        auto value{ deserialize(name, token) };
        if (isError(value))
        {
            return std::get<RecoveryError>(value);
        }
        out.emplace(name, std::move(std::get<Value>(value)));
    }
    return out;
}

} // namespace restora::core
