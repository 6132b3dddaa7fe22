#include "restora/core/TokenWire.hpp"

#include "restora/core/ValueCodec.hpp"
#include <cstddef>
#include <span>
#include <utility>

namespace restora::core
{
namespace
{

using Json = nlohmann::json;

constexpr std::size_t g_kTokenFields{ 3U };

[[nodiscard]] RecoveryResult<Json> parseObject(std::string_view text, RecoveryError onFailure)
{
    auto parsed{ parseCanonical(std::as_bytes(std::span<const char>{ text.data(), text.size() })) };
    if (isError(parsed) || !std::get<Json>(parsed).is_object())
    {
        return onFailure;
    }
    return std::move(std::get<Json>(parsed));
}

} // namespace

RecoveryResult<std::string> encodeTokenMap(const TokenMap& tokens)
{
    Json out{ Json::object() };
    for (const auto& [name, token] : tokens)
    {
        out[name] = Json::array({ token.typeId, token.payload, token.signature });
    }
    return dumpCanonical(out);
}

RecoveryResult<TokenMap> decodeTokenMap(std::string_view text)
{
    auto parsed{ parseObject(text, RecoveryError::MalformedToken) };
    if (isError(parsed))
    {
        return std::get<RecoveryError>(parsed);
    }

    TokenMap out{};
    for (const auto& [name, fields] : std::get<Json>(parsed).items())
    {
        if (!fields.is_array() || fields.size() != g_kTokenFields || !fields[0].is_string() ||
            !fields[1].is_string() || !fields[2].is_string())
        {
            return RecoveryError::MalformedToken;
        }
        out.emplace(name, RecoveryToken{
                              .typeId = fields[0].get<std::string>(),
                              .payload = fields[1].get<std::string>(),
                              .signature = fields[2].get<std::string>(),
                          });
    }
    return out;
}

RecoveryResult<std::string> encodeValueMap(const ValueMap& values)
{
    Json out{ Json::object() };
    for (const auto& [name, value] : values)
    {
        auto json{ toJson(value, ObjectEncoder{}) };
        if (isError(json))
        {
            return std::get<RecoveryError>(json);
        }
        out[name] = std::move(std::get<Json>(json));
    }
    return dumpCanonical(out);
}

RecoveryResult<ValueMap> decodeValueMap(std::string_view text)
{
    auto parsed{ parseObject(text, RecoveryError::ReconstructionError) };
    if (isError(parsed))
    {
        return std::get<RecoveryError>(parsed);
    }

    ValueMap out{};
    for (const auto& [name, json] : std::get<Json>(parsed).items())
    {
        auto value{ fromJson(json) };
        if (isError(value))
        {
            return std::get<RecoveryError>(value);
        }
        out.emplace(name, std::move(std::get<Value>(value)));
    }
    return out;
}

} // namespace restora::core
