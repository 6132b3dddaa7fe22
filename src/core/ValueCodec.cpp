#include "restora/core/ValueCodec.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <variant>

namespace restora::core
{
namespace
{

using Json = nlohmann::json;

[[nodiscard]] RecoveryResult<Json> toJsonAt(const Value& value, const ObjectEncoder& encodeObject, std::size_t depth);

[[nodiscard]] RecoveryResult<Json> sequenceToJson(const List& items, const ObjectEncoder& encodeObject,
                                                  std::size_t depth)
{
    Json out{ Json::array() };
    for (const auto& item : items)
    {
        auto encoded{ toJsonAt(item, encodeObject, depth + 1U) };
        if (isError(encoded))
        {
            return std::get<RecoveryError>(encoded);
        }
        out.push_back(std::move(std::get<Json>(encoded)));
    }
    return out;
}

[[nodiscard]] RecoveryResult<Json> objectToJson(const ObjectPtr& object, const ObjectEncoder& encodeObject)
{
    if (!object || !encodeObject)
    {
        return RecoveryError::UnencodableValue;
    }
    try
    {
        auto encoded{ encodeObject(*object) };
        if (!encoded)
        {
            return RecoveryError::UnencodableValue;
        }
        return std::move(*encoded);
    }
    catch (const std::exception&)
    {
        return RecoveryError::UnencodableValue;
    }
}

RecoveryResult<Json> toJsonAt(const Value& value, const ObjectEncoder& encodeObject, std::size_t depth)
{
    if (depth > g_maxNestingDepth)
    {
        return RecoveryError::UnencodableValue;
    }

    switch (value.kind())
    {
    case ValueKind::None:
        return Json(nullptr);
    case ValueKind::String:
        return Json(*value.getIf<std::string>());
    case ValueKind::Integer:
        return Json(*value.getIf<std::int64_t>());
    case ValueKind::Float:
    {
        const double d{ *value.getIf<double>() };
        if (!std::isfinite(d))
        {
            return RecoveryError::UnencodableValue;
        }
        return Json(d);
    }
    case ValueKind::Boolean:
        return Json(*value.getIf<bool>());
    case ValueKind::List:
        return sequenceToJson(*value.getIf<List>(), encodeObject, depth);
    case ValueKind::Tuple:
        return sequenceToJson(value.getIf<Tuple>()->items, encodeObject, depth);
    case ValueKind::Uuid:
        return Json(value.getIf<Uuid>()->toString());
    case ValueKind::Mapping:
    {
        Json out{ Json::object() };
        for (const auto& [key, item] : *value.getIf<Mapping>())
        {
            auto encoded{ toJsonAt(item, encodeObject, depth + 1U) };
            if (isError(encoded))
            {
                return std::get<RecoveryError>(encoded);
            }
            out[key] = std::move(std::get<Json>(encoded));
        }
        return out;
    }
    case ValueKind::Object:
        return objectToJson(*value.getIf<ObjectPtr>(), encodeObject);
    case ValueKind::Decimal:
        return Json(value.getIf<Decimal>()->text());
    // Out-of-range calendar values have no canonical text that would parse back.
    case ValueKind::DateTime:
    {
        const DateTime& dateTime{ *value.getIf<DateTime>() };
        if (!dateTime.valid())
        {
            return RecoveryError::UnencodableValue;
        }
        return Json(formatIso(dateTime));
    }
    case ValueKind::Date:
    {
        const Date& date{ *value.getIf<Date>() };
        if (!date.valid())
        {
            return RecoveryError::UnencodableValue;
        }
        return Json(formatIso(date));
    }
    case ValueKind::Time:
    {
        const Time& time{ *value.getIf<Time>() };
        if (!time.valid())
        {
            return RecoveryError::UnencodableValue;
        }
        return Json(formatIso(time));
    }
    }
    return RecoveryError::UnencodableValue;
}

[[nodiscard]] RecoveryResult<Value> fromJsonAt(const Json& json, std::size_t depth);

[[nodiscard]] RecoveryResult<List> listFromJson(const Json& json, std::size_t depth)
{
    if (!json.is_array())
    {
        return RecoveryError::ReconstructionError;
    }
    List out{};
    out.reserve(json.size());
    for (const auto& item : json)
    {
        auto decoded{ fromJsonAt(item, depth + 1U) };
        if (isError(decoded))
        {
            return std::get<RecoveryError>(decoded);
        }
        out.push_back(std::move(std::get<Value>(decoded)));
    }
    return out;
}

[[nodiscard]] RecoveryResult<Mapping> mappingFromJson(const Json& json, std::size_t depth)
{
    if (!json.is_object())
    {
        return RecoveryError::ReconstructionError;
    }
    Mapping out{};
    for (const auto& [key, item] : json.items())
    {
        auto decoded{ fromJsonAt(item, depth + 1U) };
        if (isError(decoded))
        {
            return std::get<RecoveryError>(decoded);
        }
        out.emplace(key, std::move(std::get<Value>(decoded)));
    }
    return out;
}

RecoveryResult<Value> fromJsonAt(const Json& json, std::size_t depth)
{
    if (depth > g_maxNestingDepth)
    {
        return RecoveryError::ReconstructionError;
    }

    switch (json.type())
    {
    case Json::value_t::null:
        return Value{};
    case Json::value_t::boolean:
        return Value{ json.get<bool>() };
    case Json::value_t::number_integer:
        return Value{ json.get<std::int64_t>() };
    case Json::value_t::number_unsigned:
    {
        const auto u{ json.get<std::uint64_t>() };
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        {
            return RecoveryError::ReconstructionError;
        }
        return Value{ static_cast<std::int64_t>(u) };
    }
    case Json::value_t::number_float:
        return Value{ json.get<double>() };
    case Json::value_t::string:
        return Value{ json.get<std::string>() };
    case Json::value_t::array:
    {
        auto list{ listFromJson(json, depth) };
        if (isError(list))
        {
            return std::get<RecoveryError>(list);
        }
        return Value{ std::move(std::get<List>(list)) };
    }
    case Json::value_t::object:
    {
        auto mapping{ mappingFromJson(json, depth) };
        if (isError(mapping))
        {
            return std::get<RecoveryError>(mapping);
        }
        return Value{ std::move(std::get<Mapping>(mapping)) };
    }
    case Json::value_t::binary:
    case Json::value_t::discarded:
        break;
    }
    return RecoveryError::ReconstructionError;
}

template <class T, class Parser>
[[nodiscard]] RecoveryResult<Value> parseFromString(const Json& json, Parser parser)
{
    if (!json.is_string())
    {
        return RecoveryError::ReconstructionError;
    }
    std::optional<T> parsed{ parser(json.get_ref<const std::string&>()) };
    if (!parsed)
    {
        return RecoveryError::ReconstructionError;
    }
    return Value{ std::move(*parsed) };
}

} // namespace

RecoveryResult<Json> toJson(const Value& value, const ObjectEncoder& encodeObject)
{
    return toJsonAt(value, encodeObject, 0U);
}

RecoveryResult<std::string> dumpCanonical(const Json& json)
{
    try
    {
        return json.dump();
    }
    catch (const Json::type_error&)
    {
        return RecoveryError::UnencodableValue;
    }
}

RecoveryResult<Json> parseCanonical(std::span<const std::byte> bytes) noexcept
{
    try
    {
        const auto* first{ reinterpret_cast<const char*>(bytes.data()) };
        Json parsed{ Json::parse(first, first + bytes.size(), nullptr, false) };
        if (parsed.is_discarded())
        {
            return RecoveryError::ReconstructionError;
        }
        return parsed;
    }
    catch (const std::exception&)
    {
        return RecoveryError::ReconstructionError;
    }
}

RecoveryResult<Value> fromJson(const Json& json)
{
    return fromJsonAt(json, 0U);
}

RecoveryResult<Value> reconstructBuiltin(ValueKind kind, const Json& json)
{
    switch (kind)
    {
    case ValueKind::None:
        if (json.is_null())
        {
            return Value{};
        }
        break;
    case ValueKind::String:
        if (json.is_string())
        {
            return Value{ json.get<std::string>() };
        }
        break;
    case ValueKind::Integer:
        if (json.is_number_integer())
        {
            return fromJson(json);
        }
        break;
    case ValueKind::Float:
        if (json.is_number())
        {
            return Value{ json.get<double>() };
        }
        break;
    case ValueKind::Boolean:
        if (json.is_boolean())
        {
            return Value{ json.get<bool>() };
        }
        break;
    case ValueKind::List:
    {
        auto list{ listFromJson(json, 0U) };
        if (isError(list))
        {
            return std::get<RecoveryError>(list);
        }
        return Value{ std::move(std::get<List>(list)) };
    }
    case ValueKind::Tuple:
    {
        auto list{ listFromJson(json, 0U) };
        if (isError(list))
        {
            return std::get<RecoveryError>(list);
        }
        return Value{ Tuple{ std::move(std::get<List>(list)) } };
    }
    case ValueKind::Uuid:
        return parseFromString<Uuid>(json, [](const std::string& s) { return Uuid::parse(s); });
    case ValueKind::Mapping:
    {
        auto mapping{ mappingFromJson(json, 0U) };
        if (isError(mapping))
        {
            return std::get<RecoveryError>(mapping);
        }
        return Value{ std::move(std::get<Mapping>(mapping)) };
    }
    case ValueKind::Decimal:
        return parseFromString<Decimal>(json, [](const std::string& s) { return Decimal::parse(s); });
    case ValueKind::DateTime:
        return parseFromString<DateTime>(json, [](const std::string& s) { return parseIsoDateTime(s); });
    case ValueKind::Date:
        return parseFromString<Date>(json, [](const std::string& s) { return parseIsoDate(s); });
    case ValueKind::Time:
        return parseFromString<Time>(json, [](const std::string& s) { return parseIsoTime(s); });
    case ValueKind::Object:
        break;
    }
    return RecoveryError::ReconstructionError;
}

} // namespace restora::core
