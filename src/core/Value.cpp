#include "restora/core/Value.hpp"

namespace restora::core
{

bool Tuple::operator==(const Tuple& other) const noexcept
{
    return items == other.items;
}

bool operator==(const Value& a, const Value& b) noexcept
{
    if (a.m_storage.index() != b.m_storage.index())
    {
        return false;
    }

    if (const auto* lhs{ std::get_if<ObjectPtr>(&a.m_storage) })
    {
        const auto& rhs{ std::get<ObjectPtr>(b.m_storage) };
        if (!*lhs || !rhs)
        {
            return *lhs == rhs;
        }
        return (*lhs)->equals(*rhs);
    }

    return a.m_storage == b.m_storage;
}

std::string_view kindName(ValueKind kind) noexcept
{
    switch (kind)
    {
    case ValueKind::None:
        return "none";
    case ValueKind::String:
        return "str";
    case ValueKind::Integer:
        return "int";
    case ValueKind::Float:
        return "float";
    case ValueKind::Boolean:
        return "bool";
    case ValueKind::List:
        return "list";
    case ValueKind::Tuple:
        return "tuple";
    case ValueKind::Uuid:
        return "uuid";
    case ValueKind::Mapping:
        return "dict";
    case ValueKind::Object:
        return "object";
    case ValueKind::Decimal:
        return "decimal";
    case ValueKind::DateTime:
        return "datetime";
    case ValueKind::Date:
        return "date";
    case ValueKind::Time:
        return "time";
    }
    return "unknown";
}

} // namespace restora::core
