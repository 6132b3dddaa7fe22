#include "restora/core/TypeRegistry.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <utility>

namespace restora::core
{
namespace
{

constexpr std::array<ValueKind, 9> g_kLeadingBuiltins{
    ValueKind::None,    ValueKind::String, ValueKind::Integer, ValueKind::Float,   ValueKind::Boolean,
    ValueKind::List,    ValueKind::Tuple,  ValueKind::Uuid,    ValueKind::Mapping,
};

constexpr std::array<ValueKind, 4> g_kTrailingBuiltins{
    ValueKind::Decimal,
    ValueKind::DateTime,
    ValueKind::Date,
    ValueKind::Time,
};

} // namespace

bool TypeRegistry::isReservedName(std::string_view name) noexcept
{
    const auto matches{ [name](ValueKind kind) { return kindName(kind) == name; } };
    return std::ranges::any_of(g_kLeadingBuiltins, matches) || std::ranges::any_of(g_kTrailingBuiltins, matches) ||
           name == kindName(ValueKind::Object);
}

void TypeRegistry::append(std::string name, ValueKind kind, ObjectReconstructor reconstruct, ObjectEncoder encode)
{
    const std::size_t ordinal{ m_entries.size() };
    m_byName.emplace(name, ordinal);
    m_entries.push_back(TypeEntry{
        .id = std::to_string(ordinal),
        .name = std::move(name),
        .kind = kind,
        .reconstruct = std::move(reconstruct),
        .encode = std::move(encode),
    });
}

RecoveryResult<TypeRegistry> TypeRegistry::build(std::vector<RecoverableType> domainTypes)
{
    TypeRegistry registry{};
    registry.m_entries.reserve(g_kLeadingBuiltins.size() + domainTypes.size() + g_kTrailingBuiltins.size());

    for (const ValueKind kind : g_kLeadingBuiltins)
    {
        registry.append(std::string{ kindName(kind) }, kind);
    }

    for (auto& type : domainTypes)
    {
        if (type.name.empty() || isReservedName(type.name) || registry.m_byName.contains(type.name) ||
            !type.reconstruct)
        {
            return RecoveryError::ConfigurationError;
        }
        registry.append(std::move(type.name), ValueKind::Object, std::move(type.reconstruct), std::move(type.encode));
    }

    for (const ValueKind kind : g_kTrailingBuiltins)
    {
        registry.append(std::string{ kindName(kind) }, kind);
    }

    return registry;
}

const TypeEntry* TypeRegistry::entryForObject(const RecoverableObject& object) const noexcept
{
    for (const std::string_view name : object.lineage())
    {
        const TypeEntry* entry{ findByName(name) };
        if (entry != nullptr && entry->kind == ValueKind::Object)
        {
            return entry;
        }
    }
    return nullptr;
}

const TypeEntry* TypeRegistry::entryFor(const Value& value) const noexcept
{
    if (value.kind() != ValueKind::Object)
    {
        return findByName(kindName(value.kind()));
    }

    const auto* object{ value.getIf<ObjectPtr>() };
    if (object == nullptr || !*object)
    {
        return nullptr;
    }
    return entryForObject(**object);
}

std::optional<std::string_view> TypeRegistry::idFor(const Value& value) const noexcept
{
    if (const TypeEntry* entry{ entryFor(value) }; entry != nullptr)
    {
        return std::string_view{ entry->id };
    }
    return std::nullopt;
}

const TypeEntry* TypeRegistry::typeFor(std::string_view id) const noexcept
{
    if (id.empty() || (id.size() > 1U && id.front() == '0'))
    {
        return nullptr;
    }

    std::size_t ordinal{};
    const auto* last{ id.data() + id.size() };
    const auto [ptr, ec]{ std::from_chars(id.data(), last, ordinal) };
    if (ec != std::errc{} || ptr != last || ordinal >= m_entries.size())
    {
        return nullptr;
    }
    return &m_entries[ordinal];
}

const TypeEntry* TypeRegistry::findByName(std::string_view name) const noexcept
{
    const auto it{ m_byName.find(name) };
    if (it == m_byName.end())
    {
        return nullptr;
    }
    return &m_entries[it->second];
}

} // namespace restora::core
