#ifndef INCLUDE_RESTORA_CORE_TYPEREGISTRY_HPP
#define INCLUDE_RESTORA_CORE_TYPEREGISTRY_HPP

#include "restora/core/RecoveryError.hpp"
#include "restora/core/Value.hpp"
#include "restora/core/ValueCodec.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace restora::core
{

constexpr std::string_view g_noneTypeId{ "0" };

// Builds a domain object from its parsed JSON form (a string or an object). Throwing signals that the
// data is decodable but not a valid instance.
using ObjectReconstructor = std::function<ObjectPtr(const nlohmann::json&)>;

// One whitelist entry supplied by the server.
struct RecoverableType final
{
    std::string name;
    ObjectReconstructor reconstruct;
    // Optional; the manager's default encoder is used when empty.
    ObjectEncoder encode;
};

struct TypeEntry final
{
    std::string id;
    std::string name;
    ValueKind kind{ ValueKind::None };
    ObjectReconstructor reconstruct;
    ObjectEncoder encode;
};

// Ordinals are positional: none, str, int, float, bool, list, tuple, uuid, dict, the domain types in
// declaration order, then decimal, datetime, date, time. Reordering the whitelist changes every id after
// the first moved entry and silently invalidates outstanding tokens.
class TypeRegistry final
{
public:
    // ConfigurationError on empty, duplicate or reserved names and on missing reconstructors.
    [[nodiscard]] static RecoveryResult<TypeRegistry> build(std::vector<RecoverableType> domainTypes);

    // Nearest registered ancestor for objects, direct mapping for everything else.
    [[nodiscard]] const TypeEntry* entryFor(const Value& value) const noexcept;
    [[nodiscard]] const TypeEntry* entryForObject(const RecoverableObject& object) const noexcept;

    [[nodiscard]] std::optional<std::string_view> idFor(const Value& value) const noexcept;

    // Ids must be canonical decimal ordinals ("07" is not "7").
    [[nodiscard]] const TypeEntry* typeFor(std::string_view id) const noexcept;

    [[nodiscard]] const TypeEntry* findByName(std::string_view name) const noexcept;

    [[nodiscard]] std::span<const TypeEntry> entries() const noexcept
    {
        return m_entries;
    }

    [[nodiscard]] static bool isReservedName(std::string_view name) noexcept;

private:
    TypeRegistry() = default;

    void append(std::string name, ValueKind kind, ObjectReconstructor reconstruct = {}, ObjectEncoder encode = {});

    std::vector<TypeEntry> m_entries;
    std::map<std::string, std::size_t, std::less<>> m_byName;
};

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_TYPEREGISTRY_HPP
