#ifndef INCLUDE_RESTORA_CORE_VALUE_HPP
#define INCLUDE_RESTORA_CORE_VALUE_HPP

#include "restora/core/Calendar.hpp"
#include "restora/core/Decimal.hpp"
#include "restora/core/Uuid.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace restora::core
{

// Base for server-declared domain types. Instances are immutable once handed to a Value.
class RecoverableObject
{
public:
    virtual ~RecoverableObject() = default;

    // Type names from most specific to least specific. The first registered name decides the type id.
    [[nodiscard]] virtual std::span<const std::string_view> lineage() const noexcept = 0;

    [[nodiscard]] virtual bool equals(const RecoverableObject& other) const noexcept = 0;

protected:
    RecoverableObject() = default;
    RecoverableObject(const RecoverableObject&) = default;
    RecoverableObject& operator=(const RecoverableObject&) = default;
    RecoverableObject(RecoverableObject&&) = default;
    RecoverableObject& operator=(RecoverableObject&&) = default;
};

using ObjectPtr = std::shared_ptr<const RecoverableObject>;

class Value;
using List = std::vector<Value>;
using Mapping = std::map<std::string, Value, std::less<>>;

// Fixed-length sequence; kept apart from List so it recovers under its own type id.
struct Tuple final
{
    List items;

    bool operator==(const Tuple& other) const noexcept;
};

enum class ValueKind : std::uint8_t
{
    None,
    String,
    Integer,
    Float,
    Boolean,
    List,
    Tuple,
    Uuid,
    Mapping,
    Object,
    Decimal,
    DateTime,
    Date,
    Time,
};

class Value final
{
public:
    // Alternative order mirrors ValueKind.
    using Storage = std::variant<std::monostate, std::string, std::int64_t, double, bool, List, Tuple, Uuid, Mapping,
                                 ObjectPtr, Decimal, DateTime, Date, Time>;

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept
    {
    }
    Value(std::string s) noexcept : m_storage{ std::move(s) }
    {
    }
    Value(const char* s) : m_storage{ std::string{ s } }
    {
    }
    Value(int i) noexcept : m_storage{ static_cast<std::int64_t>(i) }
    {
    }
    Value(std::int64_t i) noexcept : m_storage{ i }
    {
    }
    Value(double d) noexcept : m_storage{ d }
    {
    }
    Value(bool b) noexcept : m_storage{ b }
    {
    }
    Value(List items) noexcept : m_storage{ std::move(items) }
    {
    }
    Value(Tuple tuple) noexcept : m_storage{ std::move(tuple) }
    {
    }
    Value(Uuid uuid) noexcept : m_storage{ uuid }
    {
    }
    Value(Mapping mapping) noexcept : m_storage{ std::move(mapping) }
    {
    }
    Value(ObjectPtr object) noexcept : m_storage{ std::move(object) }
    {
    }
    Value(Decimal decimal) noexcept : m_storage{ std::move(decimal) }
    {
    }
    Value(DateTime dateTime) noexcept : m_storage{ dateTime }
    {
    }
    Value(Date date) noexcept : m_storage{ date }
    {
    }
    Value(Time time) noexcept : m_storage{ time }
    {
    }

    [[nodiscard]] ValueKind kind() const noexcept
    {
        return static_cast<ValueKind>(m_storage.index());
    }

    [[nodiscard]] bool isNone() const noexcept
    {
        return std::holds_alternative<std::monostate>(m_storage);
    }

    template <class T> [[nodiscard]] const T* getIf() const noexcept
    {
        return std::get_if<T>(&m_storage);
    }

    // Null when this is not an object or the object is not a T.
    template <class T> [[nodiscard]] std::shared_ptr<const T> objectAs() const noexcept
    {
        if (const auto* object{ std::get_if<ObjectPtr>(&m_storage) })
        {
            return std::dynamic_pointer_cast<const T>(*object);
        }
        return nullptr;
    }

    [[nodiscard]] const Storage& storage() const noexcept
    {
        return m_storage;
    }

    // Objects compare by content via RecoverableObject::equals.
    friend bool operator==(const Value& a, const Value& b) noexcept;

private:
    Storage m_storage{};
};

template <class T, class... Args> [[nodiscard]] Value makeObject(Args&&... args)
{
    return Value{ ObjectPtr{ std::make_shared<T>(std::forward<Args>(args)...) } };
}

[[nodiscard]] std::string_view kindName(ValueKind kind) noexcept;

} // namespace restora::core

#endif // INCLUDE_RESTORA_CORE_VALUE_HPP
