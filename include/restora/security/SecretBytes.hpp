#ifndef INCLUDE_RESTORA_SECURITY_SECRETBYTES_HPP
#define INCLUDE_RESTORA_SECURITY_SECRETBYTES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace restora::security
{

void secureWipe(std::span<std::byte> bytes) noexcept;

// Heap blocks are wiped before they are returned, including the old block on reallocation.
template <class T> struct WipingAllocator
{
    WipingAllocator() noexcept = default;

    template <class U> constexpr explicit WipingAllocator([[maybe_unused]] const WipingAllocator<U>& other) noexcept
    {
    }

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const WipingAllocator<T>& a,
                          [[maybe_unused]] const WipingAllocator<U>& b) noexcept
{
    return true;
}

// Pepper, master key and rotating codes live here, never in plain std::string.
using SecretBytes = std::vector<std::uint8_t, WipingAllocator<std::uint8_t>>;

[[nodiscard]] inline SecretBytes secretBytesFrom(std::string_view text)
{
    SecretBytes out{};
    out.reserve(text.size());
    for (const char c : text)
    {
        out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c)));
    }
    return out;
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecretBytes& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::string_view asStringView(const SecretBytes& b) noexcept
{
    if (b.empty())
    {
        return {};
    }
    return std::string_view{ reinterpret_cast<const char*>(b.data()), b.size() };
}

inline void secureRelease(SecretBytes& b) noexcept
{
    secureWipe(std::as_writable_bytes(std::span{ b }));
    SecretBytes empty{};
    b.swap(empty);
}

} // namespace restora::security

#endif // INCLUDE_RESTORA_SECURITY_SECRETBYTES_HPP
