#ifndef INCLUDE_KEYSTEAD_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_KEYSTEAD_SECURITY_SECUREBUFFER_HPP

#include "keystead/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <vector>

namespace keystead::security
{

// Allocator that wipes every block before handing it back to the heap.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

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
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& a, [[maybe_unused]] const ZeroAllocator<U>& b) noexcept
{
    return true;
}

// Holds private keys, shared secrets, derived keys and content-encryption keys.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<std::uint8_t> asSpan(SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline SecureBuffer secureBufferOfSize(std::size_t size)
{
    SecureBuffer out{};
    out.resize(size);
    return out;
}

// Shrinking wipes the tail first; std::vector would otherwise leave it in capacity.
inline void secureResize(SecureBuffer& b, std::size_t newSize)
{
    if (newSize < b.size())
    {
        secureWipe(asSpan(b).subspan(newSize));
    }
    b.resize(newSize);
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asSpan(b));
    SecureBuffer empty{};
    b.swap(empty);
}

} // namespace keystead::security

#endif // INCLUDE_KEYSTEAD_SECURITY_SECUREBUFFER_HPP
