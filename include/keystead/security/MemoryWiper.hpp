#ifndef INCLUDE_KEYSTEAD_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_KEYSTEAD_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace keystead::security
{

// Zeroes `bytes` in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Scans every byte; the running time does not depend on where a non-zero byte sits.
[[nodiscard]] bool isWiped(std::span<const std::byte> bytes) noexcept;

template <typename T>
    requires(std::is_trivially_copyable_v<T>)
[[nodiscard]] bool isWiped(std::span<const T> buffer) noexcept
{
    return isWiped(std::as_bytes(buffer));
}

} // namespace keystead::security

#endif // INCLUDE_KEYSTEAD_SECURITY_MEMORYWIPER_HPP
