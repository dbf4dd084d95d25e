#ifndef INCLUDE_KEYSTEAD_SECURITY_SECURERANDOM_HPP
#define INCLUDE_KEYSTEAD_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace keystead::security
{

// Fills `out` from the operating system CSPRNG. Returns false if the OS source failed.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace keystead::security

#endif // INCLUDE_KEYSTEAD_SECURITY_SECURERANDOM_HPP
