#include "keystead/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace keystead::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#else
    ::explicit_bzero(bytes.data(), bytes.size());
#endif
}

bool isWiped(std::span<const std::byte> bytes) noexcept
{
    volatile std::byte acc{ 0 };
    for (const std::byte b : bytes)
    {
        acc = acc | b;
    }
    return acc == std::byte{ 0 };
}

} // namespace keystead::security
