#ifndef INCLUDE_KEYSTEAD_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_KEYSTEAD_SECURITY_SCOPEWIPE_HPP

#include "keystead/security/MemoryWiper.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace keystead::security
{

// Wipes a caller-owned buffer when the guard leaves scope, on success and error paths alike.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.release();
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            wipeNow();
            m_bytes = other.m_bytes;
            other.release();
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        wipeNow();
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    void wipeNow() noexcept
    {
        if (!m_bytes.empty())
        {
            secureWipe(m_bytes);
        }
    }

    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(bytes) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(asSpan(b)) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::vector<std::uint8_t>& v) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span{ v }) };
}

template <std::size_t N> [[nodiscard]] ScopeWipe scopeWipe(std::array<std::uint8_t, N>& a) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span{ a }) };
}

} // namespace keystead::security

#endif // INCLUDE_KEYSTEAD_SECURITY_SCOPEWIPE_HPP
