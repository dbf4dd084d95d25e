#include "keystead/identity/KeyLocation.hpp"
#include "keystead/crypto/Sha256.hpp"
#include <cstddef>
#include <string_view>
#include <utility>

namespace keystead::identity
{
namespace
{

constexpr std::size_t g_kFingerprintBytes{ 8 };

[[nodiscard]] std::uint64_t fingerprintOf(std::span<const std::uint8_t> publicKey)
{
    const auto digest{ keystead::crypto::sha256(publicKey) };
    std::uint64_t v{ 0U };
    for (std::size_t i{ 0U }; i < g_kFingerprintBytes; ++i)
    {
        v = (v << 8U) | digest[i];
    }
    return v;
}

} // namespace

KeyLocation::KeyLocation(keystead::crypto::KeyType keyType, std::string fragment,
                         std::span<const std::uint8_t> publicKey)
    : m_keyType{ keyType }, m_fragment{ std::move(fragment) }, m_fingerprint{ fingerprintOf(publicKey) }
{
}

std::string KeyLocation::canonical() const
{
    constexpr std::string_view kHexDigits{ "0123456789abcdef" };
    constexpr unsigned kNibbles{ 16U };

    std::string out{ m_fragment };
    out.push_back(':');
    for (unsigned i{ kNibbles }; i > 0U; --i)
    {
        out.push_back(kHexDigits[(m_fingerprint >> ((i - 1U) * 4U)) & 0xFU]);
    }
    return out;
}

} // namespace keystead::identity
