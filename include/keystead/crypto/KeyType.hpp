#ifndef INCLUDE_KEYSTEAD_CRYPTO_KEYTYPE_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_KEYTYPE_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace keystead::crypto
{

constexpr std::size_t g_ed25519PrivateKeyBytes{ 32 };
constexpr std::size_t g_ed25519PublicKeyBytes{ 32 };
constexpr std::size_t g_ed25519SignatureBytes{ 64 };
constexpr std::size_t g_x25519PrivateKeyBytes{ 32 };
constexpr std::size_t g_x25519PublicKeyBytes{ 32 };
constexpr std::size_t g_x25519SharedSecretBytes{ 32 };

// The key type encodes usage capability: Ed25519 signs, X25519 agrees.
enum class KeyType : std::uint8_t
{
    Ed25519 = 1U,
    X25519 = 2U,
};

[[nodiscard]] constexpr std::string_view keyTypeName(KeyType type) noexcept
{
    switch (type)
    {
    case KeyType::Ed25519:
        return "Ed25519";
    case KeyType::X25519:
        return "X25519";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool canSign(KeyType type) noexcept
{
    return type == KeyType::Ed25519;
}

[[nodiscard]] constexpr bool canAgree(KeyType type) noexcept
{
    return type == KeyType::X25519;
}

[[nodiscard]] constexpr std::size_t privateKeyBytes(KeyType type) noexcept
{
    return (type == KeyType::Ed25519) ? g_ed25519PrivateKeyBytes : g_x25519PrivateKeyBytes;
}

[[nodiscard]] constexpr std::size_t publicKeyBytes(KeyType type) noexcept
{
    return (type == KeyType::Ed25519) ? g_ed25519PublicKeyBytes : g_x25519PublicKeyBytes;
}

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_KEYTYPE_HPP
