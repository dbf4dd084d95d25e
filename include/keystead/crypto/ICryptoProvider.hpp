#ifndef INCLUDE_KEYSTEAD_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_ICRYPTOPROVIDER_HPP

#include "keystead/crypto/KeyType.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace keystead::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };
constexpr std::size_t g_keyWrapBlockBytes{ 8 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

// Primitive operations used by key pairs, the envelope cipher and the storage backends.
// Implementations are stateless from the caller's point of view and safe for concurrent use.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // Throws InvalidPrivateKeyError if `privateKey` has the wrong length for `type`.
    [[nodiscard]] virtual std::vector<std::uint8_t> derivePublicKey(KeyType type,
                                                                    std::span<const std::uint8_t> privateKey) const = 0;

    // Ed25519 (RFC 8032, pure). Other key types throw UnsupportedKeyTypeError.
    [[nodiscard]] virtual std::vector<std::uint8_t> sign(KeyType type, std::span<const std::uint8_t> privateKey,
                                                         std::span<const std::uint8_t> message) const = 0;

    // X25519 (RFC 7748). A peer key that yields the all-zero secret throws InvalidPublicKeyError.
    [[nodiscard]] virtual keystead::security::SecureBuffer
    keyAgreement(std::span<const std::uint8_t> privateKey, std::span<const std::uint8_t> peerPublicKey) const = 0;

    // AEAD: AES-256-GCM with a fresh random 96-bit nonce per call.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> plainText,
                                              std::span<const std::uint8_t> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<keystead::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::uint8_t> associatedData) = 0;

    // AES-256 key wrap (RFC 3394). Output is one 8-byte block longer than `key`.
    [[nodiscard]] virtual std::vector<std::uint8_t> wrapKey(std::span<const std::uint8_t> kek,
                                                            std::span<const std::uint8_t> key) const = 0;

    // Throws std::invalid_argument unless `wrapped` is block aligned and at least three blocks long.
    // Returns std::nullopt when the integrity check fails.
    [[nodiscard]] virtual std::optional<keystead::security::SecureBuffer>
    unwrapKey(std::span<const std::uint8_t> kek, std::span<const std::uint8_t> wrapped) const = 0;
};

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_ICRYPTOPROVIDER_HPP
