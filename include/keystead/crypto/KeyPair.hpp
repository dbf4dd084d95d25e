#ifndef INCLUDE_KEYSTEAD_CRYPTO_KEYPAIR_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_KEYPAIR_HPP

#include "keystead/crypto/ICryptoProvider.hpp"
#include "keystead/crypto/KeyType.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace keystead::crypto
{

// A public/private key pair of one key type. The private half lives in a wiping buffer
// and is never copied; a pair is moved into exactly one vault entry.
class KeyPair final
{
public:
    // Throws std::runtime_error if the CSPRNG fails.
    [[nodiscard]] static KeyPair generate(ICryptoProvider& crypto, KeyType type);

    // Throws InvalidPrivateKeyError if `privateKey` is not a valid key of `type`.
    [[nodiscard]] static KeyPair fromPrivateKey(const ICryptoProvider& crypto, KeyType type,
                                                std::span<const std::uint8_t> privateKey);

    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;
    KeyPair(KeyPair&&) noexcept = default;
    KeyPair& operator=(KeyPair&&) noexcept = default;
    ~KeyPair() = default;

    [[nodiscard]] KeyType type() const noexcept
    {
        return m_type;
    }

    [[nodiscard]] const std::vector<std::uint8_t>& publicKey() const noexcept
    {
        return m_publicKey;
    }

    [[nodiscard]] std::span<const std::uint8_t> privateKey() const noexcept
    {
        return keystead::security::asSpan(m_privateKey);
    }

private:
    KeyPair(KeyType type, std::vector<std::uint8_t> publicKey, keystead::security::SecureBuffer privateKey) noexcept;

    KeyType m_type;
    std::vector<std::uint8_t> m_publicKey;
    keystead::security::SecureBuffer m_privateKey;
};

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_KEYPAIR_HPP
