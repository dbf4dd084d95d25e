#include "keystead/crypto/KeyPair.hpp"
#include "keystead/crypto/CryptoErrors.hpp"
#include <stdexcept>
#include <utility>

namespace keystead::crypto
{

KeyPair::KeyPair(KeyType type, std::vector<std::uint8_t> publicKey,
                 keystead::security::SecureBuffer privateKey) noexcept
    : m_type{ type }, m_publicKey{ std::move(publicKey) }, m_privateKey{ std::move(privateKey) }
{
}

KeyPair KeyPair::generate(ICryptoProvider& crypto, KeyType type)
{
    auto privateKey{ keystead::security::secureBufferOfSize(privateKeyBytes(type)) };
    if (!crypto.randomBytes(keystead::security::asSpan(privateKey)))
    {
        throw std::runtime_error("KeyPair::generate: CSPRNG failure");
    }
    auto publicKey{ crypto.derivePublicKey(type, keystead::security::asSpan(privateKey)) };
    return KeyPair{ type, std::move(publicKey), std::move(privateKey) };
}

KeyPair KeyPair::fromPrivateKey(const ICryptoProvider& crypto, KeyType type,
                                std::span<const std::uint8_t> privateKey)
{
    if (privateKey.size() != privateKeyBytes(type))
    {
        throw InvalidPrivateKeyError("KeyPair::fromPrivateKey: wrong private key length");
    }
    auto publicKey{ crypto.derivePublicKey(type, privateKey) };
    return KeyPair{ type, std::move(publicKey), keystead::security::secureBufferFrom(privateKey) };
}

} // namespace keystead::crypto
