#include "keystead/storage/VaultOps.hpp"
#include "keystead/crypto/CryptoErrors.hpp"
#include "keystead/crypto/EnvelopeCipher.hpp"
#include "keystead/security/ScopeWipe.hpp"
#include <string>
#include <utility>

namespace keystead::storage::vault
{

NewIdentity prepareIdentity(keystead::crypto::ICryptoProvider& crypto, keystead::identity::IdentityKind kind,
                            const keystead::identity::NetworkName& network, std::string_view fragment,
                            std::optional<std::span<std::uint8_t>> privateKey)
{
    using keystead::crypto::KeyPair;
    using keystead::crypto::KeyType;

    auto keyPair{ [&] {
        if (!privateKey)
        {
            return KeyPair::generate(crypto, KeyType::Ed25519);
        }
        auto wipeCallerKey{ keystead::security::scopeWipe(*privateKey) };
        return KeyPair::fromPrivateKey(crypto, KeyType::Ed25519, *privateKey);
    }() };

    keystead::identity::KeyLocation location{ KeyType::Ed25519, std::string{ fragment }, keyPair.publicKey() };
    auto did{ keystead::identity::Did::fromPublicKey(kind, keyPair.publicKey(), network) };
    return NewIdentity{ std::move(did), std::move(location), std::move(keyPair) };
}

NewKey generateKey(keystead::crypto::ICryptoProvider& crypto, keystead::crypto::KeyType type,
                   std::string_view fragment)
{
    auto keyPair{ keystead::crypto::KeyPair::generate(crypto, type) };
    keystead::identity::KeyLocation location{ type, std::string{ fragment }, keyPair.publicKey() };
    return NewKey{ std::move(location), std::move(keyPair) };
}

keystead::crypto::KeyPair rebuildKey(const keystead::crypto::ICryptoProvider& crypto,
                                     const keystead::identity::KeyLocation& location,
                                     std::span<std::uint8_t> privateKey)
{
    auto wipeCallerKey{ keystead::security::scopeWipe(privateKey) };

    auto keyPair{ keystead::crypto::KeyPair::fromPrivateKey(crypto, location.keyType(), privateKey) };
    const keystead::identity::KeyLocation derived{ location.keyType(), location.fragment(), keyPair.publicKey() };
    if (derived != location)
    {
        throw keystead::crypto::InvalidPrivateKeyError("private key does not match the key location");
    }
    return keyPair;
}

Signature sign(const keystead::crypto::ICryptoProvider& crypto, const keystead::crypto::KeyPair& keyPair,
               std::span<const std::uint8_t> message)
{
    if (!keystead::crypto::canSign(keyPair.type()))
    {
        throw keystead::crypto::UnsupportedKeyTypeError("key type cannot sign");
    }
    return crypto.sign(keyPair.type(), keyPair.privateKey(), message);
}

keystead::crypto::EncryptedData encrypt(keystead::crypto::ICryptoProvider& crypto,
                                        std::span<const std::uint8_t> plainText,
                                        std::span<const std::uint8_t> associatedData,
                                        keystead::crypto::EncryptionAlgorithm encryption,
                                        const keystead::crypto::CekAlgorithm& cek,
                                        std::span<const std::uint8_t> recipientPublicKey)
{
    return keystead::crypto::encryptEnvelope(crypto, plainText, associatedData, encryption, cek, recipientPublicKey);
}

std::vector<std::uint8_t> decrypt(keystead::crypto::ICryptoProvider& crypto,
                                  const keystead::crypto::EncryptedData& data,
                                  keystead::crypto::EncryptionAlgorithm encryption,
                                  const keystead::crypto::CekAlgorithm& cek, const keystead::crypto::KeyPair& keyPair)
{
    const auto plainText{ keystead::crypto::decryptEnvelope(crypto, data, encryption, cek, keyPair) };
    return { plainText.begin(), plainText.end() };
}

} // namespace keystead::storage::vault
