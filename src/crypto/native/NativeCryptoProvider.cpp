#include "keystead/crypto/CryptoErrors.hpp"
#include "keystead/crypto/OpenSslSymmetric.hpp"
#include "keystead/crypto/providers/NativeProviderFactory.hpp"
#include "keystead/security/ScopeWipe.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include "keystead/security/SecureRandom.hpp"
#include "monocypher-ed25519.h"
#include "monocypher.h"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace keystead::crypto::providers
{
namespace
{

// Monocypher keeps the Ed25519 secret key as seed || public key.
constexpr std::size_t g_kEd25519ExpandedSecretBytes{ 64 };

void requirePrivateKeySize(keystead::crypto::KeyType type, std::span<const std::uint8_t> privateKey, const char* what)
{
    if (privateKey.size() != keystead::crypto::privateKeyBytes(type))
    {
        throw keystead::crypto::InvalidPrivateKeyError(what);
    }
}

// crypto_ed25519_key_pair() wipes the seed it is given, so it always receives a copy.
void expandEd25519(std::span<const std::uint8_t> seed,
                   std::array<std::uint8_t, g_kEd25519ExpandedSecretBytes>& secretKey,
                   std::array<std::uint8_t, keystead::crypto::g_ed25519PublicKeyBytes>& publicKey)
{
    std::array<std::uint8_t, keystead::crypto::g_ed25519PrivateKeyBytes> seedCopy{};
    auto wipeSeed{ keystead::security::scopeWipe(seedCopy) };
    std::copy(seed.begin(), seed.end(), seedCopy.begin());
    crypto_ed25519_key_pair(secretKey.data(), publicKey.data(), seedCopy.data());
}

class NativeCryptoProvider final : public keystead::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return keystead::security::secureRandomFill(out);
    }

    [[nodiscard]] std::vector<std::uint8_t> derivePublicKey(keystead::crypto::KeyType type,
                                                            std::span<const std::uint8_t> privateKey) const override
    {
        requirePrivateKeySize(type, privateKey, "derivePublicKey: invalid private key");

        if (type == keystead::crypto::KeyType::X25519)
        {
            std::vector<std::uint8_t> publicKey(keystead::crypto::g_x25519PublicKeyBytes);
            crypto_x25519_public_key(publicKey.data(), privateKey.data());
            return publicKey;
        }

        std::array<std::uint8_t, g_kEd25519ExpandedSecretBytes> secretKey{};
        auto wipeSecret{ keystead::security::scopeWipe(secretKey) };
        std::array<std::uint8_t, keystead::crypto::g_ed25519PublicKeyBytes> publicKey{};
        expandEd25519(privateKey, secretKey, publicKey);
        return { publicKey.begin(), publicKey.end() };
    }

    [[nodiscard]] std::vector<std::uint8_t> sign(keystead::crypto::KeyType type,
                                                 std::span<const std::uint8_t> privateKey,
                                                 std::span<const std::uint8_t> message) const override
    {
        if (!keystead::crypto::canSign(type))
        {
            throw keystead::crypto::UnsupportedKeyTypeError("sign: key type cannot sign");
        }
        requirePrivateKeySize(type, privateKey, "sign: invalid private key");

        std::array<std::uint8_t, g_kEd25519ExpandedSecretBytes> secretKey{};
        auto wipeSecret{ keystead::security::scopeWipe(secretKey) };
        std::array<std::uint8_t, keystead::crypto::g_ed25519PublicKeyBytes> publicKey{};
        expandEd25519(privateKey, secretKey, publicKey);

        std::vector<std::uint8_t> signature(keystead::crypto::g_ed25519SignatureBytes);
        crypto_ed25519_sign(signature.data(), secretKey.data(), message.data(), message.size());
        return signature;
    }

    [[nodiscard]] keystead::security::SecureBuffer
    keyAgreement(std::span<const std::uint8_t> privateKey, std::span<const std::uint8_t> peerPublicKey) const override
    {
        requirePrivateKeySize(keystead::crypto::KeyType::X25519, privateKey, "keyAgreement: invalid private key");
        if (peerPublicKey.size() != keystead::crypto::g_x25519PublicKeyBytes)
        {
            throw keystead::crypto::InvalidPublicKeyError("keyAgreement: invalid peer key length");
        }

        auto shared{ keystead::security::secureBufferOfSize(keystead::crypto::g_x25519SharedSecretBytes) };
        crypto_x25519(shared.data(), privateKey.data(), peerPublicKey.data());

        // Monocypher does not reject low-order points; an all-zero result means the peer key is unusable.
        std::uint8_t acc{ 0U };
        for (const std::uint8_t b : shared)
        {
            acc |= b;
        }
        if (acc == 0U)
        {
            keystead::security::secureRelease(shared);
            throw keystead::crypto::InvalidPublicKeyError("keyAgreement: peer key rejected");
        }
        return shared;
    }

    [[nodiscard]] keystead::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                        std::span<const std::uint8_t> plainText,
                                                        std::span<const std::uint8_t> associatedData) override
    {
        std::array<std::uint8_t, keystead::crypto::g_aeadNonceBytes> nonce{};
        if (!randomBytes(std::span<std::uint8_t>{ nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }
        return keystead::crypto::openssl::aes256GcmSeal(key, nonce, plainText, associatedData);
    }

    [[nodiscard]] std::optional<keystead::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const keystead::crypto::AeadBox& box,
                std::span<const std::uint8_t> associatedData) override
    {
        return keystead::crypto::openssl::aes256GcmOpen(key, box, associatedData);
    }

    [[nodiscard]] std::vector<std::uint8_t> wrapKey(std::span<const std::uint8_t> kek,
                                                    std::span<const std::uint8_t> key) const override
    {
        return keystead::crypto::openssl::aes256KeyWrap(kek, key);
    }

    [[nodiscard]] std::optional<keystead::security::SecureBuffer>
    unwrapKey(std::span<const std::uint8_t> kek, std::span<const std::uint8_t> wrapped) const override
    {
        return keystead::crypto::openssl::aes256KeyUnwrap(kek, wrapped);
    }
};

} // namespace

std::unique_ptr<keystead::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace keystead::crypto::providers
