#include "keystead/crypto/CryptoErrors.hpp"
#include "keystead/crypto/OpenSslSymmetric.hpp"
#include "keystead/crypto/providers/OpenSslProviderFactory.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include "keystead/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace keystead::crypto::providers
{
namespace
{

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

[[nodiscard]] int evpKeyId(keystead::crypto::KeyType type) noexcept
{
    return (type == keystead::crypto::KeyType::Ed25519) ? EVP_PKEY_ED25519 : EVP_PKEY_X25519;
}

[[nodiscard]] EvpPkeyPtr loadPrivateKey(keystead::crypto::KeyType type, std::span<const std::uint8_t> privateKey,
                                        const char* what)
{
    if (privateKey.size() != keystead::crypto::privateKeyBytes(type))
    {
        throw keystead::crypto::InvalidPrivateKeyError(what);
    }
    EvpPkeyPtr pkey{ EVP_PKEY_new_raw_private_key(evpKeyId(type), nullptr, privateKey.data(), privateKey.size()),
                     &EVP_PKEY_free };
    if (!pkey)
    {
        throw keystead::crypto::InvalidPrivateKeyError(what);
    }
    return pkey;
}

[[nodiscard]] bool isAllZero(std::span<const std::uint8_t> bytes) noexcept
{
    std::uint8_t acc{ 0U };
    for (const std::uint8_t b : bytes)
    {
        acc |= b;
    }
    return acc == 0U;
}

class OpenSslCryptoProvider final : public keystead::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return keystead::security::secureRandomFill(out);
    }

    [[nodiscard]] std::vector<std::uint8_t> derivePublicKey(keystead::crypto::KeyType type,
                                                            std::span<const std::uint8_t> privateKey) const override
    {
        const auto pkey{ loadPrivateKey(type, privateKey, "derivePublicKey: invalid private key") };

        std::vector<std::uint8_t> publicKey(keystead::crypto::publicKeyBytes(type));
        std::size_t written{ publicKey.size() };
        if (EVP_PKEY_get_raw_public_key(pkey.get(), publicKey.data(), &written) != 1 || written != publicKey.size())
        {
            throw std::runtime_error("derivePublicKey: EVP_PKEY_get_raw_public_key failed");
        }
        return publicKey;
    }

    [[nodiscard]] std::vector<std::uint8_t> sign(keystead::crypto::KeyType type,
                                                 std::span<const std::uint8_t> privateKey,
                                                 std::span<const std::uint8_t> message) const override
    {
        if (!keystead::crypto::canSign(type))
        {
            throw keystead::crypto::UnsupportedKeyTypeError("sign: key type cannot sign");
        }
        const auto pkey{ loadPrivateKey(type, privateKey, "sign: invalid private key") };

        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("sign: EVP_MD_CTX_new failed");
        }
        // Ed25519 is a one-shot scheme: no digest is configured.
        if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1)
        {
            throw std::runtime_error("sign: EVP_DigestSignInit failed");
        }

        static constexpr std::uint8_t kEmpty{ 0U };
        const std::uint8_t* msg{ message.empty() ? &kEmpty : message.data() };

        std::vector<std::uint8_t> signature(keystead::crypto::g_ed25519SignatureBytes);
        std::size_t sigLen{ signature.size() };
        if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, msg, message.size()) != 1 ||
            sigLen != signature.size())
        {
            throw std::runtime_error("sign: EVP_DigestSign failed");
        }
        return signature;
    }

    [[nodiscard]] keystead::security::SecureBuffer
    keyAgreement(std::span<const std::uint8_t> privateKey, std::span<const std::uint8_t> peerPublicKey) const override
    {
        const auto pkey{ loadPrivateKey(keystead::crypto::KeyType::X25519, privateKey,
                                        "keyAgreement: invalid private key") };
        if (peerPublicKey.size() != keystead::crypto::g_x25519PublicKeyBytes)
        {
            throw keystead::crypto::InvalidPublicKeyError("keyAgreement: invalid peer key length");
        }
        EvpPkeyPtr peer{ EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peerPublicKey.data(),
                                                     peerPublicKey.size()),
                         &EVP_PKEY_free };
        if (!peer)
        {
            throw keystead::crypto::InvalidPublicKeyError("keyAgreement: invalid peer key");
        }

        EvpPkeyCtxPtr ctx{ EVP_PKEY_CTX_new(pkey.get(), nullptr), &EVP_PKEY_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("keyAgreement: EVP_PKEY_CTX_new failed");
        }
        if (EVP_PKEY_derive_init(ctx.get()) != 1)
        {
            throw std::runtime_error("keyAgreement: EVP_PKEY_derive_init failed");
        }
        if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1)
        {
            throw keystead::crypto::InvalidPublicKeyError("keyAgreement: peer key rejected");
        }

        auto shared{ keystead::security::secureBufferOfSize(keystead::crypto::g_x25519SharedSecretBytes) };
        std::size_t written{ shared.size() };
        // OpenSSL refuses to derive a low-order (all-zero) result.
        if (EVP_PKEY_derive(ctx.get(), shared.data(), &written) != 1)
        {
            throw keystead::crypto::InvalidPublicKeyError("keyAgreement: peer key rejected");
        }
        if (written != shared.size() || isAllZero(keystead::security::asSpan(shared)))
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

std::unique_ptr<keystead::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace keystead::crypto::providers
