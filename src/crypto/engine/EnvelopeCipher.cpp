#include "keystead/crypto/EnvelopeCipher.hpp"
#include "keystead/crypto/ConcatKdf.hpp"
#include "keystead/crypto/CryptoErrors.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace keystead::crypto
{
namespace
{

// Contract violations and validation errors pass through; anything else a primitive
// raises becomes the error type of the direction being run.
template <class Failure, class Fn> auto translatePrimitiveErrors(const char* step, Fn&& fn)
{
    try
    {
        return std::forward<Fn>(fn)();
    }
    catch (const std::logic_error&)
    {
        throw;
    }
    catch (const Failure&)
    {
        throw;
    }
    catch (const std::runtime_error& e)
    {
        throw Failure(std::string{ step } + ": " + e.what());
    }
}

[[nodiscard]] keystead::security::SecureBuffer deriveAgreementKey(const ICryptoProvider& crypto,
                                                                  std::span<const std::uint8_t> privateKey,
                                                                  std::span<const std::uint8_t> peerPublicKey,
                                                                  const CekAlgorithm& cek, std::size_t keyBytes)
{
    auto shared{ crypto.keyAgreement(privateKey, peerPublicKey) };
    return concatKdf(cekAlgorithmName(cek), keyBytes, keystead::security::asSpan(shared), agreementInfo(cek));
}

} // namespace

EncryptedData encryptEnvelope(ICryptoProvider& crypto, std::span<const std::uint8_t> plainText,
                              std::span<const std::uint8_t> associatedData, EncryptionAlgorithm encryption,
                              const CekAlgorithm& cek, std::span<const std::uint8_t> recipientPublicKey)
{
    if (recipientPublicKey.size() != g_x25519PublicKeyBytes)
    {
        throw InvalidPublicKeyError("encryptEnvelope: recipient key is not an X25519 public key");
    }
    const std::size_t cekBytes{ encryptionKeyBytes(encryption) };

    auto ephemeral{ translatePrimitiveErrors<EncryptionFailureError>(
        "encryptEnvelope: ephemeral key", [&] { return KeyPair::generate(crypto, KeyType::X25519); }) };

    EncryptedData out{};
    out.ephemeralPublicKey = ephemeral.publicKey();
    out.associatedData.assign(associatedData.begin(), associatedData.end());

    auto agreementKey{ translatePrimitiveErrors<EncryptionFailureError>("encryptEnvelope: key agreement", [&] {
        return deriveAgreementKey(crypto, ephemeral.privateKey(), recipientPublicKey, cek, cekBytes);
    }) };

    keystead::security::SecureBuffer contentKey{};
    if (std::holds_alternative<EcdhEs>(cek))
    {
        contentKey = std::move(agreementKey);
    }
    else
    {
        contentKey = keystead::security::secureBufferOfSize(cekBytes);
        if (!crypto.randomBytes(keystead::security::asSpan(contentKey)))
        {
            throw EncryptionFailureError("encryptEnvelope: CSPRNG failure");
        }
        out.encryptedCek = translatePrimitiveErrors<EncryptionFailureError>("encryptEnvelope: key wrap", [&] {
            return crypto.wrapKey(keystead::security::asSpan(agreementKey), keystead::security::asSpan(contentKey));
        });
    }

    auto box{ translatePrimitiveErrors<EncryptionFailureError>("encryptEnvelope: content encryption", [&] {
        return crypto.aeadEncrypt(keystead::security::asSpan(contentKey), plainText, associatedData);
    }) };

    out.nonce.assign(box.nonce.begin(), box.nonce.end());
    out.tag.assign(box.tag.begin(), box.tag.end());
    out.cipherText = std::move(box.cipherText);
    return out;
}

keystead::security::SecureBuffer decryptEnvelope(ICryptoProvider& crypto, const EncryptedData& data,
                                                 EncryptionAlgorithm encryption, const CekAlgorithm& cek,
                                                 const KeyPair& recipient)
{
    if (!canAgree(recipient.type()))
    {
        throw InvalidPrivateKeyError("decryptEnvelope: recipient key cannot perform key agreement");
    }
    if (data.ephemeralPublicKey.size() != g_x25519PublicKeyBytes)
    {
        throw InvalidPublicKeyError("decryptEnvelope: malformed ephemeral public key");
    }
    if (data.nonce.size() != g_aeadNonceBytes || data.tag.size() != g_aeadTagBytes)
    {
        throw MalformedEnvelopeError("decryptEnvelope: malformed nonce or tag");
    }
    const std::size_t cekBytes{ encryptionKeyBytes(encryption) };
    const bool wrapped{ std::holds_alternative<EcdhEsA256Kw>(cek) };
    if (wrapped && data.encryptedCek.size() != cekBytes + g_keyWrapBlockBytes)
    {
        throw MalformedEnvelopeError("decryptEnvelope: encrypted content key has the wrong length");
    }

    auto agreementKey{ translatePrimitiveErrors<DecryptionFailureError>("decryptEnvelope: key agreement", [&] {
        return deriveAgreementKey(crypto, recipient.privateKey(), data.ephemeralPublicKey, cek, cekBytes);
    }) };

    keystead::security::SecureBuffer contentKey{};
    if (!wrapped)
    {
        contentKey = std::move(agreementKey);
    }
    else
    {
        auto unwrapped{ translatePrimitiveErrors<DecryptionFailureError>("decryptEnvelope: key unwrap", [&] {
            return crypto.unwrapKey(keystead::security::asSpan(agreementKey), data.encryptedCek);
        }) };
        if (!unwrapped)
        {
            throw DecryptionFailureError("decryptEnvelope: content key integrity check failed");
        }
        contentKey = std::move(*unwrapped);
    }

    AeadBox box{};
    std::copy(data.nonce.begin(), data.nonce.end(), box.nonce.begin());
    std::copy(data.tag.begin(), data.tag.end(), box.tag.begin());
    box.cipherText = data.cipherText;

    auto plainText{ translatePrimitiveErrors<DecryptionFailureError>("decryptEnvelope: content decryption", [&] {
        return crypto.aeadDecrypt(keystead::security::asSpan(contentKey), box, data.associatedData);
    }) };
    if (!plainText)
    {
        throw DecryptionFailureError("decryptEnvelope: authentication failed");
    }
    return std::move(*plainText);
}

} // namespace keystead::crypto
