#ifndef INCLUDE_KEYSTEAD_CRYPTO_ENVELOPECIPHER_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_ENVELOPECIPHER_HPP

#include "keystead/crypto/Envelope.hpp"
#include "keystead/crypto/ICryptoProvider.hpp"
#include "keystead/crypto/KeyPair.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>

namespace keystead::crypto
{

// Anonymous-sender encryption to a static X25519 key with a fresh ephemeral key per call.
// Throws InvalidPublicKeyError, std::invalid_argument or EncryptionFailureError.
[[nodiscard]] EncryptedData encryptEnvelope(ICryptoProvider& crypto, std::span<const std::uint8_t> plainText,
                                            std::span<const std::uint8_t> associatedData,
                                            EncryptionAlgorithm encryption, const CekAlgorithm& cek,
                                            std::span<const std::uint8_t> recipientPublicKey);

// Throws InvalidPrivateKeyError for a non-agreement recipient key, InvalidPublicKeyError or
// MalformedEnvelopeError for malformed fields, and DecryptionFailureError when authentication fails.
[[nodiscard]] keystead::security::SecureBuffer decryptEnvelope(ICryptoProvider& crypto, const EncryptedData& data,
                                                               EncryptionAlgorithm encryption,
                                                               const CekAlgorithm& cek, const KeyPair& recipient);

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_ENVELOPECIPHER_HPP
