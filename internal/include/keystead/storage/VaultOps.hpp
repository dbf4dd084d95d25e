#ifndef INCLUDE_KEYSTEAD_STORAGE_VAULTOPS_HPP
#define INCLUDE_KEYSTEAD_STORAGE_VAULTOPS_HPP

#include "keystead/crypto/Envelope.hpp"
#include "keystead/crypto/ICryptoProvider.hpp"
#include "keystead/crypto/KeyPair.hpp"
#include "keystead/identity/Did.hpp"
#include "keystead/identity/KeyLocation.hpp"
#include "keystead/storage/IStorage.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

// Backend-independent steps shared by every IStorage implementation. They throw; callers run
// them under guardStorage().
namespace keystead::storage::vault
{

struct NewIdentity final
{
    keystead::identity::Did did;
    keystead::identity::KeyLocation location;
    keystead::crypto::KeyPair keyPair;
};

// Builds the Ed25519 pair, its location and the DID derived from it. The caller's private key
// is wiped before returning or throwing.
[[nodiscard]] NewIdentity prepareIdentity(keystead::crypto::ICryptoProvider& crypto,
                                          keystead::identity::IdentityKind kind,
                                          const keystead::identity::NetworkName& network, std::string_view fragment,
                                          std::optional<std::span<std::uint8_t>> privateKey);

struct NewKey final
{
    keystead::identity::KeyLocation location;
    keystead::crypto::KeyPair keyPair;
};

[[nodiscard]] NewKey generateKey(keystead::crypto::ICryptoProvider& crypto, keystead::crypto::KeyType type,
                                 std::string_view fragment);

// Rebuilds the pair for `location` and wipes `privateKey`. Throws InvalidPrivateKeyError when the
// bytes are not a key of the location's type or derive a different location.
[[nodiscard]] keystead::crypto::KeyPair rebuildKey(const keystead::crypto::ICryptoProvider& crypto,
                                                   const keystead::identity::KeyLocation& location,
                                                   std::span<std::uint8_t> privateKey);

// Throws UnsupportedKeyTypeError for a key that cannot sign.
[[nodiscard]] Signature sign(const keystead::crypto::ICryptoProvider& crypto, const keystead::crypto::KeyPair& keyPair,
                             std::span<const std::uint8_t> message);

[[nodiscard]] keystead::crypto::EncryptedData encrypt(keystead::crypto::ICryptoProvider& crypto,
                                                      std::span<const std::uint8_t> plainText,
                                                      std::span<const std::uint8_t> associatedData,
                                                      keystead::crypto::EncryptionAlgorithm encryption,
                                                      const keystead::crypto::CekAlgorithm& cek,
                                                      std::span<const std::uint8_t> recipientPublicKey);

// Throws InvalidPrivateKeyError when `keyPair` is not an agreement key.
[[nodiscard]] std::vector<std::uint8_t> decrypt(keystead::crypto::ICryptoProvider& crypto,
                                                const keystead::crypto::EncryptedData& data,
                                                keystead::crypto::EncryptionAlgorithm encryption,
                                                const keystead::crypto::CekAlgorithm& cek,
                                                const keystead::crypto::KeyPair& keyPair);

} // namespace keystead::storage::vault

#endif // INCLUDE_KEYSTEAD_STORAGE_VAULTOPS_HPP
