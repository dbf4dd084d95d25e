#ifndef INCLUDE_KEYSTEAD_STORAGE_ISTORAGE_HPP
#define INCLUDE_KEYSTEAD_STORAGE_ISTORAGE_HPP

#include "keystead/crypto/Envelope.hpp"
#include "keystead/crypto/KeyType.hpp"
#include "keystead/identity/Did.hpp"
#include "keystead/identity/KeyLocation.hpp"
#include "keystead/storage/StorageError.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace keystead::storage
{

using Signature = std::vector<std::uint8_t>;

struct CreatedIdentity final
{
    keystead::identity::Did did;
    keystead::identity::KeyLocation location;
};

// Key storage for decentralized identities. Each identity owns a vault of key pairs and one
// opaque blob. Private keys never leave a backend; callers address them by KeyLocation.
//
// Every operation is safe to call concurrently and is atomic on its own. None of them throw:
// failures come back as StorageError.
class IStorage
{
public:
    IStorage() = default;
    IStorage(const IStorage&) = delete;
    IStorage& operator=(const IStorage&) = delete;
    IStorage(IStorage&&) = delete;
    IStorage& operator=(IStorage&&) = delete;
    virtual ~IStorage() = default;

    // Creates an identity whose DID is derived from an Ed25519 key: the supplied private key
    // (wiped in place on every path) or a freshly generated one. AlreadyExists if the DID is
    // registered; the check and the insert are one atomic step.
    [[nodiscard]] virtual StorageResult<CreatedIdentity>
    identityCreate(keystead::identity::IdentityKind kind, const keystead::identity::NetworkName& network,
                   std::string_view fragment, std::optional<std::span<std::uint8_t>> privateKey) noexcept = 0;

    // Removes the vault and the blob. Returns false if the identity was already absent.
    [[nodiscard]] virtual StorageResult<bool> identityPurge(const keystead::identity::Did& did) noexcept = 0;

    [[nodiscard]] virtual StorageResult<bool> identityExists(const keystead::identity::Did& did) noexcept = 0;

    [[nodiscard]] virtual StorageResult<std::vector<keystead::identity::Did>> identityList() noexcept = 0;

    // Creates the vault if the identity has none.
    [[nodiscard]] virtual StorageResult<keystead::identity::KeyLocation>
    keyGenerate(const keystead::identity::Did& did, keystead::crypto::KeyType type,
                std::string_view fragment) noexcept = 0;

    // Rebuilds a key pair of `location.keyType()` from `privateKey`, which is wiped in place on
    // every path. InvalidPrivateKey if the bytes are not a key of that type or do not produce
    // `location`. Creates the vault if the identity has none.
    [[nodiscard]] virtual StorageResult<std::monostate> keyInsert(const keystead::identity::Did& did,
                                                                  const keystead::identity::KeyLocation& location,
                                                                  std::span<std::uint8_t> privateKey) noexcept = 0;

    // False, not an error, when the vault is missing.
    [[nodiscard]] virtual StorageResult<bool> keyExists(const keystead::identity::Did& did,
                                                        const keystead::identity::KeyLocation& location) noexcept = 0;

    [[nodiscard]] virtual StorageResult<std::vector<std::uint8_t>>
    keyPublic(const keystead::identity::Did& did, const keystead::identity::KeyLocation& location) noexcept = 0;

    // Returns whether a key was removed. VaultNotFound if the identity has no vault.
    [[nodiscard]] virtual StorageResult<bool> keyDelete(const keystead::identity::Did& did,
                                                        const keystead::identity::KeyLocation& location) noexcept = 0;

    [[nodiscard]] virtual StorageResult<Signature> keySign(const keystead::identity::Did& did,
                                                           const keystead::identity::KeyLocation& location,
                                                           std::span<const std::uint8_t> message) noexcept = 0;

    // Encrypts to `recipientPublicKey`. The sender stays anonymous and nothing is stored.
    [[nodiscard]] virtual StorageResult<keystead::crypto::EncryptedData>
    dataEncrypt(const keystead::identity::Did& did, std::span<const std::uint8_t> plainText,
                std::span<const std::uint8_t> associatedData, keystead::crypto::EncryptionAlgorithm encryption,
                const keystead::crypto::CekAlgorithm& cek,
                std::span<const std::uint8_t> recipientPublicKey) noexcept = 0;

    [[nodiscard]] virtual StorageResult<std::vector<std::uint8_t>>
    dataDecrypt(const keystead::identity::Did& did, const keystead::crypto::EncryptedData& data,
                keystead::crypto::EncryptionAlgorithm encryption, const keystead::crypto::CekAlgorithm& cek,
                const keystead::identity::KeyLocation& location) noexcept = 0;

    // Replaces the identity's blob wholesale.
    [[nodiscard]] virtual StorageResult<std::monostate> blobSet(const keystead::identity::Did& did,
                                                                std::span<const std::uint8_t> blob) noexcept = 0;

    [[nodiscard]] virtual StorageResult<std::optional<std::vector<std::uint8_t>>>
    blobGet(const keystead::identity::Did& did) noexcept = 0;

    // Asks the backend to make prior writes durable, for one identity or for all of them.
    [[nodiscard]] virtual StorageResult<std::monostate>
    flush(const std::optional<keystead::identity::Did>& scope) noexcept = 0;
};

} // namespace keystead::storage

#endif // INCLUDE_KEYSTEAD_STORAGE_ISTORAGE_HPP
