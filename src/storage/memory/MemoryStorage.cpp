#include "keystead/storage/memory/MemoryStorageFactory.hpp"
#include "keystead/storage/StorageGuard.hpp"
#include "keystead/storage/VaultOps.hpp"
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace keystead::storage::memory
{
namespace
{

using keystead::identity::Did;
using keystead::identity::KeyLocation;

using Vault = std::map<KeyLocation, keystead::crypto::KeyPair>;

class MemoryStorage final : public keystead::storage::IStorage
{
public:
    explicit MemoryStorage(keystead::crypto::ICryptoProvider& crypto) noexcept : m_crypto{ crypto }
    {
    }

    [[nodiscard]] StorageResult<CreatedIdentity>
    identityCreate(keystead::identity::IdentityKind kind, const keystead::identity::NetworkName& network,
                   std::string_view fragment, std::optional<std::span<std::uint8_t>> privateKey) noexcept override
    {
        return guardStorage("identityCreate", [&] {
            auto prepared{ vault::prepareIdentity(m_crypto, kind, network, fragment, privateKey) };

            const std::unique_lock lock{ m_vaultsMutex };
            if (m_vaults.contains(prepared.did))
            {
                throw StorageFailure(StorageErrc::AlreadyExists, "identity already exists");
            }
            vaultFor(prepared.did).emplace(prepared.location, std::move(prepared.keyPair));
            return CreatedIdentity{ std::move(prepared.did), std::move(prepared.location) };
        });
    }

    [[nodiscard]] StorageResult<bool> identityPurge(const Did& did) noexcept override
    {
        return guardStorage("identityPurge", [&] {
            const std::unique_lock vaultsLock{ m_vaultsMutex };
            if (m_vaults.erase(did) == 0U)
            {
                return false;
            }
            const std::unique_lock blobsLock{ m_blobsMutex };
            m_blobs.erase(did);
            return true;
        });
    }

    [[nodiscard]] StorageResult<bool> identityExists(const Did& did) noexcept override
    {
        return guardStorage("identityExists", [&] {
            const std::shared_lock lock{ m_vaultsMutex };
            return m_vaults.contains(did);
        });
    }

    [[nodiscard]] StorageResult<std::vector<Did>> identityList() noexcept override
    {
        return guardStorage("identityList", [&] {
            const std::shared_lock lock{ m_vaultsMutex };
            std::vector<Did> dids{};
            dids.reserve(m_vaults.size());
            for (const auto& entry : m_vaults)
            {
                dids.push_back(entry.first);
            }
            return dids;
        });
    }

    [[nodiscard]] StorageResult<KeyLocation> keyGenerate(const Did& did, keystead::crypto::KeyType type,
                                                         std::string_view fragment) noexcept override
    {
        return guardStorage("keyGenerate", [&] {
            auto generated{ vault::generateKey(m_crypto, type, fragment) };

            const std::unique_lock lock{ m_vaultsMutex };
            vaultFor(did).insert_or_assign(generated.location, std::move(generated.keyPair));
            return generated.location;
        });
    }

    [[nodiscard]] StorageResult<std::monostate> keyInsert(const Did& did, const KeyLocation& location,
                                                          std::span<std::uint8_t> privateKey) noexcept override
    {
        return guardStorage("keyInsert", [&] {
            auto keyPair{ vault::rebuildKey(m_crypto, location, privateKey) };

            const std::unique_lock lock{ m_vaultsMutex };
            vaultFor(did).insert_or_assign(location, std::move(keyPair));
            return std::monostate{};
        });
    }

    [[nodiscard]] StorageResult<bool> keyExists(const Did& did, const KeyLocation& location) noexcept override
    {
        return guardStorage("keyExists", [&] {
            const std::shared_lock lock{ m_vaultsMutex };
            const auto it{ m_vaults.find(did) };
            return it != m_vaults.end() && it->second.contains(location);
        });
    }

    [[nodiscard]] StorageResult<std::vector<std::uint8_t>> keyPublic(const Did& did,
                                                                     const KeyLocation& location) noexcept override
    {
        return guardStorage("keyPublic", [&] {
            const std::shared_lock lock{ m_vaultsMutex };
            return findKey(did, location).publicKey();
        });
    }

    [[nodiscard]] StorageResult<bool> keyDelete(const Did& did, const KeyLocation& location) noexcept override
    {
        return guardStorage("keyDelete", [&] {
            const std::unique_lock lock{ m_vaultsMutex };
            return findVault(did).erase(location) != 0U;
        });
    }

    [[nodiscard]] StorageResult<Signature> keySign(const Did& did, const KeyLocation& location,
                                                   std::span<const std::uint8_t> message) noexcept override
    {
        return guardStorage("keySign", [&] {
            const std::shared_lock lock{ m_vaultsMutex };
            return vault::sign(m_crypto, findKey(did, location), message);
        });
    }

    [[nodiscard]] StorageResult<keystead::crypto::EncryptedData>
    dataEncrypt([[maybe_unused]] const Did& did, std::span<const std::uint8_t> plainText,
                std::span<const std::uint8_t> associatedData, keystead::crypto::EncryptionAlgorithm encryption,
                const keystead::crypto::CekAlgorithm& cek,
                std::span<const std::uint8_t> recipientPublicKey) noexcept override
    {
        return guardStorage("dataEncrypt", [&] {
            return vault::encrypt(m_crypto, plainText, associatedData, encryption, cek, recipientPublicKey);
        });
    }

    [[nodiscard]] StorageResult<std::vector<std::uint8_t>>
    dataDecrypt(const Did& did, const keystead::crypto::EncryptedData& data,
                keystead::crypto::EncryptionAlgorithm encryption, const keystead::crypto::CekAlgorithm& cek,
                const KeyLocation& location) noexcept override
    {
        return guardStorage("dataDecrypt", [&] {
            const std::shared_lock lock{ m_vaultsMutex };
            return vault::decrypt(m_crypto, data, encryption, cek, findKey(did, location));
        });
    }

    [[nodiscard]] StorageResult<std::monostate> blobSet(const Did& did,
                                                        std::span<const std::uint8_t> blob) noexcept override
    {
        return guardStorage("blobSet", [&] {
            std::vector<std::uint8_t> copy(blob.begin(), blob.end());
            const std::unique_lock lock{ m_blobsMutex };
            m_blobs.insert_or_assign(did, std::move(copy));
            return std::monostate{};
        });
    }

    [[nodiscard]] StorageResult<std::optional<std::vector<std::uint8_t>>> blobGet(const Did& did) noexcept override
    {
        return guardStorage("blobGet", [&] {
            const std::shared_lock lock{ m_blobsMutex };
            const auto it{ m_blobs.find(did) };
            return (it == m_blobs.end()) ? std::optional<std::vector<std::uint8_t>>{} : std::optional{ it->second };
        });
    }

    [[nodiscard]] StorageResult<std::monostate>
    flush([[maybe_unused]] const std::optional<Did>& scope) noexcept override
    {
        return std::monostate{};
    }

private:
    // Callers hold m_vaultsMutex exclusively. Creates the vault if the identity has none.
    [[nodiscard]] Vault& vaultFor(const Did& did)
    {
        return m_vaults.try_emplace(did).first->second;
    }

    // Callers hold m_vaultsMutex.
    [[nodiscard]] Vault& findVault(const Did& did)
    {
        const auto it{ m_vaults.find(did) };
        if (it == m_vaults.end())
        {
            throw StorageFailure(StorageErrc::VaultNotFound, "no vault for identity");
        }
        return it->second;
    }

    [[nodiscard]] const keystead::crypto::KeyPair& findKey(const Did& did, const KeyLocation& location)
    {
        const Vault& v{ findVault(did) };
        const auto it{ v.find(location) };
        if (it == v.end())
        {
            throw StorageFailure(StorageErrc::KeyNotFound, "no key at location");
        }
        return it->second;
    }

    keystead::crypto::ICryptoProvider& m_crypto;

    // Lock order: m_vaultsMutex before m_blobsMutex.
    std::shared_mutex m_vaultsMutex;
    std::map<Did, Vault> m_vaults;

    std::shared_mutex m_blobsMutex;
    std::map<Did, std::vector<std::uint8_t>> m_blobs;
};

} // namespace

std::unique_ptr<keystead::storage::IStorage> makeMemoryStorage(keystead::crypto::ICryptoProvider& crypto)
{
    return std::make_unique<MemoryStorage>(crypto);
}

} // namespace keystead::storage::memory
