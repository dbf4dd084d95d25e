#include "keystead/storage/sqlite/SqliteStorageFactory.hpp"

#include "SqliteSupport.hpp"
#include "keystead/crypto/KeyPair.hpp"
#include "keystead/security/SecureEquals.hpp"
#include "keystead/storage/StorageGuard.hpp"
#include "keystead/storage/VaultOps.hpp"
#include <algorithm>
#include <array>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace keystead::storage::sqlite
{
namespace
{

using keystead::identity::Did;
using keystead::identity::KeyLocation;

// Sealed under the storage key when a database is created; reopening with another key fails to open it.
constexpr std::string_view g_kKeyCheckPlainText{ "keystead.sqlite.v1" };
constexpr std::string_view g_kKeyCheckAad{ "keystead.meta" };
constexpr std::string_view g_kKeyAadPrefix{ "keystead.key|" };
constexpr std::string_view g_kBlobAadPrefix{ "keystead.blob|" };

[[nodiscard]] std::span<const std::uint8_t> asU8(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

[[nodiscard]] std::string keyAad(const Did& did, const KeyLocation& location)
{
    std::string aad{ g_kKeyAadPrefix };
    aad.append(did.str()).push_back('|');
    aad.append(keystead::crypto::keyTypeName(location.keyType())).push_back('|');
    aad.append(location.canonical());
    return aad;
}

[[nodiscard]] std::string blobAad(const Did& did)
{
    std::string aad{ g_kBlobAadPrefix };
    aad.append(did.str());
    return aad;
}

[[nodiscard]] const char* journalModePragma(SqliteJournalMode mode) noexcept
{
    switch (mode)
    {
    case SqliteJournalMode::Wal:
        return "PRAGMA journal_mode=WAL;";
    case SqliteJournalMode::Delete:
        return "PRAGMA journal_mode=DELETE;";
    }
    return "PRAGMA journal_mode=DELETE;";
}

[[nodiscard]] const char* synchronousPragma(SqliteSynchronous level) noexcept
{
    switch (level)
    {
    case SqliteSynchronous::Off:
        return "PRAGMA synchronous=OFF;";
    case SqliteSynchronous::Normal:
        return "PRAGMA synchronous=NORMAL;";
    case SqliteSynchronous::Full:
        return "PRAGMA synchronous=FULL;";
    }
    return "PRAGMA synchronous=FULL;";
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS meta ("
             " id INTEGER PRIMARY KEY CHECK(id = 1),"
             " nonce BLOB NOT NULL,"
             " tag BLOB NOT NULL,"
             " ciphertext BLOB NOT NULL"
             ");"
             "CREATE TABLE IF NOT EXISTS vaults ("
             " did TEXT PRIMARY KEY"
             ");"
             "CREATE TABLE IF NOT EXISTS keys ("
             " did TEXT NOT NULL,"
             " key_type INTEGER NOT NULL,"
             " location TEXT NOT NULL,"
             " public_key BLOB NOT NULL,"
             " nonce BLOB NOT NULL,"
             " tag BLOB NOT NULL,"
             " ciphertext BLOB NOT NULL,"
             " PRIMARY KEY(did, key_type, location)"
             ");"
             "CREATE TABLE IF NOT EXISTS blobs ("
             " did TEXT PRIMARY KEY,"
             " nonce BLOB NOT NULL,"
             " tag BLOB NOT NULL,"
             " ciphertext BLOB NOT NULL"
             ");");
}

[[nodiscard]] keystead::crypto::AeadBox boxFromColumns(const Statement& stmt, int firstColumn)
{
    const auto nonce{ stmt.columnBlob(firstColumn) };
    const auto tag{ stmt.columnBlob(firstColumn + 1) };
    if (nonce.size() != keystead::crypto::g_aeadNonceBytes || tag.size() != keystead::crypto::g_aeadTagBytes)
    {
        throw std::runtime_error("storage: invalid sealed record");
    }
    keystead::crypto::AeadBox box{};
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
    std::copy(tag.begin(), tag.end(), box.tag.begin());
    box.cipherText = stmt.columnBlob(firstColumn + 2);
    return box;
}

class SqliteStorage final : public keystead::storage::IStorage
{
public:
    SqliteStorage(keystead::crypto::ICryptoProvider& crypto, SqliteDbPtr db,
                  keystead::security::SecureBuffer storageKey) noexcept
        : m_crypto{ crypto }, m_db{ std::move(db) }, m_storageKey{ std::move(storageKey) }
    {
    }

    // Creates the key-check record on a fresh database, or verifies it on an existing one.
    void bindStorageKey()
    {
        const std::scoped_lock lock{ m_mutex };
        Transaction tx{ m_db.get() };

        Statement select{ m_db.get(), "SELECT nonce, tag, ciphertext FROM meta WHERE id = 1;" };
        if (select.step())
        {
            const auto opened{ m_crypto.aeadDecrypt(keystead::security::asSpan(m_storageKey),
                                                    boxFromColumns(select, 0), asU8(g_kKeyCheckAad)) };
            if (!opened ||
                !keystead::security::secureEquals(keystead::security::asSpan(*opened), asU8(g_kKeyCheckPlainText)))
            {
                throw std::runtime_error("storage: storage key does not open this database");
            }
            return;
        }

        const auto box{ seal(asU8(g_kKeyCheckPlainText), g_kKeyCheckAad) };
        Statement insert{ m_db.get(), "INSERT INTO meta(id, nonce, tag, ciphertext) VALUES (1, ?, ?, ?);" };
        insert.bind(1, box.nonce).bind(2, box.tag).bind(3, box.cipherText).run();
        tx.commit();
    }

    [[nodiscard]] StorageResult<CreatedIdentity>
    identityCreate(keystead::identity::IdentityKind kind, const keystead::identity::NetworkName& network,
                   std::string_view fragment, std::optional<std::span<std::uint8_t>> privateKey) noexcept override
    {
        return guardStorage("identityCreate", [&] {
            auto prepared{ vault::prepareIdentity(m_crypto, kind, network, fragment, privateKey) };

            const std::scoped_lock lock{ m_mutex };
            Transaction tx{ m_db.get() };
            if (vaultExists(prepared.did))
            {
                throw StorageFailure(StorageErrc::AlreadyExists, "identity already exists");
            }
            insertVault(prepared.did);
            upsertKey(prepared.did, prepared.location, prepared.keyPair);
            tx.commit();
            return CreatedIdentity{ std::move(prepared.did), std::move(prepared.location) };
        });
    }

    [[nodiscard]] StorageResult<bool> identityPurge(const Did& did) noexcept override
    {
        return guardStorage("identityPurge", [&] {
            const std::scoped_lock lock{ m_mutex };
            Transaction tx{ m_db.get() };
            Statement deleteVault{ m_db.get(), "DELETE FROM vaults WHERE did = ?;" };
            deleteVault.bind(1, did.str()).run();
            if (sqlite3_changes(m_db.get()) == 0)
            {
                return false;
            }
            Statement deleteKeys{ m_db.get(), "DELETE FROM keys WHERE did = ?;" };
            deleteKeys.bind(1, did.str()).run();
            Statement deleteBlob{ m_db.get(), "DELETE FROM blobs WHERE did = ?;" };
            deleteBlob.bind(1, did.str()).run();
            tx.commit();
            return true;
        });
    }

    [[nodiscard]] StorageResult<bool> identityExists(const Did& did) noexcept override
    {
        return guardStorage("identityExists", [&] {
            const std::scoped_lock lock{ m_mutex };
            return vaultExists(did);
        });
    }

    [[nodiscard]] StorageResult<std::vector<Did>> identityList() noexcept override
    {
        return guardStorage("identityList", [&] {
            const std::scoped_lock lock{ m_mutex };
            Statement select{ m_db.get(), "SELECT did FROM vaults ORDER BY did;" };
            std::vector<Did> dids{};
            while (select.step())
            {
                auto did{ Did::parse(select.columnText(0)) };
                if (!did)
                {
                    throw std::runtime_error("storage: malformed identifier in vaults table");
                }
                dids.push_back(std::move(*did));
            }
            return dids;
        });
    }

    [[nodiscard]] StorageResult<KeyLocation> keyGenerate(const Did& did, keystead::crypto::KeyType type,
                                                         std::string_view fragment) noexcept override
    {
        return guardStorage("keyGenerate", [&] {
            auto generated{ vault::generateKey(m_crypto, type, fragment) };

            const std::scoped_lock lock{ m_mutex };
            Transaction tx{ m_db.get() };
            insertVault(did);
            upsertKey(did, generated.location, generated.keyPair);
            tx.commit();
            return generated.location;
        });
    }

    [[nodiscard]] StorageResult<std::monostate> keyInsert(const Did& did, const KeyLocation& location,
                                                          std::span<std::uint8_t> privateKey) noexcept override
    {
        return guardStorage("keyInsert", [&] {
            const auto keyPair{ vault::rebuildKey(m_crypto, location, privateKey) };

            const std::scoped_lock lock{ m_mutex };
            Transaction tx{ m_db.get() };
            insertVault(did);
            upsertKey(did, location, keyPair);
            tx.commit();
            return std::monostate{};
        });
    }

    [[nodiscard]] StorageResult<bool> keyExists(const Did& did, const KeyLocation& location) noexcept override
    {
        return guardStorage("keyExists", [&] {
            const std::scoped_lock lock{ m_mutex };
            Statement select{ m_db.get(), "SELECT 1 FROM keys WHERE did = ? AND key_type = ? AND location = ?;" };
            bindKeyRow(select, did, location);
            return select.step();
        });
    }

    [[nodiscard]] StorageResult<std::vector<std::uint8_t>> keyPublic(const Did& did,
                                                                     const KeyLocation& location) noexcept override
    {
        return guardStorage("keyPublic", [&] {
            const std::scoped_lock lock{ m_mutex };
            requireVault(did);
            Statement select{ m_db.get(),
                              "SELECT public_key FROM keys WHERE did = ? AND key_type = ? AND location = ?;" };
            bindKeyRow(select, did, location);
            if (!select.step())
            {
                throw StorageFailure(StorageErrc::KeyNotFound, "no key at location");
            }
            return select.columnBlob(0);
        });
    }

    [[nodiscard]] StorageResult<bool> keyDelete(const Did& did, const KeyLocation& location) noexcept override
    {
        return guardStorage("keyDelete", [&] {
            const std::scoped_lock lock{ m_mutex };
            requireVault(did);
            Statement remove{ m_db.get(), "DELETE FROM keys WHERE did = ? AND key_type = ? AND location = ?;" };
            bindKeyRow(remove, did, location);
            remove.run();
            return sqlite3_changes(m_db.get()) > 0;
        });
    }

    [[nodiscard]] StorageResult<Signature> keySign(const Did& did, const KeyLocation& location,
                                                   std::span<const std::uint8_t> message) noexcept override
    {
        return guardStorage("keySign", [&] {
            const auto keyPair{ loadKeyPair(did, location) };
            return vault::sign(m_crypto, keyPair, message);
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
            const auto keyPair{ loadKeyPair(did, location) };
            return vault::decrypt(m_crypto, data, encryption, cek, keyPair);
        });
    }

    [[nodiscard]] StorageResult<std::monostate> blobSet(const Did& did,
                                                        std::span<const std::uint8_t> blob) noexcept override
    {
        return guardStorage("blobSet", [&] {
            const std::scoped_lock lock{ m_mutex };
            const auto box{ seal(blob, blobAad(did)) };
            Statement upsert{ m_db.get(),
                              "INSERT INTO blobs(did, nonce, tag, ciphertext) VALUES (?, ?, ?, ?)"
                              " ON CONFLICT(did) DO UPDATE SET nonce=excluded.nonce, tag=excluded.tag,"
                              " ciphertext=excluded.ciphertext;" };
            upsert.bind(1, did.str()).bind(2, box.nonce).bind(3, box.tag).bind(4, box.cipherText).run();
            return std::monostate{};
        });
    }

    [[nodiscard]] StorageResult<std::optional<std::vector<std::uint8_t>>> blobGet(const Did& did) noexcept override
    {
        return guardStorage("blobGet", [&] {
            const std::scoped_lock lock{ m_mutex };
            Statement select{ m_db.get(), "SELECT nonce, tag, ciphertext FROM blobs WHERE did = ?;" };
            select.bind(1, did.str());
            if (!select.step())
            {
                return std::optional<std::vector<std::uint8_t>>{};
            }
            const auto plain{ open(boxFromColumns(select, 0), blobAad(did)) };
            return std::optional{ std::vector<std::uint8_t>(plain.begin(), plain.end()) };
        });
    }

    // The checkpoint covers every identity, so the scope is not narrowed.
    [[nodiscard]] StorageResult<std::monostate>
    flush([[maybe_unused]] const std::optional<Did>& scope) noexcept override
    {
        return guardStorage("flush", [&] {
            const std::scoped_lock lock{ m_mutex };
            const int rc = sqlite3_wal_checkpoint_v2(m_db.get(), nullptr, SQLITE_CHECKPOINT_FULL, nullptr, nullptr);
            if (rc != SQLITE_OK)
            {
                throw std::runtime_error(sqliteErr(m_db.get(), "storage: wal checkpoint failed"));
            }
            return std::monostate{};
        });
    }

private:
    // Unless noted otherwise, the helpers below expect m_mutex to be held.

    [[nodiscard]] keystead::crypto::AeadBox seal(std::span<const std::uint8_t> plain, std::string_view aad)
    {
        return m_crypto.aeadEncrypt(keystead::security::asSpan(m_storageKey), plain, asU8(aad));
    }

    [[nodiscard]] keystead::security::SecureBuffer open(const keystead::crypto::AeadBox& box, std::string_view aad)
    {
        auto plain{ m_crypto.aeadDecrypt(keystead::security::asSpan(m_storageKey), box, asU8(aad)) };
        if (!plain)
        {
            throw std::runtime_error("storage: sealed record failed authentication");
        }
        return std::move(*plain);
    }

    [[nodiscard]] bool vaultExists(const Did& did)
    {
        Statement select{ m_db.get(), "SELECT 1 FROM vaults WHERE did = ?;" };
        select.bind(1, did.str());
        return select.step();
    }

    void requireVault(const Did& did)
    {
        if (!vaultExists(did))
        {
            throw StorageFailure(StorageErrc::VaultNotFound, "no vault for identity");
        }
    }

    void insertVault(const Did& did)
    {
        Statement insert{ m_db.get(), "INSERT OR IGNORE INTO vaults(did) VALUES (?);" };
        insert.bind(1, did.str()).run();
    }

    static void bindKeyRow(Statement& stmt, const Did& did, const KeyLocation& location)
    {
        stmt.bind(1, did.str())
            .bind(2, static_cast<std::int64_t>(location.keyType()))
            .bind(3, std::string_view{ location.canonical() });
    }

    void upsertKey(const Did& did, const KeyLocation& location, const keystead::crypto::KeyPair& keyPair)
    {
        const auto box{ seal(keyPair.privateKey(), keyAad(did, location)) };
        Statement upsert{ m_db.get(),
                          "INSERT INTO keys(did, key_type, location, public_key, nonce, tag, ciphertext)"
                          " VALUES (?, ?, ?, ?, ?, ?, ?)"
                          " ON CONFLICT(did, key_type, location) DO UPDATE SET public_key=excluded.public_key,"
                          " nonce=excluded.nonce, tag=excluded.tag, ciphertext=excluded.ciphertext;" };
        bindKeyRow(upsert, did, location);
        upsert.bind(4, keyPair.publicKey()).bind(5, box.nonce).bind(6, box.tag).bind(7, box.cipherText).run();
    }

    // Takes m_mutex itself; the returned pair is used after the lock is released.
    [[nodiscard]] keystead::crypto::KeyPair loadKeyPair(const Did& did, const KeyLocation& location)
    {
        const std::scoped_lock lock{ m_mutex };
        requireVault(did);
        Statement select{ m_db.get(), "SELECT public_key, nonce, tag, ciphertext FROM keys"
                                      " WHERE did = ? AND key_type = ? AND location = ?;" };
        bindKeyRow(select, did, location);
        if (!select.step())
        {
            throw StorageFailure(StorageErrc::KeyNotFound, "no key at location");
        }
        const auto publicKey{ select.columnBlob(0) };
        const auto privateKey{ open(boxFromColumns(select, 1), keyAad(did, location)) };
        auto keyPair{ keystead::crypto::KeyPair::fromPrivateKey(m_crypto, location.keyType(),
                                                                keystead::security::asSpan(privateKey)) };
        if (!keystead::security::secureEquals(keyPair.publicKey(), publicKey))
        {
            throw std::runtime_error("storage: stored key pair is inconsistent");
        }
        return keyPair;
    }

    keystead::crypto::ICryptoProvider& m_crypto;
    std::mutex m_mutex;
    SqliteDbPtr m_db;
    keystead::security::SecureBuffer m_storageKey;
};

} // namespace

SqliteStorageOptions defaultSqliteStorageOptions(std::filesystem::path databasePath)
{
    SqliteStorageOptions options{};
    options.databasePath = std::move(databasePath);
    return options;
}

StorageResult<std::unique_ptr<keystead::storage::IStorage>>
makeSqliteStorage(keystead::crypto::ICryptoProvider& crypto, SqliteStorageOptions options,
                  keystead::security::SecureBuffer storageKey) noexcept
{
    return guardStorage("makeSqliteStorage", [&]() -> std::unique_ptr<keystead::storage::IStorage> {
        if (storageKey.size() != keystead::crypto::g_aeadKeyBytes)
        {
            throw std::invalid_argument("storage key must be 32 bytes");
        }

        auto db{ openDb(options.databasePath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) };
        if (sqlite3_busy_timeout(db.get(), static_cast<int>(options.busyTimeout.count())) != SQLITE_OK)
        {
            throw std::runtime_error(sqliteErr(db.get(), "storage: busy timeout failed"));
        }
        exec(db.get(), journalModePragma(options.journalMode));
        exec(db.get(), synchronousPragma(options.synchronous));
        ensureSchema(db.get());

        auto storage{ std::make_unique<SqliteStorage>(crypto, std::move(db), std::move(storageKey)) };
        storage->bindStorageKey();
        return storage;
    });
}

} // namespace keystead::storage::sqlite
