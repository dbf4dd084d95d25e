#ifndef INCLUDE_KEYSTEAD_STORAGE_SQLITE_SQLITESTORAGEFACTORY_HPP
#define INCLUDE_KEYSTEAD_STORAGE_SQLITE_SQLITESTORAGEFACTORY_HPP

#include "keystead/crypto/ICryptoProvider.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include "keystead/storage/IStorage.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace keystead::storage::sqlite
{

enum class SqliteJournalMode : std::uint8_t
{
    Wal,
    Delete,
};

enum class SqliteSynchronous : std::uint8_t
{
    Off,
    Normal,
    Full,
};

struct SqliteStorageOptions final
{
    std::filesystem::path databasePath;
    SqliteJournalMode journalMode{ SqliteJournalMode::Wal };
    std::chrono::milliseconds busyTimeout{ 5000 };
    SqliteSynchronous synchronous{ SqliteSynchronous::Normal };
};

[[nodiscard]] SqliteStorageOptions defaultSqliteStorageOptions(std::filesystem::path databasePath);

// Opens (creating if needed) a database whose private keys and blobs are sealed with
// AES-256-GCM under `storageKey` (32 bytes). A database created under another key fails with
// BackendIO. `crypto` must outlive the returned storage.
[[nodiscard]] StorageResult<std::unique_ptr<keystead::storage::IStorage>>
makeSqliteStorage(keystead::crypto::ICryptoProvider& crypto, SqliteStorageOptions options,
                  keystead::security::SecureBuffer storageKey) noexcept;

} // namespace keystead::storage::sqlite

#endif // INCLUDE_KEYSTEAD_STORAGE_SQLITE_SQLITESTORAGEFACTORY_HPP
