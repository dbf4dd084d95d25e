#include "keystead/storage/sqlite/SqliteStorageFactory.hpp"

#include "keystead/crypto/providers/OpenSslProviderFactory.hpp"
#include "keystead/storage/memory/MemoryStorageFactory.hpp"
#include "keystead/security/SecureRandom.hpp"
#include "test_utils/StorageConformance.hpp"
#include "test_utils/TestUtils.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <sqlite3.h>
#include <span>
#include <system_error>
#include <utility>
#include <variant>

namespace
{

using keystead::test_utils::ScenarioOutcome;

[[nodiscard]] keystead::security::SecureBuffer randomStorageKey()
{
    auto key{ keystead::security::secureBufferOfSize(keystead::crypto::g_aeadKeyBytes) };
    EXPECT_TRUE(keystead::security::secureRandomFill(keystead::security::asSpan(key)));
    return key;
}

class SqliteStorageConformance : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir_ = keystead::test_utils::makeSecureTempDir("sqlite_storage_");
        ASSERT_FALSE(dir_.empty()) << "failed to create temp dir";
        key_ = randomStorageKey();
        storage_ = open(key_);
        ASSERT_NE(storage_, nullptr);
    }

    void TearDown() override
    {
        storage_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] std::filesystem::path dbPath() const
    {
        return dir_ / "keystead.db";
    }

    // Returns nullptr and records a failure when the backend cannot be opened.
    [[nodiscard]] std::unique_ptr<keystead::storage::IStorage> open(const keystead::security::SecureBuffer& key)
    {
        auto result{ keystead::storage::sqlite::makeSqliteStorage(
            *crypto_, keystead::storage::sqlite::defaultSqliteStorageOptions(dbPath()), key) };
        if (auto* err{ std::get_if<keystead::storage::StorageError>(&result) }; err != nullptr)
        {
            ADD_FAILURE() << "makeSqliteStorage failed: " << keystead::storage::toString(err->code) << " ("
                          << err->detail << ")";
            return nullptr;
        }
        return std::move(std::get<std::unique_ptr<keystead::storage::IStorage>>(result));
    }

    std::unique_ptr<keystead::crypto::ICryptoProvider> crypto_{
        keystead::crypto::providers::makeOpenSslCryptoProvider()
    };
    std::filesystem::path dir_;
    keystead::security::SecureBuffer key_;
    std::unique_ptr<keystead::storage::IStorage> storage_;
};

} // namespace

TEST_F(SqliteStorageConformance, CreateWithPrivateKey)
{
    EXPECT_EQ(keystead::test_utils::runCreateWithPrivateKey(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, CreateWithGeneratedKey)
{
    EXPECT_EQ(keystead::test_utils::runCreateWithGeneratedKey(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, KeyGenerate)
{
    EXPECT_EQ(keystead::test_utils::runKeyGenerate(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, KeyDeleteIsIdempotent)
{
    EXPECT_EQ(keystead::test_utils::runKeyDeleteIdempotent(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, IdentityList)
{
    EXPECT_EQ(keystead::test_utils::runIdentityList(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, KeyInsert)
{
    EXPECT_EQ(keystead::test_utils::runKeyInsert(*storage_, *crypto_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, SignKnownAnswer)
{
    EXPECT_EQ(keystead::test_utils::runSignKnownAnswer(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, SignRejectedForX25519)
{
    EXPECT_EQ(keystead::test_utils::runSignRejectedForX25519(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, BlobStore)
{
    EXPECT_EQ(keystead::test_utils::runBlobStore(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, PurgeCompleteness)
{
    EXPECT_EQ(keystead::test_utils::runPurgeCompleteness(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, EncryptionRoundTripWithMemoryBackend)
{
    auto sender = keystead::storage::memory::makeMemoryStorage(*crypto_);
    EXPECT_EQ(keystead::test_utils::runEncryptionRoundTrip(*sender, *storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, DecryptRejectedForEd25519)
{
    EXPECT_EQ(keystead::test_utils::runDecryptRejectedForEd25519(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, MissingVaultErrors)
{
    EXPECT_EQ(keystead::test_utils::runMissingVaultErrors(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, ConcurrentCreateIsAtomic)
{
    EXPECT_EQ(keystead::test_utils::runConcurrentCreate(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(SqliteStorageConformance, StatePersistsAcrossReopen)
{
    auto secret{ keystead::test_utils::fromHex(keystead::test_utils::g_rfc8032Secret) };
    const auto createRes{ storage_->identityCreate(keystead::identity::IdentityKind::Iota,
                                                   keystead::identity::NetworkName::devnet(), "sign-0",
                                                   std::span<std::uint8_t>{ secret }) };
    ASSERT_TRUE(keystead::storage::isOk(createRes));
    const auto created{ std::get<keystead::storage::CreatedIdentity>(createRes) };

    const std::vector<std::uint8_t> blob{ 0x10U, 0x20U, 0x30U };
    ASSERT_TRUE(keystead::storage::isOk(storage_->blobSet(created.did, blob)));
    ASSERT_TRUE(keystead::storage::isOk(storage_->flush(std::nullopt)));
    storage_.reset();

    auto reopened{ open(key_) };
    ASSERT_NE(reopened, nullptr);

    const auto exists{ reopened->identityExists(created.did) };
    ASSERT_TRUE(keystead::storage::isOk(exists));
    EXPECT_TRUE(std::get<bool>(exists));

    const auto storedBlob{ reopened->blobGet(created.did) };
    ASSERT_TRUE(keystead::storage::isOk(storedBlob));
    const auto& maybeBlob{ std::get<std::optional<std::vector<std::uint8_t>>>(storedBlob) };
    ASSERT_TRUE(maybeBlob.has_value());
    EXPECT_EQ(*maybeBlob, blob);

    const auto signature{ reopened->keySign(created.did, created.location,
                                            keystead::test_utils::fromHex(keystead::test_utils::g_rfc8032Message)) };
    ASSERT_TRUE(keystead::storage::isOk(signature));
    EXPECT_EQ(keystead::test_utils::toHex(std::get<keystead::storage::Signature>(signature)),
              keystead::test_utils::g_rfc8032Signature);
}

TEST_F(SqliteStorageConformance, AlteredPublicKeyColumnIsRejected)
{
    auto secret{ keystead::test_utils::fromHex(keystead::test_utils::g_rfc8032Secret) };
    const auto createRes{ storage_->identityCreate(keystead::identity::IdentityKind::Iota,
                                                   keystead::identity::NetworkName::devnet(), "sign-0",
                                                   std::span<std::uint8_t>{ secret }) };
    ASSERT_TRUE(keystead::storage::isOk(createRes));
    const auto created{ std::get<keystead::storage::CreatedIdentity>(createRes) };
    storage_.reset();

    sqlite3* raw{ nullptr };
    const int openRc{ sqlite3_open(dbPath().string().c_str(), &raw) };
    const int execRc{ openRc == SQLITE_OK
                          ? sqlite3_exec(raw, "UPDATE keys SET public_key = zeroblob(32);", nullptr, nullptr, nullptr)
                          : openRc };
    sqlite3_close(raw);
    ASSERT_EQ(execRc, SQLITE_OK);

    auto reopened{ open(key_) };
    ASSERT_NE(reopened, nullptr);
    const auto signature{ reopened->keySign(created.did, created.location,
                                            keystead::test_utils::fromHex(keystead::test_utils::g_rfc8032Message)) };
    ASSERT_FALSE(keystead::storage::isOk(signature));
    EXPECT_EQ(std::get<keystead::storage::StorageError>(signature).code, keystead::storage::StorageErrc::BackendIO);
}

TEST_F(SqliteStorageConformance, WrongStorageKeyIsRejected)
{
    storage_.reset();

    auto result{ keystead::storage::sqlite::makeSqliteStorage(
        *crypto_, keystead::storage::sqlite::defaultSqliteStorageOptions(dbPath()), randomStorageKey()) };
    ASSERT_TRUE(std::holds_alternative<keystead::storage::StorageError>(result));
    EXPECT_EQ(std::get<keystead::storage::StorageError>(result).code, keystead::storage::StorageErrc::BackendIO);
}

TEST_F(SqliteStorageConformance, StorageKeyMustBe32Bytes)
{
    auto result{ keystead::storage::sqlite::makeSqliteStorage(
        *crypto_, keystead::storage::sqlite::defaultSqliteStorageOptions(dir_ / "other.db"),
        keystead::security::secureBufferOfSize(16U)) };
    ASSERT_TRUE(std::holds_alternative<keystead::storage::StorageError>(result));
    EXPECT_EQ(std::get<keystead::storage::StorageError>(result).code, keystead::storage::StorageErrc::InvalidInput);
}

TEST_F(SqliteStorageConformance, UnopenablePathIsBackendIO)
{
    auto result{ keystead::storage::sqlite::makeSqliteStorage(
        *crypto_, keystead::storage::sqlite::defaultSqliteStorageOptions(dir_ / "missing" / "nested" / "x.db"),
        randomStorageKey()) };
    ASSERT_TRUE(std::holds_alternative<keystead::storage::StorageError>(result));
    EXPECT_EQ(std::get<keystead::storage::StorageError>(result).code, keystead::storage::StorageErrc::BackendIO);
}

TEST_F(SqliteStorageConformance, RollbackJournalModeWorks)
{
    auto options{ keystead::storage::sqlite::defaultSqliteStorageOptions(dir_ / "delete-journal.db") };
    options.journalMode = keystead::storage::sqlite::SqliteJournalMode::Delete;
    options.synchronous = keystead::storage::sqlite::SqliteSynchronous::Full;

    auto result{ keystead::storage::sqlite::makeSqliteStorage(*crypto_, options, randomStorageKey()) };
    ASSERT_TRUE(keystead::storage::isOk(result));
    auto& storage{ *std::get<std::unique_ptr<keystead::storage::IStorage>>(result) };

    EXPECT_EQ(keystead::test_utils::runBlobStore(storage).outcome, ScenarioOutcome::Ok);
}
