#include <gtest/gtest.h>

#include <memory>

#include "keystead/crypto/providers/OpenSslProviderFactory.hpp"
#include "keystead/storage/memory/MemoryStorageFactory.hpp"
#include "test_utils/StorageConformance.hpp"

namespace
{

using keystead::test_utils::ScenarioOutcome;

class MemoryStorageConformance : public ::testing::Test
{
protected:
    std::unique_ptr<keystead::crypto::ICryptoProvider> crypto_{
        keystead::crypto::providers::makeOpenSslCryptoProvider()
    };
    std::unique_ptr<keystead::storage::IStorage> storage_{ keystead::storage::memory::makeMemoryStorage(*crypto_) };
};

} // namespace

TEST_F(MemoryStorageConformance, CreateWithPrivateKey)
{
    EXPECT_EQ(keystead::test_utils::runCreateWithPrivateKey(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, CreateWithGeneratedKey)
{
    EXPECT_EQ(keystead::test_utils::runCreateWithGeneratedKey(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, KeyGenerate)
{
    EXPECT_EQ(keystead::test_utils::runKeyGenerate(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, KeyDeleteIsIdempotent)
{
    EXPECT_EQ(keystead::test_utils::runKeyDeleteIdempotent(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, IdentityList)
{
    EXPECT_EQ(keystead::test_utils::runIdentityList(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, KeyInsert)
{
    EXPECT_EQ(keystead::test_utils::runKeyInsert(*storage_, *crypto_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, SignKnownAnswer)
{
    EXPECT_EQ(keystead::test_utils::runSignKnownAnswer(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, SignRejectedForX25519)
{
    EXPECT_EQ(keystead::test_utils::runSignRejectedForX25519(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, BlobStore)
{
    EXPECT_EQ(keystead::test_utils::runBlobStore(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, PurgeCompleteness)
{
    EXPECT_EQ(keystead::test_utils::runPurgeCompleteness(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, EncryptionRoundTripBetweenBackends)
{
    auto recipient = keystead::storage::memory::makeMemoryStorage(*crypto_);
    EXPECT_EQ(keystead::test_utils::runEncryptionRoundTrip(*storage_, *recipient).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, DecryptRejectedForEd25519)
{
    EXPECT_EQ(keystead::test_utils::runDecryptRejectedForEd25519(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, MissingVaultErrors)
{
    EXPECT_EQ(keystead::test_utils::runMissingVaultErrors(*storage_).outcome, ScenarioOutcome::Ok);
}

TEST_F(MemoryStorageConformance, ConcurrentCreateIsAtomic)
{
    EXPECT_EQ(keystead::test_utils::runConcurrentCreate(*storage_).outcome, ScenarioOutcome::Ok);
}
