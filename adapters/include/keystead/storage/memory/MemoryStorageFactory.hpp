#ifndef INCLUDE_KEYSTEAD_STORAGE_MEMORY_MEMORYSTORAGEFACTORY_HPP
#define INCLUDE_KEYSTEAD_STORAGE_MEMORY_MEMORYSTORAGEFACTORY_HPP

#include "keystead/crypto/ICryptoProvider.hpp"
#include "keystead/storage/IStorage.hpp"
#include <memory>

namespace keystead::storage::memory
{

// Volatile reference backend. `crypto` must outlive the returned storage.
[[nodiscard]] std::unique_ptr<keystead::storage::IStorage> makeMemoryStorage(keystead::crypto::ICryptoProvider& crypto);

} // namespace keystead::storage::memory

#endif // INCLUDE_KEYSTEAD_STORAGE_MEMORY_MEMORYSTORAGEFACTORY_HPP
