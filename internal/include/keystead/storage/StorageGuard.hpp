#ifndef INCLUDE_KEYSTEAD_STORAGE_STORAGEGUARD_HPP
#define INCLUDE_KEYSTEAD_STORAGE_STORAGEGUARD_HPP

#include "keystead/crypto/CryptoErrors.hpp"
#include "keystead/storage/StorageError.hpp"
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace keystead::storage
{

// Raised inside a backend for contract outcomes that have no crypto-level exception.
class StorageFailure final : public std::runtime_error
{
public:
    StorageFailure(StorageErrc code, const std::string& what) : std::runtime_error(what), m_code{ code }
    {
    }

    [[nodiscard]] StorageErrc code() const noexcept
    {
        return m_code;
    }

private:
    StorageErrc m_code;
};

// Keeps the code and leaves the detail empty when the message cannot be built.
[[nodiscard]] inline StorageError makeStorageError(StorageErrc code, const char* operation, const char* what) noexcept
{
    try
    {
        std::string detail{ operation };
        detail.append(": ").append(what);
        return StorageError{ code, std::move(detail) };
    }
    catch (const std::exception&)
    {
        return StorageError{ code, {} };
    }
}

// Runs one backend operation and converts whatever it throws into a StorageError.
// This is the single place where exceptions become error codes. No handler allocates
// outside makeStorageError, so a failed allocation never escapes.
template <class Fn>
[[nodiscard]] auto guardStorage(const char* operation, Fn&& fn) noexcept -> StorageResult<std::invoke_result_t<Fn>>
{
    try
    {
        return std::forward<Fn>(fn)();
    }
    catch (const StorageFailure& e)
    {
        return makeStorageError(e.code(), operation, e.what());
    }
    catch (const keystead::crypto::InvalidPrivateKeyError& e)
    {
        return makeStorageError(StorageErrc::InvalidPrivateKey, operation, e.what());
    }
    catch (const keystead::crypto::InvalidPublicKeyError& e)
    {
        return makeStorageError(StorageErrc::InvalidPublicKey, operation, e.what());
    }
    catch (const keystead::crypto::UnsupportedKeyTypeError& e)
    {
        return makeStorageError(StorageErrc::UnsupportedOperation, operation, e.what());
    }
    catch (const keystead::crypto::EncryptionFailureError& e)
    {
        return makeStorageError(StorageErrc::EncryptionFailure, operation, e.what());
    }
    catch (const keystead::crypto::DecryptionFailureError& e)
    {
        return makeStorageError(StorageErrc::DecryptionFailure, operation, e.what());
    }
    catch (const std::invalid_argument& e)
    {
        return makeStorageError(StorageErrc::InvalidInput, operation, e.what());
    }
    catch (const std::bad_alloc&)
    {
        return StorageError{ StorageErrc::BackendIO, {} };
    }
    catch (const std::exception& e)
    {
        return makeStorageError(StorageErrc::BackendIO, operation, e.what());
    }
    catch (...)
    {
        return makeStorageError(StorageErrc::BackendIO, operation, "unknown exception");
    }
}

} // namespace keystead::storage

#endif // INCLUDE_KEYSTEAD_STORAGE_STORAGEGUARD_HPP
