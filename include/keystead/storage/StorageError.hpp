#ifndef INCLUDE_KEYSTEAD_STORAGE_STORAGEERROR_HPP
#define INCLUDE_KEYSTEAD_STORAGE_STORAGEERROR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace keystead::storage
{

enum class StorageErrc : std::uint8_t
{
    AlreadyExists,
    VaultNotFound,
    KeyNotFound,
    InvalidPrivateKey,
    InvalidPublicKey,
    UnsupportedOperation,
    EncryptionFailure,
    DecryptionFailure,
    BackendIO,
    InvalidInput,
};

[[nodiscard]] constexpr std::string_view toString(StorageErrc code) noexcept
{
    switch (code)
    {
    case StorageErrc::AlreadyExists:
        return "AlreadyExists";
    case StorageErrc::VaultNotFound:
        return "VaultNotFound";
    case StorageErrc::KeyNotFound:
        return "KeyNotFound";
    case StorageErrc::InvalidPrivateKey:
        return "InvalidPrivateKey";
    case StorageErrc::InvalidPublicKey:
        return "InvalidPublicKey";
    case StorageErrc::UnsupportedOperation:
        return "UnsupportedOperation";
    case StorageErrc::EncryptionFailure:
        return "EncryptionFailure";
    case StorageErrc::DecryptionFailure:
        return "DecryptionFailure";
    case StorageErrc::BackendIO:
        return "BackendIO";
    case StorageErrc::InvalidInput:
        return "InvalidInput";
    }
    return "Unknown";
}

// `detail` names the failing operation and step; it never carries key material.
struct StorageError final
{
    StorageErrc code{ StorageErrc::BackendIO };
    std::string detail;
};

template <class T> using StorageResult = std::variant<T, StorageError>;

template <class T> [[nodiscard]] bool isOk(const StorageResult<T>& r) noexcept
{
    return std::holds_alternative<T>(r);
}

} // namespace keystead::storage

#endif // INCLUDE_KEYSTEAD_STORAGE_STORAGEERROR_HPP
