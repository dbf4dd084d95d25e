#include "keystead/crypto/OpenSslSymmetric.hpp"
#include <cstddef>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace keystead::crypto::openssl
{
namespace
{

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

constexpr std::size_t g_kMinWrappedBytes{ 3U * g_keyWrapBlockBytes };
// GCM finalization emits no bytes; the scratch block only satisfies the API.
constexpr std::size_t g_kFinalScratchBytes{ 16U };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

[[nodiscard]] EvpCipherCtxPtr newCipherCtx(const char* what)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error(what);
    }
    return ctx;
}

} // namespace

AeadBox aes256GcmSeal(std::span<const std::uint8_t> key, const std::array<std::uint8_t, g_aeadNonceBytes>& nonce,
                      std::span<const std::uint8_t> plainText, std::span<const std::uint8_t> associatedData)
{
    requireExactSize(key, g_aeadKeyBytes, "aes256GcmSeal: key");
    requireIntSized(plainText.size(), "aes256GcmSeal: plainText too large");
    requireIntSized(associatedData.size(), "aes256GcmSeal: associatedData too large");

    AeadBox box{};
    box.nonce = nonce;

    auto ctx{ newCipherCtx("aes256GcmSeal: EVP_CIPHER_CTX_new failed") };
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
    {
        throw std::runtime_error("aes256GcmSeal: EVP_EncryptInit_ex failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
    {
        throw std::runtime_error("aes256GcmSeal: set ivlen failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
    {
        throw std::runtime_error("aes256GcmSeal: set key/nonce failed");
    }

    int len{ 0 };
    if (!associatedData.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, associatedData.data(), static_cast<int>(associatedData.size())) != 1)
    {
        throw std::runtime_error("aes256GcmSeal: add aad failed");
    }

    box.cipherText.resize(plainText.size());
    int outLen{ 0 };
    if (!plainText.empty() && EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen, plainText.data(),
                                                static_cast<int>(plainText.size())) != 1)
    {
        throw std::runtime_error("aes256GcmSeal: encrypt update failed");
    }
    if (outLen < 0 || static_cast<std::size_t>(outLen) != plainText.size())
    {
        throw std::runtime_error("aes256GcmSeal: invalid output length");
    }

    std::array<unsigned char, g_kFinalScratchBytes> finalBlock{};
    int finalLen{ 0 };
    if (EVP_EncryptFinal_ex(ctx.get(), finalBlock.data(), &finalLen) != 1 || finalLen != 0)
    {
        throw std::runtime_error("aes256GcmSeal: encrypt final failed");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) != 1)
    {
        throw std::runtime_error("aes256GcmSeal: get tag failed");
    }

    return box;
}

std::optional<keystead::security::SecureBuffer> aes256GcmOpen(std::span<const std::uint8_t> key, const AeadBox& box,
                                                              std::span<const std::uint8_t> associatedData)
{
    requireExactSize(key, g_aeadKeyBytes, "aes256GcmOpen: key");
    requireIntSized(box.cipherText.size(), "aes256GcmOpen: cipherText too large");
    requireIntSized(associatedData.size(), "aes256GcmOpen: associatedData too large");

    auto ctx{ newCipherCtx("aes256GcmOpen: EVP_CIPHER_CTX_new failed") };
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
    {
        throw std::runtime_error("aes256GcmOpen: EVP_DecryptInit_ex failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
    {
        throw std::runtime_error("aes256GcmOpen: set ivlen failed");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
    {
        throw std::runtime_error("aes256GcmOpen: set key/nonce failed");
    }

    int len{ 0 };
    if (!associatedData.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, associatedData.data(), static_cast<int>(associatedData.size())) != 1)
    {
        throw std::runtime_error("aes256GcmOpen: add aad failed");
    }

    auto plainText{ keystead::security::secureBufferOfSize(box.cipherText.size()) };
    int outLen{ 0 };
    if (!box.cipherText.empty() && EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                                                     static_cast<int>(box.cipherText.size())) != 1)
    {
        return std::nullopt;
    }
    if (outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
    {
        return std::nullopt;
    }

    std::array<std::uint8_t, g_aeadTagBytes> tagCopy{ box.tag };
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) != 1)
    {
        throw std::runtime_error("aes256GcmOpen: set tag failed");
    }

    std::array<unsigned char, g_kFinalScratchBytes> finalBlock{};
    int finalLen{ 0 };
    if (EVP_DecryptFinal_ex(ctx.get(), finalBlock.data(), &finalLen) != 1 || finalLen != 0)
    {
        return std::nullopt;
    }

    // Trim to the authenticated length; nothing beyond it is ever returned.
    keystead::security::secureResize(plainText, static_cast<std::size_t>(outLen));
    return plainText;
}

std::vector<std::uint8_t> aes256KeyWrap(std::span<const std::uint8_t> kek, std::span<const std::uint8_t> key)
{
    requireExactSize(kek, g_aeadKeyBytes, "aes256KeyWrap: kek");
    if (key.size() < 2U * g_keyWrapBlockBytes || (key.size() % g_keyWrapBlockBytes) != 0U)
    {
        throw std::invalid_argument("aes256KeyWrap: key must be at least two 8-byte blocks");
    }
    requireIntSized(key.size(), "aes256KeyWrap: key too large");

    auto ctx{ newCipherCtx("aes256KeyWrap: EVP_CIPHER_CTX_new failed") };
    EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1)
    {
        throw std::runtime_error("aes256KeyWrap: EVP_EncryptInit_ex failed");
    }

    std::vector<std::uint8_t> wrapped(key.size() + g_keyWrapBlockBytes);
    int outLen{ 0 };
    if (EVP_EncryptUpdate(ctx.get(), wrapped.data(), &outLen, key.data(), static_cast<int>(key.size())) != 1)
    {
        throw std::runtime_error("aes256KeyWrap: wrap failed");
    }
    int finalLen{ 0 };
    if (EVP_EncryptFinal_ex(ctx.get(), wrapped.data() + outLen, &finalLen) != 1)
    {
        throw std::runtime_error("aes256KeyWrap: wrap final failed");
    }
    if (static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) != wrapped.size())
    {
        throw std::runtime_error("aes256KeyWrap: invalid output length");
    }
    return wrapped;
}

std::optional<keystead::security::SecureBuffer> aes256KeyUnwrap(std::span<const std::uint8_t> kek,
                                                                std::span<const std::uint8_t> wrapped)
{
    requireExactSize(kek, g_aeadKeyBytes, "aes256KeyUnwrap: kek");
    if (wrapped.size() < g_kMinWrappedBytes || (wrapped.size() % g_keyWrapBlockBytes) != 0U)
    {
        throw std::invalid_argument("aes256KeyUnwrap: wrapped key must be block aligned and at least three blocks");
    }
    requireIntSized(wrapped.size(), "aes256KeyUnwrap: wrapped key too large");

    auto ctx{ newCipherCtx("aes256KeyUnwrap: EVP_CIPHER_CTX_new failed") };
    EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1)
    {
        throw std::runtime_error("aes256KeyUnwrap: EVP_DecryptInit_ex failed");
    }

    auto key{ keystead::security::secureBufferOfSize(wrapped.size() - g_keyWrapBlockBytes) };
    int outLen{ 0 };
    if (EVP_DecryptUpdate(ctx.get(), key.data(), &outLen, wrapped.data(), static_cast<int>(wrapped.size())) !=
        1)
    {
        return std::nullopt;
    }
    int finalLen{ 0 };
    if (EVP_DecryptFinal_ex(ctx.get(), key.data() + outLen, &finalLen) != 1)
    {
        return std::nullopt;
    }
    if (static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) != key.size())
    {
        return std::nullopt;
    }
    return key;
}

} // namespace keystead::crypto::openssl
