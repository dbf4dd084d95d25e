#ifndef INCLUDE_KEYSTEAD_CRYPTO_OPENSSLSYMMETRIC_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_OPENSSLSYMMETRIC_HPP

#include "keystead/crypto/ICryptoProvider.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

// AES primitives shared by every crypto provider. Curve25519 is the only part that differs per provider.
namespace keystead::crypto::openssl
{

[[nodiscard]] AeadBox aes256GcmSeal(std::span<const std::uint8_t> key,
                                    const std::array<std::uint8_t, g_aeadNonceBytes>& nonce,
                                    std::span<const std::uint8_t> plainText,
                                    std::span<const std::uint8_t> associatedData);

[[nodiscard]] std::optional<keystead::security::SecureBuffer> aes256GcmOpen(std::span<const std::uint8_t> key,
                                                                           const AeadBox& box,
                                                                           std::span<const std::uint8_t> associatedData);

[[nodiscard]] std::vector<std::uint8_t> aes256KeyWrap(std::span<const std::uint8_t> kek,
                                                      std::span<const std::uint8_t> key);

[[nodiscard]] std::optional<keystead::security::SecureBuffer> aes256KeyUnwrap(std::span<const std::uint8_t> kek,
                                                                             std::span<const std::uint8_t> wrapped);

} // namespace keystead::crypto::openssl

#endif // INCLUDE_KEYSTEAD_CRYPTO_OPENSSLSYMMETRIC_HPP
