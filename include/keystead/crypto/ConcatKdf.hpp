#ifndef INCLUDE_KEYSTEAD_CRYPTO_CONCATKDF_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_CONCATKDF_HPP

#include "keystead/crypto/Envelope.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace keystead::crypto
{

// Concat KDF with SHA-256 (NIST SP 800-56A section 5.8.1, single-step).
//
// Round i (1-based) hashes:
//   BE32(i) || Z || BE32(|alg|) alg || BE32(|apu|) apu || BE32(|apv|) apv || pubInfo || privInfo
// and the digests are concatenated and truncated to `outputBytes`.
//
// Throws std::invalid_argument for a zero output length or a field longer than 2^32 - 1 bytes,
// and EncryptionFailureError if the round count does not fit the 32-bit counter.
[[nodiscard]] keystead::security::SecureBuffer concatKdf(std::string_view algorithmId, std::size_t outputBytes,
                                                         std::span<const std::uint8_t> sharedSecret,
                                                         const AgreementInfo& agreement);

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_CONCATKDF_HPP
