#ifndef INCLUDE_KEYSTEAD_CRYPTO_ENVELOPE_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_ENVELOPE_HPP

#include "keystead/crypto/ICryptoProvider.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace keystead::crypto
{

// Context bound into every derived key (NIST SP 800-56A / RFC 7518 section 4.6.2).
struct AgreementInfo final
{
    std::vector<std::uint8_t> apu;      // PartyUInfo, sender
    std::vector<std::uint8_t> apv;      // PartyVInfo, receiver
    std::vector<std::uint8_t> pubInfo;  // SuppPubInfo
    std::vector<std::uint8_t> privInfo; // SuppPrivInfo

    friend bool operator==(const AgreementInfo&, const AgreementInfo&) = default;
};

// The agreement-derived secret is the content-encryption key.
struct EcdhEs final
{
    static constexpr std::string_view name{ "ECDH-ES" };
    AgreementInfo agreement;
};

// The agreement-derived secret wraps a fresh random content-encryption key.
struct EcdhEsA256Kw final
{
    static constexpr std::string_view name{ "ECDH-ES+A256KW" };
    AgreementInfo agreement;
};

using CekAlgorithm = std::variant<EcdhEs, EcdhEsA256Kw>;

[[nodiscard]] inline std::string_view cekAlgorithmName(const CekAlgorithm& algorithm) noexcept
{
    return std::holds_alternative<EcdhEs>(algorithm) ? EcdhEs::name : EcdhEsA256Kw::name;
}

[[nodiscard]] inline const AgreementInfo& agreementInfo(const CekAlgorithm& algorithm) noexcept
{
    if (const auto* direct{ std::get_if<EcdhEs>(&algorithm) }; direct != nullptr)
    {
        return direct->agreement;
    }
    return std::get<EcdhEsA256Kw>(algorithm).agreement;
}

enum class EncryptionAlgorithm : std::uint8_t
{
    Aes256Gcm = 1U,
};

[[nodiscard]] constexpr std::size_t encryptionKeyBytes(EncryptionAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case EncryptionAlgorithm::Aes256Gcm:
        return g_aeadKeyBytes;
    }
    return 0U;
}

// Output of one encryption. Decryption needs only this, the algorithms and the recipient key.
struct EncryptedData final
{
    std::vector<std::uint8_t> nonce;
    std::vector<std::uint8_t> associatedData;
    std::vector<std::uint8_t> tag;
    std::vector<std::uint8_t> cipherText;
    std::vector<std::uint8_t> encryptedCek; // empty for ECDH-ES
    std::vector<std::uint8_t> ephemeralPublicKey;

    friend bool operator==(const EncryptedData&, const EncryptedData&) = default;
};

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_ENVELOPE_HPP
