#ifndef INCLUDE_KEYSTEAD_IDENTITY_KEYLOCATION_HPP
#define INCLUDE_KEYSTEAD_IDENTITY_KEYLOCATION_HPP

#include "keystead/crypto/KeyType.hpp"
#include <compare>
#include <cstdint>
#include <span>
#include <string>

namespace keystead::identity
{

// Addresses one key inside an identity's vault. The fingerprint is the first 8 bytes of
// SHA-256 over the public key, read big-endian, so a location can only be formed from
// public key material and always names the same key.
class KeyLocation final
{
public:
    KeyLocation(keystead::crypto::KeyType keyType, std::string fragment, std::span<const std::uint8_t> publicKey);

    [[nodiscard]] keystead::crypto::KeyType keyType() const noexcept
    {
        return m_keyType;
    }

    [[nodiscard]] const std::string& fragment() const noexcept
    {
        return m_fragment;
    }

    [[nodiscard]] std::uint64_t fingerprint() const noexcept
    {
        return m_fingerprint;
    }

    // "<fragment>:<16 lowercase hex digits>"
    [[nodiscard]] std::string canonical() const;

    friend bool operator==(const KeyLocation&, const KeyLocation&) = default;
    friend std::strong_ordering operator<=>(const KeyLocation&, const KeyLocation&) = default;

private:
    keystead::crypto::KeyType m_keyType;
    std::string m_fragment;
    std::uint64_t m_fingerprint;
};

} // namespace keystead::identity

#endif // INCLUDE_KEYSTEAD_IDENTITY_KEYLOCATION_HPP
