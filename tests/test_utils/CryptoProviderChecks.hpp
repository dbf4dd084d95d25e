#ifndef KEYSTEAD_TESTS_TEST_UTILS_CRYPTOPROVIDERCHECKS_HPP
#define KEYSTEAD_TESTS_TEST_UTILS_CRYPTOPROVIDERCHECKS_HPP

#include "keystead/crypto/CryptoErrors.hpp"
#include "keystead/crypto/ICryptoProvider.hpp"
#include "keystead/crypto/KeyPair.hpp"
#include "keystead/security/SecureBuffer.hpp"
#include "test_utils/TestUtils.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

// Known-answer and contract checks every ICryptoProvider must pass. Each provider test
// binary calls these against its own factory.
namespace keystead::test_utils
{

// RFC 8032 section 7.1, TEST 2.
inline constexpr std::string_view g_rfc8032Secret{ "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb" };
inline constexpr std::string_view g_rfc8032Public{ "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c" };
inline constexpr std::string_view g_rfc8032Message{ "72" };
inline constexpr std::string_view g_rfc8032Signature{
    "92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da"
    "085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00"
};

// RFC 7748 section 6.1.
inline constexpr std::string_view g_rfc7748AlicePrivate{
    "77076d0a7318a57d3c16c17251b26645df4c2f87ebc0992ab177fba51db92c2a"
};
inline constexpr std::string_view g_rfc7748AlicePublic{
    "8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a"
};
inline constexpr std::string_view g_rfc7748BobPrivate{ "5dab087e624a8a4b79e17f8b83800ee66f3bb1292618b6fd1c2f8b27ff88e0eb" };
inline constexpr std::string_view g_rfc7748BobPublic{ "de9edb7d7b7dc1b4d35b61c2ece435373f8343c85b78674dadfc7e146f882b4f" };
inline constexpr std::string_view g_rfc7748Shared{ "4a5d9d5ba4ce2de1728e3bf480350f25e07e21c947d19e3376f09b3c1e161742" };

// RFC 3394 section 4.6: 256 bits of key data with a 256-bit KEK.
inline constexpr std::string_view g_rfc3394Kek{ "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f" };
inline constexpr std::string_view g_rfc3394KeyData{
    "00112233445566778899aabbccddeeff000102030405060708090a0b0c0d0e0f"
};
inline constexpr std::string_view g_rfc3394Wrapped{
    "28c9f404c4b810f4cbccb35cfb87f8263f5786e2d80ed326cbc7f0e71a99f43bfb988b9b7a02dd21"
};

inline void checkEd25519KnownAnswer(keystead::crypto::ICryptoProvider& crypto)
{
    const auto secret{ fromHex(g_rfc8032Secret) };
    const auto message{ fromHex(g_rfc8032Message) };

    const auto publicKey{ crypto.derivePublicKey(keystead::crypto::KeyType::Ed25519, secret) };
    EXPECT_EQ(toHex(publicKey), g_rfc8032Public);

    const auto signature{ crypto.sign(keystead::crypto::KeyType::Ed25519, secret, message) };
    EXPECT_EQ(toHex(signature), g_rfc8032Signature);
}

inline void checkEd25519Deterministic(keystead::crypto::ICryptoProvider& crypto)
{
    const auto pair{ keystead::crypto::KeyPair::generate(crypto, keystead::crypto::KeyType::Ed25519) };
    const auto message{ bytesOf("deterministic") };

    const auto a{ crypto.sign(pair.type(), pair.privateKey(), message) };
    const auto b{ crypto.sign(pair.type(), pair.privateKey(), message) };
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), keystead::crypto::g_ed25519SignatureBytes);

    const auto empty{ crypto.sign(pair.type(), pair.privateKey(), {}) };
    EXPECT_EQ(empty.size(), keystead::crypto::g_ed25519SignatureBytes);
    EXPECT_NE(empty, a);
}

inline void checkX25519KnownAnswer(keystead::crypto::ICryptoProvider& crypto)
{
    const auto alicePrivate{ fromHex(g_rfc7748AlicePrivate) };
    const auto bobPrivate{ fromHex(g_rfc7748BobPrivate) };

    EXPECT_EQ(toHex(crypto.derivePublicKey(keystead::crypto::KeyType::X25519, alicePrivate)),
              g_rfc7748AlicePublic);
    EXPECT_EQ(toHex(crypto.derivePublicKey(keystead::crypto::KeyType::X25519, bobPrivate)), g_rfc7748BobPublic);

    const auto aliceShared{ crypto.keyAgreement(alicePrivate, fromHex(g_rfc7748BobPublic)) };
    const auto bobShared{ crypto.keyAgreement(bobPrivate, fromHex(g_rfc7748AlicePublic)) };
    EXPECT_EQ(toHex(keystead::security::asSpan(aliceShared)), g_rfc7748Shared);
    EXPECT_EQ(toHex(keystead::security::asSpan(bobShared)), g_rfc7748Shared);
}

inline void checkKeyAgreementRejectsBadPeers(keystead::crypto::ICryptoProvider& crypto)
{
    const auto alicePrivate{ fromHex(g_rfc7748AlicePrivate) };

    // The identity point always yields the all-zero shared secret.
    const std::array<std::uint8_t, keystead::crypto::g_x25519PublicKeyBytes> lowOrder{};
    EXPECT_THROW((void)crypto.keyAgreement(alicePrivate, lowOrder), keystead::crypto::InvalidPublicKeyError);

    const std::array<std::uint8_t, keystead::crypto::g_x25519PublicKeyBytes - 1U> shortPeer{};
    EXPECT_THROW((void)crypto.keyAgreement(alicePrivate, shortPeer), keystead::crypto::InvalidPublicKeyError);

    const std::array<std::uint8_t, 4> shortPrivate{};
    EXPECT_THROW((void)crypto.keyAgreement(shortPrivate, fromHex(g_rfc7748BobPublic)),
                 keystead::crypto::InvalidPrivateKeyError);
}

inline void checkKeyTypeContracts(keystead::crypto::ICryptoProvider& crypto)
{
    const auto x25519{ keystead::crypto::KeyPair::generate(crypto, keystead::crypto::KeyType::X25519) };
    EXPECT_THROW((void)crypto.sign(x25519.type(), x25519.privateKey(), bytesOf("m")),
                 keystead::crypto::UnsupportedKeyTypeError);

    const std::array<std::uint8_t, 31> shortKey{};
    EXPECT_THROW((void)crypto.derivePublicKey(keystead::crypto::KeyType::Ed25519, shortKey),
                 keystead::crypto::InvalidPrivateKeyError);
    EXPECT_THROW((void)keystead::crypto::KeyPair::fromPrivateKey(crypto, keystead::crypto::KeyType::X25519, shortKey),
                 keystead::crypto::InvalidPrivateKeyError);
}

inline void checkAeadRoundTripAndTamper(keystead::crypto::ICryptoProvider& crypto)
{
    std::array<std::uint8_t, keystead::crypto::g_aeadKeyBytes> key{};
    for (std::size_t i{}; i < key.size(); ++i)
    {
        key[i] = static_cast<std::uint8_t>(i);
    }
    const auto plain{ bytesOf("attack at dawn") };
    const auto ad{ bytesOf("header") };

    const auto box{ crypto.aeadEncrypt(key, plain, ad) };
    EXPECT_EQ(box.cipherText.size(), plain.size());

    const auto opened{ crypto.aeadDecrypt(key, box, ad) };
    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(std::equal(opened->begin(), opened->end(), plain.begin(), plain.end()));

    EXPECT_FALSE(crypto.aeadDecrypt(key, box, bytesOf("other")).has_value());

    auto tamperedTag{ box };
    tamperedTag.tag[0] ^= 0x01U;
    EXPECT_FALSE(crypto.aeadDecrypt(key, tamperedTag, ad).has_value());

    auto tamperedText{ box };
    tamperedText.cipherText[0] ^= 0x80U;
    EXPECT_FALSE(crypto.aeadDecrypt(key, tamperedText, ad).has_value());

    // Two encryptions of the same message never share a nonce.
    const auto again{ crypto.aeadEncrypt(key, plain, ad) };
    EXPECT_NE(box.nonce, again.nonce);

    const std::array<std::uint8_t, 16> shortKey{};
    EXPECT_THROW((void)crypto.aeadEncrypt(shortKey, plain, ad), std::invalid_argument);
}

inline void checkAeadEmptyPlainText(keystead::crypto::ICryptoProvider& crypto)
{
    const std::array<std::uint8_t, keystead::crypto::g_aeadKeyBytes> key{};
    const auto box{ crypto.aeadEncrypt(key, {}, {}) };
    EXPECT_TRUE(box.cipherText.empty());

    const auto opened{ crypto.aeadDecrypt(key, box, {}) };
    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(opened->empty());
}

inline void checkKeyWrapKnownAnswer(keystead::crypto::ICryptoProvider& crypto)
{
    const auto kek{ fromHex(g_rfc3394Kek) };
    const auto keyData{ fromHex(g_rfc3394KeyData) };

    const auto wrapped{ crypto.wrapKey(kek, keyData) };
    EXPECT_EQ(toHex(wrapped), g_rfc3394Wrapped);
    EXPECT_EQ(wrapped.size(), keyData.size() + keystead::crypto::g_keyWrapBlockBytes);

    const auto unwrapped{ crypto.unwrapKey(kek, wrapped) };
    ASSERT_TRUE(unwrapped.has_value());
    EXPECT_EQ(toHex(keystead::security::asSpan(*unwrapped)), g_rfc3394KeyData);

    auto corrupted{ wrapped };
    corrupted[corrupted.size() - 1U] ^= 0x01U;
    EXPECT_FALSE(crypto.unwrapKey(kek, corrupted).has_value());

    auto otherKek{ kek };
    otherKek[0] ^= 0x01U;
    EXPECT_FALSE(crypto.unwrapKey(otherKek, wrapped).has_value());
}

inline void checkKeyWrapRejectsBadLengths(keystead::crypto::ICryptoProvider& crypto)
{
    const auto kek{ fromHex(g_rfc3394Kek) };

    const std::vector<std::uint8_t> oneBlock(keystead::crypto::g_keyWrapBlockBytes);
    EXPECT_THROW((void)crypto.wrapKey(kek, oneBlock), std::invalid_argument);

    const std::vector<std::uint8_t> unaligned(20U);
    EXPECT_THROW((void)crypto.wrapKey(kek, unaligned), std::invalid_argument);

    const std::vector<std::uint8_t> twoBlocks(2U * keystead::crypto::g_keyWrapBlockBytes);
    EXPECT_THROW((void)crypto.unwrapKey(kek, twoBlocks), std::invalid_argument);
    EXPECT_THROW((void)crypto.unwrapKey(kek, unaligned), std::invalid_argument);

    const std::vector<std::uint8_t> shortKek(16U);
    EXPECT_THROW((void)crypto.wrapKey(shortKek, fromHex(g_rfc3394KeyData)), std::invalid_argument);
}

} // namespace keystead::test_utils

#endif // KEYSTEAD_TESTS_TEST_UTILS_CRYPTOPROVIDERCHECKS_HPP
