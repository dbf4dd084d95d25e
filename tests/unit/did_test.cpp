#include <gtest/gtest.h>

#include <string>

#include "keystead/crypto/Sha256.hpp"
#include "keystead/identity/Base58.hpp"
#include "keystead/identity/Did.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

const std::string g_samplePublicKey{ "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c" };

[[nodiscard]] std::string expectedTag()
{
    const auto pub{ keystead::test_utils::fromHex(g_samplePublicKey) };
    return keystead::identity::base58::encode(keystead::crypto::sha256(pub));
}

} // namespace

TEST(NetworkName, AcceptsShortLowercaseAlphanumerics)
{
    EXPECT_TRUE(keystead::identity::NetworkName::parse("a").has_value());
    EXPECT_TRUE(keystead::identity::NetworkName::parse("dev").has_value());
    EXPECT_TRUE(keystead::identity::NetworkName::parse("net123").has_value());
}

TEST(NetworkName, RejectsInvalidNames)
{
    EXPECT_FALSE(keystead::identity::NetworkName::parse("").has_value());
    EXPECT_FALSE(keystead::identity::NetworkName::parse("toolong").has_value());
    EXPECT_FALSE(keystead::identity::NetworkName::parse("Dev").has_value());
    EXPECT_FALSE(keystead::identity::NetworkName::parse("de-v").has_value());
}

TEST(NetworkName, WellKnownNetworks)
{
    EXPECT_EQ(keystead::identity::NetworkName::mainnet().str(), "main");
    EXPECT_TRUE(keystead::identity::NetworkName::mainnet().isMainnet());
    EXPECT_EQ(keystead::identity::NetworkName::devnet().str(), "dev");
    EXPECT_FALSE(keystead::identity::NetworkName::devnet().isMainnet());
    EXPECT_EQ(keystead::identity::NetworkName::parse("main"), keystead::identity::NetworkName::mainnet());
}

TEST(Did, MainnetOmitsNetworkSegment)
{
    const auto pub{ keystead::test_utils::fromHex(g_samplePublicKey) };
    const auto did{ keystead::identity::Did::fromPublicKey(keystead::identity::IdentityKind::Iota, pub,
                                                           keystead::identity::NetworkName::mainnet()) };

    EXPECT_EQ(did.tag(), expectedTag());
    EXPECT_EQ(did.str(), "did:iota:" + expectedTag());
    EXPECT_EQ(did.kind(), keystead::identity::IdentityKind::Iota);
    EXPECT_TRUE(did.network().isMainnet());
}

TEST(Did, OtherNetworksIncludeSegment)
{
    const auto pub{ keystead::test_utils::fromHex(g_samplePublicKey) };
    const auto did{ keystead::identity::Did::fromPublicKey(keystead::identity::IdentityKind::Iota, pub,
                                                           keystead::identity::NetworkName::devnet()) };

    EXPECT_EQ(did.str(), "did:iota:dev:" + expectedTag());
}

TEST(Did, SameKeyAndNetworkGiveSameDid)
{
    const auto pub{ keystead::test_utils::fromHex(g_samplePublicKey) };
    const auto a{ keystead::identity::Did::fromPublicKey(keystead::identity::IdentityKind::Iota, pub,
                                                         keystead::identity::NetworkName::devnet()) };
    const auto b{ keystead::identity::Did::fromPublicKey(keystead::identity::IdentityKind::Iota, pub,
                                                         keystead::identity::NetworkName::devnet()) };
    const auto main{ keystead::identity::Did::fromPublicKey(keystead::identity::IdentityKind::Iota, pub,
                                                            keystead::identity::NetworkName::mainnet()) };

    EXPECT_EQ(a, b);
    EXPECT_NE(a, main);
}

TEST(Did, ParseRoundTripsCanonicalForms)
{
    const auto mainText{ "did:iota:" + expectedTag() };
    const auto devText{ "did:iota:dev:" + expectedTag() };

    const auto main{ keystead::identity::Did::parse(mainText) };
    ASSERT_TRUE(main.has_value());
    EXPECT_EQ(main->str(), mainText);
    EXPECT_TRUE(main->network().isMainnet());

    const auto dev{ keystead::identity::Did::parse(devText) };
    ASSERT_TRUE(dev.has_value());
    EXPECT_EQ(dev->str(), devText);
    EXPECT_EQ(dev->network(), keystead::identity::NetworkName::devnet());
    EXPECT_EQ(dev->tag(), expectedTag());
}

TEST(Did, ParseNormalizesExplicitMainnet)
{
    const auto parsed{ keystead::identity::Did::parse("did:iota:main:" + expectedTag()) };
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->str(), "did:iota:" + expectedTag());
}

TEST(Did, ParseRejectsMalformedText)
{
    const auto tag{ expectedTag() };
    EXPECT_FALSE(keystead::identity::Did::parse("").has_value());
    EXPECT_FALSE(keystead::identity::Did::parse("did:example:" + tag).has_value());
    EXPECT_FALSE(keystead::identity::Did::parse("did:iota:").has_value());
    EXPECT_FALSE(keystead::identity::Did::parse("did:iota:toolong:" + tag).has_value());
    EXPECT_FALSE(keystead::identity::Did::parse("did:iota:dev:" + tag + "0").has_value());
    EXPECT_FALSE(keystead::identity::Did::parse("did:iota:abc").has_value());
    EXPECT_FALSE(keystead::identity::Did::parse("did:iota:dev:x:" + tag).has_value());
}
