#ifndef INCLUDE_KEYSTEAD_IDENTITY_DID_HPP
#define INCLUDE_KEYSTEAD_IDENTITY_DID_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace keystead::identity
{

inline constexpr std::string_view g_didScheme{ "did" };
inline constexpr std::string_view g_iotaMethod{ "iota" };
inline constexpr std::size_t g_networkNameMaxChars{ 6 };

enum class IdentityKind : std::uint8_t
{
    Iota = 1U,
};

// Name of the network an identity is published on: 1-6 characters of [a-z0-9].
class NetworkName final
{
public:
    [[nodiscard]] static std::optional<NetworkName> parse(std::string_view name);

    [[nodiscard]] static NetworkName mainnet();
    [[nodiscard]] static NetworkName devnet();

    [[nodiscard]] const std::string& str() const noexcept
    {
        return m_name;
    }

    [[nodiscard]] bool isMainnet() const noexcept;

    friend bool operator==(const NetworkName&, const NetworkName&) = default;
    friend std::strong_ordering operator<=>(const NetworkName&, const NetworkName&) = default;

private:
    explicit NetworkName(std::string name) noexcept;

    std::string m_name;
};

// Decentralized identifier: did:iota[:<network>]:<tag>, with the network segment omitted on mainnet.
// The tag is the base58 encoding of SHA-256 over the identity's initial public key, so the same
// key on the same network always yields the same identifier.
class Did final
{
public:
    [[nodiscard]] static Did fromPublicKey(IdentityKind kind, std::span<const std::uint8_t> publicKey,
                                           const NetworkName& network);

    // Accepts the canonical form and the explicit "did:iota:main:<tag>" spelling.
    [[nodiscard]] static std::optional<Did> parse(std::string_view text);

    [[nodiscard]] IdentityKind kind() const noexcept
    {
        return m_kind;
    }

    [[nodiscard]] const NetworkName& network() const noexcept
    {
        return m_network;
    }

    [[nodiscard]] const std::string& tag() const noexcept
    {
        return m_tag;
    }

    [[nodiscard]] const std::string& str() const noexcept
    {
        return m_str;
    }

    friend bool operator==(const Did& a, const Did& b) noexcept
    {
        return a.m_str == b.m_str;
    }

    friend std::strong_ordering operator<=>(const Did& a, const Did& b) noexcept
    {
        return a.m_str <=> b.m_str;
    }

private:
    Did(IdentityKind kind, NetworkName network, std::string tag);

    IdentityKind m_kind;
    NetworkName m_network;
    std::string m_tag;
    std::string m_str;
};

} // namespace keystead::identity

#endif // INCLUDE_KEYSTEAD_IDENTITY_DID_HPP
