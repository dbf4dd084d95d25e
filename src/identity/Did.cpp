#include "keystead/identity/Did.hpp"
#include "keystead/crypto/Sha256.hpp"
#include "keystead/identity/Base58.hpp"
#include <algorithm>
#include <utility>

namespace keystead::identity
{
namespace
{

constexpr std::string_view g_kMainnetName{ "main" };
constexpr std::string_view g_kDevnetName{ "dev" };
constexpr char g_kSeparator{ ':' };

[[nodiscard]] bool isNetworkChar(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

[[nodiscard]] bool isValidTag(std::string_view tag)
{
    const auto decoded{ base58::decode(tag) };
    return decoded.has_value() && decoded->size() == keystead::crypto::g_sha256DigestBytes;
}

} // namespace

NetworkName::NetworkName(std::string name) noexcept : m_name{ std::move(name) }
{
}

std::optional<NetworkName> NetworkName::parse(std::string_view name)
{
    if (name.empty() || name.size() > g_networkNameMaxChars)
    {
        return std::nullopt;
    }
    if (!std::all_of(name.begin(), name.end(), isNetworkChar))
    {
        return std::nullopt;
    }
    return NetworkName{ std::string{ name } };
}

NetworkName NetworkName::mainnet()
{
    return NetworkName{ std::string{ g_kMainnetName } };
}

NetworkName NetworkName::devnet()
{
    return NetworkName{ std::string{ g_kDevnetName } };
}

bool NetworkName::isMainnet() const noexcept
{
    return m_name == g_kMainnetName;
}

Did::Did(IdentityKind kind, NetworkName network, std::string tag)
    : m_kind{ kind }, m_network{ std::move(network) }, m_tag{ std::move(tag) }
{
    m_str.reserve(g_didScheme.size() + g_iotaMethod.size() + m_network.str().size() + m_tag.size() + 3U);
    m_str.append(g_didScheme).push_back(g_kSeparator);
    m_str.append(g_iotaMethod).push_back(g_kSeparator);
    if (!m_network.isMainnet())
    {
        m_str.append(m_network.str()).push_back(g_kSeparator);
    }
    m_str.append(m_tag);
}

Did Did::fromPublicKey(IdentityKind kind, std::span<const std::uint8_t> publicKey, const NetworkName& network)
{
    const auto digest{ keystead::crypto::sha256(publicKey) };
    return Did{ kind, network, base58::encode(digest) };
}

std::optional<Did> Did::parse(std::string_view text)
{
    std::string prefix{ g_didScheme };
    prefix.push_back(g_kSeparator);
    prefix.append(g_iotaMethod).push_back(g_kSeparator);
    if (!text.starts_with(prefix))
    {
        return std::nullopt;
    }
    const std::string_view rest{ text.substr(prefix.size()) };

    auto network{ NetworkName::mainnet() };
    std::string_view tag{ rest };
    if (const auto sep{ rest.find(g_kSeparator) }; sep != std::string_view::npos)
    {
        auto parsed{ NetworkName::parse(rest.substr(0U, sep)) };
        if (!parsed)
        {
            return std::nullopt;
        }
        network = std::move(*parsed);
        tag = rest.substr(sep + 1U);
    }

    if (!isValidTag(tag))
    {
        return std::nullopt;
    }
    return Did{ IdentityKind::Iota, std::move(network), std::string{ tag } };
}

} // namespace keystead::identity
