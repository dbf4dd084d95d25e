#include "keystead/crypto/ConcatKdf.hpp"
#include "keystead/crypto/CryptoErrors.hpp"
#include "keystead/crypto/Sha256.hpp"
#include "keystead/security/ScopeWipe.hpp"
#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace keystead::crypto
{
namespace
{

[[nodiscard]] std::array<std::uint8_t, 4> bigEndian32(std::uint32_t v) noexcept
{
    return { static_cast<std::uint8_t>(v >> 24U), static_cast<std::uint8_t>(v >> 16U),
             static_cast<std::uint8_t>(v >> 8U), static_cast<std::uint8_t>(v) };
}

[[nodiscard]] std::uint32_t fieldLength(std::size_t n)
{
    if (n > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("concatKdf: field too long");
    }
    return static_cast<std::uint32_t>(n);
}

void updatePrefixed(Sha256& hasher, std::span<const std::uint8_t> field)
{
    hasher.update(bigEndian32(fieldLength(field.size())));
    hasher.update(field);
}

} // namespace

keystead::security::SecureBuffer concatKdf(std::string_view algorithmId, std::size_t outputBytes,
                                           std::span<const std::uint8_t> sharedSecret, const AgreementInfo& agreement)
{
    if (outputBytes == 0U)
    {
        throw std::invalid_argument("concatKdf: zero output length");
    }
    const std::size_t rounds{ outputBytes / g_sha256DigestBytes +
                              (outputBytes % g_sha256DigestBytes != 0U ? 1U : 0U) };
    if (rounds > std::numeric_limits<std::uint32_t>::max())
    {
        throw EncryptionFailureError("concatKdf: output length exceeds counter range");
    }
    const std::span<const std::uint8_t> algorithm{ reinterpret_cast<const std::uint8_t*>(algorithmId.data()),
                                                   algorithmId.size() };

    auto out{ keystead::security::secureBufferOfSize(rounds * g_sha256DigestBytes) };
    Sha256 hasher{};
    for (std::size_t i{ 0U }; i < rounds; ++i)
    {
        hasher.update(bigEndian32(static_cast<std::uint32_t>(i + 1U)));
        hasher.update(sharedSecret);
        updatePrefixed(hasher, algorithm);
        updatePrefixed(hasher, agreement.apu);
        updatePrefixed(hasher, agreement.apv);
        hasher.update(agreement.pubInfo);
        hasher.update(agreement.privInfo);

        auto digest{ hasher.finalize() };
        auto wipeDigest{ keystead::security::scopeWipe(digest) };
        std::copy(digest.begin(), digest.end(), out.begin() + static_cast<std::ptrdiff_t>(i * g_sha256DigestBytes));
    }

    keystead::security::secureResize(out, outputBytes);
    return out;
}

} // namespace keystead::crypto
