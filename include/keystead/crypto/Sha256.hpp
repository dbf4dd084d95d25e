#ifndef INCLUDE_KEYSTEAD_CRYPTO_SHA256_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

struct evp_md_ctx_st;

namespace keystead::crypto
{

constexpr std::size_t g_sha256DigestBytes{ 32 };

using Sha256Digest = std::array<std::uint8_t, g_sha256DigestBytes>;

// Incremental SHA-256. `finalize()` returns the digest and leaves the hasher ready for a new message.
class Sha256 final
{
public:
    Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept = default;
    Sha256& operator=(Sha256&&) noexcept = default;
    ~Sha256() = default;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);

    [[nodiscard]] Sha256Digest finalize();

private:
    struct CtxDeleter final
    {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> m_ctx;
};

[[nodiscard]] Sha256Digest sha256(std::span<const std::uint8_t> data);

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_SHA256_HPP
