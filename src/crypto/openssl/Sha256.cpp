#include "keystead/crypto/Sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace keystead::crypto
{

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept
{
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : m_ctx{ EVP_MD_CTX_new() }
{
    if (!m_ctx)
    {
        throw std::runtime_error("Sha256: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Sha256: EVP_DigestInit_ex failed");
    }
}

void Sha256::update(std::span<const std::uint8_t> data)
{
    if (data.empty())
    {
        return;
    }
    if (EVP_DigestUpdate(m_ctx.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("Sha256: EVP_DigestUpdate failed");
    }
}

void Sha256::update(std::string_view text)
{
    update(std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(text.data()), text.size() });
}

Sha256Digest Sha256::finalize()
{
    Sha256Digest out{};
    unsigned int written{ 0U };
    if (EVP_DigestFinal_ex(m_ctx.get(), out.data(), &written) != 1 || written != out.size())
    {
        throw std::runtime_error("Sha256: EVP_DigestFinal_ex failed");
    }
    if (EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Sha256: EVP_DigestInit_ex failed");
    }
    return out;
}

Sha256Digest sha256(std::span<const std::uint8_t> data)
{
    Sha256 hasher{};
    hasher.update(data);
    return hasher.finalize();
}

} // namespace keystead::crypto
