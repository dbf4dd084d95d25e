#ifndef INCLUDE_KEYSTEAD_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "keystead/crypto/ICryptoProvider.hpp"
#include <memory>

namespace keystead::crypto::providers
{

// Curve25519 via Monocypher; AES-GCM and key wrap are shared with the OpenSSL provider.
[[nodiscard]] std::unique_ptr<keystead::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace keystead::crypto::providers

#endif // INCLUDE_KEYSTEAD_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
