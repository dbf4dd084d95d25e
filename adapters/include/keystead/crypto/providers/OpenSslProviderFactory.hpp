#ifndef INCLUDE_KEYSTEAD_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "keystead/crypto/ICryptoProvider.hpp"
#include <memory>

namespace keystead::crypto::providers
{

[[nodiscard]] std::unique_ptr<keystead::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace keystead::crypto::providers

#endif // INCLUDE_KEYSTEAD_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
