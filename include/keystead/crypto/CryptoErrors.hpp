#ifndef INCLUDE_KEYSTEAD_CRYPTO_CRYPTOERRORS_HPP
#define INCLUDE_KEYSTEAD_CRYPTO_CRYPTOERRORS_HPP

#include <stdexcept>

namespace keystead::crypto
{

// Input validation failures, raised before any primitive runs.

class InvalidPrivateKeyError final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class InvalidPublicKeyError final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class MalformedEnvelopeError final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// The key type cannot perform the requested operation (e.g. signing with X25519).
class UnsupportedKeyTypeError final : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// Primitive-level failures. Messages name the failing step, never key material.

class EncryptionFailureError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class DecryptionFailureError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace keystead::crypto

#endif // INCLUDE_KEYSTEAD_CRYPTO_CRYPTOERRORS_HPP
