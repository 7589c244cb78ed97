#ifndef SHARDROOT_CRYPTO_ERROR_HPP
#define SHARDROOT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace shardroot::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

class HexDecodeError : public CryptoError {
public:
    explicit HexDecodeError(const std::string& message)
        : CryptoError("Hex decode error: " + message) {}
};

} // namespace shardroot::crypto

#endif // SHARDROOT_CRYPTO_ERROR_HPP
