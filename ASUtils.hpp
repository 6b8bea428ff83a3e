#ifndef AIRSTREAM_UTILS_HPP
#define AIRSTREAM_UTILS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <string>
#include <vector>

namespace AirStream {
namespace Utils {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

// Define Deleters for OpenSSL EVP contexts
struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX *ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;

struct BioDeleter {
    void operator()(BIO *bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// RAOP strips the trailing '=' from every base64 value it sends
std::string base64Encode(const uint8_t *data, size_t size, bool padding = false);
inline std::string base64Encode(const std::vector<uint8_t> &data, bool padding = false) {
    return base64Encode(data.data(), data.size(), padding);
}

std::string hexString(const uint8_t *data, size_t size, bool upperCase = false);

// Lower-case hex MD5, as used by HTTP digest authentication
std::string md5Hex(const std::string &input);

// Cryptographically random bytes; throws std::runtime_error if the RNG fails
std::vector<uint8_t> randomBytes(size_t count);

std::array<uint8_t, 6> getPrimaryMacAddress();

// 64-bit identifier derived from the first non-loopback MAC, as 16 hex digits
std::string clientInstanceId();

} // namespace Utils
} // namespace AirStream

#endif // AIRSTREAM_UTILS_HPP
