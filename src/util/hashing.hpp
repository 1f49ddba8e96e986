#ifndef PIIANON_UTIL_HASHING_HPP
#define PIIANON_UTIL_HASHING_HPP

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief OpenSSL-backed digests for the hash anonymization strategy.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * DESIGN:
 *   - Digests are looked up by name through EVP so the algorithm is a config value.
 *   - Only algorithms with at least 128-bit output are accepted.
 *   - Output is lowercase hex.
 *
 * USAGE:
 *   @code
 *   using namespace piianon::util::hashing;
 *
 *   std::string h = hexDigest("default_salt" + value, "sha256");
 *   // h is a 64-hex-character string
 *   @endcode
 */

namespace piianon {
namespace util {
namespace hashing {

/**
 * @brief Names accepted by hexDigest().
 */
inline const std::vector<std::string>& supportedAlgorithms()
{
    static const std::vector<std::string> names = {
        "md5", "sha1", "sha224", "sha256", "sha384", "sha512",
        "sha3-256", "sha3-512", "blake2b512", "blake2s256"
    };
    return names;
}

inline bool isSupportedAlgorithm(const std::string &name)
{
    const auto &names = supportedAlgorithms();
    return std::find(names.begin(), names.end(), name) != names.end();
}

/**
 * @brief Compute the digest of @p input with the named algorithm, as lowercase hex.
 * @throw std::invalid_argument for an unsupported algorithm name.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string hexDigest(const std::string &input, const std::string &algorithm)
{
    if (!isSupportedAlgorithm(algorithm)) {
        throw std::invalid_argument("hashing::hexDigest: unsupported algorithm: " + algorithm);
    }

    const EVP_MD *md = EVP_get_digestbyname(algorithm.c_str());
    if (md == nullptr) {
        throw std::runtime_error("hashing::hexDigest: OpenSSL has no digest named " + algorithm);
    }

    EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::hexDigest: Failed to create EVP_MD_CTX.");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestInit_ex(mdctx, md, nullptr) != 1 ||
        EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(mdctx, digest, &digestLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::hexDigest: " + algorithm + " computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    }
    return oss.str();
}

/**
 * @brief SHA-256 of the input as lowercase hex.
 */
inline std::string sha256(const std::string &input)
{
    return hexDigest(input, "sha256");
}

} // namespace hashing
} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_HASHING_HPP
