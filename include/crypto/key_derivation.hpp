#ifndef FLUX_CRYPTO_KEY_DERIVATION_HPP
#define FLUX_CRYPTO_KEY_DERIVATION_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace flux::crypto {

constexpr std::size_t SALT_SIZE = 16;
constexpr std::size_t DERIVED_KEY_SIZE = 32;
constexpr int PBKDF2_ITERATIONS = 100000;

// PBKDF2-HMAC-SHA256 over password and salt, DERIVED_KEY_SIZE bytes
std::vector<uint8_t> derive_key(const std::string& password, const std::vector<uint8_t>& salt,
                                int iterations = PBKDF2_ITERATIONS);

// SALT_SIZE bytes from the OpenSSL CSPRNG
std::vector<uint8_t> generate_salt();

// Base64 helpers used to carry the salt in the transfer header
std::string encode_salt(const std::vector<uint8_t>& salt);
std::vector<uint8_t> decode_salt(const std::string& encoded);

} // namespace flux::crypto

#endif // FLUX_CRYPTO_KEY_DERIVATION_HPP
