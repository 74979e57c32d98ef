#include "crypto/key_derivation.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace flux::crypto {

std::vector<uint8_t> derive_key(const std::string& password, const std::vector<uint8_t>& salt,
                                int iterations) {
  if (salt.empty()) {
    throw KeyDerivationError("Salt must not be empty");
  }
  if (iterations <= 0) {
    throw KeyDerivationError("Iteration count must be positive");
  }

  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Deriving " << DERIVED_KEY_SIZE << " byte key with "
                           << iterations << " iterations";

  std::vector<uint8_t> key(DERIVED_KEY_SIZE);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        iterations, EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    throw KeyDerivationError("PBKDF2 derivation failed");
  }
  return key;
}

std::vector<uint8_t> generate_salt() {
  std::vector<uint8_t> salt(SALT_SIZE);
  if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
    throw KeyDerivationError("Failed to generate random salt");
  }
  return salt;
}

std::string encode_salt(const std::vector<uint8_t>& salt) {
  if (salt.empty()) {
    return {};
  }

  // EVP_EncodeBlock appends a NUL terminator
  std::string encoded(4 * ((salt.size() + 2) / 3) + 1, '\0');
  int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                               salt.data(), static_cast<int>(salt.size()));
  encoded.resize(static_cast<std::size_t>(length));
  return encoded;
}

std::vector<uint8_t> decode_salt(const std::string& encoded) {
  if (encoded.empty() || encoded.size() % 4 != 0) {
    throw KeyDerivationError("Malformed salt encoding");
  }

  std::vector<uint8_t> decoded(3 * encoded.size() / 4);
  int length = EVP_DecodeBlock(decoded.data(),
                               reinterpret_cast<const unsigned char*>(encoded.data()),
                               static_cast<int>(encoded.size()));
  if (length < 0) {
    throw KeyDerivationError("Malformed salt encoding");
  }

  // EVP_DecodeBlock counts padding characters as zero bytes
  std::size_t padding = 0;
  for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '=' && padding < 2; ++it) {
    ++padding;
  }
  decoded.resize(static_cast<std::size_t>(length) - padding);
  return decoded;
}

} // namespace flux::crypto
