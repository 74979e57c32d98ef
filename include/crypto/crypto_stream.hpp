#ifndef FLUX_CRYPTO_STREAM_HPP
#define FLUX_CRYPTO_STREAM_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>
#include <memory>
#include <array>
#include "crypto_error.hpp"

namespace flux::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-GCM over byte chunks and streams.
//
// A sealed chunk is laid out as nonce | tag | ciphertext. The stream form cuts
// the input into records of at most RECORD_SIZE plaintext bytes, each written
// as a 4-byte big-endian length followed by a sealed chunk. The top bit of the
// length marks the final record; the record sequence number and that flag are
// authenticated, so dropped, reordered or truncated records fail decryption.
class CryptoStream {
public:

  static constexpr std::size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr std::size_t NONCE_SIZE = 12;   // 96 bits for GCM
  static constexpr std::size_t TAG_SIZE = 16;     // 128-bit authentication tag
  static constexpr std::size_t CHUNK_OVERHEAD = NONCE_SIZE + TAG_SIZE;
  static constexpr std::size_t RECORD_SIZE = 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CryptoStream();
  ~CryptoStream();

  CryptoStream(const CryptoStream&) = delete;
  CryptoStream& operator=(const CryptoStream&) = delete;

  // Generate a random nonce
  std::array<uint8_t, NONCE_SIZE> generate_nonce() const;
  
  // ---- INITIALIZATION ----
  void initialize(const std::vector<uint8_t>& key);
  bool is_initialized() const { return is_initialized_; }

  
  // ---- CHUNK OPERATIONS ----
  std::vector<uint8_t> encrypt_chunk(const std::vector<uint8_t>& plain,
                                     const std::vector<uint8_t>& associated_data = {});
  std::vector<uint8_t> decrypt_chunk(const std::vector<uint8_t>& sealed,
                                     const std::vector<uint8_t>& associated_data = {});


  // ---- STREAM OPERATIONS ----
  std::ostream& encrypt(std::istream& input, std::ostream& output);
  std::ostream& decrypt(std::istream& input, std::ostream& output);

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;

  static constexpr uint32_t FINAL_RECORD_FLAG = 0x80000000u;


  // ---- RECORD PROCESSING ----
  // Builds the authenticated data bound to one stream record
  static std::vector<uint8_t> record_associated_data(uint64_t sequence, bool final);
  // Safely writes a block of processed data to the output stream
  void writeOutputBlock(std::ostream& output, const uint8_t* data, std::size_t length);
  // Reads exactly length bytes, returns false on a clean end of stream before the first byte
  bool readInputBlock(std::istream& input, uint8_t* data, std::size_t length);
};

// One-shot helpers keyed per call
std::vector<uint8_t> encrypt_chunk(const std::vector<uint8_t>& plain, const std::vector<uint8_t>& key);
std::vector<uint8_t> decrypt_chunk(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key);
  
} // namespace flux::crypto

#endif // FLUX_CRYPTO_STREAM_HPP
