#include "crypto/crypto_stream.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace flux::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

   // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw std::runtime_error("Crypto stream: Failed to create cipher context");
    }
  }

  // Clean up cipher context when object is destroyed - free cipher context
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  // Access the underlying context  
  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoStream::CryptoStream() {
  context_ = std::make_unique<CipherContext>();
  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: initialization complete";
}

CryptoStream::~CryptoStream() {
  // Wipe key material before releasing it
  std::fill(key_.begin(), key_.end(), 0);
}

//==============================================
// CRYPTO UNIT INITIALIZATION
//==============================================

void CryptoStream::initialize(const std::vector<uint8_t>& key) {
  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Initializing crypto parameters";

  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto stream: Invalid key size: " << key.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }

  key_ = key;
  is_initialized_ = true;
}

//==============================================
// CHUNK OPERATIONS
//==============================================

std::vector<uint8_t> CryptoStream::encrypt_chunk(const std::vector<uint8_t>& plain,
                                                 const std::vector<uint8_t>& associated_data) {
  if (!is_initialized_) {
    throw InitializationError("Crypto stream: CryptoStream not initialized");
  }

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  auto nonce = generate_nonce();
  std::vector<uint8_t> sealed(CHUNK_OVERHEAD + plain.size());
  std::copy(nonce.begin(), nonce.end(), sealed.begin());
  uint8_t* tag = sealed.data() + NONCE_SIZE;
  uint8_t* ciphertext = tag + TAG_SIZE;

  if (!EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_EncryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce.data())) {
    throw EncryptionError("Crypto stream: Failed to initialize encryption context");
  }

  int outlen = 0;
  if (!associated_data.empty() &&
      !EVP_EncryptUpdate(ctx, nullptr, &outlen, associated_data.data(), static_cast<int>(associated_data.size()))) {
    throw EncryptionError("Crypto stream: Failed to authenticate associated data");
  }

  int written = 0;
  if (!plain.empty()) {
    if (!EVP_EncryptUpdate(ctx, ciphertext, &outlen, plain.data(), static_cast<int>(plain.size()))) {
      throw EncryptionError("Crypto stream: Failed to encrypt data block");
    }
    written = outlen;
  }

  if (!EVP_EncryptFinal_ex(ctx, ciphertext + written, &outlen)) {
    throw EncryptionError("Crypto stream: Failed to finalize encryption");
  }

  if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag)) {
    throw EncryptionError("Crypto stream: Failed to read authentication tag");
  }

  BOOST_LOG_TRIVIAL(trace) << "Crypto stream: Sealed chunk of " << plain.size() << " bytes";
  return sealed;
}

std::vector<uint8_t> CryptoStream::decrypt_chunk(const std::vector<uint8_t>& sealed,
                                                 const std::vector<uint8_t>& associated_data) {
  if (!is_initialized_) {
    throw InitializationError("Crypto stream: CryptoStream not initialized");
  }
  if (sealed.size() < CHUNK_OVERHEAD) {
    throw DecryptionError("Crypto stream: Sealed chunk is shorter than nonce and tag");
  }

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  const uint8_t* nonce = sealed.data();
  std::array<uint8_t, TAG_SIZE> tag;
  std::copy(sealed.begin() + NONCE_SIZE, sealed.begin() + CHUNK_OVERHEAD, tag.begin());
  const uint8_t* ciphertext = sealed.data() + CHUNK_OVERHEAD;
  const std::size_t ciphertext_size = sealed.size() - CHUNK_OVERHEAD;

  if (!EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_DecryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce)) {
    throw DecryptionError("Crypto stream: Failed to initialize decryption context");
  }

  int outlen = 0;
  if (!associated_data.empty() &&
      !EVP_DecryptUpdate(ctx, nullptr, &outlen, associated_data.data(), static_cast<int>(associated_data.size()))) {
    throw DecryptionError("Crypto stream: Failed to authenticate associated data");
  }

  std::vector<uint8_t> plain(ciphertext_size);
  int written = 0;
  if (ciphertext_size > 0) {
    if (!EVP_DecryptUpdate(ctx, plain.data(), &outlen, ciphertext, static_cast<int>(ciphertext_size))) {
      throw DecryptionError("Crypto stream: Failed to decrypt data block");
    }
    written = outlen;
  }

  if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data())) {
    throw DecryptionError("Crypto stream: Failed to set authentication tag");
  }

  // GCM final fails when the tag does not match
  uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
  if (EVP_DecryptFinal_ex(ctx, final_block, &outlen) <= 0) {
    BOOST_LOG_TRIVIAL(warning) << "Crypto stream: Authentication failed for chunk of " << ciphertext_size << " bytes";
    throw AuthenticationError("data is corrupted or the key is wrong");
  }

  plain.resize(static_cast<std::size_t>(written));
  return plain;
}

//==============================================
// STREAM PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

std::ostream& CryptoStream::encrypt(std::istream& input, std::ostream& output) {
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Starting stream encryption";

  if (!input.good() || !output.good()) {
    throw std::runtime_error("Crypto stream: Invalid stream state");
  }

  std::vector<uint8_t> inbuf(RECORD_SIZE);
  uint64_t sequence = 0;
  std::size_t total_bytes_processed = 0;
  bool final = false;

  while (!final) {
    input.read(reinterpret_cast<char*>(inbuf.data()), static_cast<std::streamsize>(inbuf.size()));
    if (input.bad()) {
      throw std::runtime_error("Crypto stream: Failed to read from input stream");
    }
    auto bytes_read = static_cast<std::size_t>(input.gcount());
    final = input.eof() || input.peek() == std::char_traits<char>::eof();

    std::vector<uint8_t> plain(inbuf.begin(), inbuf.begin() + bytes_read);
    auto sealed = encrypt_chunk(plain, record_associated_data(sequence, final));

    uint32_t length = static_cast<uint32_t>(sealed.size()) | (final ? FINAL_RECORD_FLAG : 0u);
    uint32_t network_length = boost::endian::native_to_big(length);
    writeOutputBlock(output, reinterpret_cast<const uint8_t*>(&network_length), sizeof(network_length));
    writeOutputBlock(output, sealed.data(), sealed.size());

    total_bytes_processed += bytes_read;
    ++sequence;
  }

  output.flush();
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Completed encryption: Processed " << total_bytes_processed
                          << " bytes in " << sequence << " records";
  return output;
}

std::ostream& CryptoStream::decrypt(std::istream& input, std::ostream& output) {
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Starting stream decryption";

  if (!input.good() || !output.good()) {
    throw std::runtime_error("Crypto stream: Invalid stream state");
  }

  uint64_t sequence = 0;
  std::size_t total_bytes_processed = 0;
  bool final_seen = false;

  while (true) {
    uint32_t network_length = 0;
    if (!readInputBlock(input, reinterpret_cast<uint8_t*>(&network_length), sizeof(network_length))) {
      break;
    }
    if (final_seen) {
      throw DecryptionError("Unexpected data after final record");
    }

    uint32_t length = boost::endian::big_to_native(network_length);
    bool final = (length & FINAL_RECORD_FLAG) != 0;
    std::size_t sealed_size = length & ~FINAL_RECORD_FLAG;
    if (sealed_size < CHUNK_OVERHEAD || sealed_size > RECORD_SIZE + CHUNK_OVERHEAD) {
      throw DecryptionError("Invalid record length: " + std::to_string(sealed_size));
    }

    std::vector<uint8_t> sealed(sealed_size);
    if (!readInputBlock(input, sealed.data(), sealed.size())) {
      throw DecryptionError("Encrypted stream is truncated");
    }

    auto plain = decrypt_chunk(sealed, record_associated_data(sequence, final));
    writeOutputBlock(output, plain.data(), plain.size());

    total_bytes_processed += plain.size();
    final_seen = final;
    ++sequence;
  }

  if (!final_seen) {
    throw DecryptionError("Encrypted stream is truncated");
  }

  output.flush();
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Completed decryption: Processed " << total_bytes_processed
                          << " bytes in " << sequence << " records";
  return output;
}

std::vector<uint8_t> CryptoStream::record_associated_data(uint64_t sequence, bool final) {
  std::vector<uint8_t> aad(sizeof(uint64_t) + 1);
  uint64_t network_sequence = boost::endian::native_to_big(sequence);
  std::copy(reinterpret_cast<const uint8_t*>(&network_sequence),
            reinterpret_cast<const uint8_t*>(&network_sequence) + sizeof(network_sequence),
            aad.begin());
  aad.back() = final ? 1 : 0;
  return aad;
}

void CryptoStream::writeOutputBlock(std::ostream& output, const uint8_t* data, std::size_t length) {
  if (length > 0) {
    // Cast uint8_t data to char* and write to output stream
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output.good()) {
      throw std::runtime_error("Crypto stream: Failed to write to output stream");
    }
  }
}

bool CryptoStream::readInputBlock(std::istream& input, uint8_t* data, std::size_t length) {
  input.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(length));
  auto bytes_read = static_cast<std::size_t>(input.gcount());
  if (input.bad()) {
    throw std::runtime_error("Crypto stream: Failed to read from input stream");
  }
  if (bytes_read == 0 && input.eof()) {
    return false;
  }
  if (bytes_read != length) {
    throw DecryptionError("Encrypted stream is truncated");
  }
  return true;
}

//==============================================
// PUBLIC NONCE GENERATION METHOD
//==============================================

std::array<uint8_t, CryptoStream::NONCE_SIZE> CryptoStream::generate_nonce() const {
  std::array<uint8_t, NONCE_SIZE> nonce;
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw EncryptionError("Crypto stream: Failed to generate random nonce");
  }
  return nonce;
}

//==============================================
// ONE-SHOT HELPERS
//==============================================

std::vector<uint8_t> encrypt_chunk(const std::vector<uint8_t>& plain, const std::vector<uint8_t>& key) {
  CryptoStream crypto;
  crypto.initialize(key);
  return crypto.encrypt_chunk(plain);
}

std::vector<uint8_t> decrypt_chunk(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key) {
  CryptoStream crypto;
  crypto.initialize(key);
  return crypto.decrypt_chunk(sealed);
}

} // namespace flux::crypto
