#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include <cstring>
#include <boost/endian/conversion.hpp>
#include "crypto/crypto_stream.hpp"
#include "test_utils.hpp"

using namespace flux::crypto;

class CryptoStreamTest : public ::testing::Test {
protected:
    CryptoStream crypto;
    std::vector<uint8_t> key;

    void SetUp() override {
        init_test_logging(boost::log::trivial::warning);
        key.resize(CryptoStream::KEY_SIZE, 0x42);
        crypto.initialize(key);
    }

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    // Splits an encrypted stream into its length-prefixed records
    static std::vector<std::string> split_records(const std::string& stream) {
        std::vector<std::string> records;
        std::size_t offset = 0;
        while (offset + 4 <= stream.size()) {
            uint32_t length;
            std::memcpy(&length, stream.data() + offset, sizeof(length));
            length = boost::endian::big_to_native(length) & 0x7FFFFFFFu;
            records.push_back(stream.substr(offset, 4 + length));
            offset += 4 + length;
        }
        return records;
    }
};

// Test basic encryption and decryption with streams
TEST_F(CryptoStreamTest, BasicStreamOperation) {
    const std::string plaintext = "Hello, World! This is a test of stream encryption.";
    std::stringstream input(plaintext);
    std::stringstream encrypted;
    std::stringstream decrypted;

    crypto.encrypt(input, encrypted);
    ASSERT_EQ(encrypted.str().find(plaintext), std::string::npos);

    crypto.decrypt(encrypted, decrypted);
    ASSERT_EQ(decrypted.str(), plaintext);
}

// Test error handling for uninitialized crypto
TEST_F(CryptoStreamTest, UninitializedError) {
    CryptoStream uninitialized;
    std::stringstream input("test"), output;
    EXPECT_THROW(uninitialized.encrypt(input, output), InitializationError);
    EXPECT_THROW(uninitialized.encrypt_chunk(bytes("test")), InitializationError);
}

TEST_F(CryptoStreamTest, InvalidKeySize) {
    CryptoStream other;
    EXPECT_THROW(other.initialize(std::vector<uint8_t>(16, 0x01)), InitializationError);
    EXPECT_FALSE(other.is_initialized());
}

// Test handling of empty streams
TEST_F(CryptoStreamTest, EmptyStream) {
    std::stringstream empty, output;
    crypto.encrypt(empty, output);
    // One final record carrying only nonce and tag
    ASSERT_EQ(output.str().size(), 4 + CryptoStream::CHUNK_OVERHEAD);

    std::stringstream decrypted;
    crypto.decrypt(output, decrypted);
    ASSERT_TRUE(decrypted.str().empty());
}

// Test handling of large data streams spanning several records
TEST_F(CryptoStreamTest, LargeStream) {
    const std::string plaintext = random_content(1024 * 1024 + 17);
    std::stringstream input(plaintext);
    std::stringstream encrypted, decrypted;

    crypto.encrypt(input, encrypted);
    crypto.decrypt(encrypted, decrypted);

    ASSERT_EQ(decrypted.str(), plaintext);
}

TEST_F(CryptoStreamTest, RecordBoundaries) {
    for (std::size_t size : {CryptoStream::RECORD_SIZE - 1, CryptoStream::RECORD_SIZE,
                             CryptoStream::RECORD_SIZE + 1, 2 * CryptoStream::RECORD_SIZE}) {
        const std::string plaintext = random_content(size, static_cast<unsigned>(size));
        std::stringstream input(plaintext), encrypted, decrypted;

        crypto.encrypt(input, encrypted);
        crypto.decrypt(encrypted, decrypted);

        ASSERT_EQ(decrypted.str(), plaintext) << "Failed for size: " << size;
    }
}

// Test invalid stream states
TEST_F(CryptoStreamTest, InvalidStreamState) {
    std::stringstream input("test"), output;
    input.setstate(std::ios::badbit);
    EXPECT_THROW(crypto.encrypt(input, output), std::runtime_error);

    input.clear();
    output.setstate(std::ios::badbit);
    EXPECT_THROW(crypto.encrypt(input, output), std::runtime_error);
}

// Test nonce generation functionality
TEST_F(CryptoStreamTest, NonceGeneration) {
    auto nonce1 = crypto.generate_nonce();
    auto nonce2 = crypto.generate_nonce();
    ASSERT_EQ(nonce1.size(), CryptoStream::NONCE_SIZE);
    ASSERT_NE(std::memcmp(nonce1.data(), nonce2.data(), CryptoStream::NONCE_SIZE), 0)
        << "Generated nonces should be different";
}

TEST_F(CryptoStreamTest, ChunkRoundTrip) {
    const auto plain = bytes("chunk of compressed data");
    auto sealed = encrypt_chunk(plain, key);

    ASSERT_EQ(sealed.size(), plain.size() + CryptoStream::CHUNK_OVERHEAD);
    EXPECT_EQ(decrypt_chunk(sealed, key), plain);

    // Random nonce per chunk
    EXPECT_NE(encrypt_chunk(plain, key), sealed);
}

TEST_F(CryptoStreamTest, TamperingAnyByteIsDetected) {
    const auto plain = bytes("integrity protected payload");
    const auto sealed = encrypt_chunk(plain, key);

    for (std::size_t i = 0; i < sealed.size(); ++i) {
        auto tampered = sealed;
        tampered[i] ^= 0x01;
        EXPECT_THROW(decrypt_chunk(tampered, key), DecryptionError) << "Byte " << i << " not authenticated";
    }
}

TEST_F(CryptoStreamTest, WrongKeyFails) {
    const auto sealed = encrypt_chunk(bytes("secret"), key);
    std::vector<uint8_t> other_key(CryptoStream::KEY_SIZE, 0x43);
    EXPECT_THROW(decrypt_chunk(sealed, other_key), AuthenticationError);

    std::stringstream input("stream secret"), encrypted, decrypted;
    crypto.encrypt(input, encrypted);
    CryptoStream other;
    other.initialize(other_key);
    EXPECT_THROW(other.decrypt(encrypted, decrypted), DecryptionError);
}

TEST_F(CryptoStreamTest, ShortChunkRejected) {
    std::vector<uint8_t> sealed(CryptoStream::CHUNK_OVERHEAD - 1, 0x00);
    EXPECT_THROW(decrypt_chunk(sealed, key), DecryptionError);
}

TEST_F(CryptoStreamTest, AssociatedDataMustMatch) {
    const auto plain = bytes("record");
    auto sealed = crypto.encrypt_chunk(plain, bytes("seq-1"));
    EXPECT_EQ(crypto.decrypt_chunk(sealed, bytes("seq-1")), plain);
    EXPECT_THROW(crypto.decrypt_chunk(sealed, bytes("seq-2")), DecryptionError);
}

TEST_F(CryptoStreamTest, TruncatedStreamDetected) {
    std::stringstream input(random_content(3 * CryptoStream::RECORD_SIZE)), encrypted;
    crypto.encrypt(input, encrypted);
    const auto records = split_records(encrypted.str());
    ASSERT_EQ(records.size(), 3u);

    // Dropping the final record
    {
        std::stringstream truncated(records[0] + records[1]), output;
        EXPECT_THROW(crypto.decrypt(truncated, output), DecryptionError);
    }

    // Cutting a record in half
    {
        const std::string full = encrypted.str();
        std::stringstream truncated(full.substr(0, full.size() - 10)), output;
        EXPECT_THROW(crypto.decrypt(truncated, output), DecryptionError);
    }
}

TEST_F(CryptoStreamTest, ReorderedRecordsDetected) {
    std::stringstream input(random_content(3 * CryptoStream::RECORD_SIZE)), encrypted;
    crypto.encrypt(input, encrypted);
    const auto records = split_records(encrypted.str());
    ASSERT_EQ(records.size(), 3u);

    std::stringstream reordered(records[1] + records[0] + records[2]), output;
    EXPECT_THROW(crypto.decrypt(reordered, output), DecryptionError);
}

TEST_F(CryptoStreamTest, TrailingDataAfterFinalRecord) {
    std::stringstream input("payload"), encrypted;
    crypto.encrypt(input, encrypted);
    const std::string once = encrypted.str();

    std::stringstream doubled(once + once), output;
    EXPECT_THROW(crypto.decrypt(doubled, output), DecryptionError);
}
