#ifndef FLUX_CRYPTO_ERROR_HPP
#define FLUX_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace flux::crypto {

// Base of every failure raised by the cipher layer. The transfer engine
// records all of them as ErrorCode::CRYPTO_ERROR.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Missing or malformed key material
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

// PBKDF2 parameters, salt generation or salt encoding
class KeyDerivationError : public CryptoError {
public:
    explicit KeyDerivationError(const std::string& message)
        : CryptoError("Key derivation error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Malformed, truncated or reordered ciphertext
class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

// GCM tag mismatch: tampered data or a wrong password
class AuthenticationError : public DecryptionError {
public:
    explicit AuthenticationError(const std::string& message)
        : DecryptionError("authentication failed: " + message) {}
};

} // namespace flux::crypto

#endif // FLUX_CRYPTO_ERROR_HPP
