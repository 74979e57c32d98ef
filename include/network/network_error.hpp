#ifndef FLUX_NETWORK_ERROR_HPP
#define FLUX_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace flux {
namespace network {

enum class ErrorCode {
    SUCCESS = 0,
    CONNECTION_FAILED,
    PROTOCOL_ERROR,
    IO_ERROR,
    CRYPTO_ERROR,
    TIMEOUT,
    CANCELLED,
    UNKNOWN_ERROR
};

inline const char* error_code_to_string(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::CONNECTION_FAILED: return "Connection failed";
        case ErrorCode::PROTOCOL_ERROR: return "Protocol error";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::CRYPTO_ERROR: return "Crypto error";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ConnectionError : public TransferError {
public:
    explicit ConnectionError(const std::string& message)
        : TransferError(ErrorCode::CONNECTION_FAILED, "Connection error: " + message) {}
};

class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& message)
        : TransferError(ErrorCode::PROTOCOL_ERROR, "Protocol error: " + message) {}
};

class IOError : public TransferError {
public:
    explicit IOError(const std::string& message)
        : TransferError(ErrorCode::IO_ERROR, "I/O error: " + message) {}
};

class TimeoutError : public TransferError {
public:
    explicit TimeoutError(const std::string& message)
        : TransferError(ErrorCode::TIMEOUT, "Timeout: " + message) {}
};

class CancelledError : public TransferError {
public:
    explicit CancelledError(const std::string& message)
        : TransferError(ErrorCode::CANCELLED, "Cancelled: " + message) {}
};

} // namespace network
} // namespace flux

#endif // FLUX_NETWORK_ERROR_HPP
