#ifndef FLUX_TRANSFER_RECORD_HPP
#define FLUX_TRANSFER_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "network/network_error.hpp"

namespace flux {
namespace transfer {

enum class TransferStatus {
  CONNECTING,
  SENDING,
  RECEIVING,
  COMPLETED,
  FAILED
};

enum class TransferDirection {
  SEND,
  RECEIVE
};

const char* status_to_string(TransferStatus status);
const char* direction_to_string(TransferDirection direction);

// Snapshot of one transfer attempt as kept by the registry
struct TransferRecord {
  std::string id;
  std::string file_name;
  TransferDirection direction = TransferDirection::SEND;
  TransferStatus status = TransferStatus::CONNECTING;
  int progress = 0;
  std::chrono::system_clock::time_point start_time;
  std::uint64_t bytes_transferred = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t original_size = 0;
  std::string transfer_code;
  network::ErrorCode error = network::ErrorCode::SUCCESS;
  std::string error_message;
  std::string file_path;
  bool cancel_requested = false;

  bool is_terminal() const {
    return status == TransferStatus::COMPLETED || status == TransferStatus::FAILED;
  }
};

} // namespace transfer
} // namespace flux

#endif // FLUX_TRANSFER_RECORD_HPP
