#ifndef FLUX_TRANSFER_CONFIG_HPP
#define FLUX_TRANSFER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include "network/transfer_header.hpp"

namespace flux {
namespace transfer {

struct TransferConfig {
  static constexpr uint16_t DEFAULT_PORT = 5555;

  // Network
  std::string listen_address = "0.0.0.0";
  uint16_t port = DEFAULT_PORT;

  // Filesystem
  std::filesystem::path save_directory = "./received";
  std::filesystem::path temp_directory = std::filesystem::temp_directory_path();

  // Streaming
  std::size_t chunk_size = 8192;
  std::size_t max_header_size = network::DEFAULT_MAX_HEADER_SIZE;
  std::size_t max_concurrent_receivers = 8;

  // Deadlines
  std::chrono::milliseconds connect_timeout{30 * 1000};
  std::chrono::milliseconds read_timeout{60 * 1000};
  std::chrono::milliseconds write_timeout{60 * 1000};
  std::chrono::milliseconds code_ttl{600 * 1000};

  // Receiver side: password for encrypted bodies and the code senders must present
  std::string password;
  std::string expected_code;

  // Throws std::invalid_argument describing the first bad setting
  void validate() const;
};

} // namespace transfer
} // namespace flux

#endif // FLUX_TRANSFER_CONFIG_HPP
