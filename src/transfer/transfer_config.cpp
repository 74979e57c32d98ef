#include "transfer/transfer_config.hpp"
#include <stdexcept>
#include "transfer/transfer_registry.hpp"

namespace flux {
namespace transfer {

void TransferConfig::validate() const {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than zero");
  }
  if (max_concurrent_receivers == 0) {
    throw std::invalid_argument("max_concurrent_receivers must be greater than zero");
  }
  if (save_directory.empty()) {
    throw std::invalid_argument("save_directory must not be empty");
  }
  if (temp_directory.empty()) {
    throw std::invalid_argument("temp_directory must not be empty");
  }
  if (max_header_size == 0) {
    throw std::invalid_argument("max_header_size must be greater than zero");
  }
  if (connect_timeout.count() <= 0 || read_timeout.count() <= 0 || write_timeout.count() <= 0) {
    throw std::invalid_argument("timeouts must be positive");
  }
  if (!expected_code.empty() && !TransferRegistry::is_valid_code(expected_code)) {
    throw std::invalid_argument("expected_code must be " + std::to_string(TransferRegistry::CODE_LENGTH) + " digits");
  }
}

} // namespace transfer
} // namespace flux
