#include "transfer/transfer_registry.hpp"
#include <algorithm>
#include <cstdio>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace flux {
namespace transfer {

//==============================================
// CONSTRUCTOR
//==============================================

TransferRegistry::TransferRegistry(std::chrono::milliseconds code_ttl)
  : code_ttl_(code_ttl) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer registry: Initialized with code TTL of "
                           << code_ttl.count() << " ms";
}


//==============================================
// RECORDS
//==============================================

std::string TransferRegistry::generate_transfer_id() {
  boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

void TransferRegistry::create_record(const std::string& transfer_id, const std::string& file_name,
                                     TransferDirection direction, TransferStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (records_.count(transfer_id) > 0) {
    throw RegistryError("Transfer id already exists: " + transfer_id);
  }

  TransferRecord record;
  record.id = transfer_id;
  record.file_name = file_name;
  record.direction = direction;
  record.status = status;
  record.start_time = std::chrono::system_clock::now();
  records_.emplace(transfer_id, std::move(record));

  BOOST_LOG_TRIVIAL(debug) << "Transfer registry: Created " << direction_to_string(direction)
                           << " record " << transfer_id << " for " << file_name;
}

bool TransferRegistry::has_record(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.count(transfer_id) > 0;
}

void TransferRegistry::set_status(const std::string& transfer_id, TransferStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = find_record(transfer_id);
  if (record.is_terminal()) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer registry: Ignoring status change of finished transfer " << transfer_id;
    return;
  }
  record.status = status;
}

void TransferRegistry::set_sizes(const std::string& transfer_id, std::uint64_t original_size,
                                 std::uint64_t total_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = find_record(transfer_id);
  record.original_size = original_size;
  record.total_bytes = total_bytes;
}

int TransferRegistry::update_progress(const std::string& transfer_id, std::uint64_t bytes_transferred,
                                      std::uint64_t total_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = find_record(transfer_id);

  if (record.is_terminal()) {
    return record.progress;
  }

  int progress = 100;
  if (total_bytes > 0) {
    progress = static_cast<int>(std::min<std::uint64_t>(bytes_transferred, total_bytes) * 100 / total_bytes);
  }

  record.total_bytes = total_bytes;
  record.bytes_transferred = std::max(record.bytes_transferred, bytes_transferred);
  record.progress = std::max(record.progress, progress);
  return record.progress;
}

void TransferRegistry::mark_completed(const std::string& transfer_id, const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = find_record(transfer_id);
  record.status = TransferStatus::COMPLETED;
  record.progress = 100;
  record.bytes_transferred = record.total_bytes;
  record.error = network::ErrorCode::SUCCESS;
  if (!file_path.empty()) {
    record.file_path = file_path;
  }
  BOOST_LOG_TRIVIAL(info) << "Transfer registry: Transfer " << transfer_id << " completed";
}

void TransferRegistry::mark_failed(const std::string& transfer_id, network::ErrorCode error,
                                   const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = find_record(transfer_id);
  // Progress stays at the last value reached
  record.status = TransferStatus::FAILED;
  record.error = error;
  record.error_message = message;
  BOOST_LOG_TRIVIAL(warning) << "Transfer registry: Transfer " << transfer_id << " failed ("
                             << network::error_code_to_string(error) << "): " << message;
}

std::optional<TransferRecord> TransferRegistry::get(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(transfer_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TransferRecord> TransferRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransferRecord> result;
  result.reserve(records_.size());
  for (const auto& entry : records_) {
    result.push_back(entry.second);
  }
  std::sort(result.begin(), result.end(), [](const TransferRecord& a, const TransferRecord& b) {
    return a.start_time < b.start_time;
  });
  return result;
}


//==============================================
// TRANSFER CODES
//==============================================

std::string TransferRegistry::generate_transfer_code() {
  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired_codes();
  return draw_free_code();
}

std::string TransferRegistry::assign_transfer_code(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired_codes();
  const std::string code = draw_free_code();
  bind_code(transfer_id, code);
  return code;
}

void TransferRegistry::register_transfer(const std::string& transfer_id, const std::string& code) {
  if (!is_valid_code(code)) {
    throw RegistryError("Malformed transfer code: " + code);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired_codes();

  auto it = codes_.find(code);
  if (it != codes_.end() && it->second.transfer_id != transfer_id) {
    throw RegistryError("Transfer code " + code + " is bound to another transfer");
  }

  bind_code(transfer_id, code);
}

std::optional<TransferRecord> TransferRegistry::get_transfer_by_code(const std::string& code) {
  if (!is_valid_code(code)) {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired_codes();

  auto it = codes_.find(code);
  if (it == codes_.end()) {
    return std::nullopt;
  }
  auto record = records_.find(it->second.transfer_id);
  if (record == records_.end()) {
    return std::nullopt;
  }
  return record->second;
}

std::optional<std::string> TransferRegistry::resolve_code(const std::string& code) {
  if (!is_valid_code(code)) {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired_codes();

  auto it = codes_.find(code);
  if (it == codes_.end()) {
    return std::nullopt;
  }
  return it->second.transfer_id;
}

void TransferRegistry::release_code(const std::string& code) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (codes_.erase(code) > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer registry: Released code " << code;
  }
}

bool TransferRegistry::is_valid_code(const std::string& code) {
  return code.size() == CODE_LENGTH &&
         std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
}


//==============================================
// CANCELLATION
//==============================================

bool TransferRegistry::request_cancel(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(transfer_id);
  if (it == records_.end() || it->second.is_terminal()) {
    return false;
  }
  it->second.cancel_requested = true;
  BOOST_LOG_TRIVIAL(info) << "Transfer registry: Cancellation requested for " << transfer_id;
  return true;
}

bool TransferRegistry::is_cancel_requested(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(transfer_id);
  return it != records_.end() && it->second.cancel_requested;
}


//==============================================
// HELPERS
//==============================================

std::string TransferRegistry::draw_free_code() const {
  while (true) {
    uint32_t value = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
      throw RegistryError("Failed to generate random transfer code");
    }

    char code[CODE_LENGTH + 1];
    std::snprintf(code, sizeof(code), "%06u", static_cast<unsigned>(value % 1000000u));
    if (codes_.count(code) == 0) {
      return std::string(code);
    }
  }
}

void TransferRegistry::bind_code(const std::string& transfer_id, const std::string& code) {
  codes_[code] = CodeEntry{transfer_id, std::chrono::steady_clock::now()};

  auto record = records_.find(transfer_id);
  if (record != records_.end()) {
    record->second.transfer_code = code;
  }

  BOOST_LOG_TRIVIAL(debug) << "Transfer registry: Registered code " << code << " for " << transfer_id;
}

TransferRecord& TransferRegistry::find_record(const std::string& transfer_id) {
  auto it = records_.find(transfer_id);
  if (it == records_.end()) {
    throw RegistryError("Unknown transfer id: " + transfer_id);
  }
  return it->second;
}

void TransferRegistry::purge_expired_codes() {
  for (auto it = codes_.begin(); it != codes_.end();) {
    if (is_expired(it->second)) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer registry: Code " << it->first << " expired";
      it = codes_.erase(it);
    } else {
      ++it;
    }
  }
}

bool TransferRegistry::is_expired(const CodeEntry& entry) const {
  return std::chrono::steady_clock::now() - entry.registered_at >= code_ttl_;
}

} // namespace transfer
} // namespace flux
