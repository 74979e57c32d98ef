#ifndef FLUX_TRANSFER_REGISTRY_HPP
#define FLUX_TRANSFER_REGISTRY_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "transfer/transfer_record.hpp"

namespace flux {
namespace transfer {

class RegistryError : public std::runtime_error {
public:
  explicit RegistryError(const std::string& message)
    : std::runtime_error("Registry error: " + message) {}
};

// Thread-safe table of transfer records and the short codes bound to them.
// All getters return copies so callers never hold references into the table.
class TransferRegistry {
public:
  static constexpr std::size_t CODE_LENGTH = 6;
  static constexpr std::chrono::milliseconds DEFAULT_CODE_TTL{600 * 1000};

  
  // ---- CONSTRUCTOR ----
  explicit TransferRegistry(std::chrono::milliseconds code_ttl = DEFAULT_CODE_TTL);

  TransferRegistry(const TransferRegistry&) = delete;
  TransferRegistry& operator=(const TransferRegistry&) = delete;

  
  // ---- RECORDS ----
  static std::string generate_transfer_id();
  // Throws RegistryError when the id is already in use
  void create_record(const std::string& transfer_id, const std::string& file_name,
                     TransferDirection direction, TransferStatus status);
  bool has_record(const std::string& transfer_id) const;
  void set_status(const std::string& transfer_id, TransferStatus status);
  void set_sizes(const std::string& transfer_id, std::uint64_t original_size, std::uint64_t total_bytes);
  // Records body progress and returns the stored percentage, which never decreases
  int update_progress(const std::string& transfer_id, std::uint64_t bytes_transferred, std::uint64_t total_bytes);
  void mark_completed(const std::string& transfer_id, const std::string& file_path = "");
  void mark_failed(const std::string& transfer_id, network::ErrorCode error, const std::string& message);
  std::optional<TransferRecord> get(const std::string& transfer_id) const;
  std::vector<TransferRecord> list() const;

  
  // ---- TRANSFER CODES ----
  // Random 6-digit code not bound to any live entry
  std::string generate_transfer_code();
  // Draws a free code and binds it to transfer_id under one lock
  std::string assign_transfer_code(const std::string& transfer_id);
  // Binds code to transfer_id, throws RegistryError for malformed codes or
  // codes held by another live transfer
  void register_transfer(const std::string& transfer_id, const std::string& code);
  std::optional<TransferRecord> get_transfer_by_code(const std::string& code);
  std::optional<std::string> resolve_code(const std::string& code);
  void release_code(const std::string& code);
  static bool is_valid_code(const std::string& code);

  
  // ---- CANCELLATION ----
  // Returns false for unknown or already finished transfers
  bool request_cancel(const std::string& transfer_id);
  bool is_cancel_requested(const std::string& transfer_id) const;

private:
  struct CodeEntry {
    std::string transfer_id;
    std::chrono::steady_clock::time_point registered_at;
  };

  // ---- PARAMETERS ----
  const std::chrono::milliseconds code_ttl_;
  mutable std::mutex mutex_;
  std::map<std::string, TransferRecord> records_;
  std::map<std::string, CodeEntry> codes_;

  
  // ---- HELPERS ----
  // Caller must hold mutex_
  TransferRecord& find_record(const std::string& transfer_id);
  std::string draw_free_code() const;
  void bind_code(const std::string& transfer_id, const std::string& code);
  void purge_expired_codes();
  bool is_expired(const CodeEntry& entry) const;
};

} // namespace transfer
} // namespace flux

#endif // FLUX_TRANSFER_REGISTRY_HPP
