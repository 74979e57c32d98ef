#ifndef FLUX_NETWORK_TRANSFER_HEADER_HPP
#define FLUX_NETWORK_TRANSFER_HEADER_HPP

#include <cstdint>
#include <string>
#include "network/network_error.hpp"

namespace flux {
namespace network {

constexpr char HEADER_DELIMITER = '\n';
constexpr std::size_t DEFAULT_MAX_HEADER_SIZE = 64 * 1024;
constexpr std::size_t MAX_FILE_NAME_LENGTH = 255;
constexpr std::size_t MAX_TRANSFER_ID_LENGTH = 64;

// Metadata sent as one JSON line ahead of the body. compressed_size is the
// exact number of body bytes that follow the delimiter.
struct TransferHeader {
  std::string transfer_id;
  std::string file_name;
  std::uint64_t original_size = 0;
  std::uint64_t compressed_size = 0;
  bool encrypted = false;
  std::string salt;            // base64, empty when not encrypted
  std::string transfer_code;
};

// Serializes the header as a single JSON line ending with HEADER_DELIMITER
std::string serialize_header(const TransferHeader& header);

// Parses one header line (without the delimiter), throws ProtocolError
TransferHeader parse_header(const std::string& line);

// True for a plain file name that cannot escape the directory it is joined with
bool is_safe_file_name(const std::string& file_name);

// Transfer ids end up in local file names, so only [A-Za-z0-9_-] is accepted
bool is_valid_transfer_id(const std::string& transfer_id);


// Accumulates socket reads until the header delimiter arrives. Bytes that
// follow the delimiter in the same read are kept as the start of the body.
class HeaderReader {
public:
  // ---- CONSTRUCTOR ----
  explicit HeaderReader(std::size_t max_header_size = DEFAULT_MAX_HEADER_SIZE);

  
  // ---- INPUT ----
  // Appends received bytes, returns true once the delimiter has been seen
  bool feed(const char* data, std::size_t size);

  
  // ---- RESULTS ----
  bool complete() const { return complete_; }
  // Header line without the delimiter
  const std::string& line() const { return line_; }
  // Parses the completed header line
  TransferHeader header() const;
  // Hands over the body bytes received along with the header
  std::string take_remainder();

private:
  // ---- PARAMETERS ----
  std::size_t max_header_size_;
  std::string line_;
  std::string remainder_;
  bool complete_;
};

} // namespace network
} // namespace flux

#endif // FLUX_NETWORK_TRANSFER_HEADER_HPP
