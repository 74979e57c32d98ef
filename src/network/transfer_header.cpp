#include "network/transfer_header.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace flux {
namespace network {

namespace {

namespace pt = boost::property_tree;

std::uint64_t read_size(const pt::ptree& tree, const std::string& key) {
  const auto value = tree.get<std::string>(key);
  if (value.empty() || value.size() > 20 ||
      !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw ProtocolError("Invalid value for " + key + ": " + value);
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw ProtocolError("Value out of range for " + key + ": " + value);
  }
}

} // namespace

//==============================================
// SERIALIZATION AND PARSING
//==============================================

std::string serialize_header(const TransferHeader& header) {
  pt::ptree tree;
  tree.put("transfer_id", header.transfer_id);
  tree.put("file_name", header.file_name);
  tree.put("original_size", header.original_size);
  tree.put("compressed_size", header.compressed_size);
  tree.put("encrypted", header.encrypted);
  tree.put("salt", header.salt);
  tree.put("transfer_code", header.transfer_code);

  std::ostringstream output;
  pt::write_json(output, tree, false);

  // write_json terminates with its own newline, the record carries exactly one delimiter
  std::string line = output.str();
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  line.push_back(HEADER_DELIMITER);

  BOOST_LOG_TRIVIAL(debug) << "Transfer header: Serialized header for " << header.transfer_id
                           << " (" << line.size() << " bytes)";
  return line;
}

TransferHeader parse_header(const std::string& line) {
  if (line.empty()) {
    throw ProtocolError("Empty header");
  }

  pt::ptree tree;
  TransferHeader header;

  try {
    std::istringstream input(line);
    pt::read_json(input, tree);

    header.transfer_id = tree.get<std::string>("transfer_id");
    header.file_name = tree.get<std::string>("file_name");
    header.original_size = read_size(tree, "original_size");
    header.compressed_size = read_size(tree, "compressed_size");
    header.encrypted = tree.get<bool>("encrypted", false);
    header.salt = tree.get<std::string>("salt", "");
    header.transfer_code = tree.get<std::string>("transfer_code", "");
  }
  catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer header: Failed to parse header: " << e.what();
    throw ProtocolError(std::string("Malformed header: ") + e.what());
  }

  if (!is_valid_transfer_id(header.transfer_id)) {
    throw ProtocolError("Header has an invalid transfer_id: " + header.transfer_id);
  }
  if (!is_safe_file_name(header.file_name)) {
    throw ProtocolError("Header has an unsafe file name: " + header.file_name);
  }
  if (header.encrypted && header.salt.empty()) {
    throw ProtocolError("Encrypted transfer without salt");
  }

  BOOST_LOG_TRIVIAL(debug) << "Transfer header: Parsed header for " << header.transfer_id
                           << " file: " << header.file_name
                           << " body: " << header.compressed_size << " bytes";
  return header;
}

bool is_safe_file_name(const std::string& file_name) {
  if (file_name.empty() || file_name.size() > MAX_FILE_NAME_LENGTH) {
    return false;
  }
  if (file_name == "." || file_name == "..") {
    return false;
  }
  return std::none_of(file_name.begin(), file_name.end(), [](char c) {
    return c == '/' || c == '\\' || c == '\0' || c == ':' || c == HEADER_DELIMITER;
  });
}

bool is_valid_transfer_id(const std::string& transfer_id) {
  if (transfer_id.empty() || transfer_id.size() > MAX_TRANSFER_ID_LENGTH) {
    return false;
  }
  return std::all_of(transfer_id.begin(), transfer_id.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
  });
}

//==============================================
// HEADER READER
//==============================================

HeaderReader::HeaderReader(std::size_t max_header_size)
  : max_header_size_(max_header_size)
  , complete_(false) {
}

bool HeaderReader::feed(const char* data, std::size_t size) {
  if (complete_) {
    remainder_.append(data, size);
    return true;
  }

  const char* end = data + size;
  const char* delimiter = std::find(data, end, HEADER_DELIMITER);

  if (line_.size() + static_cast<std::size_t>(delimiter - data) > max_header_size_) {
    BOOST_LOG_TRIVIAL(error) << "Transfer header: Header exceeds " << max_header_size_ << " bytes";
    throw ProtocolError("Header exceeds " + std::to_string(max_header_size_) + " bytes");
  }

  line_.append(data, delimiter);
  if (delimiter == end) {
    return false;
  }

  complete_ = true;
  remainder_.append(delimiter + 1, end);
  BOOST_LOG_TRIVIAL(trace) << "Transfer header: Delimiter found after " << line_.size()
                           << " bytes, " << remainder_.size() << " body bytes buffered";
  return true;
}

TransferHeader HeaderReader::header() const {
  if (!complete_) {
    throw ProtocolError("Header is incomplete");
  }
  return parse_header(line_);
}

std::string HeaderReader::take_remainder() {
  std::string remainder;
  remainder.swap(remainder_);
  return remainder;
}

} // namespace network
} // namespace flux
