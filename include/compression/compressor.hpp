#ifndef FLUX_COMPRESSION_COMPRESSOR_HPP
#define FLUX_COMPRESSION_COMPRESSOR_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace flux::compression {

class CompressionError : public std::runtime_error {
public:
  explicit CompressionError(const std::string& message)
    : std::runtime_error("Compression error: " + message) {}
};

// Thrown when inflating would produce more bytes than the caller allowed
class OutputLimitError : public CompressionError {
public:
  explicit OutputLimitError(std::uintmax_t limit)
    : CompressionError("Decompressed output exceeds " + std::to_string(limit) + " bytes")
    , limit_(limit) {}

  std::uintmax_t limit() const { return limit_; }

private:
  std::uintmax_t limit_;
};

class Compressor {
public:
  static constexpr int COMPRESSION_LEVEL = 6;    // zlib default, moderate CPU cost
  static constexpr std::size_t BUFFER_SIZE = 8192;
  static constexpr std::uintmax_t NO_LIMIT = std::numeric_limits<std::uintmax_t>::max();

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Compressor(int level = COMPRESSION_LEVEL);


  // ---- FILE OPERATIONS ----
  // Compresses source into artifact, returns the artifact size in bytes
  std::uintmax_t compress(const std::filesystem::path& source, const std::filesystem::path& artifact) const;
  // Compresses source into "<source>.z" and returns that path
  std::filesystem::path compress(const std::filesystem::path& source) const;
  // Restores the original bytes of artifact into destination, returns the restored size.
  // Throws OutputLimitError as soon as the output would grow past max_output.
  std::uintmax_t decompress(const std::filesystem::path& artifact, const std::filesystem::path& destination,
                            std::uintmax_t max_output = NO_LIMIT) const;


  // ---- STREAM OPERATIONS ----
  std::uintmax_t compress(std::istream& input, std::ostream& output) const;
  std::uintmax_t decompress(std::istream& input, std::ostream& output, std::uintmax_t max_output = NO_LIMIT) const;


  // ---- GETTERS ----
  int get_level() const { return level_; }

private:
  int level_;

  // Runs operation from source file to destination file, removing destination on failure
  template <typename Operation>
  std::uintmax_t process_file(const std::filesystem::path& source, const std::filesystem::path& destination,
                              const char* action, Operation operation) const;
};

} // namespace flux::compression

#endif // FLUX_COMPRESSION_COMPRESSOR_HPP
