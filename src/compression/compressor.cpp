#include "compression/compressor.hpp"
#include <array>
#include <fstream>
#include <boost/log/trivial.hpp>
#include <zlib.h>

namespace flux::compression {

namespace {

//=================================================
// RAII WRAPPERS TO MANAGE ZLIB STREAM LIFECYCLE
//=================================================

struct DeflateStream {
  z_stream zs{};

  explicit DeflateStream(int level) {
    if (deflateInit(&zs, level) != Z_OK) {
      throw CompressionError("Failed to initialize deflate stream");
    }
  }

  ~DeflateStream() {
    deflateEnd(&zs);
  }
};

struct InflateStream {
  z_stream zs{};

  InflateStream() {
    if (inflateInit(&zs) != Z_OK) {
      throw CompressionError("Failed to initialize inflate stream");
    }
  }

  ~InflateStream() {
    inflateEnd(&zs);
  }
};

void write_block(std::ostream& output, const char* data, std::size_t length) {
  if (length == 0) {
    return;
  }
  output.write(data, static_cast<std::streamsize>(length));
  if (!output.good()) {
    throw CompressionError("Failed to write to output stream");
  }
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Compressor::Compressor(int level) : level_(level) {
  if (level_ < Z_NO_COMPRESSION || level_ > Z_BEST_COMPRESSION) {
    throw std::invalid_argument("Compressor: Invalid compression level: " + std::to_string(level_));
  }
}

//==============================================
// STREAM OPERATIONS
//==============================================

std::uintmax_t Compressor::compress(std::istream& input, std::ostream& output) const {
  if (!input.good() || !output.good()) {
    throw CompressionError("Invalid stream state");
  }

  DeflateStream stream(level_);
  std::array<char, BUFFER_SIZE> inbuf;
  std::array<char, BUFFER_SIZE> outbuf;
  std::uintmax_t total_out = 0;
  int flush = Z_NO_FLUSH;

  do {
    input.read(inbuf.data(), inbuf.size());
    if (input.bad()) {
      throw CompressionError("Failed to read from input stream");
    }
    flush = input.eof() ? Z_FINISH : Z_NO_FLUSH;

    stream.zs.next_in = reinterpret_cast<Bytef*>(inbuf.data());
    stream.zs.avail_in = static_cast<uInt>(input.gcount());

    // Drain deflate until it no longer fills the output buffer
    do {
      stream.zs.next_out = reinterpret_cast<Bytef*>(outbuf.data());
      stream.zs.avail_out = static_cast<uInt>(outbuf.size());

      if (deflate(&stream.zs, flush) == Z_STREAM_ERROR) {
        throw CompressionError("Deflate stream error");
      }

      std::size_t have = outbuf.size() - stream.zs.avail_out;
      write_block(output, outbuf.data(), have);
      total_out += have;
    } while (stream.zs.avail_out == 0);
  } while (flush != Z_FINISH);

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Compressor: Compressed " << stream.zs.total_in << " bytes into " << total_out;
  return total_out;
}

std::uintmax_t Compressor::decompress(std::istream& input, std::ostream& output, std::uintmax_t max_output) const {
  if (!input.good() || !output.good()) {
    throw CompressionError("Invalid stream state");
  }

  InflateStream stream;
  std::array<char, BUFFER_SIZE> inbuf;
  std::array<char, BUFFER_SIZE> outbuf;
  std::uintmax_t total_out = 0;
  int ret = Z_OK;

  while (ret != Z_STREAM_END) {
    input.read(inbuf.data(), inbuf.size());
    if (input.bad()) {
      throw CompressionError("Failed to read from input stream");
    }
    if (input.gcount() == 0) {
      throw CompressionError("Compressed stream is truncated");
    }

    stream.zs.next_in = reinterpret_cast<Bytef*>(inbuf.data());
    stream.zs.avail_in = static_cast<uInt>(input.gcount());

    do {
      stream.zs.next_out = reinterpret_cast<Bytef*>(outbuf.data());
      stream.zs.avail_out = static_cast<uInt>(outbuf.size());

      ret = inflate(&stream.zs, Z_NO_FLUSH);
      switch (ret) {
        case Z_NEED_DICT:
        case Z_DATA_ERROR:
          throw CompressionError("Corrupted compressed stream");
        case Z_MEM_ERROR:
          throw CompressionError("Out of memory while inflating");
        case Z_STREAM_ERROR:
          throw CompressionError("Inflate stream error");
        default:
          break;
      }

      std::size_t have = outbuf.size() - stream.zs.avail_out;
      if (have > max_output - total_out) {
        throw OutputLimitError(max_output);
      }
      write_block(output, outbuf.data(), have);
      total_out += have;
    } while (stream.zs.avail_out == 0 && ret != Z_STREAM_END);
  }

  // Nothing may follow the end of the zlib stream
  if (stream.zs.avail_in > 0 || input.peek() != std::char_traits<char>::eof()) {
    throw CompressionError("Unexpected data after end of compressed stream");
  }

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Compressor: Decompressed " << stream.zs.total_in << " bytes into " << total_out;
  return total_out;
}

//==============================================
// FILE OPERATIONS
//==============================================

template <typename Operation>
std::uintmax_t Compressor::process_file(const std::filesystem::path& source,
                                        const std::filesystem::path& destination,
                                        const char* action, Operation operation) const {
  BOOST_LOG_TRIVIAL(info) << "Compressor: Starting to " << action << " " << source.string()
                          << " into " << destination.string();

  std::ifstream input(source, std::ios::binary);
  if (!input) {
    throw CompressionError("Failed to open source file: " + source.string());
  }

  std::ofstream output(destination, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw CompressionError("Failed to create destination file: " + destination.string());
  }

  try {
    std::uintmax_t written = operation(input, output);
    output.close();
    if (!output) {
      throw CompressionError("Failed to close destination file: " + destination.string());
    }
    BOOST_LOG_TRIVIAL(info) << "Compressor: Finished " << action << " of " << source.string()
                            << " (" << written << " bytes written)";
    return written;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Compressor: Failed to " << action << " " << source.string() << ": " << e.what();
    // Never leave a half-written destination behind
    output.close();
    std::error_code ec;
    std::filesystem::remove(destination, ec);
    throw;
  }
}

std::uintmax_t Compressor::compress(const std::filesystem::path& source,
                                    const std::filesystem::path& artifact) const {
  return process_file(source, artifact, "compress",
    [this](std::istream& input, std::ostream& output) { return compress(input, output); });
}

std::filesystem::path Compressor::compress(const std::filesystem::path& source) const {
  std::filesystem::path artifact = source;
  artifact += ".z";
  compress(source, artifact);
  return artifact;
}

std::uintmax_t Compressor::decompress(const std::filesystem::path& artifact,
                                      const std::filesystem::path& destination,
                                      std::uintmax_t max_output) const {
  return process_file(artifact, destination, "decompress",
    [this, max_output](std::istream& input, std::ostream& output) {
      return decompress(input, output, max_output);
    });
}

} // namespace flux::compression
