#include "transfer/transfer_engine.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>
#include "crypto/crypto_error.hpp"
#include "crypto/crypto_stream.hpp"
#include "crypto/key_derivation.hpp"

namespace flux {
namespace transfer {

namespace fs = std::filesystem;

namespace {

// Removes the file it names when it goes out of scope unless released
class ScopedTempFile {
public:
  explicit ScopedTempFile(fs::path path) : path_(std::move(path)) {}

  ~ScopedTempFile() {
    if (path_.empty()) {
      return;
    }
    std::error_code ec;
    if (fs::remove(path_, ec)) {
      BOOST_LOG_TRIVIAL(trace) << "Transfer engine: Removed temporary file " << path_;
    } else if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Failed to remove " << path_ << ": " << ec.message();
    }
  }

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const fs::path& path() const { return path_; }
  void release() { path_.clear(); }

private:
  fs::path path_;
};

void check_stream(const std::ios& stream, const std::string& what) {
  if (!stream) {
    throw network::IOError(what);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferEngine::TransferEngine(TransferConfig config, TransferRegistry& registry, NotificationSink sink)
  : config_(std::move(config))
  , registry_(registry)
  , sink_(std::move(sink)) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Initialized with save directory " << config_.save_directory
                          << " and temp directory " << config_.temp_directory;
}

TransferEngine::~TransferEngine() {
  shutdown();
}


//==============================================
// SEND PATH
//==============================================

std::string TransferEngine::send_file(const fs::path& file_path, const std::string& address,
                                      uint16_t port, const std::string& password) {
  auto request = begin_send(file_path, address, port, password);
  run_send(request);
  return request.transfer_id;
}

std::string TransferEngine::send_file_async(const fs::path& file_path, const std::string& address,
                                            uint16_t port, const std::string& password) {
  auto request = begin_send(file_path, address, port, password);

  std::lock_guard<std::mutex> lock(send_mutex_);
  join_finished_sends();

  auto done = std::make_shared<std::atomic<bool>>(false);
  send_workers_.push_back(SendWorker{std::thread([this, request, done]() {
    run_send(request);
    *done = true;
  }), done});
  return request.transfer_id;
}

TransferEngine::SendRequest TransferEngine::begin_send(const fs::path& file_path, const std::string& address,
                                                      uint16_t port, const std::string& password) {
  SendRequest request;
  request.transfer_id = TransferRegistry::generate_transfer_id();
  request.file_path = file_path;
  request.address = address;
  request.port = port;
  request.password = password;

  registry_.create_record(request.transfer_id, file_path.filename().string(),
                          TransferDirection::SEND, TransferStatus::CONNECTING);

  try {
    request.transfer_code = registry_.assign_transfer_code(request.transfer_id);
  }
  catch (const std::exception& e) {
    fail_transfer(request.transfer_id, e);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Transfer " << request.transfer_id << " of " << file_path
                          << " to " << address << ":" << port << " has code " << request.transfer_code;
  notify(request.transfer_id, 0, "Transfer code: " + request.transfer_code);
  return request;
}

void TransferEngine::run_send(const SendRequest& request) {
  const auto& transfer_id = request.transfer_id;
  ScopedTempFile compressed(temp_path(transfer_id, ".z"));
  ScopedTempFile encrypted(temp_path(transfer_id, ".z.enc"));

  try {
    if (!fs::is_regular_file(request.file_path)) {
      throw network::IOError("Not a regular file: " + request.file_path.string());
    }

    // ---- PREPARE ARTIFACT ----
    network::TransferHeader header;
    header.transfer_id = transfer_id;
    header.file_name = request.file_path.filename().string();
    header.original_size = fs::file_size(request.file_path);
    header.transfer_code = request.transfer_code;

    BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Compressing " << request.file_path;
    compressor_.compress(request.file_path, compressed.path());
    fs::path body_path = compressed.path();

    if (!request.password.empty()) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Encrypting artifact for " << transfer_id;
      auto salt = crypto::generate_salt();
      crypto::CryptoStream crypto;
      crypto.initialize(crypto::derive_key(request.password, salt));

      std::ifstream input(compressed.path(), std::ios::binary);
      check_stream(input, "Failed to open compressed artifact");
      std::ofstream output(encrypted.path(), std::ios::binary | std::ios::trunc);
      check_stream(output, "Failed to create encrypted artifact");
      crypto.encrypt(input, output);
      output.close();
      check_stream(output, "Failed to write encrypted artifact");

      header.encrypted = true;
      header.salt = crypto::encode_salt(salt);
      body_path = encrypted.path();
    }

    header.compressed_size = fs::file_size(body_path);
    registry_.set_sizes(transfer_id, header.original_size, header.compressed_size);
    check_cancelled(transfer_id);

    // ---- CONNECT ----
    auto connection = std::make_shared<network::TcpConnection>(config_.read_timeout, config_.write_timeout);
    {
      std::lock_guard<std::mutex> lock(send_mutex_);
      send_connections_[transfer_id] = connection;
    }
    connection->connect(request.address, request.port, config_.connect_timeout);
    check_cancelled(transfer_id);

    // ---- HEADER AND BODY ----
    const std::string line = network::serialize_header(header);
    connection->write_all(line.data(), line.size());

    registry_.set_status(transfer_id, TransferStatus::SENDING);
    notify(transfer_id, 0, "Sending " + header.file_name);

    stream_body(transfer_id, *connection, body_path, header.compressed_size);
    connection->close();

    registry_.mark_completed(transfer_id, request.file_path.string());
    notify(transfer_id, 100, "Transfer completed");
  }
  catch (const std::exception& e) {
    fail_transfer(transfer_id, e);
  }

  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    send_connections_.erase(transfer_id);
  }
  registry_.release_code(request.transfer_code);
}

void TransferEngine::stream_body(const std::string& transfer_id, network::Connection& connection,
                                 const fs::path& body_path, std::uint64_t body_size) {
  std::ifstream input(body_path, std::ios::binary);
  check_stream(input, "Failed to open artifact " + body_path.string());

  std::vector<char> buffer(config_.chunk_size);
  std::uint64_t bytes_sent = 0;

  while (bytes_sent < body_size) {
    check_cancelled(transfer_id);

    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), body_size - bytes_sent));
    input.read(buffer.data(), static_cast<std::streamsize>(wanted));
    const auto bytes_read = static_cast<std::size_t>(input.gcount());
    if (bytes_read == 0) {
      throw network::IOError("Artifact ended after " + std::to_string(bytes_sent) + " bytes");
    }

    connection.write_all(buffer.data(), bytes_read);
    bytes_sent += bytes_read;

    int progress = registry_.update_progress(transfer_id, bytes_sent, body_size);
    notify(transfer_id, progress, "Sent " + std::to_string(bytes_sent) + " of " + std::to_string(body_size) + " bytes");
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Sent " << bytes_sent << " body bytes for " << transfer_id;
}


//==============================================
// RECEIVE PATH
//==============================================

bool TransferEngine::start_receiver() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_ && listener_->is_running()) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Receiver already running";
    return false;
  }

  std::error_code ec;
  fs::create_directories(config_.save_directory, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Cannot create save directory " << config_.save_directory
                             << ": " << ec.message();
    return false;
  }

  listener_ = std::make_unique<network::TcpListener>(config_.listen_address, config_.port,
                                                     config_.max_concurrent_receivers,
                                                     config_.read_timeout, config_.write_timeout);
  if (!listener_->start_listener([this](std::shared_ptr<network::TcpConnection> connection) {
        handle_connection(*connection);
      })) {
    listener_.reset();
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Receiver listening on port " << listener_->get_port();
  return true;
}

void TransferEngine::stop_receiver() {
  std::unique_ptr<network::TcpListener> listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener.swap(listener_);
  }
  if (listener) {
    listener->shutdown();
    BOOST_LOG_TRIVIAL(info) << "Transfer engine: Receiver stopped";
  }
}

uint16_t TransferEngine::get_receiver_port() const {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  return listener_ ? listener_->get_port() : 0;
}

bool TransferEngine::is_receiving() const {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  return listener_ && listener_->is_running();
}

std::string TransferEngine::handle_connection(network::Connection& connection) {
  const std::string peer = connection.remote_endpoint();
  std::string transfer_id;

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Handling incoming transfer from " << peer;

  try {
    // ---- HEADER ----
    network::HeaderReader reader(config_.max_header_size);
    std::vector<char> buffer(config_.chunk_size);
    while (!reader.complete()) {
      const std::size_t bytes_read = connection.read_some(buffer.data(), buffer.size());
      if (bytes_read == 0) {
        throw network::ProtocolError("Connection closed before the header was complete");
      }
      reader.feed(buffer.data(), bytes_read);
    }

    const network::TransferHeader header = reader.header();
    transfer_id = create_receive_record(header);
    registry_.set_sizes(transfer_id, header.original_size, header.compressed_size);

    if (!header.transfer_code.empty()) {
      try {
        registry_.register_transfer(transfer_id, header.transfer_code);
      } catch (const RegistryError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Not binding code for " << transfer_id << ": " << e.what();
      }
    }
    notify(transfer_id, 0, "Receiving " + header.file_name + " from " + peer);

    if (!config_.expected_code.empty() && header.transfer_code != config_.expected_code) {
      throw network::ProtocolError("Transfer code does not match the expected code");
    }
    if (header.encrypted && config_.password.empty()) {
      throw crypto::DecryptionError("Body is encrypted but no password is configured");
    }

    const fs::path destination = resolve_destination(header.file_name);
    {
      // ---- BODY ----
      ScopedTempFile body(temp_path(transfer_id, ".recv"));
      ScopedTempFile decrypted(temp_path(transfer_id, ".dec"));
      receive_body(transfer_id, connection, header, reader.take_remainder(), body.path());

      fs::path compressed_path = body.path();
      if (header.encrypted) {
        BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Decrypting body of " << transfer_id;
        crypto::CryptoStream crypto;
        crypto.initialize(crypto::derive_key(config_.password, crypto::decode_salt(header.salt)));

        std::ifstream input(body.path(), std::ios::binary);
        check_stream(input, "Failed to open received body");
        std::ofstream output(decrypted.path(), std::ios::binary | std::ios::trunc);
        check_stream(output, "Failed to create decrypted artifact");
        crypto.decrypt(input, output);
        output.close();
        check_stream(output, "Failed to write decrypted artifact");
        compressed_path = decrypted.path();
      }

      // ---- OUTPUT ----
      ScopedTempFile part(staging_path(destination, transfer_id));
      std::uintmax_t written = 0;
      try {
        written = compressor_.decompress(compressed_path, part.path(), header.original_size);
      }
      catch (const compression::OutputLimitError&) {
        throw network::ProtocolError("Decompressed body exceeds the declared " +
                                     std::to_string(header.original_size) + " bytes");
      }
      if (written != header.original_size) {
        throw network::ProtocolError("Decompressed " + std::to_string(written) + " bytes, header declared " +
                                     std::to_string(header.original_size));
      }
      fs::rename(part.path(), destination);
      part.release();
    }

    registry_.mark_completed(transfer_id, destination.string());
    notify(transfer_id, 100, "Saved " + destination.string());
  }
  catch (const std::exception& e) {
    if (transfer_id.empty()) {
      // Failed before a header could be read
      transfer_id = TransferRegistry::generate_transfer_id();
      registry_.create_record(transfer_id, "<unknown>", TransferDirection::RECEIVE, TransferStatus::RECEIVING);
    }
    fail_transfer(transfer_id, e);
    connection.close();
  }

  return transfer_id;
}

std::string TransferEngine::create_receive_record(const network::TransferHeader& header) {
  std::string transfer_id = header.transfer_id;
  while (true) {
    try {
      registry_.create_record(transfer_id, header.file_name, TransferDirection::RECEIVE, TransferStatus::RECEIVING);
      break;
    } catch (const RegistryError&) {
      // A record with this id already exists locally
      transfer_id = TransferRegistry::generate_transfer_id();
    }
  }

  if (transfer_id != header.transfer_id) {
    BOOST_LOG_TRIVIAL(info) << "Transfer engine: Sender id " << header.transfer_id
                            << " already known, recording as " << transfer_id;
  }
  return transfer_id;
}

std::uint64_t TransferEngine::receive_body(const std::string& transfer_id, network::Connection& connection,
                                           const network::TransferHeader& header, std::string remainder,
                                           const fs::path& body_path) {
  const std::uint64_t expected = header.compressed_size;
  if (remainder.size() > expected) {
    throw network::ProtocolError("Received " + std::to_string(remainder.size()) +
                                 " body bytes, header declared " + std::to_string(expected));
  }

  std::ofstream output(body_path, std::ios::binary | std::ios::trunc);
  check_stream(output, "Failed to create " + body_path.string());

  std::uint64_t received = 0;
  if (!remainder.empty()) {
    output.write(remainder.data(), static_cast<std::streamsize>(remainder.size()));
    check_stream(output, "Failed to write " + body_path.string());
    received = remainder.size();
    int progress = registry_.update_progress(transfer_id, received, expected);
    notify(transfer_id, progress, "Received " + std::to_string(received) + " of " + std::to_string(expected) + " bytes");
  }

  std::vector<char> buffer(config_.chunk_size);
  while (received < expected) {
    check_cancelled(transfer_id);

    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), expected - received));
    const std::size_t bytes_read = connection.read_some(buffer.data(), wanted);
    if (bytes_read == 0) {
      throw network::ProtocolError("Connection closed after " + std::to_string(received) + " of " +
                                   std::to_string(expected) + " body bytes");
    }

    output.write(buffer.data(), static_cast<std::streamsize>(bytes_read));
    check_stream(output, "Failed to write " + body_path.string());
    received += bytes_read;

    int progress = registry_.update_progress(transfer_id, received, expected);
    notify(transfer_id, progress, "Received " + std::to_string(received) + " of " + std::to_string(expected) + " bytes");
  }

  output.close();
  check_stream(output, "Failed to close " + body_path.string());

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Received " << received << " body bytes for " << transfer_id;
  return received;
}

fs::path TransferEngine::resolve_destination(const std::string& file_name) const {
  if (!network::is_safe_file_name(file_name)) {
    throw network::ProtocolError("Unsafe file name: " + file_name);
  }

  fs::create_directories(config_.save_directory);
  const fs::path directory = fs::weakly_canonical(config_.save_directory);
  const fs::path destination = fs::weakly_canonical(directory / file_name);
  if (destination.parent_path() != directory) {
    throw network::ProtocolError("File name escapes the save directory: " + file_name);
  }
  return destination;
}


//==============================================
// CONTROL
//==============================================

bool TransferEngine::cancel_transfer(const std::string& transfer_id) {
  if (!registry_.request_cancel(transfer_id)) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: No active transfer " << transfer_id << " to cancel";
    return false;
  }

  // Abort a blocking connect or write of an outgoing transfer
  std::lock_guard<std::mutex> lock(send_mutex_);
  auto it = send_connections_.find(transfer_id);
  if (it != send_connections_.end()) {
    if (auto connection = it->second.lock()) {
      connection->cancel();
    }
  }
  return true;
}

void TransferEngine::shutdown() {
  stop_receiver();

  std::list<SendWorker> workers;
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    for (auto& entry : send_connections_) {
      registry_.request_cancel(entry.first);
      if (auto connection = entry.second.lock()) {
        connection->cancel();
      }
    }
    workers.swap(send_workers_);
  }

  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }

  if (!workers.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Transfer engine: Joined " << workers.size() << " send threads";
  }
}

std::size_t TransferEngine::reap_send_threads() {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return join_finished_sends();
}


//==============================================
// SHARED HELPERS
//==============================================

std::size_t TransferEngine::join_finished_sends() {
  for (auto it = send_workers_.begin(); it != send_workers_.end();) {
    if (*it->done) {
      it->thread.join();
      it = send_workers_.erase(it);
    } else {
      ++it;
    }
  }
  return send_workers_.size();
}

fs::path TransferEngine::staging_path(const fs::path& destination, const std::string& transfer_id) {
  return destination.parent_path() / ("." + destination.filename().string() + "." + transfer_id + ".part");
}

fs::path TransferEngine::temp_path(const std::string& transfer_id, const std::string& suffix) const {
  return config_.temp_directory / ("flux-" + transfer_id + suffix);
}

void TransferEngine::check_cancelled(const std::string& transfer_id) const {
  if (registry_.is_cancel_requested(transfer_id)) {
    throw network::CancelledError("Transfer " + transfer_id + " was cancelled");
  }
}

void TransferEngine::fail_transfer(const std::string& transfer_id, const std::exception& error) {
  const auto code = classify_error(error);
  BOOST_LOG_TRIVIAL(error) << "Transfer engine: Transfer " << transfer_id << " failed ("
                           << network::error_code_to_string(code) << "): " << error.what();

  try {
    registry_.mark_failed(transfer_id, code, error.what());
  } catch (const RegistryError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: " << e.what();
  }

  int progress = 0;
  if (auto record = registry_.get(transfer_id)) {
    progress = record->progress;
  }
  notify(transfer_id, progress, std::string("Transfer failed: ") + error.what());
}

void TransferEngine::notify(const std::string& transfer_id, int progress, const std::string& message) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer engine: [" << transfer_id << "] " << progress << "% " << message;
  if (!sink_) {
    return;
  }
  try {
    sink_(transfer_id, progress, message);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Notification sink threw: " << e.what();
  }
}

network::ErrorCode TransferEngine::classify_error(const std::exception& error) {
  if (auto transfer_error = dynamic_cast<const network::TransferError*>(&error)) {
    return transfer_error->code();
  }
  if (dynamic_cast<const crypto::CryptoError*>(&error)) {
    return network::ErrorCode::CRYPTO_ERROR;
  }
  if (dynamic_cast<const compression::CompressionError*>(&error) ||
      dynamic_cast<const fs::filesystem_error*>(&error) ||
      dynamic_cast<const std::ios_base::failure*>(&error)) {
    return network::ErrorCode::IO_ERROR;
  }
  return network::ErrorCode::UNKNOWN_ERROR;
}

} // namespace transfer
} // namespace flux
