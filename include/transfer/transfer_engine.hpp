#ifndef FLUX_TRANSFER_ENGINE_HPP
#define FLUX_TRANSFER_ENGINE_HPP

#include <atomic>
#include <filesystem>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "compression/compressor.hpp"
#include "network/connection.hpp"
#include "network/network_error.hpp"
#include "network/tcp_connection.hpp"
#include "network/tcp_listener.hpp"
#include "network/transfer_header.hpp"
#include "transfer/notification_sink.hpp"
#include "transfer/transfer_config.hpp"
#include "transfer/transfer_registry.hpp"

namespace flux {
namespace transfer {

// Drives both directions of a transfer. The send path compresses then
// encrypts the file into temporary artifacts and streams them after the
// header; the receive path reverses it for every accepted connection.
class TransferEngine {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferEngine(TransferConfig config, TransferRegistry& registry, NotificationSink sink = nullptr);
  ~TransferEngine();

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  
  // ---- SEND PATH ----
  // Sends one file and returns its transfer id once the attempt has finished.
  // Failures are recorded on the transfer record, not thrown. Only a failure
  // to assign a transfer code propagates, after the record is marked failed.
  std::string send_file(const std::filesystem::path& file_path, const std::string& address,
                        uint16_t port, const std::string& password = "");
  // Starts the same attempt on its own thread and returns the id immediately
  std::string send_file_async(const std::filesystem::path& file_path, const std::string& address,
                              uint16_t port, const std::string& password = "");

  
  // ---- RECEIVE PATH ----
  bool start_receiver();
  void stop_receiver();
  // Port the receiver is bound to, 0 when it is not running
  uint16_t get_receiver_port() const;
  bool is_receiving() const;
  // Reads one complete transfer from the connection, returns its transfer id
  std::string handle_connection(network::Connection& connection);

  
  // ---- CONTROL ----
  bool cancel_transfer(const std::string& transfer_id);
  void shutdown();
  // Joins finished async sends and returns how many are still held
  std::size_t reap_send_threads();

  
  // ---- GETTERS ----
  const TransferConfig& get_config() const { return config_; }
  TransferRegistry& get_registry() { return registry_; }

private:
  struct SendRequest {
    std::string transfer_id;
    std::string transfer_code;
    std::filesystem::path file_path;
    std::string address;
    uint16_t port;
    std::string password;
  };

  struct SendWorker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // ---- PARAMETERS ----
  const TransferConfig config_;
  TransferRegistry& registry_;
  NotificationSink sink_;
  const compression::Compressor compressor_;

  // Receiver
  mutable std::mutex listener_mutex_;
  std::unique_ptr<network::TcpListener> listener_;

  // Outgoing transfers
  std::mutex send_mutex_;
  std::list<SendWorker> send_workers_;
  std::map<std::string, std::weak_ptr<network::TcpConnection>> send_connections_;

  
  // ---- SEND HELPERS ----
  SendRequest begin_send(const std::filesystem::path& file_path, const std::string& address,
                         uint16_t port, const std::string& password);
  void run_send(const SendRequest& request);
  void stream_body(const std::string& transfer_id, network::Connection& connection,
                   const std::filesystem::path& body_path, std::uint64_t body_size);

  
  // ---- RECEIVE HELPERS ----
  std::string create_receive_record(const network::TransferHeader& header);
  std::uint64_t receive_body(const std::string& transfer_id, network::Connection& connection,
                             const network::TransferHeader& header, std::string remainder,
                             const std::filesystem::path& body_path);
  std::filesystem::path resolve_destination(const std::string& file_name) const;
  // Per-transfer staging file beside the destination so the rename stays on one filesystem
  static std::filesystem::path staging_path(const std::filesystem::path& destination, const std::string& transfer_id);

  
  // ---- SHARED HELPERS ----
  // Caller must hold send_mutex_
  std::size_t join_finished_sends();
  std::filesystem::path temp_path(const std::string& transfer_id, const std::string& suffix) const;
  void check_cancelled(const std::string& transfer_id) const;
  void fail_transfer(const std::string& transfer_id, const std::exception& error);
  void notify(const std::string& transfer_id, int progress, const std::string& message);
  static network::ErrorCode classify_error(const std::exception& error);
};

} // namespace transfer
} // namespace flux

#endif // FLUX_TRANSFER_ENGINE_HPP
