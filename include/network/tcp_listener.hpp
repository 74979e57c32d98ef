#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include "network/tcp_connection.hpp"

namespace flux {
namespace network {

class TcpListener {
public:
  using ConnectionHandler = std::function<void(std::shared_ptr<TcpConnection>)>;

  
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TcpListener(const std::string& address, uint16_t port, std::size_t max_workers,
              std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout);
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  
  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the port and starts accepting; every connection is passed to handler on a worker thread
  bool start_listener(ConnectionHandler handler);
  // Stops accepting, cancels connections in flight and waits for their handlers
  void shutdown();

  
  // ---- GETTERS ----
  // Port actually bound, useful when constructed with port 0
  uint16_t get_port() const;
  bool is_running() const { return is_running_; }
  std::size_t active_connections() const;

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;
  const std::size_t max_workers_;
  const std::chrono::milliseconds read_timeout_;
  const std::chrono::milliseconds write_timeout_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};
  ConnectionHandler handler_;
  
  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::thread_pool> workers_;

  // Connections currently owned by a worker
  mutable std::mutex connections_mutex_;
  std::vector<std::weak_ptr<TcpConnection>> connections_;

  
  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Hands an accepted connection to the worker pool
  void dispatch(std::shared_ptr<TcpConnection> connection);
  // Forgets connections whose handlers have finished
  void prune_connections();
};

} // namespace network
} // namespace flux
