#include "network/tcp_listener.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace flux {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpListener::TcpListener(const std::string& address, uint16_t port, std::size_t max_workers,
                         std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout)
  : address_(address)
  , port_(port)
  , max_workers_(max_workers)
  , read_timeout_(read_timeout)
  , write_timeout_(write_timeout) {
  BOOST_LOG_TRIVIAL(info) << "TCP listener: Initializing TCP listener on " << address << ":" << port
                          << " with " << max_workers << " workers";
}

TcpListener::~TcpListener() {
  shutdown();
}

  
//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TcpListener::start_listener(ConnectionHandler handler) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP listener: Listener already running";
    return false;
  }
  if (!handler || max_workers_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "TCP listener: A handler and at least one worker are required";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();

    handler_ = std::move(handler);
    workers_ = std::make_unique<boost::asio::thread_pool>(max_workers_);
    is_running_ = true;

    // Start accepting connections
    io_context_.restart();
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "TCP listener: Starting IO context";
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP listener: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP listener: Listening on " << address_ << ":" << get_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP listener: Failed to start listener: " << e.what();
    acceptor_.reset();
    workers_.reset();
    return false;
  }
}

void TcpListener::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection owns its socket and io_context
  auto connection = std::make_shared<TcpConnection>(read_timeout_, write_timeout_);

  acceptor_->async_accept(connection->get_socket(),
    [this, connection](const boost::system::error_code& error) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "TCP listener: Accepted connection from " << connection->remote_endpoint();
        dispatch(connection);
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "TCP listener: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void TcpListener::dispatch(std::shared_ptr<TcpConnection> connection) {
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    prune_connections();
    connections_.push_back(connection);
    if (connections_.size() > max_workers_) {
      BOOST_LOG_TRIVIAL(warning) << "TCP listener: " << connections_.size()
                                 << " connections pending for " << max_workers_ << " workers";
    }
  }

  boost::asio::post(*workers_, [this, connection]() {
    try {
      handler_(connection);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "TCP listener: Connection handler failed: " << e.what();
    }
    connection->close();
  });
}

void TcpListener::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP listener: Initiating listener shutdown";

  is_running_ = false;

  // Stop accepting new connections from the IO thread
  boost::asio::post(io_context_, [this]() {
    if (acceptor_ && acceptor_->is_open()) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "TCP listener: Error closing acceptor: " << ec.message();
      }
    }
  });

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  // Abort transfers in flight so their handlers return
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& weak : connections_) {
      if (auto connection = weak.lock()) {
        connection->cancel();
      }
    }
  }

  if (workers_) {
    workers_->join();
    workers_.reset();
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
  }

  BOOST_LOG_TRIVIAL(info) << "TCP listener: Listener shutdown complete";
}

//==============================================
// GETTERS
//==============================================

uint16_t TcpListener::get_port() const {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    if (!ec) {
      return endpoint.port();
    }
  }
  return port_;
}

std::size_t TcpListener::active_connections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
    [](const std::weak_ptr<TcpConnection>& weak) { return !weak.expired(); }));
}

void TcpListener::prune_connections() {
  connections_.erase(
    std::remove_if(connections_.begin(), connections_.end(),
      [](const std::weak_ptr<TcpConnection>& weak) { return weak.expired(); }),
    connections_.end());
}

} // namespace network
} // namespace flux
