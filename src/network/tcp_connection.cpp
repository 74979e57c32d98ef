#include "network/tcp_connection.hpp"
#include <boost/log/trivial.hpp>

namespace flux {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpConnection::TcpConnection(std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout)
  : socket_(io_context_)
  , read_timeout_(read_timeout)
  , write_timeout_(write_timeout) {
  BOOST_LOG_TRIVIAL(trace) << "TCP connection: Constructing TcpConnection";
}

TcpConnection::~TcpConnection() {
  close();
}

//==============================================
// CONNECTION INITIATION
//==============================================

void TcpConnection::connect(const std::string& remote_address, uint16_t remote_port,
                            std::chrono::milliseconds timeout) {
  BOOST_LOG_TRIVIAL(info) << "TCP connection: Resolving " << remote_address << ":" << remote_port;

  boost::system::error_code error;
  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(remote_address, std::to_string(remote_port), error);
  if (error) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Failed to resolve " << remote_address << ": " << error.message();
    throw ConnectionError("Failed to resolve " + remote_address + ": " + error.message());
  }

  BOOST_LOG_TRIVIAL(info) << "TCP connection: Attempting to connect to " << remote_address << ":" << remote_port;

  error = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
    [&error](const boost::system::error_code& ec, const boost::asio::ip::tcp::endpoint&) {
      error = ec;
    });
  run_for(timeout, "connect");

  if (error) {
    raise(error, "connect");
  }

  boost::system::error_code ec;
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);

  BOOST_LOG_TRIVIAL(info) << "TCP connection: Successfully connected to " << remote_address << ":" << remote_port;
}

//==============================================
// DATA TRANSFER
//==============================================

std::size_t TcpConnection::read_some(char* data, std::size_t size) {
  if (cancelled_) {
    throw CancelledError("Connection was cancelled");
  }

  boost::system::error_code error = boost::asio::error::would_block;
  std::size_t bytes_read = 0;

  socket_.async_read_some(boost::asio::buffer(data, size),
    [&error, &bytes_read](const boost::system::error_code& ec, std::size_t bytes_transferred) {
      error = ec;
      bytes_read = bytes_transferred;
    });
  run_for(read_timeout_, "read");

  if (error == boost::asio::error::eof) {
    BOOST_LOG_TRIVIAL(debug) << "TCP connection: Peer closed the stream";
    return 0;
  }
  if (error) {
    raise(error, "read");
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP connection: Read " << bytes_read << " bytes";
  return bytes_read;
}

void TcpConnection::write_all(const char* data, std::size_t size) {
  if (cancelled_) {
    throw CancelledError("Connection was cancelled");
  }

  boost::system::error_code error = boost::asio::error::would_block;
  std::size_t bytes_written = 0;

  boost::asio::async_write(socket_, boost::asio::buffer(data, size),
    [&error, &bytes_written](const boost::system::error_code& ec, std::size_t bytes_transferred) {
      error = ec;
      bytes_written = bytes_transferred;
    });
  run_for(write_timeout_, "write");

  if (error) {
    raise(error, "write");
  }
  if (bytes_written != size) {
    throw ConnectionError("Short write: " + std::to_string(bytes_written) + " of " + std::to_string(size) + " bytes");
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP connection: Wrote " << bytes_written << " bytes";
}

//==============================================
// DEADLINE HANDLING
//==============================================

void TcpConnection::run_for(std::chrono::milliseconds timeout, const char* operation) {
  io_context_.restart();
  io_context_.run_for(timeout);

  // The io_context only stops by itself once the operation has completed
  if (!io_context_.stopped()) {
    BOOST_LOG_TRIVIAL(warning) << "TCP connection: " << operation << " timed out after "
                               << timeout.count() << " ms";
    boost::system::error_code ignored;
    socket_.close(ignored);
    io_context_.run();
    throw TimeoutError(std::string(operation) + " timed out after " + std::to_string(timeout.count()) + " ms");
  }
}

void TcpConnection::raise(const boost::system::error_code& error, const char* operation) {
  if (cancelled_ && error == boost::asio::error::operation_aborted) {
    throw CancelledError(std::string(operation) + " aborted");
  }
  BOOST_LOG_TRIVIAL(error) << "TCP connection: " << operation << " failed: " << error.message();
  throw ConnectionError(std::string(operation) + " failed: " + error.message());
}

//==============================================
// TEARDOWN
//==============================================

void TcpConnection::close() {
  if (!socket_.is_open()) {
    return;
  }

  boost::system::error_code ec;

  // Shutdown both send and receive operations
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "TCP connection: Socket shutdown error: " << ec.message();
  }

  socket_.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP connection: Socket close error: " << ec.message();
  }
}

void TcpConnection::cancel() {
  cancelled_ = true;
  // The socket is only touched from the thread driving io_context_
  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ignored;
    socket_.close(ignored);
  });
}

//==============================================
// GETTERS
//==============================================

std::string TcpConnection::remote_endpoint() const {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (ec) {
    return "<disconnected>";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

boost::asio::ip::tcp::socket& TcpConnection::get_socket() {
  return socket_;
}

bool TcpConnection::is_open() const {
  return socket_.is_open();
}

} // namespace network
} // namespace flux
