#ifndef FLUX_NETWORK_TCP_CONNECTION_HPP
#define FLUX_NETWORK_TCP_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <boost/asio.hpp>
#include "network/connection.hpp"
#include "network/network_error.hpp"

namespace flux {
namespace network {

// TCP connection with a private io_context. Every blocking call runs one
// asynchronous operation against a deadline and closes the socket when the
// deadline expires.
class TcpConnection : public Connection {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    TcpConnection(std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout);
    ~TcpConnection() override;


    // ---- CONNECTION INITIATION ----
    // Resolves and connects to remote host, throws ConnectionError or TimeoutError
    void connect(const std::string& remote_address, uint16_t remote_port, std::chrono::milliseconds timeout);


    // ---- DATA TRANSFER ----
    std::size_t read_some(char* data, std::size_t size) override;
    void write_all(const char* data, std::size_t size) override;


    // ---- TEARDOWN ----
    void close() override;
    // Aborts any blocking call from another thread
    void cancel();


    // ---- GETTERS ----
    std::string remote_endpoint() const override;
    boost::asio::ip::tcp::socket& get_socket();
    bool is_open() const;

private:
    // ---- PARAMETERS ----
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::chrono::milliseconds read_timeout_;
    std::chrono::milliseconds write_timeout_;
    std::atomic<bool> cancelled_{false};


    // ---- DEADLINE HANDLING ----
    // Runs the pending operation until it completes or the timeout expires
    void run_for(std::chrono::milliseconds timeout, const char* operation);
    // Converts a failed operation into the matching exception
    [[noreturn]] void raise(const boost::system::error_code& error, const char* operation);
};

} // namespace network
} // namespace flux

#endif // FLUX_NETWORK_TCP_CONNECTION_HPP
