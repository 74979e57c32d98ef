#ifndef FLUX_NETWORK_CONNECTION_HPP
#define FLUX_NETWORK_CONNECTION_HPP

#include <cstddef>
#include <string>

namespace flux {
namespace network {

// Byte stream carrying exactly one transfer
class Connection {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;


    // ---- DATA TRANSFER ----
    // Reads up to size bytes, returns 0 once the peer has closed the stream
    virtual std::size_t read_some(char* data, std::size_t size) = 0;
    // Writes all size bytes or throws
    virtual void write_all(const char* data, std::size_t size) = 0;


    // ---- TEARDOWN ----
    virtual void close() = 0;


    // ---- GETTERS ----
    virtual std::string remote_endpoint() const = 0;

protected:
    Connection() = default;
};

} // namespace network
} // namespace flux

#endif // FLUX_NETWORK_CONNECTION_HPP
