#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace skyhop {

struct NetworkEndpoint {
    std::string address;
    std::uint16_t port;
};

bool operator==(const NetworkEndpoint &lhs, const NetworkEndpoint &rhs);
bool operator!=(const NetworkEndpoint &lhs, const NetworkEndpoint &rhs);
bool operator<(const NetworkEndpoint &lhs, const NetworkEndpoint &rhs);

std::string to_string(const NetworkEndpoint &endpoint);

// A bidirectional byte stream between two gateways. send() and receive() block
// only the calling thread; close() may be called from any thread and wakes
// blocked peers. Failures throw ConnectionError.
class Connection {
  public:
    virtual ~Connection() = default;

    virtual void send(const char *data, std::size_t size) = 0;

    // Returns 0 on orderly end of stream.
    virtual std::size_t receive(char *buffer, std::size_t size) = 0;

    virtual void close() = 0;

    // Bounds every later blocking send() or receive(); zero waits forever. A
    // wait that runs out throws ConnectionError.
    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;

    void receive_exact(char *buffer, std::size_t size);
};

class Listener {
  public:
    virtual ~Listener() = default;

    // Returns nullptr once the listener has been closed.
    virtual std::unique_ptr<Connection> accept() = 0;

    virtual void close() = 0;

    virtual NetworkEndpoint endpoint() const = 0;
};

class NetworkTransport {
  public:
    virtual ~NetworkTransport() = default;

    virtual std::unique_ptr<Connection> open(const NetworkEndpoint &endpoint) = 0;

    // A port of 0 binds an ephemeral port; the listener reports the real one.
    virtual std::unique_ptr<Listener> listen(const NetworkEndpoint &endpoint) = 0;
};

class TcpTransport : public NetworkTransport {
  public:
    std::unique_ptr<Connection> open(const NetworkEndpoint &endpoint) override;

    std::unique_ptr<Listener> listen(const NetworkEndpoint &endpoint) override;
};

} // namespace skyhop
