#pragma once

#include "skyhop/network.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace skyhop {

// Fixed-capacity byte pipe. write() blocks while the pipe is full, which is how
// a slow reader throttles its writer; read() blocks while it is empty.
class BoundedPipe {
  public:
    explicit BoundedPipe(std::size_t capacity_bytes);

    // A non-zero timeout bounds each wait for room; running out throws
    // ConnectionError.
    void write(const char *data, std::size_t size, std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // Returns 0 once the pipe is closed and drained. A non-zero timeout bounds
    // the wait for data.
    std::size_t read(char *buffer, std::size_t size, std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    void close();

    std::size_t capacity() const noexcept { return capacity_; }

    std::size_t high_watermark() const;

  private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;
    std::deque<char> bytes_;
    std::size_t high_watermark_{0};
    bool closed_{false};
};

// In-process NetworkTransport. Endpoints are names in a private registry;
// every connection is a pair of BoundedPipes.
class LoopbackTransport : public NetworkTransport {
  public:
    explicit LoopbackTransport(std::size_t pipe_capacity_bytes);

    std::unique_ptr<Connection> open(const NetworkEndpoint &endpoint) override;

    std::unique_ptr<Listener> listen(const NetworkEndpoint &endpoint) override;

    // Every pipe created so far, for inspecting buffer occupancy.
    std::vector<std::shared_ptr<BoundedPipe>> pipes() const;

    class Acceptor;

  private:
    void unregister(const NetworkEndpoint &endpoint, const Acceptor *acceptor);

    std::size_t pipe_capacity_;
    mutable std::mutex mutex_;
    std::map<NetworkEndpoint, std::shared_ptr<Acceptor>> acceptors_;
    std::vector<std::shared_ptr<BoundedPipe>> pipes_;
    std::uint16_t next_port_{1};
};

} // namespace skyhop
