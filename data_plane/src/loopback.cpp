#include "skyhop/loopback.hpp"

#include "skyhop/errors.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>

namespace skyhop {

BoundedPipe::BoundedPipe(std::size_t capacity_bytes) : capacity_(capacity_bytes) {
    if (capacity_ == 0) {
        throw std::invalid_argument("pipe capacity must be > 0");
    }
}

namespace {

template <typename Predicate>
void wait_or_throw(std::condition_variable &cv, std::unique_lock<std::mutex> &lock,
                   std::chrono::milliseconds timeout, const char *what, Predicate ready) {
    if (timeout.count() <= 0) {
        cv.wait(lock, ready);
    } else if (!cv.wait_for(lock, timeout, ready)) {
        throw ConnectionError(std::string(what) + " timed out");
    }
}

} // namespace

void BoundedPipe::write(const char *data, std::size_t size, std::chrono::milliseconds timeout) {
    std::size_t done = 0;
    while (done < size) {
        std::unique_lock<std::mutex> lock(mutex_);
        wait_or_throw(writable_, lock, timeout, "pipe write", [&] { return closed_ || bytes_.size() < capacity_; });
        if (closed_) {
            throw ConnectionError("write to closed connection");
        }
        auto n = std::min(size - done, capacity_ - bytes_.size());
        bytes_.insert(bytes_.end(), data + done, data + done + n);
        high_watermark_ = std::max(high_watermark_, bytes_.size());
        done += n;
        lock.unlock();
        readable_.notify_one();
    }
}

std::size_t BoundedPipe::read(char *buffer, std::size_t size, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    wait_or_throw(readable_, lock, timeout, "pipe read", [&] { return closed_ || !bytes_.empty(); });
    if (bytes_.empty()) {
        return 0;
    }
    auto n = std::min(size, bytes_.size());
    std::copy(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(n), buffer);
    bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(n));
    lock.unlock();
    writable_.notify_one();
    return n;
}

void BoundedPipe::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    readable_.notify_all();
    writable_.notify_all();
}

std::size_t BoundedPipe::high_watermark() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_watermark_;
}

namespace {

class PipeConnection : public Connection {
  public:
    PipeConnection(std::shared_ptr<BoundedPipe> inbound, std::shared_ptr<BoundedPipe> outbound)
        : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

    ~PipeConnection() override { close(); }

    void send(const char *data, std::size_t size) override { outbound_->write(data, size, timeout_); }

    std::size_t receive(char *buffer, std::size_t size) override { return inbound_->read(buffer, size, timeout_); }

    void set_timeout(std::chrono::milliseconds timeout) override { timeout_ = timeout; }

    // Closing either end tears down both directions, like a reset socket.
    void close() override {
        inbound_->close();
        outbound_->close();
    }

  private:
    std::shared_ptr<BoundedPipe> inbound_;
    std::shared_ptr<BoundedPipe> outbound_;
    std::chrono::milliseconds timeout_{0};
};

} // namespace

class LoopbackTransport::Acceptor {
  public:
    void push(std::unique_ptr<Connection> connection) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw ConnectionError("connection refused");
            }
            pending_.push_back(std::move(connection));
        }
        cv_.notify_one();
    }

    std::unique_ptr<Connection> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return closed_ || !pending_.empty(); });
        if (closed_) {
            return nullptr;
        }
        auto connection = std::move(pending_.front());
        pending_.pop_front();
        return connection;
    }

    void close() {
        std::deque<std::unique_ptr<Connection>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            dropped.swap(pending_);
        }
        cv_.notify_all();
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Connection>> pending_;
    bool closed_{false};
};

namespace {

class LoopbackListener : public Listener {
  public:
    LoopbackListener(std::shared_ptr<LoopbackTransport::Acceptor> acceptor, NetworkEndpoint endpoint,
                     std::function<void()> on_close)
        : acceptor_(std::move(acceptor)), endpoint_(std::move(endpoint)), on_close_(std::move(on_close)) {}

    ~LoopbackListener() override { close(); }

    std::unique_ptr<Connection> accept() override { return acceptor_->pop(); }

    void close() override {
        if (on_close_) {
            acceptor_->close();
            auto on_close = std::move(on_close_);
            on_close_ = nullptr;
            on_close();
        }
    }

    NetworkEndpoint endpoint() const override { return endpoint_; }

  private:
    std::shared_ptr<LoopbackTransport::Acceptor> acceptor_;
    NetworkEndpoint endpoint_;
    std::function<void()> on_close_;
};

} // namespace

LoopbackTransport::LoopbackTransport(std::size_t pipe_capacity_bytes) : pipe_capacity_(pipe_capacity_bytes) {
    if (pipe_capacity_ == 0) {
        throw std::invalid_argument("pipe capacity must be > 0");
    }
}

std::unique_ptr<Connection> LoopbackTransport::open(const NetworkEndpoint &endpoint) {
    std::shared_ptr<Acceptor> acceptor;
    auto forward = std::make_shared<BoundedPipe>(pipe_capacity_);
    auto backward = std::make_shared<BoundedPipe>(pipe_capacity_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = acceptors_.find(endpoint);
        if (it == acceptors_.end()) {
            throw ConnectionError("connection refused by " + to_string(endpoint));
        }
        acceptor = it->second;
        pipes_.push_back(forward);
        pipes_.push_back(backward);
    }
    acceptor->push(std::make_unique<PipeConnection>(forward, backward));
    return std::make_unique<PipeConnection>(backward, forward);
}

std::unique_ptr<Listener> LoopbackTransport::listen(const NetworkEndpoint &endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    NetworkEndpoint bound = endpoint;
    if (bound.port == 0) {
        bound.port = next_port_++;
    }
    if (acceptors_.count(bound) != 0) {
        throw ConnectionError("address already in use: " + to_string(bound));
    }
    auto acceptor = std::make_shared<Acceptor>();
    acceptors_.emplace(bound, acceptor);
    const Acceptor *raw = acceptor.get();
    return std::make_unique<LoopbackListener>(acceptor, bound, [this, bound, raw] { unregister(bound, raw); });
}

std::vector<std::shared_ptr<BoundedPipe>> LoopbackTransport::pipes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pipes_;
}

void LoopbackTransport::unregister(const NetworkEndpoint &endpoint, const Acceptor *acceptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = acceptors_.find(endpoint);
    if (it != acceptors_.end() && it->second.get() == acceptor) {
        acceptors_.erase(it);
    }
}

} // namespace skyhop
