#include "skyhop/network.hpp"

#include "skyhop/errors.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <tuple>

namespace skyhop {

namespace {

std::string errno_message(const std::string &what) {
    std::ostringstream oss;
    oss << what << ": " << std::strerror(errno);
    return oss.str();
}

class AddrInfo {
  public:
    AddrInfo(const std::string &host, const std::string &port, bool passive) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = passive ? AI_PASSIVE : 0;

        int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &info_);
        if (rc != 0) {
            std::ostringstream oss;
            oss << "getaddrinfo failed for " << host << ':' << port << ": " << ::gai_strerror(rc);
            throw ConnectionError(oss.str());
        }
    }

    ~AddrInfo() {
        if (info_ != nullptr) {
            ::freeaddrinfo(info_);
        }
    }

    AddrInfo(const AddrInfo &) = delete;
    AddrInfo &operator=(const AddrInfo &) = delete;

    struct addrinfo *get() const { return info_; }

  private:
    struct addrinfo *info_ = nullptr;
};

class TcpConnection : public Connection {
  public:
    explicit TcpConnection(int fd) : fd_(fd) {
        int enable = 1;
        ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));
    }

    ~TcpConnection() override { ::close(fd_); }

    void send(const char *data, std::size_t size) override {
        std::size_t sent = 0;
        while (sent < size) {
            ssize_t rc = ::send(fd_, data + sent, size - sent, MSG_NOSIGNAL);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    throw ConnectionError("socket send timed out");
                }
                throw ConnectionError(errno_message("socket send failed"));
            }
            sent += static_cast<std::size_t>(rc);
        }
    }

    std::size_t receive(char *buffer, std::size_t size) override {
        while (true) {
            ssize_t rc = ::recv(fd_, buffer, size, 0);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    throw ConnectionError("socket recv timed out");
                }
                throw ConnectionError(errno_message("socket recv failed"));
            }
            return static_cast<std::size_t>(rc);
        }
    }

    void set_timeout(std::chrono::milliseconds timeout) override {
        struct timeval tv;
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
            ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
            throw ConnectionError(errno_message("cannot set socket timeout"));
        }
    }

    void close() override {
        if (!closed_.exchange(true)) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

  private:
    int fd_;
    std::atomic<bool> closed_{false};
};

class TcpListener : public Listener {
  public:
    TcpListener(int fd, NetworkEndpoint endpoint) : fd_(fd), endpoint_(std::move(endpoint)) {}

    ~TcpListener() override { ::close(fd_); }

    std::unique_ptr<Connection> accept() override {
        while (!closed_) {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client >= 0) {
                return std::make_unique<TcpConnection>(client);
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (closed_) {
                break;
            }
            throw ConnectionError(errno_message("accept failed"));
        }
        return nullptr;
    }

    void close() override {
        if (!closed_.exchange(true)) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    NetworkEndpoint endpoint() const override { return endpoint_; }

  private:
    int fd_;
    NetworkEndpoint endpoint_;
    std::atomic<bool> closed_{false};
};

std::uint16_t bound_port(int fd) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr *>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<struct sockaddr_in *>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<struct sockaddr_in6 *>(&addr)->sin6_port);
    }
    return 0;
}

} // namespace

bool operator==(const NetworkEndpoint &lhs, const NetworkEndpoint &rhs) {
    return lhs.address == rhs.address && lhs.port == rhs.port;
}

bool operator!=(const NetworkEndpoint &lhs, const NetworkEndpoint &rhs) { return !(lhs == rhs); }

bool operator<(const NetworkEndpoint &lhs, const NetworkEndpoint &rhs) {
    return std::tie(lhs.address, lhs.port) < std::tie(rhs.address, rhs.port);
}

std::string to_string(const NetworkEndpoint &endpoint) {
    return endpoint.address + ':' + std::to_string(endpoint.port);
}

void Connection::receive_exact(char *buffer, std::size_t size) {
    std::size_t received = 0;
    while (received < size) {
        std::size_t rc = receive(buffer + received, size - received);
        if (rc == 0) {
            throw ConnectionError("unexpected end of stream");
        }
        received += rc;
    }
}

std::unique_ptr<Connection> TcpTransport::open(const NetworkEndpoint &endpoint) {
    AddrInfo info(endpoint.address, std::to_string(endpoint.port), false);
    for (struct addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            return std::make_unique<TcpConnection>(fd);
        }
        ::close(fd);
    }
    throw ConnectionError("failed to connect to " + to_string(endpoint));
}

std::unique_ptr<Listener> TcpTransport::listen(const NetworkEndpoint &endpoint) {
    AddrInfo info(endpoint.address, std::to_string(endpoint.port), true);
    for (struct addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        int enable = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, 64) == 0) {
            NetworkEndpoint bound{endpoint.address, bound_port(fd)};
            return std::make_unique<TcpListener>(fd, std::move(bound));
        }
        ::close(fd);
    }
    throw ConnectionError("failed to bind listening socket on " + to_string(endpoint));
}

} // namespace skyhop
