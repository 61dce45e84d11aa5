// TCP client transport implementation (POSIX sockets)

#include "tcp_transport.hpp"
#include "dxwatch/logging.hpp"

#include <chrono>
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>

#define CLOSE_SOCKET ::close

namespace dxwatch {
namespace cluster {

TcpTransport::TcpTransport() : TcpTransport(TcpTransportConfig{}) {}

TcpTransport::TcpTransport(const TcpTransportConfig& config) : config_(config) {
    if (pipe(wake_fds_) != 0) {
        wake_fds_[0] = wake_fds_[1] = -1;
        LOG_CLUSTER(ERROR, "TcpTransport: Failed to create wake pipe (errno %d)", errno);
        return;
    }
    setNonBlocking(wake_fds_[0]);
    setNonBlocking(wake_fds_[1]);
}

TcpTransport::~TcpTransport() {
    close();
    if (wake_fds_[0] >= 0) ::close(wake_fds_[0]);
    if (wake_fds_[1] >= 0) ::close(wake_fds_[1]);
}

bool TcpTransport::open(const std::string& host, uint16_t port) {
    close();

    if (host.empty()) {
        setError("No host configured");
        return false;
    }

    // Resolve hostname
    struct addrinfo hints, *result = nullptr;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char port_str[16];
    snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(port));

    int ret = getaddrinfo(host.c_str(), port_str, &hints, &result);
    if (ret != 0 || !result) {
        setError("Failed to resolve host: " + host + " (" + gai_strerror(ret) + ")");
        return false;
    }

    socket_t sock = INVALID_SOCKET_VALUE;
    std::string err;

    // Try each address until one connects
    for (struct addrinfo* ai = result; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == INVALID_SOCKET_VALUE) {
            err = "Failed to create socket";
            continue;
        }
        setNonBlocking(sock);

        ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret != 0 && errno != EINPROGRESS) {
            err = std::string("Connect failed: ") + strerror(errno);
            CLOSE_SOCKET(sock);
            sock = INVALID_SOCKET_VALUE;
            continue;
        }

        if (ret != 0) {
            // Wait for completion, or an interrupt
            struct pollfd pfds[2];
            pfds[0].fd = sock;
            pfds[0].events = POLLOUT;
            pfds[1].fd = wake_fds_[0];
            pfds[1].events = POLLIN;
            int ready = poll(pfds, wake_fds_[0] >= 0 ? 2 : 1, config_.connect_timeout_ms);

            if (ready > 0 && wake_fds_[0] >= 0 && (pfds[1].revents & POLLIN)) {
                drainWakePipe();
                CLOSE_SOCKET(sock);
                freeaddrinfo(result);
                setError("Connect interrupted");
                return false;
            }
            if (ready <= 0) {
                err = "Connect timed out";
                CLOSE_SOCKET(sock);
                sock = INVALID_SOCKET_VALUE;
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                err = std::string("Connect failed: ") + strerror(so_error);
                CLOSE_SOCKET(sock);
                sock = INVALID_SOCKET_VALUE;
                continue;
            }
        }
        break;
    }
    freeaddrinfo(result);

    if (sock == INVALID_SOCKET_VALUE) {
        setError(err + " (" + host + ":" + std::to_string(port) + ")");
        LOG_CLUSTER(WARN, "TcpTransport: %s", lastError().c_str());
        return false;
    }

    if (config_.keepalive) {
        int on = 1;
        setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    }
    int nodelay = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    socket_fd_ = sock;
    assembler_.clear();
    pending_lines_.clear();
    setError("");

    LOG_CLUSTER(INFO, "TcpTransport: Connected to %s", peerAddress().c_str());
    return true;
}

void TcpTransport::close() {
    if (socket_fd_ != INVALID_SOCKET_VALUE) {
        CLOSE_SOCKET(socket_fd_);
        socket_fd_ = INVALID_SOCKET_VALUE;
        LOG_CLUSTER(DEBUG, "TcpTransport: Closed");
    }
    assembler_.clear();
    pending_lines_.clear();
}

ReadResult TcpTransport::readLine(std::string& line, int timeout_ms) {
    if (!pending_lines_.empty()) {
        line = std::move(pending_lines_.front());
        pending_lines_.pop_front();
        return ReadResult::Line;
    }

    if (socket_fd_ == INVALID_SOCKET_VALUE) {
        setError("Not connected");
        return ReadResult::Error;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining < 0) remaining = 0;

        struct pollfd pfds[2];
        pfds[0].fd = socket_fd_;
        pfds[0].events = POLLIN;
        pfds[0].revents = 0;
        pfds[1].fd = wake_fds_[0];
        pfds[1].events = POLLIN;
        pfds[1].revents = 0;

        int ready = poll(pfds, wake_fds_[0] >= 0 ? 2 : 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            setError(std::string("poll failed: ") + strerror(errno));
            return ReadResult::Error;
        }
        if (ready == 0) {
            return ReadResult::Timeout;
        }

        if (wake_fds_[0] >= 0 && (pfds[1].revents & POLLIN)) {
            drainWakePipe();
            return ReadResult::Interrupted;
        }

        if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            uint8_t buf[4096];
            ssize_t n = recv(socket_fd_, buf, sizeof(buf), 0);
            if (n == 0) {
                setError("Connection closed by peer");
                return ReadResult::Closed;
            }
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    continue;
                }
                setError(std::string("recv failed: ") + strerror(errno));
                return ReadResult::Error;
            }

            for (auto& l : assembler_.feed(buf, static_cast<size_t>(n))) {
                pending_lines_.push_back(std::move(l));
            }
            if (!pending_lines_.empty()) {
                line = std::move(pending_lines_.front());
                pending_lines_.pop_front();
                return ReadResult::Line;
            }
        }
    }
}

bool TcpTransport::write(const std::string& data) {
    if (socket_fd_ == INVALID_SOCKET_VALUE) {
        setError("Not connected");
        return false;
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(socket_fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            struct pollfd pfd;
            pfd.fd = socket_fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            if (poll(&pfd, 1, config_.write_timeout_ms) <= 0) {
                setError("Write timed out");
                return false;
            }
            continue;
        }
        setError(std::string("send failed: ") + strerror(errno));
        return false;
    }
    return true;
}

void TcpTransport::interrupt() {
    if (wake_fds_[1] < 0) return;
    uint8_t b = 1;
    // A full pipe already guarantees a wakeup
    ssize_t n = ::write(wake_fds_[1], &b, 1);
    (void)n;
}

void TcpTransport::clearInterrupt() {
    if (wake_fds_[0] >= 0 && drainWakePipe()) {
        LOG_CLUSTER(DEBUG, "TcpTransport: Discarded stale wakeup");
    }
}

std::string TcpTransport::lastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

std::string TcpTransport::peerAddress() const {
    if (socket_fd_ == INVALID_SOCKET_VALUE) {
        return "unknown";
    }

    struct sockaddr_storage addr;
    socklen_t addrlen = sizeof(addr);

    if (getpeername(socket_fd_, reinterpret_cast<struct sockaddr*>(&addr), &addrlen) != 0) {
        return "unknown";
    }

    char ip[INET6_ADDRSTRLEN];
    uint16_t port = 0;

    if (addr.ss_family == AF_INET) {
        auto* s = reinterpret_cast<struct sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &s->sin_addr, ip, sizeof(ip));
        port = ntohs(s->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        auto* s = reinterpret_cast<struct sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &s->sin6_addr, ip, sizeof(ip));
        port = ntohs(s->sin6_port);
    } else {
        return "unknown";
    }

    return std::string(ip) + ":" + std::to_string(port);
}

void TcpTransport::setError(const std::string& err) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = err;
}

bool TcpTransport::drainWakePipe() {
    uint8_t buf[64];
    bool any = false;
    while (::read(wake_fds_[0], buf, sizeof(buf)) > 0) {
        any = true;
    }
    return any;
}

bool TcpTransport::setNonBlocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags == -1) return false;
    return fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace cluster
} // namespace dxwatch
