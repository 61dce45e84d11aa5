// TCP client transport for the cluster telnet port

#pragma once

#include "transport.hpp"
#include "line_parser.hpp"

#include <deque>
#include <mutex>
#include <string>

namespace dxwatch {
namespace cluster {

using socket_t = int;
constexpr socket_t INVALID_SOCKET_VALUE = -1;

struct TcpTransportConfig {
    int connect_timeout_ms = 10000;
    int write_timeout_ms = 5000;
    bool keepalive = true;
};

class TcpTransport : public Transport {
public:
    TcpTransport();
    explicit TcpTransport(const TcpTransportConfig& config);
    ~TcpTransport() override;

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Transport interface
    bool open(const std::string& host, uint16_t port) override;
    void close() override;
    bool isOpen() const override { return socket_fd_ != INVALID_SOCKET_VALUE; }

    ReadResult readLine(std::string& line, int timeout_ms) override;
    bool write(const std::string& data) override;
    void interrupt() override;
    void clearInterrupt() override;

    std::string lastError() const override;
    const char* transportName() const override { return "TCP"; }

    // "host:port" of the connected peer, for logging
    std::string peerAddress() const;

private:
    TcpTransportConfig config_;
    socket_t socket_fd_ = INVALID_SOCKET_VALUE;

    // Self-pipe used by interrupt() to wake poll()
    int wake_fds_[2] = {-1, -1};

    LineAssembler assembler_;
    std::deque<std::string> pending_lines_;

    mutable std::mutex error_mutex_;
    std::string last_error_;

    void setError(const std::string& err);
    bool drainWakePipe();

    static bool setNonBlocking(socket_t sock);
};

} // namespace cluster
} // namespace dxwatch
