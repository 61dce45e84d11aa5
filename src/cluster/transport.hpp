#pragma once

#include <cstdint>
#include <string>

namespace dxwatch {
namespace cluster {

// Outcome of a blocking line read
enum class ReadResult {
    Line,          // a complete line was returned
    Timeout,       // nothing arrived within the timeout
    Interrupted,   // interrupt() woke the reader
    Closed,        // peer closed the connection (EOF)
    Error          // socket error
};

inline const char* readResultToString(ReadResult r) {
    switch (r) {
        case ReadResult::Line:        return "line";
        case ReadResult::Timeout:     return "timeout";
        case ReadResult::Interrupted: return "interrupted";
        case ReadResult::Closed:      return "closed";
        case ReadResult::Error:       return "error";
        default: return "unknown";
    }
}

// Abstract line-oriented connection used by ClusterLink
class Transport {
public:
    virtual ~Transport() = default;

    // Connection management
    virtual bool open(const std::string& host, uint16_t port) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Read one newline-stripped line, waiting at most timeout_ms
    virtual ReadResult readLine(std::string& line, int timeout_ms) = 0;

    // Write text verbatim (caller adds the line terminator)
    virtual bool write(const std::string& data) = 0;

    // Wake a reader blocked in readLine(). Safe to call from any thread.
    virtual void interrupt() = 0;

    // Discard a pending interrupt() that no reader consumed
    virtual void clearInterrupt() = 0;

    // Status and diagnostics
    virtual std::string lastError() const = 0;
    virtual const char* transportName() const = 0;
};

} // namespace cluster
} // namespace dxwatch
