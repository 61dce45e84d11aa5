#pragma once

#include "dxwatch/channel.hpp"
#include "link_event.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dxwatch {
namespace cluster {

// Configuration for the cluster connection
struct ClusterLinkConfig {
    std::string host = "www.ve7cc.net";
    uint16_t port = 23;
    std::string callsign = "N0CALL";

    // Sent after the callsign on every login
    std::vector<std::string> login_commands = {
        "set/nofilter", "set/ve7cc", "set/skimmer", "set/nodedupe"
    };

    // Fixed delay between attempts, no backoff, no retry limit
    std::chrono::milliseconds reconnect_delay{5000};

    int banner_lines = 10;          // Max welcome lines discarded after login
    int banner_timeout_ms = 2000;   // Banner ends early after this much silence
    int read_poll_ms = 250;         // Read wait per loop iteration
};

struct LinkStats {
    uint64_t lines_received = 0;
    uint64_t spots = 0;
    uint64_t solar_updates = 0;
    uint64_t commands_sent = 0;
    uint64_t command_failures = 0;
    uint64_t connects = 0;
    uint64_t reconnects = 0;
};

/**
 * Cluster Link
 *
 * Owns one outbound connection to a DX cluster. A single loop thread runs
 * connect, login, streaming and reconnect; inbound lines are parsed and
 * published to the event channel, queued commands are written between reads.
 *
 *   Idle -> Connecting -> Authenticating -> Streaming
 *        -> Reconnecting -> Connecting ...          (on I/O failure)
 *        -> Disconnecting -> Stopped                 (on stop())
 */
class ClusterLink {
public:
    ClusterLink(const ClusterLinkConfig& config,
                std::unique_ptr<Transport> transport,
                Channel<LinkEvent>& events);
    ~ClusterLink();

    // Non-copyable, non-movable
    ClusterLink(const ClusterLink&) = delete;
    ClusterLink& operator=(const ClusterLink&) = delete;

    // Start the loop thread. Returns false if already running.
    bool start();

    // Stop from any state, discard queued commands, wait for the loop to exit
    void stop();

    // Queue a command line for the cluster. Thread-safe; FIFO order is kept.
    // Commands queued while not Streaming go out once Streaming begins.
    void sendCommand(const std::string& command);

    ConnectionState state() const { return state_.load(); }
    bool isRunning() const { return running_.load(); }
    size_t pendingCommands() const { return commands_.size(); }

    const ClusterLinkConfig& config() const { return config_; }
    LinkStats stats() const;

private:
    ClusterLinkConfig config_;
    std::unique_ptr<Transport> transport_;
    Channel<LinkEvent>& events_;
    Channel<std::string> commands_;

    std::thread thread_;
    std::atomic<ConnectionState> state_{ConnectionState::Idle};
    std::atomic<bool> running_{false};

    // Guards stop_requested_ for the reconnect wait
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;

    mutable std::mutex stats_mutex_;
    LinkStats stats_;

    // Loop thread
    void run();
    bool authenticate(std::string& reason);
    void stream(std::string& reason);   // returns on stop or read failure
    void drainCommands();
    void handleLine(const std::string& line, bool in_banner);
    bool waitReconnectDelay();

    bool stopRequested();
    void setState(ConnectionState state, const std::string& text);
    void publish(LinkEvent event);

    template <typename F>
    void updateStats(F&& fn) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        fn(stats_);
    }

    // Login prompts and separators are not worth showing as responses
    bool isNoiseResponse(const std::string& line) const;
};

} // namespace cluster
} // namespace dxwatch
