#include "cluster_link.hpp"
#include "line_parser.hpp"
#include "dxwatch/logging.hpp"

#include <cctype>
#include <cstdio>

namespace dxwatch {
namespace cluster {

// Lines the cluster sends while prompting or framing output
static const char* const NOISE_MARKERS[] = {"please enter", "login:", "----"};

static std::string trimLine(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

ClusterLink::ClusterLink(const ClusterLinkConfig& config,
                         std::unique_ptr<Transport> transport,
                         Channel<LinkEvent>& events)
    : config_(config), transport_(std::move(transport)), events_(events) {}

ClusterLink::~ClusterLink() {
    if (thread_.joinable()) {
        stop();
    }
}

bool ClusterLink::start() {
    if (running_.load()) {
        return false;
    }
    if (!transport_) {
        LOG_CLUSTER(ERROR, "ClusterLink: No transport");
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }

    running_ = true;
    thread_ = std::thread(&ClusterLink::run, this);
    return true;
}

void ClusterLink::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (thread_.joinable()) {
        if (transport_) {
            transport_->interrupt();
        }
        thread_.join();
        return;
    }

    // Never started: no loop thread to walk the shutdown states
    ConnectionState current = state_.load();
    if (current == ConnectionState::Stopped) {
        return;
    }
    setState(ConnectionState::Disconnecting, "Disconnecting");
    size_t dropped = commands_.clear();
    if (dropped > 0) {
        LOG_CLUSTER(INFO, "ClusterLink: Discarded %zu queued command(s)", dropped);
    }
    setState(ConnectionState::Stopped, "Cluster stopped");
}

void ClusterLink::sendCommand(const std::string& command) {
    std::string cmd = trimLine(command);
    if (cmd.empty()) {
        return;
    }
    if (!commands_.push(cmd)) {
        return;
    }

    // Only wake the loop while it sits in a streaming read; waking it during
    // connect would abort the attempt.
    if (state_.load() == ConnectionState::Streaming && transport_) {
        transport_->interrupt();
    }
}

LinkStats ClusterLink::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ClusterLink::run() {
    LOG_CLUSTER(INFO, "ClusterLink: Loop started (%s %s:%u as %s)",
                transport_->transportName(), config_.host.c_str(),
                static_cast<unsigned>(config_.port), config_.callsign.c_str());

    const auto delay_s = std::chrono::duration_cast<std::chrono::seconds>(
        config_.reconnect_delay).count();

    while (true) {
        // Drop a wakeup left by an earlier stop() or command. stop() sets the
        // flag before it interrupts, so the check below still sees it.
        transport_->clearInterrupt();
        if (stopRequested()) {
            break;
        }

        char text[256];
        snprintf(text, sizeof(text), "Connecting to %s:%u...",
                 config_.host.c_str(), static_cast<unsigned>(config_.port));
        setState(ConnectionState::Connecting, text);

        std::string reason;
        if (transport_->open(config_.host, config_.port)) {
            updateStats([](LinkStats& s) { s.connects++; });

            setState(ConnectionState::Authenticating, "Logging in as " + config_.callsign);
            if (authenticate(reason)) {
                setState(ConnectionState::Streaming, "Cluster connected");
                stream(reason);
            }
            transport_->close();
        } else {
            reason = transport_->lastError();
        }

        if (stopRequested()) {
            break;
        }

        updateStats([](LinkStats& s) { s.reconnects++; });
        snprintf(text, sizeof(text), "Cluster lost - retrying in %llds (%s)",
                 static_cast<long long>(delay_s),
                 reason.empty() ? "unknown error" : reason.c_str());
        LOG_CLUSTER(WARN, "ClusterLink: %s", text);
        setState(ConnectionState::Reconnecting, text);

        if (!waitReconnectDelay()) {
            break;
        }
    }

    setState(ConnectionState::Disconnecting, "Disconnecting");
    transport_->close();

    size_t dropped = commands_.clear();
    if (dropped > 0) {
        LOG_CLUSTER(INFO, "ClusterLink: Discarded %zu queued command(s)", dropped);
    }

    setState(ConnectionState::Stopped, "Cluster stopped");
    running_ = false;
    LOG_CLUSTER(INFO, "ClusterLink: Loop exited");
}

bool ClusterLink::authenticate(std::string& reason) {
    if (!transport_->write(config_.callsign + "\n")) {
        reason = transport_->lastError();
        return false;
    }
    for (const auto& cmd : config_.login_commands) {
        if (!transport_->write(cmd + "\n")) {
            reason = transport_->lastError();
            return false;
        }
        LOG_CLUSTER(DEBUG, "ClusterLink: Login command '%s'", cmd.c_str());
    }

    // Welcome banner: content is not validated
    int seen = 0;
    while (seen < config_.banner_lines) {
        if (stopRequested()) {
            return false;
        }

        std::string line;
        ReadResult r = transport_->readLine(line, config_.banner_timeout_ms);
        switch (r) {
            case ReadResult::Line:
                handleLine(line, true);
                seen++;
                break;
            case ReadResult::Timeout:
                LOG_CLUSTER(DEBUG, "ClusterLink: Banner ended after %d line(s)", seen);
                return true;
            case ReadResult::Interrupted:
                break;
            case ReadResult::Closed:
            case ReadResult::Error:
                reason = transport_->lastError();
                return false;
        }
    }
    return true;
}

void ClusterLink::stream(std::string& reason) {
    while (!stopRequested()) {
        drainCommands();

        std::string line;
        ReadResult r = transport_->readLine(line, config_.read_poll_ms);
        switch (r) {
            case ReadResult::Line:
                handleLine(line, false);
                break;
            case ReadResult::Timeout:
            case ReadResult::Interrupted:
                break;
            case ReadResult::Closed:
            case ReadResult::Error:
                reason = transport_->lastError();
                LOG_CLUSTER(WARN, "ClusterLink: Read %s: %s",
                            readResultToString(r), reason.c_str());
                return;
        }
    }
}

void ClusterLink::drainCommands() {
    while (auto cmd = commands_.tryPop()) {
        std::string wire = *cmd;
        if (wire.empty() || wire.back() != '\n') {
            wire += '\n';
        }

        if (transport_->write(wire)) {
            updateStats([](LinkStats& s) { s.commands_sent++; });
            LOG_CLUSTER(INFO, "ClusterLink: Sent '%s'", cmd->c_str());
            publish(CommandEvent{CommandEvent::Direction::Sent, *cmd});
        } else {
            // Not a reconnect trigger by itself; the next read will notice
            std::string err = transport_->lastError();
            updateStats([](LinkStats& s) { s.command_failures++; });
            LOG_CLUSTER(WARN, "ClusterLink: Command '%s' failed: %s",
                        cmd->c_str(), err.c_str());
            publish(CommandEvent{CommandEvent::Direction::Failed, *cmd});
            publish(StatusEvent{state_.load(), "Command failed: " + *cmd + " (" + err + ")"});
        }
    }
}

void ClusterLink::handleLine(const std::string& line, bool in_banner) {
    updateStats([](LinkStats& s) { s.lines_received++; });

    ParsedLine parsed = LineParser::parse(line);

    if (auto* spot = std::get_if<Spot>(&parsed)) {
        updateStats([](LinkStats& s) { s.spots++; });
        publish(std::move(*spot));
        return;
    }
    if (auto* solar = std::get_if<SolarUpdate>(&parsed)) {
        updateStats([](LinkStats& s) { s.solar_updates++; });
        LOG_CLUSTER(DEBUG, "ClusterLink: WWV %s %02dZ SFI=%d A=%d K=%d",
                    solar->date.c_str(), solar->hour, solar->sfi,
                    solar->a_index, solar->k_index);
        publish(std::move(*solar));
        return;
    }

    const auto& ignored = std::get<Ignored>(parsed);
    if (in_banner) {
        LOG_CLUSTER(TRACE, "ClusterLink: Banner: %s", line.c_str());
        return;
    }
    if (ignored.reason != IgnoreReason::NotSpot) {
        LOG_CLUSTER(TRACE, "ClusterLink: Ignored (%s): %s",
                    ignoreReasonToString(ignored.reason), line.c_str());
        return;
    }

    std::string text = trimLine(line);
    if (isNoiseResponse(text)) {
        return;
    }
    publish(CommandEvent{CommandEvent::Direction::Response, text});
}

bool ClusterLink::isNoiseResponse(const std::string& line) const {
    std::string lower;
    lower.reserve(line.size());
    for (char c : line) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (const char* marker : NOISE_MARKERS) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool ClusterLink::waitReconnectDelay() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    bool stopped = stop_cv_.wait_for(lock, config_.reconnect_delay,
                                     [this] { return stop_requested_; });
    return !stopped;
}

bool ClusterLink::stopRequested() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    return stop_requested_;
}

void ClusterLink::setState(ConnectionState state, const std::string& text) {
    ConnectionState previous = state_.exchange(state);
    if (previous != state) {
        LOG_CLUSTER(DEBUG, "ClusterLink: %s -> %s",
                    connectionStateToString(previous), connectionStateToString(state));
    }
    publish(StatusEvent{state, text});
}

void ClusterLink::publish(LinkEvent event) {
    if (!events_.push(std::move(event))) {
        LOG_CLUSTER(TRACE, "ClusterLink: Event channel closed, event dropped");
    }
}

} // namespace cluster
} // namespace dxwatch
