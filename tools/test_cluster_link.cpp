// test_cluster_link.cpp - Unit test for the cluster connection loop
//
// Uses a scripted in-memory transport instead of a socket.
//
// Tests:
// 1. Defaults and stop before start
// 2. Login, banner handling, spot/solar/response events
// 3. Socket failure -> one Reconnecting, wait, Connecting again
// 4. Stop during the reconnect wait
// 5. Command queue: FIFO order, Sent events, queued before connect
// 6. Command write failure
// 7. Restart after a stop during the reconnect wait
// 8. Socket transport: stale wakeup cleared before connect

#include "cluster/cluster_link.hpp"
#include "cluster/line_parser.hpp"
#include "cluster/tcp_transport.hpp"
#include "dxwatch/channel.hpp"
#include "dxwatch/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace dxwatch;
using namespace dxwatch::cluster;

// In-memory line transport driven by the test
class FakeTransport : public Transport {
public:
    // Result of each open() in order; default_open once the list runs out
    void scriptOpens(std::deque<bool> results, bool default_open) {
        std::lock_guard<std::mutex> lock(mutex_);
        open_results_ = std::move(results);
        default_open_ = default_open;
    }

    void queueLines(const std::vector<std::string>& lines) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& l : lines) lines_.push_back(l);
        cv_.notify_all();
    }

    // Report the connection closed once the queued lines are consumed
    void dropAfterLines() {
        std::lock_guard<std::mutex> lock(mutex_);
        drop_when_drained_ = true;
        cv_.notify_all();
    }

    void failWrites(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    int openCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_calls_;
    }

    bool open(const std::string&, uint16_t) override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_calls_++;
        // A pending wakeup aborts the connect, as the socket transport does
        if (interrupted_) {
            interrupted_ = false;
            open_ = false;
            error_ = "Connect interrupted";
            return false;
        }
        bool ok = default_open_;
        if (!open_results_.empty()) {
            ok = open_results_.front();
            open_results_.pop_front();
        }
        open_ = ok;
        if (!ok) error_ = "Connection refused";
        return ok;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    ReadResult readLine(std::string& line, int timeout_ms) override {
        std::unique_lock<std::mutex> lock(mutex_);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (true) {
            if (interrupted_) {
                interrupted_ = false;
                return ReadResult::Interrupted;
            }
            if (!open_) {
                error_ = "Not connected";
                return ReadResult::Error;
            }
            if (!lines_.empty()) {
                line = lines_.front();
                lines_.pop_front();
                return ReadResult::Line;
            }
            if (drop_when_drained_) {
                drop_when_drained_ = false;
                error_ = "Connection reset by peer";
                return ReadResult::Closed;
            }
            if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
                return ReadResult::Timeout;
            }
        }
    }

    bool write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_writes_) {
            error_ = "Broken pipe";
            return false;
        }
        writes_.push_back(data);
        return true;
    }

    void interrupt() override {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
        cv_.notify_all();
    }

    void clearInterrupt() override {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = false;
    }

    bool interruptPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return interrupted_;
    }

    std::string lastError() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    const char* transportName() const override { return "Fake"; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<bool> open_results_;
    bool default_open_ = true;
    std::deque<std::string> lines_;
    std::vector<std::string> writes_;
    bool open_ = false;
    bool interrupted_ = false;
    bool drop_when_drained_ = false;
    bool fail_writes_ = false;
    int open_calls_ = 0;
    std::string error_;
};

struct Received {
    LinkEvent event;
    TimePoint at;
};

// Pop events into log until one satisfies pred or the timeout passes
static bool waitFor(Channel<LinkEvent>& events, std::vector<Received>& log,
                    const std::function<bool(const LinkEvent&)>& pred,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        auto event = events.popFor(std::chrono::milliseconds(20));
        if (!event) continue;
        log.push_back({*event, Clock::now()});
        if (pred(*event)) return true;
    }
    return false;
}

static std::function<bool(const LinkEvent&)> isState(ConnectionState state) {
    return [state](const LinkEvent& e) {
        auto* s = std::get_if<StatusEvent>(&e);
        return s && s->state == state;
    };
}

static std::function<bool(const LinkEvent&)> isCommand(CommandEvent::Direction dir) {
    return [dir](const LinkEvent& e) {
        auto* c = std::get_if<CommandEvent>(&e);
        return c && c->direction == dir;
    };
}

static std::vector<ConnectionState> statesIn(const std::vector<Received>& log) {
    std::vector<ConnectionState> states;
    for (const auto& r : log) {
        if (auto* s = std::get_if<StatusEvent>(&r.event)) {
            if (states.empty() || states.back() != s->state) states.push_back(s->state);
        }
    }
    return states;
}

static std::string spotLine(const std::string& call, const std::string& freq) {
    std::vector<std::string> f(cc11::MIN_FIELDS);
    f[cc11::TAG] = "CC11";
    f[cc11::FREQUENCY] = freq;
    f[cc11::DX_CALL] = call;
    f[cc11::TIME] = "1953Z";
    f[cc11::SPOTTER] = "W3LPL";
    f[cc11::DX_PREFIX] = "K";
    std::string line;
    for (size_t i = 0; i < f.size(); ++i) {
        if (i > 0) line += '^';
        line += f[i];
    }
    return line;
}

static ClusterLinkConfig testConfig() {
    ClusterLinkConfig config;
    config.host = "cluster.test";
    config.port = 7300;
    config.callsign = "N0TEST";
    config.login_commands = {"set/ve7cc"};
    config.banner_lines = 0;
    config.banner_timeout_ms = 50;
    config.read_poll_ms = 20;
    config.reconnect_delay = std::chrono::milliseconds(100);
    return config;
}

int main() {
    std::cout << "=== Cluster Link Unit Test ===\n\n";

    int pass = 0, fail = 0;

    // ========================================================================
    // TEST 1: Defaults, stop before start
    // ========================================================================
    std::cout << "TEST 1: Defaults and stop before start\n";
    {
        ClusterLinkConfig defaults;
        if (defaults.reconnect_delay == std::chrono::seconds(5) && defaults.port == 23 &&
            defaults.login_commands.size() == 4 && defaults.login_commands[0] == "set/nofilter") {
            std::cout << "  [PASS] 5 s reconnect delay, telnet port, VE7CC login commands\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Default configuration\n";
            fail++;
        }

        Channel<LinkEvent> events;
        ClusterLink link(testConfig(), std::make_unique<FakeTransport>(), events);
        link.sendCommand("sh/dx");
        bool queued = link.pendingCommands() == 1 && link.state() == ConnectionState::Idle;
        link.stop();

        std::vector<Received> log;
        waitFor(events, log, isState(ConnectionState::Stopped), std::chrono::milliseconds(200));
        auto states = statesIn(log);
        if (queued && link.pendingCommands() == 0 && link.state() == ConnectionState::Stopped &&
            states.size() == 2 && states[0] == ConnectionState::Disconnecting &&
            states[1] == ConnectionState::Stopped) {
            std::cout << "  [PASS] Idle -> Disconnecting -> Stopped, queue discarded\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Stop before start\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 2: Login and streaming
    // ========================================================================
    std::cout << "\nTEST 2: Login, banner and streaming events\n";
    {
        Channel<LinkEvent> events;
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        fake->queueLines({
            "Hello N0TEST, this is VE7CC-1 in Vancouver",   // banner, discarded
            spotLine("K1ABC", "14025.0"),                    // spot inside banner, delivered
            spotLine("W2XYZ", "7010.0"),
            "18-Dec-2025   18   138   6   2 No Storms -> No Storms   <VE7CC>",
            "WWV de VE7CC <18>:   SFI=138, A=6, K=2",
            "Filter set to all spots",
            "login: ",
            "----------------------------------------",
        });

        ClusterLinkConfig config = testConfig();
        config.banner_lines = 2;
        ClusterLink link(config, std::move(transport), events);

        std::vector<Received> log;
        bool started = link.start();
        bool streaming = waitFor(events, log, isState(ConnectionState::Streaming));
        bool response = waitFor(events, log, isCommand(CommandEvent::Direction::Response));
        // Noise lines after the response must not surface
        waitFor(events, log, [](const LinkEvent&) { return false; }, std::chrono::milliseconds(150));
        link.stop();

        auto writes = fake->writes();
        if (started && streaming && writes.size() == 2 && writes[0] == "N0TEST\n" &&
            writes[1] == "set/ve7cc\n") {
            std::cout << "  [PASS] Callsign then login commands, newline terminated\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Login sequence (" << writes.size() << " writes)\n";
            fail++;
        }

        auto states = statesIn(log);
        if (states.size() >= 3 && states[0] == ConnectionState::Connecting &&
            states[1] == ConnectionState::Authenticating && states[2] == ConnectionState::Streaming) {
            std::cout << "  [PASS] Connecting -> Authenticating -> Streaming\n";
            pass++;
        } else {
            std::cout << "  [FAIL] State sequence\n";
            fail++;
        }

        std::vector<std::string> spot_calls;
        int solar = 0, responses = 0;
        std::string response_text;
        for (const auto& r : log) {
            if (auto* s = std::get_if<Spot>(&r.event)) spot_calls.push_back(s->callsign);
            if (auto* w = std::get_if<SolarUpdate>(&r.event)) solar += (w->sfi == 138);
            if (auto* c = std::get_if<CommandEvent>(&r.event)) {
                if (c->direction == CommandEvent::Direction::Response) {
                    responses++;
                    response_text = c->text;
                }
            }
        }
        if (spot_calls.size() == 2 && spot_calls[0] == "K1ABC" && spot_calls[1] == "W2XYZ" &&
            solar == 1) {
            std::cout << "  [PASS] Spots (incl. banner) and WWV row published in order\n";
            pass++;
        } else {
            std::cout << "  [FAIL] " << spot_calls.size() << " spots, " << solar << " solar\n";
            fail++;
        }

        if (response && responses == 1 && response_text == "Filter set to all spots") {
            std::cout << "  [PASS] Plain text surfaced once, prompts/separators dropped\n";
            pass++;
        } else {
            std::cout << "  [FAIL] " << responses << " response event(s)\n";
            fail++;
        }

        auto stats = link.stats();
        if (stats.spots == 2 && stats.solar_updates == 1 && stats.connects == 1 && stats.reconnects == 0) {
            std::cout << "  [PASS] Link statistics\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Link statistics\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 3: Socket failure while streaming
    // ========================================================================
    std::cout << "\nTEST 3: Socket failure -> reconnect\n";
    {
        Channel<LinkEvent> events;
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        fake->queueLines({spotLine("K1ABC", "14025.0")});
        fake->dropAfterLines();

        ClusterLink link(testConfig(), std::move(transport), events);
        std::vector<Received> log;
        link.start();

        bool first = waitFor(events, log, isState(ConnectionState::Reconnecting));
        bool again = waitFor(events, log, isState(ConnectionState::Streaming));
        link.stop();
        waitFor(events, log, isState(ConnectionState::Stopped), std::chrono::milliseconds(500));

        auto states = statesIn(log);
        std::vector<ConnectionState> expected = {
            ConnectionState::Connecting, ConnectionState::Authenticating, ConnectionState::Streaming,
            ConnectionState::Reconnecting,
            ConnectionState::Connecting, ConnectionState::Authenticating, ConnectionState::Streaming,
            ConnectionState::Disconnecting, ConnectionState::Stopped,
        };
        if (first && again && states == expected) {
            std::cout << "  [PASS] Exactly one Reconnecting, then Connecting again\n";
            pass++;
        } else {
            std::cout << "  [FAIL] State sequence after failure (" << states.size() << " states)\n";
            for (auto s : states) std::cout << "    " << connectionStateToString(s) << "\n";
            fail++;
        }

        TimePoint reconnecting{}, connecting{};
        std::string reconnect_text;
        for (const auto& r : log) {
            auto* s = std::get_if<StatusEvent>(&r.event);
            if (!s) continue;
            if (s->state == ConnectionState::Reconnecting) {
                reconnecting = r.at;
                reconnect_text = s->text;
            } else if (s->state == ConnectionState::Connecting && reconnecting != TimePoint{}) {
                connecting = r.at;
                break;
            }
        }
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(connecting - reconnecting);
        if (connecting != TimePoint{} && waited >= std::chrono::milliseconds(80) &&
            reconnect_text.find("Connection reset by peer") != std::string::npos) {
            std::cout << "  [PASS] Waited " << waited.count() << " ms, reason in status text\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Reconnect wait " << waited.count() << " ms, text '"
                      << reconnect_text << "'\n";
            fail++;
        }

        auto stats = link.stats();
        if (stats.connects == 2 && stats.reconnects == 1 && fake->openCalls() == 2) {
            std::cout << "  [PASS] Two connects, one reconnect\n";
            pass++;
        } else {
            std::cout << "  [FAIL] connects=" << stats.connects << " reconnects=" << stats.reconnects << "\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 4: Stop during reconnect wait
    // ========================================================================
    std::cout << "\nTEST 4: Stop during the 5 s reconnect wait\n";
    {
        Channel<LinkEvent> events;
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        fake->scriptOpens({}, false);

        ClusterLinkConfig config = testConfig();
        config.reconnect_delay = std::chrono::seconds(5);
        ClusterLink link(config, std::move(transport), events);

        std::vector<Received> log;
        link.start();
        bool waiting = waitFor(events, log, isState(ConnectionState::Reconnecting));

        auto t0 = Clock::now();
        link.stop();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0);

        waitFor(events, log, isState(ConnectionState::Stopped), std::chrono::milliseconds(500));
        auto states = statesIn(log);
        std::vector<ConnectionState> expected = {
            ConnectionState::Connecting, ConnectionState::Reconnecting,
            ConnectionState::Disconnecting, ConnectionState::Stopped,
        };

        if (waiting && elapsed < std::chrono::milliseconds(1000)) {
            std::cout << "  [PASS] stop() returned in " << elapsed.count() << " ms\n";
            pass++;
        } else {
            std::cout << "  [FAIL] stop() took " << elapsed.count() << " ms\n";
            fail++;
        }

        if (states == expected && fake->openCalls() == 1 && !link.isRunning() &&
            link.state() == ConnectionState::Stopped) {
            std::cout << "  [PASS] Stopped without another Connecting attempt\n";
            pass++;
        } else {
            std::cout << "  [FAIL] States after stop (" << states.size() << ")\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 5: Command queue
    // ========================================================================
    std::cout << "\nTEST 5: Command queue\n";
    {
        Channel<LinkEvent> events;
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        ClusterLink link(testConfig(), std::move(transport), events);

        // Queued before the link exists on the wire
        link.sendCommand("sh/wwv");

        std::vector<Received> log;
        link.start();
        waitFor(events, log, isState(ConnectionState::Streaming));

        link.sendCommand("sh/dx 5");
        link.sendCommand("   ");
        link.sendCommand("  set/page 0  ");

        int sent = 0;
        for (int i = 0; i < 3; ++i) {
            if (waitFor(events, log, isCommand(CommandEvent::Direction::Sent))) sent++;
        }
        link.stop();

        auto writes = fake->writes();
        std::vector<std::string> expected = {"N0TEST\n", "set/ve7cc\n", "sh/wwv\n", "sh/dx 5\n", "set/page 0\n"};
        if (writes == expected) {
            std::cout << "  [PASS] Commands written in FIFO order, blank ignored\n";
            pass++;
        } else {
            std::cout << "  [FAIL] " << writes.size() << " writes\n";
            for (const auto& w : writes) std::cout << "    '" << w << "'\n";
            fail++;
        }

        std::vector<std::string> sent_text;
        for (const auto& r : log) {
            auto* c = std::get_if<CommandEvent>(&r.event);
            if (c && c->direction == CommandEvent::Direction::Sent) sent_text.push_back(c->text);
        }
        if (sent == 3 && sent_text.size() == 3 && sent_text[0] == "sh/wwv" &&
            sent_text[1] == "sh/dx 5" && sent_text[2] == "set/page 0" &&
            link.stats().commands_sent == 3) {
            std::cout << "  [PASS] One Sent event per command, in order\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Sent events\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 6: Command write failure
    // ========================================================================
    std::cout << "\nTEST 6: Command write failure\n";
    {
        Channel<LinkEvent> events;
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        ClusterLink link(testConfig(), std::move(transport), events);

        std::vector<Received> log;
        link.start();
        waitFor(events, log, isState(ConnectionState::Streaming));

        fake->failWrites(true);
        link.sendCommand("sh/dx");
        bool failed = waitFor(events, log, isCommand(CommandEvent::Direction::Failed));
        bool status = waitFor(events, log, [](const LinkEvent& e) {
            auto* s = std::get_if<StatusEvent>(&e);
            return s && s->text.rfind("Command failed: sh/dx", 0) == 0;
        });
        // Give the loop time to (wrongly) reconnect
        waitFor(events, log, [](const LinkEvent&) { return false; }, std::chrono::milliseconds(150));

        auto stats = link.stats();
        bool still_streaming = link.state() == ConnectionState::Streaming;
        link.stop();

        if (failed && status && still_streaming && stats.command_failures == 1 &&
            stats.connects == 1 && stats.reconnects == 0) {
            std::cout << "  [PASS] Failed event and status, connection kept\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Write failure handling\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 7: Restart after stop during the wait
    // ========================================================================
    std::cout << "\nTEST 7: Restart after a stop during the reconnect wait\n";
    {
        Channel<LinkEvent> events;
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        fake->scriptOpens({false}, true);

        ClusterLinkConfig config = testConfig();
        config.reconnect_delay = std::chrono::seconds(5);
        ClusterLink link(config, std::move(transport), events);

        std::vector<Received> first_log;
        link.start();
        bool waiting = waitFor(events, first_log, isState(ConnectionState::Reconnecting));
        link.stop();
        waitFor(events, first_log, isState(ConnectionState::Stopped), std::chrono::milliseconds(500));

        // stop() woke a reader that was never there
        bool stale = fake->interruptPending();

        std::vector<Received> log;
        bool restarted = link.start();
        bool streaming = waitFor(events, log, isState(ConnectionState::Streaming),
                                 std::chrono::milliseconds(1000));
        link.stop();
        waitFor(events, log, isState(ConnectionState::Stopped), std::chrono::milliseconds(500));

        auto states = statesIn(log);
        std::vector<ConnectionState> expected = {
            ConnectionState::Connecting, ConnectionState::Authenticating, ConnectionState::Streaming,
            ConnectionState::Disconnecting, ConnectionState::Stopped,
        };
        if (waiting && stale && restarted && streaming && states == expected &&
            fake->openCalls() == 2) {
            std::cout << "  [PASS] Restart goes Connecting -> Authenticating -> Streaming\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Restart state sequence (" << states.size() << " states)\n";
            for (auto st : states) std::cout << "    " << connectionStateToString(st) << "\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 8: Socket transport wakeups
    // ========================================================================
    std::cout << "\nTEST 8: Socket transport wakeups\n";
    {
        int listener = socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);

        bool listening = listener >= 0 &&
            bind(listener, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 &&
            listen(listener, 4) == 0 &&
            getsockname(listener, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0;
        uint16_t port = ntohs(addr.sin_port);

        TcpTransport tcp;
        tcp.interrupt();
        tcp.clearInterrupt();
        bool opened = listening && tcp.open("127.0.0.1", port);
        if (opened) {
            std::cout << "  [PASS] Connect after a cleared wakeup (port " << port << ")\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Connect after cleared wakeup: " << tcp.lastError() << "\n";
            fail++;
        }

        std::string line;
        tcp.interrupt();
        ReadResult woken = tcp.readLine(line, 1000);
        tcp.interrupt();
        tcp.clearInterrupt();
        ReadResult quiet = tcp.readLine(line, 50);
        if (opened && woken == ReadResult::Interrupted && quiet == ReadResult::Timeout) {
            std::cout << "  [PASS] interrupt() wakes the reader, clearInterrupt() discards it\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Wakeups: " << readResultToString(woken) << ", "
                      << readResultToString(quiet) << "\n";
            fail++;
        }

        tcp.close();
        if (listener >= 0) ::close(listener);
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All cluster link tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
