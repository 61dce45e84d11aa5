/**
 * dxwatch CLI - DX cluster client with award tracking
 *
 * Streams spots from a VE7CC-style cluster, highlights the ones still
 * needed for the multi-band (Challenge) and 6m grid (FFMA) awards.
 */

#include "cluster/cluster_link.hpp"
#include "cluster/line_parser.hpp"
#include "cluster/tcp_transport.hpp"
#include "dxcc/entity_resolver.hpp"
#include "award/award_tracker.hpp"
#include "award/adif_reader.hpp"
#include "spots/spot_buffer.hpp"
#include "spots/spot_rate.hpp"
#include "config/settings.hpp"
#include "dxwatch/channel.hpp"
#include "dxwatch/logging.hpp"
#include "dxwatch/types.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <fstream>
#include <cstring>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace dxwatch;

// Signal handling for clean shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cerr << "dxwatch - DX cluster client with award tracking\n\n";
    std::cerr << "Usage: " << prog << " [options] <command> [args]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  run                     Connect to the cluster and stream spots.\n";
    std::cerr << "                          Lines typed on stdin are sent as cluster commands.\n";
    std::cerr << "  parse <file>            Classify captured cluster lines offline\n";
    std::cerr << "  resolve <prefix>...     Show entity lookup for prefixes\n";
    std::cerr << "  import-challenge <adif> Build challenge data from a credit ADIF\n";
    std::cerr << "  import-ffma <adif>      Build 6m grid data from a QSL ADIF\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c <file>       Settings file (default: " << config::Settings::getDefaultPath() << ")\n";
    std::cerr << "  -o <file>       Output file for import commands\n";
    std::cerr << "  -g <grid>       Home grid for import-ffma (default: [Station] grid)\n";
    std::cerr << "  -v              Verbose logging (DEBUG)\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " run -c ~/dx.ini\n";
    std::cerr << "  " << prog << " resolve IT9 K VP2E\n";
    std::cerr << "  " << prog << " import-ffma lotw_qsl.adi -g FN42\n";
    std::cerr << "\n";
}

// Load resolver and award tables named in the settings. Missing data only
// degrades classification, so failures are reported and startup continues.
static void loadDataFiles(const config::Settings& settings,
                          dxcc::EntityResolver& resolver,
                          award::AwardTracker& tracker) {
    if (!resolver.initialize(settings.cty_file, settings.dxcc_mapping_file)) {
        LOG_APP(WARN, "Entity lookup unavailable (%s, %s)",
                settings.cty_file.c_str(), settings.dxcc_mapping_file.c_str());
    }
    if (!tracker.loadChallengeFile(settings.challenge_file)) {
        LOG_APP(WARN, "No challenge data, band/entity highlighting off");
    }
    if (!tracker.loadEligibleGridsFile(settings.ffma_grids_file)) {
        LOG_APP(WARN, "No eligible grid list, grid highlighting off");
    }
    if (!tracker.loadWorkedGridsFile(settings.ffma_file)) {
        LOG_APP(WARN, "No worked grid data, grid highlighting off");
    }
}

static void printSpot(const spots::ClassifiedSpot& c) {
    const Spot& s = c.spot;
    char entity[16];
    if (c.entity) {
        snprintf(entity, sizeof(entity), "%d", *c.entity);
    } else {
        snprintf(entity, sizeof(entity), "-");
    }

    char line[256];
    snprintf(line, sizeof(line), "%c%c %-6s %-4s %10s %-12s %-5s %-4s %-6s %-10s %s",
             c.needed_multi_band ? 'B' : ' ',
             c.needed_grid ? 'G' : ' ',
             s.time.c_str(), s.band.c_str(), s.frequency.c_str(), s.callsign.c_str(),
             s.prefix.c_str(), entity, s.grid.c_str(), s.spotter.c_str(), s.comment.c_str());
    std::cout << line << "\n";
}

// ============================================================================
// run - live cluster session
// ============================================================================
int runCluster(const config::Settings& settings) {
    dxcc::EntityResolver resolver;
    award::AwardTracker tracker;
    loadDataFiles(settings, resolver, tracker);

    spots::SpotClassifierBuffer buffer(resolver, tracker, settings.bufferConfig());
    spots::SpotRateMeter rate;
    spots::SpotFilter filter = settings.displayFilter();

    Channel<cluster::LinkEvent> events;
    cluster::ClusterLink link(settings.clusterConfig(),
                              std::make_unique<cluster::TcpTransport>(),
                              events);

    if (!settings.auto_connect) {
        std::cerr << "auto_connect is off in settings, not connecting\n";
        return 0;
    }

    if (!link.start()) {
        std::cerr << "Failed to start cluster link\n";
        return 1;
    }

    // Operator commands from stdin
    std::thread input([&link]() {
        std::string pending;
        while (g_running) {
            struct pollfd pfd;
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            pfd.revents = 0;
            if (poll(&pfd, 1, 200) <= 0) continue;

            char buf[512];
            ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) break;  // EOF: keep streaming, stop reading commands

            pending.append(buf, static_cast<size_t>(n));
            size_t nl;
            while ((nl = pending.find('\n')) != std::string::npos) {
                link.sendCommand(pending.substr(0, nl));
                pending.erase(0, nl + 1);
            }
        }
    });

    size_t last_rate = 0;
    while (g_running) {
        auto event = events.popFor(std::chrono::milliseconds(200));
        if (event) {
            if (auto* spot = std::get_if<Spot>(&*event)) {
                rate.record(Clock::now());
                auto c = buffer.add(*spot);
                if (c.needed() && filter.normalized().matches(c.spot)) {
                    std::cout << "*** NEEDED ";
                    printSpot(c);
                }
                buffer.requestRebuild();
            } else if (auto* solar = std::get_if<SolarUpdate>(&*event)) {
                std::cout << "[WWV] " << solar->date << " " << solar->hour << "Z"
                          << " SFI=" << solar->sfi << " A=" << solar->a_index
                          << " K=" << solar->k_index << "\n";
            } else if (auto* status = std::get_if<cluster::StatusEvent>(&*event)) {
                std::cerr << "[" << cluster::connectionStateToString(status->state) << "] "
                          << status->text << "\n";
            } else if (auto* cmd = std::get_if<cluster::CommandEvent>(&*event)) {
                std::cout << "[" << cluster::commandDirectionToString(cmd->direction) << "] "
                          << cmd->text << "\n";
            }
        }

        if (buffer.pollRebuild()) {
            auto view = buffer.filtered(filter);
            size_t needed = 0;
            for (const auto& c : view) {
                if (c.needed()) needed++;
            }
            size_t r = rate.rate(Clock::now());
            if (r != last_rate) {
                LOG_APP(INFO, "%zu spots/min, %zu needed, %zu shown", r, needed, view.size());
                last_rate = r;
            }
        }
    }

    std::cerr << "\nShutting down...\n";
    link.stop();
    input.join();

    auto stats = link.stats();
    std::cerr << "\n=== Session Statistics ===\n";
    std::cerr << "  Lines:      " << stats.lines_received << "\n";
    std::cerr << "  Spots:      " << stats.spots << "\n";
    std::cerr << "  Commands:   " << stats.commands_sent << " sent, "
              << stats.command_failures << " failed\n";
    std::cerr << "  Reconnects: " << stats.reconnects << "\n";
    return 0;
}

// ============================================================================
// parse - offline classification of a captured feed
// ============================================================================
int runParse(const config::Settings& settings, const char* input_file) {
    if (!input_file) {
        std::cerr << "parse: input file required\n";
        return 1;
    }
    std::ifstream in(input_file);
    if (!in) {
        std::cerr << "Cannot open " << input_file << "\n";
        return 1;
    }

    dxcc::EntityResolver resolver;
    award::AwardTracker tracker;
    loadDataFiles(settings, resolver, tracker);
    spots::SpotClassifierBuffer buffer(resolver, tracker, settings.bufferConfig());

    size_t lines = 0, spot_count = 0, solar = 0, ignored = 0;
    std::string line;
    while (std::getline(in, line)) {
        lines++;
        auto parsed = cluster::LineParser::parse(line);
        if (auto* spot = std::get_if<Spot>(&parsed)) {
            spot_count++;
            printSpot(buffer.add(*spot));
        } else if (std::holds_alternative<SolarUpdate>(parsed)) {
            solar++;
        } else {
            ignored++;
        }
    }

    std::cerr << "\n=== Parse Statistics ===\n";
    std::cerr << "  Lines:   " << lines << "\n";
    std::cerr << "  Spots:   " << spot_count << " (" << buffer.neededCount() << " needed)\n";
    std::cerr << "  WWV:     " << solar << "\n";
    std::cerr << "  Ignored: " << ignored << "\n";
    return 0;
}

// ============================================================================
// resolve - prefix lookups
// ============================================================================
int runResolve(const config::Settings& settings, const std::vector<std::string>& prefixes) {
    if (prefixes.empty()) {
        std::cerr << "resolve: at least one prefix required\n";
        return 1;
    }

    dxcc::EntityResolver resolver;
    if (!resolver.initialize(settings.cty_file, settings.dxcc_mapping_file)) {
        std::cerr << "Entity lookup unavailable, check " << settings.cty_file
                  << " and " << settings.dxcc_mapping_file << "\n";
        return 1;
    }

    for (const auto& p : prefixes) {
        auto record = resolver.recordFor(p);
        auto id = resolver.resolve(p);
        char line[256];
        snprintf(line, sizeof(line), "%-10s -> %-24s CQ %-2d ITU %-2d %-2s -> %s",
                 p.c_str(),
                 record ? record->name.c_str() : "Unknown",
                 record ? record->cq_zone : 0,
                 record ? record->itu_zone : 0,
                 record ? record->continent.c_str() : "",
                 id ? std::to_string(*id).c_str() : "NOT FOUND");
        std::cout << line << "\n";
    }
    return 0;
}

// ============================================================================
// import-challenge / import-ffma
// ============================================================================
int runImportChallenge(const config::Settings& settings, const char* adif_file,
                       const char* output_file) {
    if (!adif_file) {
        std::cerr << "import-challenge: ADIF file required\n";
        return 1;
    }

    std::vector<award::AdifRecord> records;
    if (!award::AdifReader::readFile(adif_file, records)) {
        return 1;
    }

    auto summary = award::AdifReader::challengeSummary(records);
    std::string out = output_file ? output_file : settings.challenge_file;
    if (!award::AdifReader::saveChallengeSummary(summary, out)) {
        return 1;
    }

    std::cout << "Entities: " << summary.totalEntities() << "\n";
    std::cout << "Slots:    " << summary.totalSlots() << "\n";
    for (const auto& [band, count] : summary.entities_by_band) {
        std::cout << "  " << band << ": " << count << "\n";
    }
    std::cout << "Saved to " << out << "\n";
    return 0;
}

int runImportFfma(const config::Settings& settings, const char* adif_file,
                  const char* output_file, const std::string& home_grid) {
    if (!adif_file) {
        std::cerr << "import-ffma: ADIF file required\n";
        return 1;
    }

    award::AwardTracker tracker;
    if (!tracker.loadEligibleGridsFile(settings.ffma_grids_file)) {
        std::cerr << "Warning: no eligible grid list (" << settings.ffma_grids_file
                  << "), keeping every 6m grid\n";
    }

    std::vector<award::AdifRecord> records;
    if (!award::AdifReader::readFile(adif_file, records)) {
        return 1;
    }

    award::GridImportOptions options;
    options.band = settings.grid_award_band;
    options.home_grid = home_grid;
    auto grids = award::AdifReader::workedGrids(records, tracker.snapshot()->eligible_grids, options);

    std::string out = output_file ? output_file : settings.ffma_file;
    if (!award::AdifReader::saveWorkedGrids(grids, out, home_grid)) {
        return 1;
    }

    tracker.setWorkedGrids([&grids]() {
        std::vector<award::WorkedGrid> list;
        for (const auto& [grid, record] : grids) list.push_back(record);
        return list;
    }());
    auto stats = tracker.gridStats();

    std::cout << "Worked grids: " << grids.size();
    if (stats.eligible > 0) {
        char pct[32];
        snprintf(pct, sizeof(pct), "%.1f", stats.percent_complete);
        std::cout << " of " << stats.eligible << " (" << pct << "%)";
    }
    std::cout << "\nSaved to " << out << "\n";
    return 0;
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    const char* settings_file = nullptr;
    const char* output_file = nullptr;
    const char* command = nullptr;
    const char* home_grid = nullptr;
    bool verbose = false;
    std::vector<std::string> args;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            settings_file = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-g") == 0 && i + 1 < argc) {
            home_grid = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            if (!command) {
                command = argv[i];
            } else {
                args.push_back(argv[i]);
            }
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    config::Settings settings;
    std::string settings_path = settings_file ? settings_file : "";
    if (!settings.load(settings_path)) {
        if (settings_file) {
            std::cerr << "Cannot read settings file " << settings_file << "\n";
            return 1;
        }
        LOG_APP(INFO, "No settings file, using defaults");
    }

    setLogLevel(verbose ? LogLevel::DEBUG : stringToLogLevel(settings.log_level));
    if (!settings.log_file.empty() && !setLogFile(settings.log_file)) {
        std::cerr << "Cannot open log file " << settings.log_file << "\n";
    }

    const char* first_arg = args.empty() ? nullptr : args[0].c_str();

    if (strcmp(command, "run") == 0) {
        return runCluster(settings);
    } else if (strcmp(command, "parse") == 0) {
        return runParse(settings, first_arg);
    } else if (strcmp(command, "resolve") == 0) {
        return runResolve(settings, args);
    } else if (strcmp(command, "import-challenge") == 0) {
        return runImportChallenge(settings, first_arg, output_file);
    } else if (strcmp(command, "import-ffma") == 0) {
        return runImportFfma(settings, first_arg, output_file,
                             home_grid ? std::string(home_grid) : settings.grid);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }
}
