#include "settings.hpp"
#include "dxwatch/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <sys/stat.h>
#define MKDIR(path) mkdir(path, 0755)

namespace dxwatch {
namespace config {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Whole-value integer parse
static bool parseInt(const std::string& value, int& out) {
    if (value.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

static bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) items.push_back(item);
        start = comma + 1;
    }
    return items;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ",";
        out += items[i];
    }
    return out;
}

// Supports DXWATCH_CONFIG for running several instances
std::string Settings::getDefaultPath() {
    const char* config_override = std::getenv("DXWATCH_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/dxwatch/settings.ini";
    }
    return "settings.ini";
}

// Helper to create directory if it doesn't exist
static void ensureDirectory(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos) {
        std::string dir = path.substr(0, pos);
        // Create parent directories recursively
        for (size_t i = 0; i < dir.size(); i++) {
            if (dir[i] == '/') {
                std::string subdir = dir.substr(0, i);
                if (!subdir.empty()) {
                    MKDIR(subdir.c_str());
                }
            }
        }
        MKDIR(dir.c_str());
    }
}

// Save settings to INI file
bool Settings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_APP(ERROR, "Cannot write settings to %s", filepath.c_str());
        return false;
    }

    file << "[Station]\n";
    file << "callsign=" << callsign << "\n";
    file << "grid=" << grid << "\n";

    file << "\n[Cluster]\n";
    file << "host=" << cluster_host << "\n";
    file << "port=" << cluster_port << "\n";
    file << "auto_connect=" << (auto_connect ? "1" : "0") << "\n";
    file << "login_commands=" << joinList(login_commands) << "\n";
    file << "reconnect_delay_s=" << reconnect_delay_s << "\n";
    file << "banner_lines=" << banner_lines << "\n";
    file << "banner_timeout_ms=" << banner_timeout_ms << "\n";

    file << "\n[Display]\n";
    file << "needed_spot_minutes=" << needed_spot_minutes << "\n";
    file << "regular_capacity=" << regular_capacity << "\n";
    file << "rebuild_interval_ms=" << rebuild_interval_ms << "\n";
    file << "grid_award_band=" << grid_award_band << "\n";
    file << "blocked_spotters=" << joinList(blocked_spotters) << "\n";
    file << "blocked_prefixes=" << joinList(blocked_prefixes) << "\n";

    file << "\n[Data]\n";
    file << "cty_file=" << cty_file << "\n";
    file << "dxcc_mapping_file=" << dxcc_mapping_file << "\n";
    file << "challenge_file=" << challenge_file << "\n";
    file << "ffma_file=" << ffma_file << "\n";
    file << "ffma_grids_file=" << ffma_grids_file << "\n";

    file << "\n[Logging]\n";
    file << "level=" << log_level << "\n";
    file << "file=" << log_file << "\n";

    if (!file) {
        LOG_APP(ERROR, "Write failed: %s", filepath.c_str());
        return false;
    }
    return true;
}

// Load settings from INI file
bool Settings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line[0] == '[') {
            size_t close = line.find(']');
            section = trim(line.substr(1, close == std::string::npos ? std::string::npos : close - 1));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Station settings
        if (section == "Station") {
            if (key == "callsign") {
                callsign = value;
            } else if (key == "grid") {
                grid = value;
            }
        }
        // Cluster connection
        else if (section == "Cluster") {
            if (key == "host") {
                cluster_host = value;
            } else if (key == "port") {
                int v = 0;
                if (parseInt(value, v) && v > 0 && v <= 65535) {
                    cluster_port = static_cast<uint16_t>(v);
                }
            } else if (key == "auto_connect") {
                auto_connect = parseBool(value);
            } else if (key == "login_commands") {
                login_commands = splitList(value);
            } else if (key == "reconnect_delay_s") {
                int v = 0;
                if (parseInt(value, v) && v >= 1) reconnect_delay_s = v;
            } else if (key == "banner_lines") {
                int v = 0;
                if (parseInt(value, v) && v >= 0) banner_lines = v;
            } else if (key == "banner_timeout_ms") {
                int v = 0;
                if (parseInt(value, v) && v >= 0) banner_timeout_ms = v;
            }
        }
        // Display / buffers
        else if (section == "Display") {
            if (key == "needed_spot_minutes") {
                int v = 0;
                if (parseInt(value, v)) setNeededSpotMinutes(v);
            } else if (key == "regular_capacity") {
                int v = 0;
                if (parseInt(value, v) && v >= 1) regular_capacity = v;
            } else if (key == "rebuild_interval_ms") {
                int v = 0;
                if (parseInt(value, v) && v >= 0) rebuild_interval_ms = v;
            } else if (key == "grid_award_band") {
                if (!value.empty()) grid_award_band = value;
            } else if (key == "blocked_spotters") {
                blocked_spotters = splitList(value);
            } else if (key == "blocked_prefixes") {
                blocked_prefixes = splitList(value);
            }
        }
        // Data files
        else if (section == "Data") {
            if (key == "cty_file") {
                cty_file = value;
            } else if (key == "dxcc_mapping_file") {
                dxcc_mapping_file = value;
            } else if (key == "challenge_file") {
                challenge_file = value;
            } else if (key == "ffma_file") {
                ffma_file = value;
            } else if (key == "ffma_grids_file") {
                ffma_grids_file = value;
            }
        }
        else if (section == "Logging") {
            if (key == "level") {
                log_level = value;
            } else if (key == "file") {
                log_file = value;
            }
        }
    }

    return true;
}

void Settings::setNeededSpotMinutes(int minutes) {
    needed_spot_minutes = std::clamp(minutes, 1, 1440);
}

cluster::ClusterLinkConfig Settings::clusterConfig() const {
    cluster::ClusterLinkConfig c;
    c.host = cluster_host;
    c.port = cluster_port;
    c.callsign = callsign;
    c.login_commands = login_commands;
    c.reconnect_delay = std::chrono::seconds(reconnect_delay_s);
    c.banner_lines = banner_lines;
    c.banner_timeout_ms = banner_timeout_ms;
    return c;
}

spots::SpotClassifierBuffer::Config Settings::bufferConfig() const {
    spots::SpotClassifierBuffer::Config c;
    c.regular_capacity = static_cast<size_t>(regular_capacity);
    c.needed_ttl = std::chrono::minutes(needed_spot_minutes);
    c.grid_award_band = grid_award_band;
    c.rebuild_interval = std::chrono::milliseconds(rebuild_interval_ms);
    return c;
}

spots::SpotFilter Settings::displayFilter() const {
    spots::SpotFilter f;
    f.blocked_spotters.insert(blocked_spotters.begin(), blocked_spotters.end());
    f.blocked_prefixes.insert(blocked_prefixes.begin(), blocked_prefixes.end());
    return f;
}

} // namespace config
} // namespace dxwatch
