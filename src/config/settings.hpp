#pragma once

#include "cluster/cluster_link.hpp"
#include "spots/spot_buffer.hpp"
#include "spots/spot_filter.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dxwatch {
namespace config {

// Settings that persist across sessions
struct Settings {
    // Save/load to INI file. Unknown keys are ignored, bad numbers keep the default.
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // $DXWATCH_CONFIG, else ~/.config/dxwatch/settings.ini
    static std::string getDefaultPath();

    // Station
    std::string callsign = "N0CALL";
    std::string grid;                       // Home grid, filters the grid-award import

    // Cluster
    std::string cluster_host = "www.ve7cc.net";
    uint16_t cluster_port = 23;
    bool auto_connect = true;
    std::vector<std::string> login_commands = {
        "set/nofilter", "set/ve7cc", "set/skimmer", "set/nodedupe"
    };
    int reconnect_delay_s = 5;
    int banner_lines = 10;
    int banner_timeout_ms = 2000;

    // Display
    int needed_spot_minutes = 15;           // How long needed spots stay highlighted
    int regular_capacity = 500;
    int rebuild_interval_ms = 2000;
    std::string grid_award_band = "6m";
    std::vector<std::string> blocked_spotters;
    std::vector<std::string> blocked_prefixes;

    // Data files
    std::string cty_file = "cty.dat";
    std::string dxcc_mapping_file = "dxcc_mapping.json";
    std::string challenge_file = "challenge_data.json";
    std::string ffma_file = "ffma_data.json";
    std::string ffma_grids_file = "ffma_grids.json";

    // Logging
    std::string log_level = "INFO";
    std::string log_file;

    // Runtime views
    cluster::ClusterLinkConfig clusterConfig() const;
    spots::SpotClassifierBuffer::Config bufferConfig() const;
    spots::SpotFilter displayFilter() const;

    // Clamps to 1..1440 minutes
    void setNeededSpotMinutes(int minutes);
};

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> splitList(const std::string& value);
std::string joinList(const std::vector<std::string>& items);

} // namespace config
} // namespace dxwatch
