#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace dxwatch {

// Core types
using Clock = std::chrono::steady_clock;      // Monotonic time for buffering/TTL
using TimePoint = Clock::time_point;
using EntityId = int;                          // DXCC entity number (e.g. 291 = USA)

// Band label used when a frequency falls outside every band plan range
constexpr const char* UNKNOWN_BAND = "?";

// One reported observation of a station on the air
struct Spot {
    std::string time;          // Time of day as sent by the cluster ("1953Z")
    std::string band;          // Band label from the band plan ("20m") or UNKNOWN_BAND
    std::string frequency;     // kHz, verbatim text
    std::string callsign;      // DX station
    std::string prefix;        // Entity prefix as reported by the cluster
    std::string grid;          // Maidenhead grid, 0-6 chars
    std::string spotter;
    std::string comment;
    TimePoint arrival{};       // When the line was received
};

// Solar/geomagnetic indices from a cluster WWV table row
struct SolarUpdate {
    std::string date;          // "18-Dec-2025"
    int hour = 0;              // UTC hour of the report
    int sfi = 0;               // Solar flux index
    int a_index = 0;           // Geomagnetic A-index
    int k_index = 0;           // Geomagnetic K-index
};

// ARRL band plan, kHz (inclusive bounds)
struct BandRange {
    double low_khz;
    double high_khz;
    const char* label;
};

constexpr std::array<BandRange, 11> BAND_PLAN = {{
    {1800.0,  2000.0,  "160m"},
    {3500.0,  4000.0,  "80m"},
    {5000.0,  5450.0,  "60m"},
    {7000.0,  7300.0,  "40m"},
    {10100.0, 10150.0, "30m"},
    {14000.0, 14350.0, "20m"},
    {18068.0, 18168.0, "17m"},
    {21000.0, 21450.0, "15m"},
    {24890.0, 24990.0, "12m"},
    {28000.0, 29700.0, "10m"},
    {50000.0, 54000.0, "6m"},
}};

// Map a frequency in kHz to its band label
inline std::string bandForFrequency(double khz) {
    for (const auto& range : BAND_PLAN) {
        if (khz >= range.low_khz && khz <= range.high_khz) {
            return range.label;
        }
    }
    return UNKNOWN_BAND;
}

// Text variant; non-numeric input maps to UNKNOWN_BAND
inline std::string bandForFrequency(const std::string& khz_text) {
    if (khz_text.empty()) return UNKNOWN_BAND;
    char* end = nullptr;
    double khz = std::strtod(khz_text.c_str(), &end);
    if (end == khz_text.c_str()) return UNKNOWN_BAND;
    while (*end == ' ' || *end == '\t') ++end;
    if (*end != '\0') return UNKNOWN_BAND;
    return bandForFrequency(khz);
}

} // namespace dxwatch
