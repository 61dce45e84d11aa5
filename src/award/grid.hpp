// Maidenhead locator helpers

#pragma once

#include <optional>
#include <string>

namespace dxwatch {
namespace award {

struct LatLon {
    double lat = 0.0;
    double lon = 0.0;
};

// First 4 characters, upper-cased; "" if shorter than 4
std::string normalizeGrid(const std::string& grid);

// Strict check: "FN42" or "FN42hn" (field A-R upper, subsquare a-x lower).
// error receives a short reason when invalid.
bool validateGrid(const std::string& grid, std::string* error = nullptr);

// Centre of a 4 or 6 character locator (case-insensitive)
std::optional<LatLon> gridToLatLon(const std::string& grid);

// precision is 4 or 6; nothing for out-of-range input
std::optional<std::string> latLonToGrid(double lat, double lon, int precision = 4);

} // namespace award
} // namespace dxwatch
