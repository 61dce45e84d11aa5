#include "grid.hpp"

#include <algorithm>
#include <cctype>

namespace dxwatch {
namespace award {

static bool isUpperAlpha(char c, char last) { return c >= 'A' && c <= last; }
static bool isLowerAlpha(char c, char last) { return c >= 'a' && c <= last; }
static bool isDigit(char c) { return c >= '0' && c <= '9'; }

std::string normalizeGrid(const std::string& grid) {
    size_t start = grid.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    std::string g = grid.substr(start);
    if (g.size() < 4) return "";
    g.resize(4);
    std::transform(g.begin(), g.end(), g.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return g;
}

bool validateGrid(const std::string& grid, std::string* error) {
    auto fail = [error](const char* why) {
        if (error) *error = why;
        return false;
    };

    if (grid.size() != 4 && grid.size() != 6) {
        return fail("Grid must be 4 or 6 characters");
    }
    if (!isUpperAlpha(grid[0], 'R') || !isUpperAlpha(grid[1], 'R')) {
        return fail("Field letters must be A-R");
    }
    if (!isDigit(grid[2]) || !isDigit(grid[3])) {
        return fail("Characters 3-4 must be digits");
    }
    if (grid.size() == 6 && (!isLowerAlpha(grid[4], 'x') || !isLowerAlpha(grid[5], 'x'))) {
        return fail("Subsquare letters must be a-x");
    }

    if (error) error->clear();
    return true;
}

std::optional<LatLon> gridToLatLon(const std::string& grid) {
    std::string g = grid;
    if (g.size() == 6) {
        g[4] = static_cast<char>(std::tolower(static_cast<unsigned char>(g[4])));
        g[5] = static_cast<char>(std::tolower(static_cast<unsigned char>(g[5])));
    }
    if (g.size() >= 2) {
        g[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(g[0])));
        g[1] = static_cast<char>(std::toupper(static_cast<unsigned char>(g[1])));
    }
    if (!validateGrid(g)) {
        return std::nullopt;
    }

    // South-west corner of field + square
    double lon = (g[0] - 'A') * 20.0 - 180.0 + (g[2] - '0') * 2.0;
    double lat = (g[1] - 'A') * 10.0 - 90.0 + (g[3] - '0') * 1.0;

    if (g.size() == 4) {
        lon += 1.0;
        lat += 0.5;
    } else {
        lon += (g[4] - 'a') * (2.0 / 24.0) + (1.0 / 24.0);
        lat += (g[5] - 'a') * (1.0 / 24.0) + (0.5 / 24.0);
    }

    return LatLon{lat, lon};
}

std::optional<std::string> latLonToGrid(double lat, double lon, int precision) {
    if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
        return std::nullopt;
    }
    if (precision != 4 && precision != 6) {
        return std::nullopt;
    }

    double adj_lat = lat + 90.0;
    double adj_lon = lon + 180.0;

    // The north pole and antimeridian fold into the last field
    int field_lon = std::min(17, static_cast<int>(adj_lon / 20.0));
    int field_lat = std::min(17, static_cast<int>(adj_lat / 10.0));
    int square_lon = std::min(9, static_cast<int>((adj_lon - field_lon * 20.0) / 2.0));
    int square_lat = std::min(9, static_cast<int>(adj_lat - field_lat * 10.0));

    std::string grid;
    grid += static_cast<char>('A' + field_lon);
    grid += static_cast<char>('A' + field_lat);
    grid += static_cast<char>('0' + square_lon);
    grid += static_cast<char>('0' + square_lat);

    if (precision == 6) {
        double rem_lon = adj_lon - field_lon * 20.0 - square_lon * 2.0;
        double rem_lat = adj_lat - field_lat * 10.0 - square_lat * 1.0;
        int sub_lon = std::clamp(static_cast<int>(rem_lon / (2.0 / 24.0)), 0, 23);
        int sub_lat = std::clamp(static_cast<int>(rem_lat / (1.0 / 24.0)), 0, 23);
        grid += static_cast<char>('a' + sub_lon);
        grid += static_cast<char>('a' + sub_lat);
    }

    return grid;
}

} // namespace award
} // namespace dxwatch
