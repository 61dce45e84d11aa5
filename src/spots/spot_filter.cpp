#include "spot_filter.hpp"

#include <algorithm>
#include <cctype>

namespace dxwatch {
namespace spots {

static std::string upperTrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    std::string result = s.substr(start, end - start + 1);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string SpotFilter::baseCall(const std::string& call) {
    std::string c = upperTrim(call);
    size_t dash = c.find('-');
    if (dash != std::string::npos) {
        c.resize(dash);
    }
    return c;
}

std::string SpotFilter::callPrefix(const std::string& call) {
    std::string c = upperTrim(call);
    std::string prefix;
    for (char ch : c) {
        if (!std::isalnum(static_cast<unsigned char>(ch))) break;
        prefix.push_back(ch);
    }
    return prefix;
}

SpotFilter SpotFilter::normalized() const {
    SpotFilter f;
    for (const auto& b : bands) {
        std::string u = upperTrim(b);
        if (!u.empty() && u != "ALL") f.bands.insert(u);
    }
    f.grid_prefix = upperTrim(grid_prefix);
    f.entity_prefix = upperTrim(entity_prefix);
    for (const auto& s : blocked_spotters) {
        std::string u = baseCall(s);
        if (!u.empty()) f.blocked_spotters.insert(u);
    }
    for (const auto& p : blocked_prefixes) {
        std::string u = callPrefix(p);
        if (!u.empty()) f.blocked_prefixes.insert(u);
    }
    return f;
}

bool SpotFilter::matches(const Spot& spot) const {
    if (!bands.empty() && bands.count(upperTrim(spot.band)) == 0) {
        return false;
    }
    if (!grid_prefix.empty() && upperTrim(spot.grid).rfind(grid_prefix, 0) != 0) {
        return false;
    }
    if (!entity_prefix.empty() && upperTrim(spot.prefix).find(entity_prefix) == std::string::npos) {
        return false;
    }
    if (!blocked_spotters.empty() && blocked_spotters.count(baseCall(spot.spotter))) {
        return false;
    }
    if (!blocked_prefixes.empty() && blocked_prefixes.count(callPrefix(spot.callsign))) {
        return false;
    }
    return true;
}

} // namespace spots
} // namespace dxwatch
