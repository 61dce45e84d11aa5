#pragma once

#include "dxwatch/types.hpp"

#include <set>
#include <string>

namespace dxwatch {
namespace spots {

// Display predicate. Empty fields pass everything.
struct SpotFilter {
    std::set<std::string> bands;              // "20M", "6M"; matched case-insensitively
    std::string grid_prefix;                  // grid must start with this
    std::string entity_prefix;                // substring of the cluster's entity prefix
    std::set<std::string> blocked_spotters;   // base calls
    std::set<std::string> blocked_prefixes;   // see callPrefix()

    bool matches(const Spot& spot) const;

    // Upper-cased copy with all sets and strings normalized
    SpotFilter normalized() const;

    // "W3LPL-2" -> "W3LPL", "dl1abc-#" -> "DL1ABC"
    static std::string baseCall(const std::string& call);

    // Leading alphanumerics of the call before any '/': "DL1ABC/P" -> "DL1ABC"
    static std::string callPrefix(const std::string& call);
};

} // namespace spots
} // namespace dxwatch
