// Country/prefix table (cty.dat)
//
// Entity header line, at least 8 colon separated fields:
//   United States:  05:  08:  NA:  37.53:  91.67:  5.0:  K:
// followed by comma separated prefixes, terminated by ';':
//   AA,AB,AC,...,=W1AW(5)[8],K(5)[8],...;
// '=' marks an exact callsign, (cq) [itu] <lat/lon> {cont} ~tz~ override
// the header values for that prefix.

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace dxwatch {
namespace dxcc {

struct EntityRecord {
    std::string primary_prefix;   // "K", "IT9" ('*' WAE marker removed)
    std::string name;             // "United States"
    std::string continent;        // "NA"
    int cq_zone = 0;
    int itu_zone = 0;
    double latitude = 0.0;
    double longitude = 0.0;       // cty.dat convention: west positive
    double utc_offset = 0.0;
    bool wae_only = false;        // primary prefix carried a '*' marker
};

class CountryTable {
public:
    CountryTable() = default;

    // Parse the whole file. Returns false if missing or nothing parsed.
    bool loadFile(const std::string& path);

    // Parse text, replacing any previous contents. Returns true if at least
    // one prefix was loaded.
    bool parse(const std::string& text);

    void clear();

    // Exact key lookup, no shortening
    const EntityRecord* find(const std::string& prefix) const;

    // Full prefix first, then shorter leading substrings down to one char
    const EntityRecord* findLongest(const std::string& prefix) const;

    const std::vector<EntityRecord>& records() const { return records_; }
    size_t prefixCount() const { return prefixes_.size(); }
    size_t entityCount() const { return records_.size(); }
    bool empty() const { return prefixes_.empty(); }

    // Strip notation markers from one prefix token; returns "" for nothing
    // usable. exact is set when the token carried the '=' marker.
    static std::string cleanPrefix(const std::string& token, bool* exact = nullptr);

    // True for an entity header line
    static bool isHeaderLine(const std::string& line);

private:
    std::vector<EntityRecord> records_;
    std::unordered_map<std::string, size_t> prefixes_;   // prefix -> records_ index

    bool parseHeader(const std::string& line, EntityRecord& record) const;
};

} // namespace dxcc
} // namespace dxwatch
