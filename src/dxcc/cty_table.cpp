#include "cty_table.hpp"
#include "dxwatch/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace dxwatch {
namespace dxcc {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string toUpper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool CountryTable::loadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_DXCC(WARN, "Country table not found: %s", path.c_str());
        clear();
        return false;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (!parse(ss.str())) {
        LOG_DXCC(WARN, "No prefixes parsed from %s", path.c_str());
        return false;
    }

    LOG_DXCC(INFO, "Loaded %zu prefixes for %zu entities from %s",
             prefixes_.size(), records_.size(), path.c_str());
    return true;
}

void CountryTable::clear() {
    records_.clear();
    prefixes_.clear();
}

bool CountryTable::isHeaderLine(const std::string& line) {
    std::string t = trim(line);
    if (t.empty() || t.back() != ':') return false;
    return std::count(t.begin(), t.end(), ':') >= 7;
}

bool CountryTable::parseHeader(const std::string& line, EntityRecord& record) const {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(trim(line));
    while (std::getline(iss, part, ':')) {
        parts.push_back(trim(part));
    }
    if (parts.size() < 8 || parts[0].empty()) {
        return false;
    }

    record = EntityRecord{};
    record.name = parts[0];
    record.cq_zone = std::atoi(parts[1].c_str());
    record.itu_zone = std::atoi(parts[2].c_str());
    record.continent = parts[3];
    record.latitude = std::atof(parts[4].c_str());
    record.longitude = std::atof(parts[5].c_str());
    record.utc_offset = std::atof(parts[6].c_str());

    std::string primary = parts[7];
    if (!primary.empty() && primary[0] == '*') {
        record.wae_only = true;
        primary.erase(0, 1);
    }
    record.primary_prefix = toUpper(primary);
    return true;
}

std::string CountryTable::cleanPrefix(const std::string& token, bool* exact) {
    std::string t = trim(token);
    if (exact) *exact = false;

    if (!t.empty() && t[0] == '=') {
        if (exact) *exact = true;
        t.erase(0, 1);
    }

    // Bracketed alternate ("[XX]"), unwrap before looking for overrides
    if (!t.empty() && t[0] == '[') {
        t.erase(0, 1);
        size_t close = t.find(']');
        if (close != std::string::npos) {
            t.erase(close, 1);
        }
    }

    // Everything from the first override marker on is per-prefix metadata
    size_t cut = t.find_first_of("([<{~");
    if (cut != std::string::npos) {
        t.resize(cut);
    }

    return toUpper(trim(t));
}

bool CountryTable::parse(const std::string& text) {
    clear();

    std::istringstream iss(text);
    std::string line;
    bool have_entity = false;
    size_t skipped_headers = 0;

    while (std::getline(iss, line)) {
        std::string t = trim(line);
        if (t.empty()) continue;

        if (isHeaderLine(t)) {
            EntityRecord record;
            if (parseHeader(t, record)) {
                records_.push_back(std::move(record));
                have_entity = true;
            } else {
                have_entity = false;
                skipped_headers++;
            }
            continue;
        }

        if (!have_entity) continue;

        // Prefix continuation line
        if (t.back() == ';') {
            t.pop_back();
        }

        size_t index = records_.size() - 1;
        std::istringstream tokens(t);
        std::string token;
        while (std::getline(tokens, token, ',')) {
            std::string prefix = cleanPrefix(token);
            if (prefix.empty()) continue;
            prefixes_[prefix] = index;   // last write wins
        }
    }

    if (skipped_headers > 0) {
        LOG_DXCC(DEBUG, "Skipped %zu malformed header line(s)", skipped_headers);
    }

    return !prefixes_.empty();
}

const EntityRecord* CountryTable::find(const std::string& prefix) const {
    auto it = prefixes_.find(prefix);
    if (it == prefixes_.end()) return nullptr;
    return &records_[it->second];
}

const EntityRecord* CountryTable::findLongest(const std::string& prefix) const {
    std::string key = toUpper(trim(prefix));
    for (size_t len = key.size(); len > 0; --len) {
        if (const EntityRecord* record = find(key.substr(0, len))) {
            return record;
        }
    }
    return nullptr;
}

} // namespace dxcc
} // namespace dxwatch
