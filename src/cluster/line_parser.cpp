// Cluster line protocol implementation

#include "line_parser.hpp"
#include "dxwatch/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace dxwatch {
namespace cluster {

// Lines starting with these never carry spots
static const char* const NON_SPOT_PREFIXES[] = {"WCY", "WWV", "To "};

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

// Whole-token integer parse
static bool parseInt(const std::string& token, int& out) {
    if (token.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

const char* ignoreReasonToString(IgnoreReason reason) {
    switch (reason) {
        case IgnoreReason::Blank:       return "blank";
        case IgnoreReason::Bulletin:    return "bulletin";
        case IgnoreReason::NotSpot:     return "text";
        case IgnoreReason::Malformed:   return "malformed";
        case IgnoreReason::OtherRecord: return "other-record";
        default: return "unknown";
    }
}

std::vector<std::string> LineParser::split(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

bool LineParser::isDateStamped(const std::string& line) {
    std::istringstream iss(line);
    std::string first;
    if (!(iss >> first)) return false;

    // Look for a run of exactly four digits starting 19 or 20
    size_t i = 0;
    while (i < first.size()) {
        if (!std::isdigit(static_cast<unsigned char>(first[i]))) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < first.size() && std::isdigit(static_cast<unsigned char>(first[j]))) ++j;
        if (j - i == 4 && (first.compare(i, 2, "19") == 0 || first.compare(i, 2, "20") == 0)) {
            return true;
        }
        i = j;
    }
    return false;
}

std::optional<SolarUpdate> LineParser::parseSolar(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok && tokens.size() < 5) {
        tokens.push_back(tok);
    }
    if (tokens.size() < 5) return std::nullopt;

    SolarUpdate update;
    update.date = tokens[0];
    if (!parseInt(tokens[1], update.hour) ||
        !parseInt(tokens[2], update.sfi) ||
        !parseInt(tokens[3], update.a_index) ||
        !parseInt(tokens[4], update.k_index)) {
        return std::nullopt;
    }

    if (update.hour < 0 || update.hour > 23) return std::nullopt;
    if (update.sfi < 0 || update.sfi > 999) return std::nullopt;
    if (update.a_index < 0 || update.a_index > 400) return std::nullopt;
    if (update.k_index < 0 || update.k_index > 9) return std::nullopt;

    return update;
}

ParsedLine LineParser::parse(const std::string& raw, TimePoint arrival) {
    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (trim(line).empty()) {
        return Ignored{IgnoreReason::Blank};
    }

    for (const char* prefix : NON_SPOT_PREFIXES) {
        if (line.rfind(prefix, 0) == 0) {
            return Ignored{IgnoreReason::Bulletin};
        }
    }

    bool delimited = line.find(DELIMITER) != std::string::npos;

    if (!delimited && line.size() > MIN_SOLAR_LENGTH && isDateStamped(line)) {
        auto solar = parseSolar(line);
        if (solar) {
            return *solar;
        }
        LOG_PARSE(TRACE, "Unparsable solar row: %s", line.c_str());
        return Ignored{IgnoreReason::NotSpot};
    }

    if (!delimited) {
        return Ignored{IgnoreReason::NotSpot};
    }

    auto fields = split(line, DELIMITER);
    if (fields.size() < cc11::MIN_FIELDS) {
        LOG_PARSE(TRACE, "Short record (%zu fields)", fields.size());
        return Ignored{IgnoreReason::Malformed};
    }

    if (fields[cc11::TAG] != SPOT_TAG) {
        return Ignored{IgnoreReason::OtherRecord};
    }

    Spot spot;
    spot.frequency = trim(fields[cc11::FREQUENCY]);
    spot.callsign = toUpper(trim(fields[cc11::DX_CALL]));
    spot.time = trim(fields[cc11::TIME]);
    spot.comment = trim(fields[cc11::COMMENT]);
    spot.spotter = toUpper(trim(fields[cc11::SPOTTER]));
    spot.prefix = toUpper(trim(fields[cc11::DX_PREFIX]));
    spot.grid = trim(fields[cc11::DX_GRID]);
    if (spot.grid.size() > 6) {
        spot.grid.resize(6);
    }
    spot.band = bandForFrequency(spot.frequency);
    spot.arrival = arrival;

    if (spot.callsign.empty()) {
        return Ignored{IgnoreReason::Malformed};
    }

    return spot;
}

// LineAssembler

std::vector<std::string> LineAssembler::feed(const uint8_t* data, size_t len) {
    std::vector<std::string> lines;

    for (size_t i = 0; i < len; ++i) {
        uint8_t c = data[i];

        // Telnet negotiation: IAC cmd [option]
        switch (telnet_) {
            case TelnetState::Iac:
                if (c == 0xFF) {
                    telnet_ = TelnetState::Data;  // escaped 0xFF, drop it
                } else if (c >= 251 && c <= 254) {
                    telnet_ = TelnetState::Option;
                } else {
                    telnet_ = TelnetState::Data;
                }
                continue;
            case TelnetState::Option:
                telnet_ = TelnetState::Data;
                continue;
            case TelnetState::Data:
                break;
        }
        if (c == 0xFF) {
            telnet_ = TelnetState::Iac;
            continue;
        }

        if (c == '\r' || c == '\n') {
            // CRLF counts once
            if (c == '\n' && last_was_cr_) {
                last_was_cr_ = false;
                continue;
            }
            last_was_cr_ = (c == '\r');
            lines.push_back(std::move(buffer_));
            buffer_.clear();
            continue;
        }
        last_was_cr_ = false;

        if (c == '\0' || c == 0x07) {
            continue;  // NUL padding, BEL
        }

        if (buffer_.size() < MAX_LINE_LENGTH) {
            buffer_.push_back(static_cast<char>(c));
        }
    }

    return lines;
}

std::vector<std::string> LineAssembler::feed(const std::string& data) {
    return feed(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void LineAssembler::clear() {
    buffer_.clear();
    telnet_ = TelnetState::Data;
    last_was_cr_ = false;
}

} // namespace cluster
} // namespace dxwatch
