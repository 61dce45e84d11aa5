// Cluster line protocol
//
// VE7CC-style clusters (after "set/ve7cc") send spots as CC11 records:
//   CC11^14025.0^K1ABC^18-Dec-2025^1953Z^CQ DX^W3LPL^...^K^FN42^...
// Fields are '^' separated, field 0 is the record tag. Plain text lines
// (command responses, bulletins, WWV table rows) are interleaved.

#pragma once

#include "dxwatch/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dxwatch {
namespace cluster {

// Why a line produced no spot/solar update
enum class IgnoreReason {
    Blank,
    Bulletin,      // WCY/WWV broadcasts, "To ..." routing notices
    NotSpot,       // plain text (command responses, banners)
    Malformed,     // delimited record with too few fields or bad numbers
    OtherRecord    // delimited record with a tag other than CC11
};

const char* ignoreReasonToString(IgnoreReason reason);

struct Ignored {
    IgnoreReason reason = IgnoreReason::NotSpot;
};

using ParsedLine = std::variant<Spot, SolarUpdate, Ignored>;

// CC11 field offsets
namespace cc11 {
constexpr size_t TAG = 0;
constexpr size_t FREQUENCY = 1;
constexpr size_t DX_CALL = 2;
constexpr size_t DATE = 3;
constexpr size_t TIME = 4;
constexpr size_t COMMENT = 5;
constexpr size_t SPOTTER = 6;
constexpr size_t DX_PREFIX = 16;
constexpr size_t DX_GRID = 18;
constexpr size_t MIN_FIELDS = 20;
} // namespace cc11

// Stateless line classifier
class LineParser {
public:
    static constexpr char DELIMITER = '^';
    static constexpr const char* SPOT_TAG = "CC11";
    static constexpr size_t MIN_SOLAR_LENGTH = 20;

    // Classify one newline-stripped line
    static ParsedLine parse(const std::string& line, TimePoint arrival = Clock::now());

    // WWV table row: "18-Dec-2025   18   138   6   2 No Storms -> No Storms   <VE7CC>"
    static std::optional<SolarUpdate> parseSolar(const std::string& line);

    // True if the line opens with a DD-Mon-YYYY style date token
    static bool isDateStamped(const std::string& line);

    // Split keeping empty fields
    static std::vector<std::string> split(const std::string& line, char delimiter);
};

// Splits a raw byte stream into lines. Accepts CR, LF or CRLF endings and
// strips telnet IAC negotiation sequences.
class LineAssembler {
public:
    static constexpr size_t MAX_LINE_LENGTH = 4096;

    LineAssembler() = default;

    std::vector<std::string> feed(const uint8_t* data, size_t len);
    std::vector<std::string> feed(const std::string& data);

    // Drop buffered partial line (e.g. on reconnect)
    void clear();

    bool hasPartial() const { return !buffer_.empty(); }

private:
    enum class TelnetState { Data, Iac, Option };

    std::string buffer_;
    TelnetState telnet_ = TelnetState::Data;
    bool last_was_cr_ = false;
};

} // namespace cluster
} // namespace dxwatch
