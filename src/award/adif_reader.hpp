// ADIF award-log import
//
// Records are <FIELD:len[:type]>value tags terminated by <EOR>; anything
// before <EOH> is header. Field names are case-insensitive.

#pragma once

#include "award_tracker.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dxwatch {
namespace award {

// One QSO: upper-cased field name -> value
using AdifRecord = std::map<std::string, std::string>;

// Multi-band award credits taken from a log
struct ChallengeSummary {
    std::set<EntityId> entities;
    std::set<AwardSlot> band_entity_pairs;
    std::map<std::string, size_t> entities_by_band;
    std::map<std::string, size_t> entities_by_mode;

    size_t totalEntities() const { return entities.size(); }
    size_t totalSlots() const { return band_entity_pairs.size(); }
};

struct GridImportOptions {
    std::string band = "6M";       // Only QSOs on this band count
    std::string home_grid;         // If set, QSOs made from elsewhere are skipped
};

class AdifReader {
public:
    static std::vector<AdifRecord> parse(const std::string& text);
    static bool readFile(const std::string& path, std::vector<AdifRecord>& records);

    // Records without a DXCC field are not credits and are skipped
    static ChallengeSummary challengeSummary(const std::vector<AdifRecord>& records);

    // VUCC_GRIDS wins over GRIDSQUARE. An empty eligible set accepts any grid.
    static WorkedGridMap workedGrids(const std::vector<AdifRecord>& records,
                                     const std::set<std::string>& eligible,
                                     const GridImportOptions& options = {});

    // "20241231" -> "2024-12-31"; other input is returned trimmed
    static std::string isoDate(const std::string& adif_date);

    // Write the files AwardTracker loads
    static bool saveChallengeSummary(const ChallengeSummary& summary, const std::string& path);
    static bool saveWorkedGrids(const WorkedGridMap& grids, const std::string& path,
                                const std::string& home_grid = "");

    // Convert for AwardTracker::setChallengeSlots
    static std::vector<std::pair<std::string, EntityId>> slotList(const ChallengeSummary& summary);
};

} // namespace award
} // namespace dxwatch
