#pragma once

#include "dxwatch/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dxwatch {
namespace award {

// (normalized band, entity) credited for the multi-band award
using AwardSlot = std::pair<std::string, EntityId>;

// First QSO in a grid square for the grid award
struct WorkedGrid {
    std::string grid;   // 4 chars, upper case
    std::string call;
    std::string date;   // YYYY-MM-DD, may be empty when the log had none
};

// Grid -> earliest QSO
using WorkedGridMap = std::map<std::string, WorkedGrid>;

struct ChallengeStats {
    bool loaded = false;
    size_t total_entities = 0;
    size_t total_slots = 0;
    std::map<std::string, size_t> entities_by_band;
};

struct GridAwardStats {
    bool loaded = false;
    size_t worked = 0;
    size_t eligible = 0;
    double percent_complete = 0.0;
};

/**
 * Award Tracker
 *
 * Two independent "already credited" sets: (band, entity) slots for the
 * multi-band award, and worked grids for the single-band grid award.
 * Every load replaces its set wholesale and publishes a new snapshot, so a
 * query never sees a half-loaded table.
 */
class AwardTracker {
public:
    struct Snapshot {
        std::set<AwardSlot> slots;
        bool challenge_loaded = false;

        WorkedGridMap worked_grids;
        bool worked_loaded = false;

        std::set<std::string> eligible_grids;
    };

    AwardTracker();

    // "20m" -> "20M", "6" -> "6M"
    static std::string normalizeBand(const std::string& band);

    // Keep whichever QSO is earlier; an empty date loses to any real date
    static void mergeWorkedGrid(WorkedGridMap& grids, const WorkedGrid& record);

    // Replace one data set
    void setChallengeSlots(const std::vector<std::pair<std::string, EntityId>>& pairs);
    void setWorkedGrids(const std::vector<WorkedGrid>& records);
    void setEligibleGrids(const std::vector<std::string>& grids);

    // JSON loaders; false (and the set left empty) on a missing or bad file
    bool loadChallengeFile(const std::string& path);     // {"raw_band_entity_pairs": [[band, id], ...]}
    bool loadWorkedGridsFile(const std::string& path);   // {"worked_grids": {grid: {call, date}}}
    bool loadEligibleGridsFile(const std::string& path); // ["FN42", ...]

    // Not needed when no award data is loaded, or the band is unknown
    bool isNeededMultiBand(EntityId entity, const std::string& band) const;

    // Needed only for an eligible grid that is not yet worked
    bool isNeededGrid(const std::string& grid) const;

    bool isWorked(EntityId entity, const std::string& band) const;
    bool hasChallengeData() const;
    bool hasGridData() const;

    ChallengeStats challengeStats() const;
    GridAwardStats gridStats() const;

    std::shared_ptr<const Snapshot> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;

    // Copy the current snapshot, let fn edit the copy, publish it
    template <typename F>
    void replace(F&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = std::make_shared<Snapshot>(*snapshot_);
        fn(*next);
        snapshot_ = std::move(next);
    }
};

} // namespace award
} // namespace dxwatch
