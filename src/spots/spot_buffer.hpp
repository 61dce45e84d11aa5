// spot_buffer.hpp - Needed/regular spot buffers for display
//
// Each incoming spot is classified against the award tables:
//   needed  -> needed buffer, newest first, one entry per (callsign, band),
//              dropped once older than the needed TTL
//   regular -> regular buffer, newest first, bounded by count
//
// Usage:
//   1. add(spot) for every parsed spot, in arrival order
//   2. requestRebuild() after add() or a filter change
//   3. if (pollRebuild()) redraw from filtered(filter)

#pragma once

#include "spot_filter.hpp"
#include "dxcc/entity_resolver.hpp"
#include "award/award_tracker.hpp"
#include "dxwatch/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dxwatch {
namespace spots {

// A spot plus its award flags. Flags are computed when read, never stored.
struct ClassifiedSpot {
    Spot spot;
    std::optional<EntityId> entity;
    bool needed_multi_band = false;
    bool needed_grid = false;

    bool needed() const { return needed_multi_band || needed_grid; }
};

class SpotClassifierBuffer {
public:
    using NowFn = std::function<TimePoint()>;

    struct Config {
        size_t regular_capacity;
        std::chrono::milliseconds needed_ttl;
        std::string grid_award_band;           // Only band the grid award counts
        std::chrono::milliseconds rebuild_interval;

        Config()
            : regular_capacity(500)
            , needed_ttl(std::chrono::minutes(15))
            , grid_award_band("6m")
            , rebuild_interval(2000)
        {}
    };

    SpotClassifierBuffer(const dxcc::EntityResolver& resolver,
                         const award::AwardTracker& tracker,
                         const Config& config = Config(),
                         NowFn now = nullptr);

    // Non-copyable
    SpotClassifierBuffer(const SpotClassifierBuffer&) = delete;
    SpotClassifierBuffer& operator=(const SpotClassifierBuffer&) = delete;

    // Classify against the current award snapshots without storing
    ClassifiedSpot classify(const Spot& spot) const;

    // Classify, stamp arrival with the buffer clock, and store
    ClassifiedSpot add(const Spot& spot);

    // Needed buffer after TTL eviction, newest first
    std::vector<ClassifiedSpot> needed();

    // Regular buffer, newest first
    std::vector<ClassifiedSpot> regular();

    // Needed spots first, then regular, each passing the filter
    std::vector<ClassifiedSpot> filtered(const SpotFilter& filter);

    // Takes effect on the next read; stored arrival times are untouched
    void setNeededTtl(std::chrono::milliseconds ttl);
    std::chrono::milliseconds neededTtl() const;

    size_t neededCount();
    size_t regularCount() const;
    void clear();

    // Rebuild throttling. Requests inside one interval collapse into a single
    // rebuild at the next allowed tick; a pending request is never lost.
    void requestRebuild();
    bool pollRebuild();
    bool rebuildPending() const;

    // Time until pollRebuild() can next return true (zero if due now)
    std::chrono::milliseconds timeUntilRebuild() const;

    struct Stats {
        uint64_t spots_added = 0;
        uint64_t needed_added = 0;
        uint64_t needed_replaced = 0;   // Same (callsign, band) already buffered
        uint64_t needed_expired = 0;
        uint64_t regular_evicted = 0;
        uint64_t rebuild_requests = 0;
        uint64_t rebuilds = 0;
    };

    Stats getStats() const;

private:
    const dxcc::EntityResolver& resolver_;
    const award::AwardTracker& tracker_;
    Config config_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::deque<Spot> needed_;
    std::deque<Spot> regular_;

    bool rebuild_pending_ = false;
    std::optional<TimePoint> last_rebuild_;

    Stats stats_;

    // Caller holds mutex
    void pruneExpired(TimePoint now);
    std::vector<ClassifiedSpot> classifyAll(const std::deque<Spot>& spots) const;
};

} // namespace spots
} // namespace dxwatch
