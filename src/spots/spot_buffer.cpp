#include "spot_buffer.hpp"
#include "dxwatch/logging.hpp"

#include <algorithm>
#include <cctype>

namespace dxwatch {
namespace spots {

static bool sameBand(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

SpotClassifierBuffer::SpotClassifierBuffer(const dxcc::EntityResolver& resolver,
                                           const award::AwardTracker& tracker,
                                           const Config& config,
                                           NowFn now)
    : resolver_(resolver)
    , tracker_(tracker)
    , config_(config)
    , now_(now ? std::move(now) : NowFn([] { return Clock::now(); }))
{}

ClassifiedSpot SpotClassifierBuffer::classify(const Spot& spot) const {
    ClassifiedSpot c;
    c.spot = spot;
    c.entity = resolver_.resolve(spot.prefix);

    if (c.entity) {
        c.needed_multi_band = tracker_.isNeededMultiBand(*c.entity, spot.band);
    }
    if (sameBand(spot.band, config_.grid_award_band)) {
        c.needed_grid = tracker_.isNeededGrid(spot.grid);
    }
    return c;
}

ClassifiedSpot SpotClassifierBuffer::add(const Spot& spot) {
    ClassifiedSpot c = classify(spot);
    c.spot.arrival = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.spots_added++;

    if (c.needed()) {
        auto before = needed_.size();
        needed_.erase(std::remove_if(needed_.begin(), needed_.end(),
                                     [&](const Spot& s) {
                                         return s.callsign == c.spot.callsign &&
                                                s.band == c.spot.band;
                                     }),
                      needed_.end());
        if (needed_.size() != before) {
            stats_.needed_replaced++;
        }

        needed_.push_front(c.spot);
        stats_.needed_added++;
        LOG_SPOTS(DEBUG, "Needed: %s %s %s%s%s", c.spot.callsign.c_str(),
                  c.spot.band.c_str(), c.spot.frequency.c_str(),
                  c.needed_multi_band ? " [band]" : "",
                  c.needed_grid ? " [grid]" : "");
    } else {
        regular_.push_front(c.spot);
        while (regular_.size() > config_.regular_capacity) {
            regular_.pop_back();
            stats_.regular_evicted++;
        }
    }

    return c;
}

void SpotClassifierBuffer::pruneExpired(TimePoint now) {
    // Called with mutex held
    auto ttl = config_.needed_ttl;
    auto before = needed_.size();
    needed_.erase(std::remove_if(needed_.begin(), needed_.end(),
                                 [&](const Spot& s) { return now - s.arrival > ttl; }),
                  needed_.end());
    size_t expired = before - needed_.size();
    if (expired > 0) {
        stats_.needed_expired += expired;
        LOG_SPOTS(TRACE, "Expired %zu needed spot(s)", expired);
    }
}

std::vector<ClassifiedSpot> SpotClassifierBuffer::classifyAll(const std::deque<Spot>& spots) const {
    std::vector<ClassifiedSpot> out;
    out.reserve(spots.size());
    for (const auto& s : spots) {
        out.push_back(classify(s));
    }
    return out;
}

std::vector<ClassifiedSpot> SpotClassifierBuffer::needed() {
    std::lock_guard<std::mutex> lock(mutex_);
    pruneExpired(now_());
    return classifyAll(needed_);
}

std::vector<ClassifiedSpot> SpotClassifierBuffer::regular() {
    std::lock_guard<std::mutex> lock(mutex_);
    return classifyAll(regular_);
}

std::vector<ClassifiedSpot> SpotClassifierBuffer::filtered(const SpotFilter& filter) {
    SpotFilter f = filter.normalized();

    std::lock_guard<std::mutex> lock(mutex_);
    pruneExpired(now_());

    std::vector<ClassifiedSpot> out;
    for (const auto* buffer : {&needed_, &regular_}) {
        for (const auto& s : *buffer) {
            if (f.matches(s)) {
                out.push_back(classify(s));
            }
        }
    }
    return out;
}

void SpotClassifierBuffer::setNeededTtl(std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.needed_ttl = ttl;
    LOG_SPOTS(INFO, "Needed spot TTL set to %lld s",
              static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(ttl).count()));
}

std::chrono::milliseconds SpotClassifierBuffer::neededTtl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.needed_ttl;
}

size_t SpotClassifierBuffer::neededCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    pruneExpired(now_());
    return needed_.size();
}

size_t SpotClassifierBuffer::regularCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return regular_.size();
}

void SpotClassifierBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    needed_.clear();
    regular_.clear();
}

void SpotClassifierBuffer::requestRebuild() {
    std::lock_guard<std::mutex> lock(mutex_);
    rebuild_pending_ = true;
    stats_.rebuild_requests++;
}

bool SpotClassifierBuffer::pollRebuild() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!rebuild_pending_) {
        return false;
    }

    TimePoint now = now_();
    if (last_rebuild_ && now - *last_rebuild_ < config_.rebuild_interval) {
        return false;
    }

    rebuild_pending_ = false;
    last_rebuild_ = now;
    stats_.rebuilds++;
    return true;
}

bool SpotClassifierBuffer::rebuildPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rebuild_pending_;
}

std::chrono::milliseconds SpotClassifierBuffer::timeUntilRebuild() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_rebuild_) {
        return std::chrono::milliseconds(0);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - *last_rebuild_);
    if (elapsed >= config_.rebuild_interval) {
        return std::chrono::milliseconds(0);
    }
    return config_.rebuild_interval - elapsed;
}

SpotClassifierBuffer::Stats SpotClassifierBuffer::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace spots
} // namespace dxwatch
