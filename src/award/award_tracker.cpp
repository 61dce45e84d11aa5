#include "award_tracker.hpp"
#include "grid.hpp"
#include "dxwatch/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace dxwatch {
namespace award {

namespace {

bool readJson(const std::string& path, nlohmann::json& out, const char* what) {
    std::ifstream file(path);
    if (!file) {
        LOG_AWARD(WARN, "No %s file: %s", what, path.c_str());
        return false;
    }
    try {
        out = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        LOG_AWARD(ERROR, "Bad %s file %s: %s", what, path.c_str(), e.what());
        return false;
    }
    return true;
}

// Entity numbers show up both as JSON numbers and as strings
bool entityFromJson(const nlohmann::json& value, EntityId& out) {
    if (value.is_number_integer()) {
        out = value.get<EntityId>();
        return out > 0;
    }
    if (value.is_string()) {
        const std::string s = value.get<std::string>();
        char* end = nullptr;
        long v = std::strtol(s.c_str(), &end, 10);
        if (s.empty() || *end != '\0' || v <= 0) return false;
        out = static_cast<EntityId>(v);
        return true;
    }
    return false;
}

} // namespace

AwardTracker::AwardTracker() : snapshot_(std::make_shared<const Snapshot>()) {}

std::string AwardTracker::normalizeBand(const std::string& band) {
    size_t start = band.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = band.find_last_not_of(" \t");
    std::string b = band.substr(start, end - start + 1);
    std::transform(b.begin(), b.end(), b.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (b.back() != 'M') {
        b += 'M';
    }
    return b;
}

void AwardTracker::mergeWorkedGrid(WorkedGridMap& grids, const WorkedGrid& record) {
    std::string key = normalizeGrid(record.grid);
    if (key.empty()) return;

    auto it = grids.find(key);
    if (it == grids.end()) {
        WorkedGrid stored = record;
        stored.grid = key;
        grids.emplace(key, std::move(stored));
        return;
    }

    // ISO dates compare correctly as text
    const std::string& have = it->second.date;
    bool earlier = !record.date.empty() && (have.empty() || record.date < have);
    if (earlier) {
        it->second.call = record.call;
        it->second.date = record.date;
    }
}

void AwardTracker::setChallengeSlots(const std::vector<std::pair<std::string, EntityId>>& pairs) {
    std::set<AwardSlot> slots;
    for (const auto& [band, entity] : pairs) {
        std::string b = normalizeBand(band);
        if (b.empty() || entity <= 0) continue;
        slots.emplace(b, entity);
    }

    size_t count = slots.size();
    replace([&](Snapshot& s) {
        s.slots = std::move(slots);
        s.challenge_loaded = true;
    });
    LOG_AWARD(INFO, "Challenge: %zu band/entity slots", count);
}

void AwardTracker::setWorkedGrids(const std::vector<WorkedGrid>& records) {
    WorkedGridMap grids;
    for (const auto& r : records) {
        mergeWorkedGrid(grids, r);
    }

    size_t count = grids.size();
    replace([&](Snapshot& s) {
        s.worked_grids = std::move(grids);
        s.worked_loaded = true;
    });
    LOG_AWARD(INFO, "Grid award: %zu worked grids", count);
}

void AwardTracker::setEligibleGrids(const std::vector<std::string>& grids) {
    std::set<std::string> eligible;
    for (const auto& g : grids) {
        std::string key = normalizeGrid(g);
        if (!key.empty()) eligible.insert(key);
    }

    size_t count = eligible.size();
    replace([&](Snapshot& s) { s.eligible_grids = std::move(eligible); });
    LOG_AWARD(INFO, "Grid award: %zu eligible grids", count);
}

bool AwardTracker::loadChallengeFile(const std::string& path) {
    nlohmann::json j;
    if (!readJson(path, j, "challenge")) {
        replace([](Snapshot& s) {
            s.slots.clear();
            s.challenge_loaded = false;
        });
        return false;
    }

    std::vector<std::pair<std::string, EntityId>> pairs;
    size_t skipped = 0;
    if (j.is_object() && j.contains("raw_band_entity_pairs") &&
        j["raw_band_entity_pairs"].is_array()) {
        for (const auto& pair : j["raw_band_entity_pairs"]) {
            EntityId entity = 0;
            if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() ||
                !entityFromJson(pair[1], entity)) {
                skipped++;
                continue;
            }
            pairs.emplace_back(pair[0].get<std::string>(), entity);
        }
    } else {
        LOG_AWARD(WARN, "Challenge file %s has no raw_band_entity_pairs", path.c_str());
        replace([](Snapshot& s) {
            s.slots.clear();
            s.challenge_loaded = false;
        });
        return false;
    }

    if (skipped > 0) {
        LOG_AWARD(DEBUG, "Challenge: skipped %zu malformed pair(s)", skipped);
    }
    setChallengeSlots(pairs);
    return true;
}

bool AwardTracker::loadWorkedGridsFile(const std::string& path) {
    nlohmann::json j;
    if (!readJson(path, j, "grid award") || !j.is_object() ||
        !j.contains("worked_grids") || !j["worked_grids"].is_object()) {
        replace([](Snapshot& s) {
            s.worked_grids.clear();
            s.worked_loaded = false;
        });
        return false;
    }

    std::vector<WorkedGrid> records;
    for (auto it = j["worked_grids"].begin(); it != j["worked_grids"].end(); ++it) {
        WorkedGrid r;
        r.grid = it.key();
        if (it.value().is_object()) {
            r.call = it.value().value("call", "");
            r.date = it.value().value("date", "");
        }
        records.push_back(std::move(r));
    }

    setWorkedGrids(records);
    return true;
}

bool AwardTracker::loadEligibleGridsFile(const std::string& path) {
    nlohmann::json j;
    if (!readJson(path, j, "eligible grid") || !j.is_array()) {
        replace([](Snapshot& s) { s.eligible_grids.clear(); });
        return false;
    }

    std::vector<std::string> grids;
    for (const auto& g : j) {
        if (g.is_string()) grids.push_back(g.get<std::string>());
    }
    setEligibleGrids(grids);
    return true;
}

bool AwardTracker::isNeededMultiBand(EntityId entity, const std::string& band) const {
    auto snap = snapshot();
    if (!snap->challenge_loaded || snap->slots.empty()) {
        return false;
    }
    if (band.empty() || band == UNKNOWN_BAND) {
        return false;
    }
    return snap->slots.count(AwardSlot{normalizeBand(band), entity}) == 0;
}

bool AwardTracker::isNeededGrid(const std::string& grid) const {
    std::string key = normalizeGrid(grid);
    if (key.empty()) {
        return false;
    }

    auto snap = snapshot();
    if (!snap->worked_loaded) {
        return false;
    }
    return snap->eligible_grids.count(key) > 0 && snap->worked_grids.count(key) == 0;
}

bool AwardTracker::isWorked(EntityId entity, const std::string& band) const {
    auto snap = snapshot();
    return snap->slots.count(AwardSlot{normalizeBand(band), entity}) > 0;
}

bool AwardTracker::hasChallengeData() const {
    auto snap = snapshot();
    return snap->challenge_loaded && !snap->slots.empty();
}

bool AwardTracker::hasGridData() const {
    auto snap = snapshot();
    return snap->worked_loaded && !snap->eligible_grids.empty();
}

ChallengeStats AwardTracker::challengeStats() const {
    auto snap = snapshot();
    ChallengeStats stats;
    if (!snap->challenge_loaded || snap->slots.empty()) {
        return stats;
    }

    std::set<EntityId> entities;
    for (const auto& [band, entity] : snap->slots) {
        entities.insert(entity);
        stats.entities_by_band[band]++;
    }
    stats.loaded = true;
    stats.total_entities = entities.size();
    stats.total_slots = snap->slots.size();
    return stats;
}

GridAwardStats AwardTracker::gridStats() const {
    auto snap = snapshot();
    GridAwardStats stats;
    stats.loaded = snap->worked_loaded;
    stats.eligible = snap->eligible_grids.size();

    for (const auto& [grid, record] : snap->worked_grids) {
        if (stats.eligible == 0 || snap->eligible_grids.count(grid)) {
            stats.worked++;
        }
    }
    if (stats.eligible > 0) {
        stats.percent_complete = 100.0 * static_cast<double>(stats.worked) /
                                 static_cast<double>(stats.eligible);
    }
    return stats;
}

std::shared_ptr<const AwardTracker::Snapshot> AwardTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

} // namespace award
} // namespace dxwatch
