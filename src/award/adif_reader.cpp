#include "adif_reader.hpp"
#include "grid.hpp"
#include "dxwatch/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace dxwatch {
namespace award {

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

static std::string fieldOf(const AdifRecord& record, const char* name) {
    auto it = record.find(name);
    return it == record.end() ? std::string() : it->second;
}

std::vector<AdifRecord> AdifReader::parse(const std::string& text) {
    std::vector<AdifRecord> records;
    AdifRecord current;
    size_t pos = 0;

    while (true) {
        size_t open = text.find('<', pos);
        if (open == std::string::npos) break;
        size_t close = text.find('>', open + 1);
        if (close == std::string::npos) break;

        std::string tag = toUpper(trim(text.substr(open + 1, close - open - 1)));
        pos = close + 1;

        if (tag == "EOR") {
            if (!current.empty()) {
                records.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        if (tag == "EOH") {
            current.clear();
            continue;
        }

        // NAME:LENGTH[:TYPE]
        size_t colon = tag.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = tag.substr(0, colon);
        std::string len_text = tag.substr(colon + 1);
        size_t type_colon = len_text.find(':');
        if (type_colon != std::string::npos) {
            len_text.resize(type_colon);
        }

        char* end = nullptr;
        long len = std::strtol(len_text.c_str(), &end, 10);
        if (name.empty() || len_text.empty() || *end != '\0' || len < 0) {
            continue;
        }

        size_t n = std::min(static_cast<size_t>(len), text.size() - pos);
        current[name] = trim(text.substr(pos, n));
        pos += n;
    }

    // Trailing record without <EOR> is incomplete and dropped
    return records;
}

bool AdifReader::readFile(const std::string& path, std::vector<AdifRecord>& records) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_AWARD(ERROR, "ADIF file not found: %s", path.c_str());
        return false;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    records = parse(ss.str());
    LOG_AWARD(INFO, "Read %zu ADIF records from %s", records.size(), path.c_str());
    return true;
}

std::string AdifReader::isoDate(const std::string& adif_date) {
    std::string d = trim(adif_date);
    if (d.size() != 8 || !std::all_of(d.begin(), d.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return d;
    }
    return d.substr(0, 4) + "-" + d.substr(4, 2) + "-" + d.substr(6, 2);
}

ChallengeSummary AdifReader::challengeSummary(const std::vector<AdifRecord>& records) {
    ChallengeSummary summary;
    std::map<std::string, std::set<EntityId>> by_band;
    std::map<std::string, std::set<EntityId>> by_mode;

    for (const auto& record : records) {
        std::string dxcc = fieldOf(record, "DXCC");
        char* end = nullptr;
        long id = std::strtol(dxcc.c_str(), &end, 10);
        if (dxcc.empty() || *end != '\0' || id <= 0) {
            continue;
        }
        EntityId entity = static_cast<EntityId>(id);
        summary.entities.insert(entity);

        std::string band = fieldOf(record, "BAND");
        if (!band.empty()) {
            std::string b = AwardTracker::normalizeBand(band);
            summary.band_entity_pairs.emplace(b, entity);
            by_band[b].insert(entity);
        }

        std::string mode = toUpper(fieldOf(record, "MODE"));
        if (!mode.empty()) {
            by_mode[mode].insert(entity);
        }
    }

    for (const auto& [band, set] : by_band) summary.entities_by_band[band] = set.size();
    for (const auto& [mode, set] : by_mode) summary.entities_by_mode[mode] = set.size();

    LOG_AWARD(INFO, "Challenge import: %zu entities, %zu slots",
              summary.totalEntities(), summary.totalSlots());
    return summary;
}

WorkedGridMap AdifReader::workedGrids(const std::vector<AdifRecord>& records,
                                      const std::set<std::string>& eligible,
                                      const GridImportOptions& options) {
    WorkedGridMap grids;
    std::string band = AwardTracker::normalizeBand(options.band);
    std::string home = normalizeGrid(options.home_grid);
    size_t other_home = 0;

    if (eligible.empty()) {
        LOG_AWARD(WARN, "No eligible grid list, accepting every grid");
    }

    for (const auto& record : records) {
        if (AwardTracker::normalizeBand(fieldOf(record, "BAND")) != band) {
            continue;
        }

        std::string my_grid = normalizeGrid(fieldOf(record, "MY_GRIDSQUARE"));
        if (!home.empty() && !my_grid.empty() && my_grid != home) {
            other_home++;
            continue;
        }

        WorkedGrid qso;
        qso.call = toUpper(fieldOf(record, "CALL"));
        qso.date = isoDate(fieldOf(record, "QSO_DATE"));

        // Rover/line contacts list every grid in VUCC_GRIDS
        std::vector<std::string> candidates;
        std::string vucc = fieldOf(record, "VUCC_GRIDS");
        if (!vucc.empty()) {
            std::istringstream iss(vucc);
            std::string g;
            while (std::getline(iss, g, ',')) {
                candidates.push_back(g);
            }
        } else {
            candidates.push_back(fieldOf(record, "GRIDSQUARE"));
        }

        for (const auto& g : candidates) {
            std::string key = normalizeGrid(g);
            if (key.empty()) continue;
            if (!eligible.empty() && eligible.count(key) == 0) continue;
            qso.grid = key;
            AwardTracker::mergeWorkedGrid(grids, qso);
        }
    }

    if (other_home > 0) {
        LOG_AWARD(INFO, "Skipped %zu QSO(s) not made from %s", other_home, home.c_str());
    }
    LOG_AWARD(INFO, "Grid import: %zu grids worked on %s", grids.size(), band.c_str());
    return grids;
}

std::vector<std::pair<std::string, EntityId>> AdifReader::slotList(const ChallengeSummary& summary) {
    return std::vector<std::pair<std::string, EntityId>>(summary.band_entity_pairs.begin(),
                                                          summary.band_entity_pairs.end());
}

static bool writeJson(const nlohmann::json& j, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        LOG_AWARD(ERROR, "Cannot write %s", path.c_str());
        return false;
    }
    file << j.dump(2) << "\n";
    if (!file) {
        LOG_AWARD(ERROR, "Write failed: %s", path.c_str());
        return false;
    }
    return true;
}

bool AdifReader::saveChallengeSummary(const ChallengeSummary& summary, const std::string& path) {
    nlohmann::json j;
    j["total_entities"] = summary.totalEntities();
    j["total_challenge_slots"] = summary.totalSlots();
    j["entities_by_band"] = summary.entities_by_band;
    j["entities_by_mode"] = summary.entities_by_mode;

    nlohmann::json entities = nlohmann::json::array();
    for (EntityId id : summary.entities) {
        entities.push_back(std::to_string(id));
    }
    j["raw_entity_set"] = entities;

    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& [band, id] : summary.band_entity_pairs) {
        pairs.push_back(nlohmann::json::array({band, std::to_string(id)}));
    }
    j["raw_band_entity_pairs"] = pairs;

    return writeJson(j, path);
}

bool AdifReader::saveWorkedGrids(const WorkedGridMap& grids, const std::string& path,
                                 const std::string& home_grid) {
    nlohmann::json worked = nlohmann::json::object();
    for (const auto& [grid, record] : grids) {
        worked[grid] = {{"call", record.call}, {"date", record.date}};
    }

    nlohmann::json j;
    j["worked_grids"] = worked;
    j["total_worked"] = grids.size();
    if (!home_grid.empty()) {
        j["home_grid"] = normalizeGrid(home_grid);
    }
    return writeJson(j, path);
}

} // namespace award
} // namespace dxwatch
