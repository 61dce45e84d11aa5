#include "entity_resolver.hpp"
#include "dxwatch/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>

namespace dxwatch {
namespace dxcc {

namespace {

struct NameOverride {
    EntityId id;
    const char* country;   // spelling used by the country table
};

// Names the two tables spell too differently for the generic match
const NameOverride NAME_OVERRIDES[] = {
    {291, "United States"},
    {110, "Hawaii"},
    {6,   "Alaska"},
    {248, "Italy"},
    {248, "Sicily"},
    {223, "England"},
    {279, "Scotland"},
    {294, "Wales"},
    {265, "Northern Ireland"},
    {105, "Guantanamo Bay"},
    {202, "Puerto Rico"},
    {285, "US Virgin Islands"},
    {285, "Virgin Islands"},
    {54,  "European Russia"},
    {15,  "Asiatic Russia"},
    {126, "Kaliningrad"},
};

std::string toUpper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

EntityResolver::EntityResolver() : snapshot_(std::make_shared<const Snapshot>()) {}

std::string EntityResolver::normalizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool pending_space = false;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::vector<std::string> EntityResolver::nameTokens(const std::string& name) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (current.size() > 2 &&
            std::find(tokens.begin(), tokens.end(), current) == tokens.end()) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

double EntityResolver::tokenOverlapRatio(const std::string& a, const std::string& b) {
    auto ta = nameTokens(a);
    auto tb = nameTokens(b);
    if (ta.empty() || tb.empty()) {
        return 0.0;
    }

    size_t common = 0;
    for (const auto& t : ta) {
        if (std::find(tb.begin(), tb.end(), t) != tb.end()) {
            common++;
        }
    }
    return static_cast<double>(common) / static_cast<double>(std::max(ta.size(), tb.size()));
}

std::optional<EntityId> EntityResolver::matchCountryName(const std::string& country,
                                                         const EntityNameMap& entity_names,
                                                         bool* fuzzy) {
    if (fuzzy) *fuzzy = false;

    std::string wanted = normalizeName(country);
    if (wanted.empty()) {
        return std::nullopt;
    }

    for (const auto& o : NAME_OVERRIDES) {
        if (normalizeName(o.country) == wanted) {
            return o.id;
        }
    }

    for (const auto& [id, name] : entity_names) {
        if (normalizeName(name) == wanted) {
            return id;
        }
    }

    // Ties keep the lowest entity number
    std::optional<EntityId> best;
    double best_ratio = 0.0;
    for (const auto& [id, name] : entity_names) {
        double ratio = tokenOverlapRatio(wanted, name);
        if (ratio > best_ratio) {
            best_ratio = ratio;
            best = id;
        }
    }
    if (best && best_ratio >= FUZZY_THRESHOLD) {
        if (fuzzy) *fuzzy = true;
        return best;
    }
    return std::nullopt;
}

bool EntityResolver::loadEntityNames(const std::string& path, EntityNameMap& out) {
    out.clear();

    std::ifstream file(path);
    if (!file) {
        LOG_DXCC(WARN, "Entity map not found: %s", path.c_str());
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            LOG_DXCC(WARN, "Entity map %s: expected an object", path.c_str());
            return false;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            char* end = nullptr;
            long id = std::strtol(key.c_str(), &end, 10);
            if (key.empty() || *end != '\0' || id <= 0 || !it.value().is_string()) {
                LOG_DXCC(DEBUG, "Entity map: skipping entry '%s'", key.c_str());
                continue;
            }
            out[static_cast<EntityId>(id)] = it.value().get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_DXCC(ERROR, "Entity map %s: %s", path.c_str(), e.what());
        out.clear();
        return false;
    }

    if (out.empty()) {
        LOG_DXCC(WARN, "Entity map %s is empty", path.c_str());
        return false;
    }
    return true;
}

void EntityResolver::mapCountries(Snapshot& snap) {
    std::set<std::string> countries;
    for (const auto& record : snap.table.records()) {
        countries.insert(record.name);
    }

    for (const auto& country : countries) {
        bool fuzzy = false;
        auto id = matchCountryName(country, snap.entity_names, &fuzzy);
        if (!id) {
            snap.unmapped++;
            LOG_DXCC(TRACE, "No entity for country '%s'", country.c_str());
            continue;
        }
        snap.country_to_entity[country] = *id;
        if (fuzzy) {
            snap.fuzzy_matches++;
            auto name = snap.entity_names.find(*id);
            LOG_DXCC(DEBUG, "Fuzzy match: %s -> %d (%s)", country.c_str(), *id,
                     name != snap.entity_names.end() ? name->second.c_str() : "?");
        }
    }

    LOG_DXCC(INFO, "Mapped %zu of %zu countries to entities (%zu fuzzy)",
             snap.country_to_entity.size(), countries.size(), snap.fuzzy_matches);
}

bool EntityResolver::initialize(const std::string& cty_path, const std::string& mapping_path) {
    auto snap = std::make_shared<Snapshot>();

    if (!snap->table.loadFile(cty_path) ||
        !loadEntityNames(mapping_path, snap->entity_names)) {
        LOG_DXCC(WARN, "Entity lookup disabled, no spot will resolve");
        publish(std::make_shared<const Snapshot>());
        return false;
    }

    mapCountries(*snap);
    if (!snap->loaded()) {
        publish(std::make_shared<const Snapshot>());
        return false;
    }
    publish(std::move(snap));
    return true;
}

bool EntityResolver::build(const std::string& cty_text, const EntityNameMap& entity_names) {
    auto snap = std::make_shared<Snapshot>();
    if (!snap->table.parse(cty_text) || entity_names.empty()) {
        publish(std::make_shared<const Snapshot>());
        return false;
    }

    snap->entity_names = entity_names;
    mapCountries(*snap);
    if (!snap->loaded()) {
        publish(std::make_shared<const Snapshot>());
        return false;
    }
    publish(std::move(snap));
    return true;
}

void EntityResolver::publish(std::shared_ptr<const Snapshot> snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = std::move(snapshot);
}

std::shared_ptr<const EntityResolver::Snapshot> EntityResolver::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

bool EntityResolver::isLoaded() const {
    return snapshot()->loaded();
}

std::optional<EntityRecord> EntityResolver::recordFor(const std::string& prefix) const {
    auto snap = snapshot();
    const EntityRecord* record = snap->table.findLongest(prefix);
    if (!record) return std::nullopt;
    return *record;
}

std::optional<std::string> EntityResolver::countryFor(const std::string& prefix) const {
    auto snap = snapshot();
    const EntityRecord* record = snap->table.findLongest(prefix);
    if (!record) return std::nullopt;
    return record->name;
}

std::optional<EntityId> EntityResolver::resolve(const std::string& prefix) const {
    auto snap = snapshot();
    if (!snap->loaded()) {
        return std::nullopt;
    }

    const EntityRecord* record = snap->table.findLongest(toUpper(prefix));
    if (!record) {
        return std::nullopt;
    }

    auto it = snap->country_to_entity.find(record->name);
    if (it == snap->country_to_entity.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> EntityResolver::entityName(EntityId id) const {
    auto snap = snapshot();
    auto it = snap->entity_names.find(id);
    if (it == snap->entity_names.end()) return std::nullopt;
    return it->second;
}

} // namespace dxcc
} // namespace dxwatch
