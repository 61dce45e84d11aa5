#pragma once

#include "cty_table.hpp"
#include "dxwatch/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dxwatch {
namespace dxcc {

// Entity number -> award-table country name ("291" -> "UNITED STATES OF AMERICA")
using EntityNameMap = std::map<EntityId, std::string>;

/**
 * Entity Resolver
 *
 * Maps an on-air prefix ("IT9") to a DXCC entity number. The country table
 * gives prefix -> country name, the entity map gives number -> name in the
 * award data's own spelling. The two name sets are joined by:
 *   1. a fixed override list keyed by entity number
 *   2. exact match after case/whitespace normalization
 *   3. best token overlap (words longer than 2 chars) >= FUZZY_THRESHOLD
 *
 * Tables are built off to the side and published as one immutable snapshot.
 * Lookups never throw and never block on a rebuild.
 */
class EntityResolver {
public:
    static constexpr double FUZZY_THRESHOLD = 0.6;

    struct Snapshot {
        CountryTable table;
        std::unordered_map<std::string, EntityId> country_to_entity;  // table name -> id
        EntityNameMap entity_names;
        size_t fuzzy_matches = 0;
        size_t unmapped = 0;

        bool loaded() const { return !table.empty() && !country_to_entity.empty(); }
    };

    EntityResolver();

    // Load both files and publish. On any failure an empty snapshot is
    // published and every lookup answers nothing.
    bool initialize(const std::string& cty_path, const std::string& mapping_path);

    // Same, from in-memory sources
    bool build(const std::string& cty_text, const EntityNameMap& entity_names);

    // Read the {"<id>": "<name>", ...} entity map
    static bool loadEntityNames(const std::string& path, EntityNameMap& out);

    // Lookups, all with progressive prefix shortening
    std::optional<EntityId> resolve(const std::string& prefix) const;
    std::optional<EntityRecord> recordFor(const std::string& prefix) const;
    std::optional<std::string> countryFor(const std::string& prefix) const;

    std::optional<std::string> entityName(EntityId id) const;

    bool isLoaded() const;
    std::shared_ptr<const Snapshot> snapshot() const;

    // Name matching helpers
    static std::string normalizeName(const std::string& name);
    static std::vector<std::string> nameTokens(const std::string& name);
    static double tokenOverlapRatio(const std::string& a, const std::string& b);

    // Best entity for one country-table name, or nothing. fuzzy is set when
    // the answer came from token overlap.
    static std::optional<EntityId> matchCountryName(const std::string& country,
                                                    const EntityNameMap& entity_names,
                                                    bool* fuzzy = nullptr);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;

    void publish(std::shared_ptr<const Snapshot> snapshot);
    static void mapCountries(Snapshot& snap);
};

} // namespace dxcc
} // namespace dxwatch
