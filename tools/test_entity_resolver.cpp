// test_entity_resolver.cpp - Unit test for prefix -> DXCC entity lookup
//
// Tests:
// 1. Country table notation (exact, bracket, overrides, last write wins)
// 2. Name matching (overrides, exact, token overlap)
// 3. Prefix resolution with shortening
// 4. Fail-open behaviour on missing or bad data
// 5. Entity map JSON loader

#include "dxcc/cty_table.hpp"
#include "dxcc/entity_resolver.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace dxwatch;
using namespace dxwatch::dxcc;

static const char* CTY_TEXT =
    "United States:            05:  08:  NA:   37.53:    91.67:     5.0:  K:\n"
    "    AA,AB,K,N,W,=W1AW(5)[8],\n"
    "    KA;\n"
    "Italy:                    15:  28:  EU:   42.82:   -12.58:    -1.0:  I:\n"
    "    I,IK,IT,IZ;\n"
    "Federal Republic of Germany: 14: 28: EU: 51.00: -10.00: -1.0: DL:\n"
    "    DA,DL,[DM],DO<51.0/-10.0>;\n"
    "Republic of Korea:        25:  44:  AS:   36.23:  -127.90:    -9.0:  HL:\n"
    "    HL,DS{AS};\n"
    "European Turkey:          20:  39:  EU:   41.02:   -28.97:    -2.0:  *TA1:\n"
    "    TA1;\n";

static EntityNameMap testNames() {
    return {
        {291, "UNITED STATES OF AMERICA"},
        {248, "ITALY"},
        {230, "FEDERAL REPUBLIC OF GERMANY"},
        {137, "KOREA, REPUBLIC OF"},
        {1,   "CANADA"},
    };
}

int main() {
    std::cout << "=== Entity Resolver Unit Test ===\n\n";

    int pass = 0, fail = 0;

    // ========================================================================
    // TEST 1: Country table
    // ========================================================================
    std::cout << "TEST 1: Country table notation\n";
    {
        bool exact = false;
        std::string a = CountryTable::cleanPrefix("=W1AW(5)[8]", &exact);
        bool exact_ok = (a == "W1AW" && exact);
        std::string b = CountryTable::cleanPrefix("[DM]", &exact);
        bool bracket_ok = (b == "DM" && !exact);
        bool override_ok = CountryTable::cleanPrefix("K(5)") == "K" &&
                           CountryTable::cleanPrefix("DO<51.0/-10.0>") == "DO" &&
                           CountryTable::cleanPrefix(" ds{AS} ") == "DS" &&
                           CountryTable::cleanPrefix("VE~-5.0~") == "VE" &&
                           CountryTable::cleanPrefix("(5)").empty();
        if (exact_ok && bracket_ok && override_ok) {
            std::cout << "  [PASS] Prefix markers stripped\n";
            pass++;
        } else {
            std::cout << "  [FAIL] cleanPrefix: '" << a << "' '" << b << "'\n";
            fail++;
        }

        CountryTable table;
        if (table.parse(CTY_TEXT) && table.entityCount() == 5 && table.prefixCount() == 18) {
            std::cout << "  [PASS] 5 entities, 18 prefixes\n";
            pass++;
        } else {
            std::cout << "  [FAIL] entities=" << table.entityCount()
                      << " prefixes=" << table.prefixCount() << "\n";
            fail++;
        }

        const EntityRecord* us = table.find("W1AW");
        if (us && us->name == "United States" && us->cq_zone == 5 && us->itu_zone == 8 &&
            us->continent == "NA" && std::fabs(us->latitude - 37.53) < 1e-9 &&
            us->primary_prefix == "K") {
            std::cout << "  [PASS] Exact callsign entry carries entity header values\n";
            pass++;
        } else {
            std::cout << "  [FAIL] W1AW record\n";
            fail++;
        }

        const EntityRecord* tr = table.find("TA1");
        if (tr && tr->wae_only && tr->primary_prefix == "TA1") {
            std::cout << "  [PASS] '*' primary prefix marks WAE-only entity\n";
            pass++;
        } else {
            std::cout << "  [FAIL] WAE marker\n";
            fail++;
        }

        CountryTable dup;
        dup.parse("Alpha: 1: 1: EU: 0.0: 0.0: 0.0: XA:\n    XA,XX;\n"
                  "Beta:  2: 2: EU: 0.0: 0.0: 0.0: XB:\n    XB,XX;\n");
        const EntityRecord* xx = dup.find("XX");
        if (xx && xx->name == "Beta") {
            std::cout << "  [PASS] Last write wins for duplicate prefix\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Duplicate prefix resolution\n";
            fail++;
        }

        if (CountryTable::isHeaderLine("Italy: 15: 28: EU: 42.82: -12.58: -1.0: I:") &&
            !CountryTable::isHeaderLine("    I,IK,IT,IZ;") &&
            !CountryTable::isHeaderLine("Italy: 15: 28: EU:")) {
            std::cout << "  [PASS] Header line detection\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Header line detection\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 2: Name matching
    // ========================================================================
    std::cout << "\nTEST 2: Country name matching\n";
    {
        double ratio = EntityResolver::tokenOverlapRatio("UNITED STATES OF AMERICA", "UNITED STATES");
        if (ratio >= EntityResolver::FUZZY_THRESHOLD) {
            std::cout << "  [PASS] UNITED STATES OF AMERICA / UNITED STATES overlap "
                      << ratio << " >= 0.6\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Overlap ratio " << ratio << "\n";
            fail++;
        }

        EntityNameMap usa = {{291, "UNITED STATES OF AMERICA"}};
        bool fuzzy = false;
        auto id = EntityResolver::matchCountryName("United  States", usa, &fuzzy);
        if (id && *id == 291) {
            std::cout << "  [PASS] United States -> 291\n";
            pass++;
        } else {
            std::cout << "  [FAIL] United States not matched\n";
            fail++;
        }

        auto korea = EntityResolver::matchCountryName("Republic of Korea", testNames(), &fuzzy);
        if (korea && *korea == 137 && fuzzy) {
            std::cout << "  [PASS] Reordered name matched by token overlap\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Republic of Korea fuzzy match\n";
            fail++;
        }

        auto germany = EntityResolver::matchCountryName("federal republic  of germany", testNames(), &fuzzy);
        if (germany && *germany == 230 && !fuzzy) {
            std::cout << "  [PASS] Case/whitespace-insensitive exact match\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Exact normalized match\n";
            fail++;
        }

        EntityNameMap other = {{999, "ZIMBABWE"}, {998, "NEW ZEALAND"}};
        auto none = EntityResolver::matchCountryName("Canada", other, &fuzzy);
        double no_overlap = EntityResolver::tokenOverlapRatio("UK", "US");
        if (!none && no_overlap == 0.0) {
            std::cout << "  [PASS] Names sharing no long tokens never match\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Unrelated names matched\n";
            fail++;
        }

        // One of three tokens in common is below threshold
        EntityNameMap germany_only = {{230, "FEDERAL REPUBLIC OF GERMANY"}};
        auto weak = EntityResolver::matchCountryName("Fed. Rep. of Germany", germany_only, &fuzzy);
        if (!weak) {
            std::cout << "  [PASS] Overlap under 0.6 rejected\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Weak overlap accepted\n";
            fail++;
        }

        auto tokens = EntityResolver::nameTokens("St. Kitts & Nevis, Nevis");
        if (tokens.size() == 2 && tokens[0] == "KITTS" && tokens[1] == "NEVIS") {
            std::cout << "  [PASS] Tokens longer than 2 chars, unique\n";
            pass++;
        } else {
            std::cout << "  [FAIL] nameTokens returned " << tokens.size() << " token(s)\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 3: Resolution
    // ========================================================================
    std::cout << "\nTEST 3: Prefix resolution\n";
    {
        EntityResolver resolver;
        bool built = resolver.build(CTY_TEXT, testNames());
        auto snap = resolver.snapshot();
        if (built && resolver.isLoaded() && snap->fuzzy_matches == 1 && snap->unmapped == 1) {
            std::cout << "  [PASS] Built: 4 mapped, 1 fuzzy, 1 unmapped\n";
            pass++;
        } else {
            std::cout << "  [FAIL] build() fuzzy=" << snap->fuzzy_matches
                      << " unmapped=" << snap->unmapped << "\n";
            fail++;
        }

        auto it9 = resolver.resolve("IT9");
        auto it = resolver.resolve("IT");
        if (it9 && it && *it9 == *it && *it9 == 248) {
            std::cout << "  [PASS] IT9 falls back to IT -> 248\n";
            pass++;
        } else {
            std::cout << "  [FAIL] IT9 fallback\n";
            fail++;
        }

        if (!resolver.resolve("ZZZZZ") && !resolver.resolve("")) {
            std::cout << "  [PASS] ZZZZZ -> none\n";
            pass++;
        } else {
            std::cout << "  [FAIL] ZZZZZ resolved\n";
            fail++;
        }

        auto w1aw = resolver.resolve("w1aw");
        auto dm = resolver.resolve("DM5X");
        auto hl = resolver.resolve("HL1");
        if (w1aw && *w1aw == 291 && dm && *dm == 230 && hl && *hl == 137) {
            std::cout << "  [PASS] Lower case, bracketed and fuzzy-mapped prefixes\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Prefix lookups\n";
            fail++;
        }

        // Known country without an entity number
        auto country = resolver.countryFor("TA1");
        if (!resolver.resolve("TA1") && country && *country == "European Turkey") {
            std::cout << "  [PASS] Unmapped country resolves to none\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Unmapped country\n";
            fail++;
        }

        auto record = resolver.recordFor("IK2ABC");
        auto name = resolver.entityName(248);
        if (record && record->name == "Italy" && record->cq_zone == 15 &&
            name && *name == "ITALY") {
            std::cout << "  [PASS] recordFor / entityName\n";
            pass++;
        } else {
            std::cout << "  [FAIL] recordFor / entityName\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 4: Fail-open
    // ========================================================================
    std::cout << "\nTEST 4: Fail-open on missing data\n";
    {
        EntityResolver resolver;
        if (!resolver.isLoaded() && !resolver.resolve("K")) {
            std::cout << "  [PASS] Fresh resolver answers nothing\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Fresh resolver\n";
            fail++;
        }

        bool ok = resolver.initialize("/nonexistent/cty.dat", "/nonexistent/dxcc_mapping.json");
        if (!ok && !resolver.resolve("K") && !resolver.recordFor("K")) {
            std::cout << "  [PASS] Missing files -> no lookups, no throw\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Missing files\n";
            fail++;
        }

        resolver.build(CTY_TEXT, testNames());
        bool reload = resolver.build(CTY_TEXT, EntityNameMap{});
        if (!reload && !resolver.isLoaded() && !resolver.resolve("K")) {
            std::cout << "  [PASS] Failed rebuild publishes empty tables\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Failed rebuild kept stale tables\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 5: Entity map loader
    // ========================================================================
    std::cout << "\nTEST 5: Entity map JSON\n";
    {
        const std::string path = "/tmp/dxwatch_test_entity_names.json";
        {
            std::ofstream out(path);
            out << "{\"291\": \"UNITED STATES OF AMERICA\", \"248\": \"ITALY\","
                   " \"abc\": \"JUNK\", \"100\": 5}";
        }
        EntityNameMap names;
        bool ok = EntityResolver::loadEntityNames(path, names);
        if (ok && names.size() == 2 && names[291] == "UNITED STATES OF AMERICA") {
            std::cout << "  [PASS] Numeric keys with string names loaded, rest skipped\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Loaded " << names.size() << " name(s)\n";
            fail++;
        }

        {
            std::ofstream out(path);
            out << "{\"291\": \"UNITED STATES";
        }
        ok = EntityResolver::loadEntityNames(path, names);
        if (!ok && names.empty()) {
            std::cout << "  [PASS] Truncated JSON rejected\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Truncated JSON accepted\n";
            fail++;
        }
        std::remove(path.c_str());
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All entity resolver tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
