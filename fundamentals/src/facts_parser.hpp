#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ParsedFacts {
    std::string entity_name;
    std::vector<RawFact> facts;
    int dropped_count = 0;
};

// Normalizes provider payloads into RawFacts. Two layouts are accepted:
//
//   SEC companyfacts: {"entityName": ..., "facts": {"us-gaap": {"Revenues":
//       {"units": {"USD": [{"start", "end", "val", "accn", "fy", "fp",
//       "form", "filed", "frame"}]}}}}}
//   flat proxy:       {"entityName": ..., "facts": [{"concept", "unit",
//       "value", "start", "end", "filed", "form", "fy", "fp"}]}
//
// Malformed entries are dropped and counted. A document matching neither
// layout throws FundamentalsError(MalformedPayload).
class FactsParser {
public:
    static ParsedFacts parse(const nlohmann::json& document);

private:
    static void parse_sec_layout(const nlohmann::json& facts, ParsedFacts& out);
    static void parse_flat_layout(const nlohmann::json& facts, ParsedFacts& out);

    // Returns false when the entry is unusable
    static bool parse_entry(const nlohmann::json& item, const std::string& taxonomy,
                            const std::string& concept_name, const std::string& unit, RawFact& fact);
};
