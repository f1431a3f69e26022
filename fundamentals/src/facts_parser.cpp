#include "facts_parser.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace {

std::optional<Date> date_field(const nlohmann::json& item, const char* key) {
    if (!item.contains(key) || !item[key].is_string()) {
        return std::nullopt;
    }
    return Date::parse(item[key].get<std::string>());
}

std::optional<double> numeric_field(const nlohmann::json& item, const char* key) {
    if (!item.contains(key)) {
        return std::nullopt;
    }
    const auto& v = item[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        // Some proxies quote numbers
        try {
            size_t consumed = 0;
            auto text = v.get<std::string>();
            double parsed = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

ParsedFacts FactsParser::parse(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("facts")) {
        throw FundamentalsError::malformed("Company facts document has no 'facts' member");
    }

    ParsedFacts out;
    if (document.contains("entityName") && document["entityName"].is_string()) {
        out.entity_name = document["entityName"].get<std::string>();
    }

    const auto& facts = document["facts"];
    if (facts.is_object()) {
        parse_sec_layout(facts, out);
    } else if (facts.is_array()) {
        parse_flat_layout(facts, out);
    } else {
        throw FundamentalsError::malformed("Company facts 'facts' member is neither an object nor an array");
    }

    if (out.dropped_count > 0) {
        spdlog::info("Dropped {} malformed facts for {}", out.dropped_count,
                     out.entity_name.empty() ? "<unnamed entity>" : out.entity_name);
    }
    return out;
}

void FactsParser::parse_sec_layout(const nlohmann::json& facts, ParsedFacts& out) {
    for (const auto& [taxonomy, concepts] : facts.items()) {
        if (!concepts.is_object()) {
            out.dropped_count++;
            continue;
        }
        for (const auto& [concept_name, body] : concepts.items()) {
            if (!body.is_object() || !body.contains("units") || !body["units"].is_object()) {
                spdlog::debug("Concept {}:{} has no units, skipping", taxonomy, concept_name);
                out.dropped_count++;
                continue;
            }
            for (const auto& [unit, entries] : body["units"].items()) {
                if (!entries.is_array()) {
                    out.dropped_count++;
                    continue;
                }
                for (const auto& item : entries) {
                    try {
                        RawFact fact;
                        if (parse_entry(item, taxonomy, concept_name, unit, fact)) {
                            out.facts.push_back(std::move(fact));
                        } else {
                            out.dropped_count++;
                        }
                    } catch (const nlohmann::json::exception& e) {
                        spdlog::debug("Dropping malformed {} entry: {}", concept_name, e.what());
                        out.dropped_count++;
                    }
                }
            }
        }
    }
}

void FactsParser::parse_flat_layout(const nlohmann::json& facts, ParsedFacts& out) {
    for (const auto& item : facts) {
        if (!item.is_object() || !item.contains("concept") || !item["concept"].is_string() ||
            !item.contains("unit") || !item["unit"].is_string()) {
            out.dropped_count++;
            continue;
        }

        if (item.contains("taxonomy") && !item["taxonomy"].is_string()) {
            spdlog::debug("Dropping flat entry with non-string taxonomy: {}", item.dump());
            out.dropped_count++;
            continue;
        }

        try {
            RawFact fact;
            auto taxonomy = item.contains("taxonomy") ? item["taxonomy"].get<std::string>() : "us-gaap";
            if (parse_entry(item, taxonomy, item["concept"].get<std::string>(),
                            item["unit"].get<std::string>(), fact)) {
                out.facts.push_back(std::move(fact));
            } else {
                out.dropped_count++;
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("Dropping malformed flat entry: {}", e.what());
            out.dropped_count++;
        }
    }
}

bool FactsParser::parse_entry(const nlohmann::json& item, const std::string& taxonomy,
                              const std::string& concept_name, const std::string& unit, RawFact& fact) {
    if (!item.is_object()) {
        return false;
    }

    auto end = date_field(item, "end");
    auto filed = date_field(item, "filed");
    auto value = numeric_field(item, item.contains("val") ? "val" : "value");

    if (!end || !filed || !value || !std::isfinite(*value)) {
        spdlog::debug("Dropping {} entry with missing end/filed/value: {}", concept_name, item.dump());
        return false;
    }

    if (!item.contains("form") || !item["form"].is_string() || item["form"].get<std::string>().empty()) {
        spdlog::debug("Dropping {} entry without form: {}", concept_name, item.dump());
        return false;
    }

    std::optional<Date> start;
    if (item.contains("start") && !item["start"].is_null()) {
        start = date_field(item, "start");
        if (!start || *start > *end) {
            spdlog::debug("Dropping {} entry with invalid start: {}", concept_name, item.dump());
            return false;
        }
    }

    fact.concept_name = concept_name;
    fact.taxonomy = taxonomy;
    fact.unit = unit;
    fact.value = *value;
    fact.period_start = start;
    fact.period_end = *end;
    fact.filed_date = *filed;
    fact.form_type = item["form"].get<std::string>();
    fact.fiscal_year = item.contains("fy") && item["fy"].is_number_integer() ? item["fy"].get<int>() : 0;
    fact.fiscal_period = item.contains("fp") && item["fp"].is_string() ? item["fp"].get<std::string>() : "";
    fact.accession = item.contains("accn") && item["accn"].is_string() ? item["accn"].get<std::string>() : "";
    fact.frame = item.contains("frame") && item["frame"].is_string() ? item["frame"].get<std::string>() : "";
    return true;
}
