#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "facts_parser.hpp"
#include "ticker_directory.hpp"
#include "errors.hpp"
#include "mock_facts_client.hpp"

TEST_CASE("FactsParser reads the SEC companyfacts layout", "[parser]") {
    auto document = R"({
        "cik": 320193,
        "entityName": "Apple Inc.",
        "facts": {
            "dei": {
                "EntityCommonStockSharesOutstanding": {
                    "units": {"shares": [
                        {"end": "2023-10-20", "val": 15552752000, "accn": "0000320193-23-000106",
                         "fy": 2023, "fp": "FY", "form": "10-K", "filed": "2023-11-03"}
                    ]}
                }
            },
            "us-gaap": {
                "Revenues": {
                    "label": "Revenues",
                    "units": {"USD": [
                        {"start": "2023-07-02", "end": "2023-09-30", "val": 89498000000,
                         "accn": "0000320193-23-000106", "fy": 2023, "fp": "FY", "form": "10-K",
                         "filed": "2023-11-03", "frame": "CY2023Q3"},
                        {"start": "2022-09-25", "end": "2023-09-30", "val": 383285000000,
                         "accn": "0000320193-23-000106", "fy": 2023, "fp": "FY", "form": "10-K",
                         "filed": "2023-11-03", "frame": "CY2023"}
                    ]}
                }
            }
        }
    })"_json;

    auto parsed = FactsParser::parse(document);

    CHECK(parsed.entity_name == "Apple Inc.");
    CHECK(parsed.dropped_count == 0);
    REQUIRE(parsed.facts.size() == 3);

    const RawFact* annual = nullptr;
    for (const auto& fact : parsed.facts) {
        if (fact.frame == "CY2023") annual = &fact;
    }
    REQUIRE(annual != nullptr);
    CHECK(annual->concept_name == "Revenues");
    CHECK(annual->taxonomy == "us-gaap");
    CHECK(annual->unit == "USD");
    CHECK(annual->value == Approx(383285000000.0));
    REQUIRE(annual->period_start.has_value());
    CHECK(*annual->period_start == Date{2022, 9, 25});
    CHECK(annual->period_end == Date{2023, 9, 30});
    CHECK(annual->filed_date == Date{2023, 11, 3});
    CHECK(annual->form_type == "10-K");
    CHECK(annual->fiscal_year == 2023);
    CHECK(annual->fiscal_period == "FY");
}

TEST_CASE("FactsParser reads the flat proxy layout", "[parser]") {
    auto document = R"({
        "entityName": "Proxy Co",
        "facts": [
            {"concept": "NetIncomeLoss", "unit": "USD", "value": 1250.5, "end": "2024-03-31",
             "filed": "2024-05-01", "form": "10-Q", "fy": 2024, "fp": "Q1"},
            {"concept": "Assets", "unit": "USD", "value": "98000", "end": "2024-03-31",
             "filed": "2024-05-01", "form": "10-Q"}
        ]
    })"_json;

    auto parsed = FactsParser::parse(document);

    REQUIRE(parsed.facts.size() == 2);
    CHECK(parsed.facts[0].concept_name == "NetIncomeLoss");
    CHECK_FALSE(parsed.facts[0].period_start.has_value());
    CHECK(parsed.facts[0].fiscal_period == "Q1");
    CHECK(parsed.facts[1].value == Approx(98000.0));
}

TEST_CASE("FactsParser drops malformed entries and keeps the rest", "[parser]") {
    auto document = R"({
        "entityName": "Messy Co",
        "facts": {"us-gaap": {"Revenues": {"units": {"USD": [
            {"start": "2023-01-01", "end": "2023-03-31", "val": 100, "form": "10-Q", "filed": "2023-05-01"},
            {"start": "2023-01-01", "val": 100, "form": "10-Q", "filed": "2023-05-01"},
            {"start": "2023-01-01", "end": "2023-03-31", "val": "n/a", "form": "10-Q", "filed": "2023-05-01"},
            {"start": "2023-01-01", "end": "2023-03-31", "val": 100, "filed": "2023-05-01"},
            {"start": "2023-01-01", "end": "2023-13-45", "val": 100, "form": "10-Q", "filed": "2023-05-01"},
            {"start": "2023-06-01", "end": "2023-03-31", "val": 100, "form": "10-Q", "filed": "2023-05-01"},
            {"start": "2023-04-01", "end": "2023-06-30", "val": 120, "form": "10-Q", "filed": "2023-08-01"}
        ]}}}}
    })"_json;

    auto parsed = FactsParser::parse(document);

    CHECK(parsed.facts.size() == 2);
    CHECK(parsed.dropped_count == 5);
}

TEST_CASE("FactsParser drops flat entries with a non-string taxonomy", "[parser]") {
    auto document = R"({
        "entityName": "Proxy Co",
        "facts": [
            {"concept": "Revenues", "unit": "USD", "value": 500, "end": "2024-03-31",
             "filed": "2024-05-01", "form": "10-Q", "taxonomy": "us-gaap"},
            {"concept": "Revenues", "unit": "USD", "value": 510, "end": "2024-06-30",
             "filed": "2024-08-01", "form": "10-Q", "taxonomy": 5},
            {"concept": "Revenues", "unit": "USD", "value": 520, "end": "2024-09-30",
             "filed": "2024-11-01", "form": "10-Q", "taxonomy": null}
        ]
    })"_json;

    ParsedFacts parsed;
    REQUIRE_NOTHROW(parsed = FactsParser::parse(document));

    REQUIRE(parsed.facts.size() == 1);
    CHECK(parsed.facts.front().taxonomy == "us-gaap");
    CHECK(parsed.facts.front().value == Approx(500.0));
    CHECK(parsed.dropped_count == 2);
}

TEST_CASE("FactsParser rejects documents without facts", "[parser]") {
    CHECK_THROWS_AS(FactsParser::parse(R"({"entityName": "Nothing"})"_json), FundamentalsError);
    CHECK_THROWS_AS(FactsParser::parse(R"({"facts": 42})"_json), FundamentalsError);
    CHECK_THROWS_AS(FactsParser::parse(R"([1, 2, 3])"_json), FundamentalsError);

    try {
        FactsParser::parse(R"({"facts": "oops"})"_json);
        FAIL("expected MalformedPayload");
    } catch (const FundamentalsError& e) {
        CHECK(e.kind() == ErrorKind::MalformedPayload);
        CHECK_FALSE(e.retryable());
    }
}

TEST_CASE("FactsParser accepts an empty facts object", "[parser]") {
    auto parsed = FactsParser::parse(R"({"facts": {}})"_json);
    CHECK(parsed.facts.empty());
    CHECK(parsed.dropped_count == 0);
}

TEST_CASE("TickerDirectory normalizes ticker spellings", "[directory]") {
    CHECK(TickerDirectory::normalize(" aapl ") == "AAPL");
    CHECK(TickerDirectory::normalize("brk.b") == "BRK-B");
    CHECK(TickerDirectory::normalize("BRK/B") == "BRK-B");
    CHECK(TickerDirectory::pad_cik(320193) == "0000320193");
}

struct TickerDirectoryFixture {
    MockFactsClient client;
    TickerDirectory directory;
    CancellationToken cancel;

    TickerDirectoryFixture() : directory(client, std::chrono::hours(24)) {}
};

TEST_CASE_METHOD(TickerDirectoryFixture, "TickerDirectory resolves tickers to padded CIKs", "[directory]") {
    auto apple = directory.resolve("aapl", cancel);
    REQUIRE(apple.has_value());
    CHECK(apple->ticker == "AAPL");
    CHECK(apple->cik == "0000320193");
    CHECK(apple->name == "Apple Inc.");

    auto berkshire = directory.resolve("BRK.B", cancel);
    REQUIRE(berkshire.has_value());
    CHECK(berkshire->cik == "0001067983");

    CHECK_FALSE(directory.resolve("ZZZZ123", cancel).has_value());
    CHECK_FALSE(directory.resolve("   ", cancel).has_value());
}

TEST_CASE_METHOD(TickerDirectoryFixture, "TickerDirectory loads the table once", "[directory]") {
    directory.resolve("AAPL", cancel);
    directory.resolve("MSFT", cancel);
    directory.resolve("NOPE", cancel);

    CHECK(client.table_calls == 1);
    CHECK(directory.size() == 5);
}

TEST_CASE_METHOD(TickerDirectoryFixture, "TickerDirectory skips malformed table entries", "[directory]") {
    client.set_ticker_table(R"({
        "0": {"cik_str": 1, "ticker": "GOOD", "title": "Good Co"},
        "1": {"cik_str": "not a number", "ticker": "BAD"},
        "2": {"ticker": "NOCIK"},
        "3": 17
    })"_json);

    CHECK(directory.resolve("GOOD", cancel).has_value());
    CHECK_FALSE(directory.resolve("BAD", cancel).has_value());
    CHECK(directory.size() == 1);
}
