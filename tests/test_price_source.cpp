#include "accounting/price_source.hpp"
#include "ingest/provider_mapping.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

TEST_CASE("price table returns the latest close within the staleness window") {
    accounting::PriceTable table{2};
    table.set_price("btc", ingest::make_utc(2024, 6, 17), accounting::Decimal(64000));
    table.set_price("BTC", ingest::make_utc(2024, 6, 19), accounting::Decimal(65000));

    CHECK(table.size() == 2);
    CHECK(table.historical_price("BTC", ingest::make_utc(2024, 6, 19, 23, 59)) == accounting::Decimal(65000));
    CHECK(table.historical_price("BTC", ingest::make_utc(2024, 6, 18, 12)) == accounting::Decimal(64000));
    CHECK(table.historical_price("btc", ingest::make_utc(2024, 6, 21)) == accounting::Decimal(65000));
    CHECK_FALSE(table.historical_price("BTC", ingest::make_utc(2024, 6, 22)));
    CHECK_FALSE(table.historical_price("BTC", ingest::make_utc(2024, 6, 16)));
    CHECK_FALSE(table.historical_price("ETH", ingest::make_utc(2024, 6, 19)));
}

TEST_CASE("stable assets always price at one dollar") {
    accounting::PriceTable table;
    CHECK(table.historical_price("USDT", ingest::make_utc(2020, 1, 1)) == accounting::Decimal(1));
    CHECK_FALSE(table.historical_price("DAI", ingest::make_utc(2020, 1, 1)));

    table.add_stable_asset("dai");
    CHECK(table.historical_price("DAI", ingest::make_utc(2020, 1, 1)) == accounting::Decimal(1));
}

TEST_CASE("price tables load from JSON documents") {
    const auto table = accounting::PriceTable::from_json(nlohmann::json::parse(R"({
        "ETH": {"2024-06-18": "3500.25", "2024-06-19": 3550},
        "DOGE": {"2024-06-19": "0.1234"}
    })"));

    CHECK(table.size() == 3);
    CHECK(table.historical_price("ETH", ingest::make_utc(2024, 6, 18, 8)) == ingest::parse_decimal("3500.25"));
    CHECK(table.historical_price("ETH", ingest::make_utc(2024, 6, 19, 8)) == accounting::Decimal(3550));
    CHECK(table.historical_price("DOGE", ingest::make_utc(2024, 6, 19)) == ingest::parse_decimal("0.1234"));

    using nlohmann::json;
    CHECK_THROWS_AS(accounting::PriceTable::from_json(json::parse(R"(["ETH"])")), ingest::StructuralError);
    CHECK_THROWS_AS(accounting::PriceTable::from_json(json::parse(R"({"ETH": {"June 18": "1"}})")),
                    ingest::StructuralError);
    CHECK_THROWS_AS(accounting::PriceTable::from_json(json::parse(R"({"ETH": {"2024-06-18": "cheap"}})")),
                    ingest::StructuralError);
    CHECK_THROWS_AS(accounting::PriceTable::from_json(json::parse(R"({"XYZ": {"2024-06-18": "-0.5"}})")),
                    ingest::StructuralError);
}
