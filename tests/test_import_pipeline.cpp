#include "accounting/import_pipeline.hpp"
#include "accounting/lot_ledger.hpp"
#include "accounting/price_source.hpp"
#include "accounting/trade_journal.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using accounting::Decimal;

ingest::RawRecord binance_row(std::size_t index, const std::string& time, const std::string& operation,
                              const std::string& coin, const std::string& change) {
    ingest::RawRecord row;
    row.row_index = index;
    row.fields = {
        {"UTC_Time", time},
        {"Operation", operation},
        {"Coin", coin},
        {"Change", change},
        {"Remark", ""},
    };
    return row;
}

accounting::PipelineConfig quiet_config(const std::string& owner) {
    accounting::PipelineConfig config;
    config.grouper.owner = owner;
    config.verbose = false;
    return config;
}

// A DOGE market buy with its fee leg, a later partial sale, and two bad rows.
std::vector<ingest::RawRecord> doge_history() {
    return {
        binance_row(1, "2024-06-19 03:12:04", "Transaction Buy", "DOGE", "601"),
        binance_row(2, "2024-06-19 03:12:04", "Transaction Fee", "DOGE", "-0.601"),
        binance_row(3, "2024-06-19 03:12:04", "Transaction Spend", "USDT", "-199.56205"),
        binance_row(4, "2024-06-20 10:00:00", "Transaction Sold", "DOGE", "-300"),
        binance_row(5, "2024-06-20 10:00:00", "Transaction Revenue", "USDT", "120"),
        binance_row(6, "2024-06-20 11:00:00", "Mystery Reward", "BNB", "1"),
        binance_row(7, "soon", "Transaction Buy", "BTC", "1"),
    };
}

ingest::ApiFill fill(const std::string& id, const std::string& type, const std::string& asset,
                     const std::string& quantity, const std::string& price, ingest::Timestamp at) {
    ingest::ApiFill result;
    result.type = type;
    result.asset = asset;
    result.quantity = ingest::parse_decimal(quantity);
    result.price = ingest::parse_decimal(price);
    result.external_id = id;
    result.timestamp = at;
    return result;
}

// Removes its directory on scope exit.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& name)
        : path_(std::filesystem::temp_directory_path() /
                (name + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))) {}

    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    std::filesystem::path journal_path() const { return path_ / "trades.jsonl"; }

private:
    std::filesystem::path path_;
};

void record(accounting::TradeJournal& journal, const accounting::BatchResult& result) {
    for (const auto& trade : result.upserted) {
        journal.append(trade);
    }
    for (const auto& acquisition : result.acquisitions) {
        journal.append(acquisition);
    }
    for (const auto& id : result.retracted) {
        journal.retract(id);
    }
}

} // namespace

TEST_CASE("import_rows turns a provider export into lots and disposals", "[integration][pipeline]") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};

    const auto result = pipeline.import_rows(doge_history(), ingest::ProviderMapping::binance_transaction_history());

    CHECK(result.rows_read == 7);
    CHECK(result.events_accepted == 5);
    CHECK(result.trades_created == 2);
    CHECK(result.lots_created == 1);
    CHECK(result.disposals_posted == 1);
    CHECK(result.grouping_errors == 0);
    CHECK(result.unknown_operations == 1);
    CHECK(result.parse_errors == 1);
    CHECK(result.error_count == 2);
    CHECK(result.needs_review == 0);
    CHECK(result.upserted.size() == 2);

    const auto lots = ledger.lots("alice", "DOGE");
    REQUIRE(lots.size() == 1);
    CHECK(lots[0].original_amount == ingest::parse_decimal("600.399"));
    CHECK(lots[0].remaining_amount == ingest::parse_decimal("300.399"));

    const auto disposals = ledger.disposals("alice", "DOGE");
    REQUIRE(disposals.size() == 1);
    CHECK_FALSE(disposals[0].needs_review);
    REQUIRE(disposals[0].realized_pnl_usd);
    CHECK(disposals[0].realized_pnl_usd->convert_to<double>() == Catch::Approx(20.2853).margin(1e-3));

    const auto trades = pipeline.trades();
    REQUIRE(trades.size() == 2);
    CHECK(trades[0].side == accounting::TradeSide::Buy);
    CHECK(trades[1].side == accounting::TradeSide::Sell);

    const nlohmann::json json = result;
    CHECK(json["trades_created"] == 2);
    CHECK(json["errors"].size() == 2);
}

TEST_CASE("re-importing the same export changes nothing") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();

    pipeline.import_rows(doge_history(), mapping);
    const auto again = pipeline.import_rows(doge_history(), mapping);

    CHECK(again.events_accepted == 0);
    CHECK(again.duplicates == 5);
    CHECK(again.trades_created == 0);
    CHECK(again.trades_updated == 0);
    CHECK(again.trades_unchanged == 2);
    CHECK(again.lots_created == 0);
    CHECK(again.disposals_posted == 0);
    CHECK(again.ledger_rebuilds == 0);
    CHECK(again.upserted.empty());
    CHECK(ledger.lots("alice", "DOGE").size() == 1);
    CHECK(ledger.disposals("alice", "DOGE").size() == 1);
}

TEST_CASE("a later import of an earlier buy rebuilds the disposal") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();

    pipeline.import_rows(doge_history(), mapping);
    const auto late = pipeline.import_rows({
        binance_row(8, "2024-06-18 09:00:00", "Transaction Buy", "DOGE", "100"),
        binance_row(9, "2024-06-18 09:00:00", "Transaction Spend", "USDT", "-10"),
    }, mapping);

    CHECK(late.trades_created == 1);
    CHECK(late.trades_unchanged == 2);
    CHECK(late.lots_created == 1);
    CHECK(late.ledger_rebuilds == 1);
    REQUIRE(late.upserted.size() == 1);

    const auto disposals = ledger.disposals("alice", "DOGE");
    REQUIRE(disposals.size() == 1);
    REQUIRE(disposals[0].portions.size() == 2);
    CHECK(disposals[0].portions[0].lot_id == late.upserted[0].id);
    CHECK(disposals[0].portions[0].amount_consumed == 100);
    CHECK(disposals[0].portions[1].amount_consumed == 200);
}

TEST_CASE("a regrouped bucket retracts trades it no longer produces") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();

    std::vector<ingest::RawRecord> rows{
        binance_row(1, "2024-06-19 03:12:04", "Transaction Buy", "DOGE", "100"),
        binance_row(2, "2024-06-19 03:12:04", "Transaction Spend", "USDT", "-10"),
    };
    const auto first = pipeline.import_rows(rows, mapping);
    REQUIRE(first.upserted.size() == 1);
    const auto buy_id = first.upserted[0].id;

    rows.push_back(binance_row(3, "2024-06-19 03:12:30", "Transaction Revenue", "USDT", "5"));
    const auto second = pipeline.import_rows(rows, mapping);

    CHECK(second.grouping_errors == 1);
    CHECK(second.trades_retracted == 1);
    REQUIRE(second.retracted.size() == 1);
    CHECK(second.retracted[0] == buy_id);
    CHECK(ledger.lots("alice", "DOGE").empty());
    CHECK(pipeline.trades().empty());
}

TEST_CASE("a structural error leaves the pipeline untouched") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};

    auto rows = doge_history();
    rows[3].fields.erase("Change");

    CHECK_THROWS_AS(pipeline.import_rows(rows, ingest::ProviderMapping::binance_transaction_history()),
                    ingest::StructuralError);
    CHECK(pipeline.events().empty());
    CHECK(pipeline.trades().empty());
    CHECK(ledger.snapshot().empty());
}

TEST_CASE("sales without acquisitions are flagged for review") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};

    const auto result = pipeline.import_rows({
        binance_row(1, "2024-03-01 12:00:00", "Transaction Sold", "BTC", "-1"),
        binance_row(2, "2024-03-01 12:00:00", "Transaction Revenue", "USDT", "60000"),
    }, ingest::ProviderMapping::binance_transaction_history());

    CHECK(result.disposals_posted == 1);
    CHECK(result.needs_review == 1);
    CHECK(result.warning_count >= 1);
    const auto flagged = std::any_of(result.warnings.begin(), result.warnings.end(), [](const std::string& w) {
        return w.find("needs review") != std::string::npos;
    });
    CHECK(flagged);
}

TEST_CASE("deposits open lots at their historical price") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    prices.set_price("ETH", ingest::make_utc(2024, 6, 1), Decimal(3000));
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();
    const std::vector<ingest::RawRecord> rows{
        binance_row(1, "2024-06-01 08:00:00", "Deposit", "ETH", "2"),
        binance_row(2, "2024-06-01 09:00:00", "Deposit", "SOL", "5"),
        binance_row(3, "2024-06-01 10:00:00", "Deposit", "USDT", "100"),
        binance_row(4, "2024-06-02 08:00:00", "Withdraw", "ETH", "-1"),
    };

    SECTION("without a fallback price") {
        accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
        const auto result = pipeline.import_rows(rows, mapping);

        CHECK(result.lots_created == 1);
        const auto eth = ledger.lots("alice", "ETH");
        REQUIRE(eth.size() == 1);
        CHECK(eth[0].id == "binance:row-1");
        CHECK(eth[0].unit_cost_usd == 3000);
        CHECK(eth[0].remaining_amount == 2);
        CHECK(ledger.lots("alice", "SOL").empty());
        CHECK(ledger.lots("alice", "USDT").empty());
        const auto unpriced = std::any_of(result.warnings.begin(), result.warnings.end(), [](const std::string& w) {
            return w.find("no historical price") != std::string::npos;
        });
        CHECK(unpriced);
    }

    SECTION("with a fallback price") {
        auto config = quiet_config("alice");
        config.grouper.fallback_price_usd = Decimal(1);
        accounting::ImportPipeline pipeline{ledger, prices, config};
        const auto result = pipeline.import_rows(rows, mapping);

        CHECK(result.lots_created == 2);
        const auto sol = ledger.lots("alice", "SOL");
        REQUIRE(sol.size() == 1);
        CHECK(sol[0].unit_cost_usd == 1);
    }

    SECTION("when deposits are not lots") {
        auto config = quiet_config("alice");
        config.deposits_create_lots = false;
        accounting::ImportPipeline pipeline{ledger, prices, config};
        const auto result = pipeline.import_rows(rows, mapping);

        CHECK(result.lots_created == 0);
        CHECK(ledger.snapshot().empty());
    }
}

TEST_CASE("import_fills posts exchange fills and skips repeats") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};

    auto buy = fill("f1", "buy", "BTC", "0.1", "30000", ingest::make_utc(2024, 2, 1, 9, 30));
    buy.fee_amount = ingest::parse_decimal("0.0001");
    buy.fee_asset = "BTC";
    auto sell = fill("f2", "sell", "BTC", "0.05", "32000", ingest::make_utc(2024, 3, 1, 9, 30));
    sell.fee_amount = ingest::parse_decimal("1.6");
    sell.fee_asset = "USDT";
    const auto anonymous = fill("", "buy", "ETH", "1", "3000", ingest::make_utc(2024, 3, 2));

    const std::vector<ingest::ApiFill> fills{sell, buy, anonymous};
    const auto result = pipeline.import_fills(fills);

    CHECK(result.rows_read == 3);
    CHECK(result.events_accepted == 2);
    CHECK(result.parse_errors == 1);
    CHECK(result.trades_created == 2);
    CHECK(result.lots_created == 1);
    CHECK(result.disposals_posted == 1);
    CHECK(result.ledger_rebuilds == 0);

    const auto lots = ledger.lots("alice", "BTC");
    REQUIRE(lots.size() == 1);
    CHECK(lots[0].original_amount == ingest::parse_decimal("0.0999"));
    CHECK(lots[0].remaining_amount == ingest::parse_decimal("0.0499"));

    const auto disposals = ledger.disposals("alice", "BTC");
    REQUIRE(disposals.size() == 1);
    CHECK(disposals[0].fee_usd == ingest::parse_decimal("1.6"));
    CHECK(disposals[0].net_proceeds_usd == ingest::parse_decimal("1598.4"));

    const auto again = pipeline.import_fills(fills);
    CHECK(again.duplicates == 2);
    CHECK(again.trades_unchanged == 2);
    CHECK(again.trades_created == 0);
}

TEST_CASE("restored trades are not reported as new") {
    accounting::LotLedger first_ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline first{first_ledger, prices, quiet_config("alice")};
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();
    const auto persisted = first.import_rows(doge_history(), mapping).upserted;

    accounting::LotLedger ledger;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
    CHECK(pipeline.restore(persisted) == 2);
    CHECK(ledger.disposals("alice", "DOGE").size() == 1);

    const auto result = pipeline.import_rows(doge_history(), mapping);
    CHECK(result.trades_created == 0);
    CHECK(result.trades_unchanged == 2);
    CHECK(result.lots_created == 0);
    CHECK(result.disposals_posted == 0);
}

TEST_CASE("a journal restart keeps re-imports idempotent", "[integration][journal]") {
    ScratchDirectory scratch("pipeline-restart");
    accounting::PriceTable prices;
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();
    const std::vector<ingest::RawRecord> rows{
        binance_row(1, "2024-01-01 10:00:00", "Transaction Buy", "BTC", "2"),
        binance_row(2, "2024-01-01 10:00:00", "Transaction Buy", "ETH", "1"),
        binance_row(3, "2024-01-01 10:00:00", "Transaction Spend", "USDT", "-200"),
    };
    const std::vector<ingest::ApiFill> fills{
        fill("f1", "buy", "SOL", "3", "101.37", ingest::from_epoch_ms(1704103200123)),
    };

    {
        accounting::LotLedger ledger;
        accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
        accounting::TradeJournal journal{accounting::TradeJournalConfig{scratch.journal_path()}};
        const auto from_rows = pipeline.import_rows(rows, mapping);
        REQUIRE(from_rows.trades_created == 2);
        record(journal, from_rows);
        record(journal, pipeline.import_fills(fills));
        CHECK(journal.entry_count() == 3);
    }

    for (int restart = 0; restart < 2; ++restart) {
        accounting::LotLedger ledger;
        accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
        accounting::TradeJournal journal{accounting::TradeJournalConfig{scratch.journal_path()}};
        const auto contents = journal.load();
        CHECK(pipeline.restore(contents.trades, contents.acquisitions) == 3);

        const auto from_rows = pipeline.import_rows(rows, mapping);
        CHECK(from_rows.trades_created == 0);
        CHECK(from_rows.trades_updated == 0);
        CHECK(from_rows.trades_unchanged == 2);
        CHECK(from_rows.ledger_rebuilds == 0);
        CHECK(from_rows.upserted.empty());
        record(journal, from_rows);

        const auto from_fills = pipeline.import_fills(fills);
        CHECK(from_fills.trades_updated == 0);
        CHECK(from_fills.trades_unchanged == 1);
        record(journal, from_fills);

        CHECK(journal.entry_count() == 3);
    }
}

TEST_CASE("deposit lots are journaled and restored") {
    ScratchDirectory scratch("pipeline-deposits");
    accounting::PriceTable prices;
    prices.set_price("BTC", ingest::make_utc(2024, 1, 1), Decimal(40000));
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();
    const std::vector<ingest::RawRecord> rows{
        binance_row(1, "2024-01-01 08:00:00", "Deposit", "BTC", "1"),
        binance_row(2, "2024-03-01 12:00:00", "Transaction Sold", "BTC", "-1"),
        binance_row(3, "2024-03-01 12:00:00", "Transaction Revenue", "USDT", "50000"),
    };

    {
        accounting::LotLedger ledger;
        accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
        accounting::TradeJournal journal{accounting::TradeJournalConfig{scratch.journal_path()}};
        const auto result = pipeline.import_rows(rows, mapping);
        CHECK(result.needs_review == 0);
        REQUIRE(result.acquisitions.size() == 1);
        CHECK(result.acquisitions[0].id == "binance:row-1");
        record(journal, result);
    }

    accounting::LotLedger ledger;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
    accounting::TradeJournal journal{accounting::TradeJournalConfig{scratch.journal_path()}};
    const auto contents = journal.load();
    REQUIRE(contents.acquisitions.size() == 1);
    CHECK(pipeline.restore(contents.trades, contents.acquisitions) == 2);

    const auto disposals = ledger.disposals("alice", "BTC");
    REQUIRE(disposals.size() == 1);
    CHECK_FALSE(disposals[0].needs_review);
    REQUIRE(disposals[0].realized_pnl_usd);
    CHECK(*disposals[0].realized_pnl_usd == 10000);

    const auto again = pipeline.import_rows(rows, mapping);
    CHECK(again.lots_created == 0);
    CHECK(again.acquisitions.empty());
    CHECK(again.trades_unchanged == 1);
    CHECK(again.needs_review == 0);
}

TEST_CASE("a deposit the ledger rejects is reported without aborting the batch") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    prices.set_price("XYZ", ingest::make_utc(2024, 1, 1), ingest::parse_decimal("-0.5"));
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};

    accounting::BatchResult result;
    REQUIRE_NOTHROW(result = pipeline.import_rows({
        binance_row(1, "2024-01-01 08:00:00", "Deposit", "XYZ", "10"),
        binance_row(2, "2024-01-02 09:00:00", "Transaction Buy", "BTC", "1"),
        binance_row(3, "2024-01-02 09:00:00", "Transaction Spend", "USDT", "-42000"),
    }, ingest::ProviderMapping::binance_transaction_history()));

    CHECK(result.trades_created == 1);
    CHECK(result.lots_created == 1);
    CHECK(result.acquisitions.empty());
    CHECK(result.error_count == 1);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].find("Ledger rejected deposit") != std::string::npos);
    CHECK(ledger.lots("alice", "BTC").size() == 1);
    CHECK(ledger.lots("alice", "XYZ").empty());
}

TEST_CASE("restored trades are retracted once their rows regroup differently") {
    accounting::PriceTable prices;
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();
    std::vector<ingest::RawRecord> rows{
        binance_row(1, "2024-06-19 03:12:04", "Transaction Buy", "DOGE", "100"),
        binance_row(2, "2024-06-19 03:12:04", "Transaction Spend", "USDT", "-10"),
    };

    accounting::LotLedger first_ledger;
    accounting::ImportPipeline first{first_ledger, prices, quiet_config("alice")};
    const auto persisted = first.import_rows(rows, mapping).upserted;
    REQUIRE(persisted.size() == 1);

    accounting::LotLedger ledger;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};
    pipeline.restore(persisted);

    SECTION("unrelated rows leave restored trades alone") {
        const auto result = pipeline.import_rows({
            binance_row(7, "2024-07-01 10:00:00", "Transaction Buy", "ETH", "1"),
            binance_row(8, "2024-07-01 10:00:00", "Transaction Spend", "USDT", "-3400"),
        }, mapping);
        CHECK(result.trades_created == 1);
        CHECK(result.trades_retracted == 0);
        CHECK(ledger.lots("alice", "DOGE").size() == 1);
    }

    SECTION("a restored trade no longer produced from its rows is retracted") {
        auto aliased = ingest::ProviderMapping::binance_transaction_history();
        aliased.add_asset_alias("DOGE", "XDG");
        const auto result = pipeline.import_rows(rows, aliased);
        CHECK(result.trades_created == 1);
        CHECK(result.trades_retracted == 1);
        REQUIRE(result.retracted.size() == 1);
        CHECK(result.retracted[0] == persisted[0].id);
        CHECK(ledger.lots("alice", "DOGE").empty());
        CHECK(ledger.lots("alice", "XDG").size() == 1);
    }
}

TEST_CASE("needs_review counts only the sales of the importing source") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};

    pipeline.import_fills({fill("f1", "sell", "ETH", "1", "3000", ingest::make_utc(2024, 2, 1))});
    const auto rows = pipeline.import_rows({
        binance_row(1, "2024-03-01 12:00:00", "Transaction Buy", "BTC", "1"),
        binance_row(2, "2024-03-01 12:00:00", "Transaction Spend", "USDT", "-60000"),
    }, ingest::ProviderMapping::binance_transaction_history());

    CHECK(ledger.all_disposals().size() == 1);
    CHECK(rows.needs_review == 0);
}

TEST_CASE("reported messages are bounded but counted") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    accounting::ImportPipeline pipeline{ledger, prices, quiet_config("alice")};

    std::vector<ingest::RawRecord> rows;
    for (std::size_t i = 0; i < 30; ++i) {
        rows.push_back(binance_row(i + 1, "2024-06-19 03:12:04", "Mystery " + std::to_string(i), "BNB", "1"));
    }
    const auto result = pipeline.import_rows(rows, ingest::ProviderMapping::binance_transaction_history());

    CHECK(result.unknown_operations == 30);
    CHECK(result.error_count == 30);
    CHECK(result.errors.size() == 20);
}

TEST_CASE("pipelines for different owners share one ledger", "[concurrency]") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    const auto mapping = ingest::ProviderMapping::binance_transaction_history();
    const std::vector<std::string> owners{"alice", "bob", "carol", "dave"};

    std::vector<accounting::BatchResult> results(owners.size());
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < owners.size(); ++i) {
        workers.emplace_back([&, i]() {
            accounting::ImportPipeline pipeline{ledger, prices, quiet_config(owners[i])};
            results[i] = pipeline.import_rows(doge_history(), mapping);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (std::size_t i = 0; i < owners.size(); ++i) {
        CHECK(results[i].trades_created == 2);
        const auto holdings = ledger.holdings(owners[i]);
        REQUIRE(holdings.size() == 1);
        CHECK(holdings[0].quantity == ingest::parse_decimal("300.399"));
    }
    CHECK(ledger.all_disposals().size() == owners.size());
    CHECK(ledger.rebuild_count() == 0);
}

TEST_CASE("a pipeline requires an owner") {
    accounting::LotLedger ledger;
    accounting::PriceTable prices;
    CHECK_THROWS_AS(accounting::ImportPipeline(ledger, prices, quiet_config("")), std::invalid_argument);
}
