#include "accounting/import_pipeline.hpp"
#include "accounting/lot_ledger.hpp"
#include "accounting/price_source.hpp"
#include "accounting/tax_categorizer.hpp"
#include "accounting/trade_journal.hpp"
#include "ingest/record_reader.hpp"
#include "ingest/util.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct LedgerSettings {
    std::string owner;
    std::string provider = "binance";
    std::string mapping_path;
    std::string rows_path;
    std::string fills_path;
    std::string prices_path;
    std::string journal_path = "data/trade_journal.jsonl";
    int tax_year = 0;
    std::optional<ingest::Decimal> fallback_price_usd;
};

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = ingest::trim(line.substr(0, pos));
        auto value = ingest::trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value && *value ? std::string(value) : fallback;
}

LedgerSettings load_settings_from_env() {
    LedgerSettings settings;
    settings.owner = env_or("LEDGER_OWNER", "");
    if (settings.owner.empty()) {
        throw std::runtime_error("LEDGER_OWNER is not set");
    }
    settings.provider = env_or("LEDGER_PROVIDER", settings.provider);
    settings.mapping_path = env_or("LEDGER_MAPPING_PATH", "");
    settings.rows_path = env_or("LEDGER_ROWS_PATH", "");
    settings.fills_path = env_or("LEDGER_FILLS_PATH", "");
    settings.prices_path = env_or("LEDGER_PRICES_PATH", "");
    settings.journal_path = env_or("LEDGER_JOURNAL_PATH", settings.journal_path);

    const auto year = env_or("LEDGER_TAX_YEAR", "");
    settings.tax_year = year.empty() ? ingest::to_civil(std::chrono::system_clock::now()).year : std::stoi(year);

    const auto fallback = env_or("LEDGER_FALLBACK_PRICE_USD", "");
    if (!fallback.empty()) {
        settings.fallback_price_usd = ingest::parse_decimal(fallback);
    }
    return settings;
}

void persist_changes(accounting::TradeJournal& journal, const accounting::BatchResult& result) {
    for (const auto& trade : result.upserted) {
        journal.append(trade);
    }
    for (const auto& acquisition : result.acquisitions) {
        journal.append(acquisition);
    }
    for (const auto& id : result.retracted) {
        journal.retract(id);
    }
    if (!result.upserted.empty() || !result.acquisitions.empty() || !result.retracted.empty()) {
        std::cout << "[Journal] Recorded " << result.upserted.size() << " upserts, "
                  << result.acquisitions.size() << " deposit lots and " << result.retracted.size()
                  << " retractions in " << journal.path().string() << std::endl;
    }
}

} // namespace

int main() {
    load_env_file(".env");

    try {
        const auto settings = load_settings_from_env();

        const auto mapping = settings.mapping_path.empty()
                                 ? ingest::ProviderMapping::binance_transaction_history()
                                 : ingest::load_provider_mapping(settings.mapping_path);
        const auto prices = settings.prices_path.empty()
                                ? accounting::PriceTable{}
                                : accounting::load_price_table(settings.prices_path);

        accounting::PipelineConfig config;
        config.grouper.owner = settings.owner;
        config.grouper.provider = settings.provider;
        config.grouper.fallback_price_usd = settings.fallback_price_usd;

        accounting::LotLedger ledger;
        accounting::ImportPipeline pipeline{ledger, prices, config};
        accounting::TradeJournal journal{accounting::TradeJournalConfig{settings.journal_path}};

        const auto restored = journal.load();
        pipeline.restore(restored.trades, restored.acquisitions);
        std::cout << "[Journal] Restored " << restored.trades.size() << " trades and "
                  << restored.acquisitions.size() << " deposit lots from " << journal.entry_count()
                  << " entries" << std::endl;

        if (!settings.rows_path.empty()) {
            const auto rows = ingest::load_raw_records(settings.rows_path);
            const auto result = pipeline.import_rows(rows, mapping);
            persist_changes(journal, result);
            std::cout << nlohmann::json(result).dump(2) << std::endl;
        }

        if (!settings.fills_path.empty()) {
            const auto fills = ingest::load_fills(settings.fills_path);
            const auto result = pipeline.import_fills(fills);
            persist_changes(journal, result);
            std::cout << nlohmann::json(result).dump(2) << std::endl;
        }

        std::cout << "[Ledger] Holdings for " << settings.owner << ":" << std::endl;
        for (const auto& holding : ledger.holdings(settings.owner)) {
            std::cout << "  " << holding.asset << " qty=" << ingest::format_decimal(holding.quantity)
                      << " cost=" << ingest::format_decimal(holding.cost_basis_usd, 2)
                      << " lots=" << holding.open_lots << std::endl;
        }

        const auto [period_start, period_end] = ingest::year_bounds(settings.tax_year);
        const auto disposals = ledger.all_disposals();
        const auto summary = accounting::categorize(disposals, period_start, period_end);
        const auto entries = accounting::capital_gain_entries(disposals, period_start, period_end);
        const auto fees = accounting::fee_summary(pipeline.trades(), period_start, period_end);

        nlohmann::json report{
            {"tax_year", settings.tax_year},
            {"summary", summary},
            {"capital_gains", entries},
            {"fees", fees},
        };
        std::cout << "[Tax] Report for " << settings.tax_year << std::endl;
        std::cout << report.dump(2) << std::endl;
        if (summary.needs_review_count > 0) {
            std::cerr << "[Tax] WARNING: " << summary.needs_review_count
                      << " disposals need review before filing" << std::endl;
        }
    } catch (const ingest::StructuralError& e) {
        std::cerr << "[Import] Structural error, nothing imported: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
