#pragma once

#include "accounting/lot_ledger.hpp"
#include "accounting/price_source.hpp"
#include "accounting/trade_grouper.hpp"
#include "accounting/types.hpp"
#include "ingest/normalizer.hpp"
#include "ingest/provider_mapping.hpp"
#include "ingest/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace accounting {

struct PipelineConfig {
    GrouperConfig grouper;                 // owner and provider live here
    std::size_t max_reported_errors = 20;
    bool deposits_create_lots = true;
    bool verbose = true;
};

struct BatchResult {
    std::size_t rows_read = 0;
    std::size_t events_accepted = 0;
    std::size_t duplicates = 0;
    std::size_t ignored = 0;
    std::size_t trades_created = 0;
    std::size_t trades_updated = 0;
    std::size_t trades_unchanged = 0;
    std::size_t trades_retracted = 0;
    std::size_t discarded_trades = 0;
    std::size_t lots_created = 0;
    std::size_t disposals_posted = 0;
    std::size_t needs_review = 0;          // among the sales this batch produced
    std::size_t grouping_errors = 0;
    std::size_t parse_errors = 0;
    std::size_t unknown_operations = 0;
    std::size_t missing_fields = 0;
    std::size_t zero_amounts = 0;
    std::size_t ledger_rebuilds = 0;

    // First `max_reported_errors` messages; the counts hold the totals.
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::size_t error_count = 0;
    std::size_t warning_count = 0;

    std::vector<Trade> upserted;           // created or updated, for persistence
    std::vector<Acquisition> acquisitions; // deposit lots created or replaced, for persistence
    std::vector<std::string> retracted;    // trade ids no longer produced
};

// Runs one import source through grouping and into the shared ledger. Each
// pipeline keeps the immutable event log of its source so that a re-import
// regroups everything and upserts by trade id.
class ImportPipeline {
public:
    ImportPipeline(LotLedger& ledger, const PriceSource& prices, PipelineConfig config);

    // Throws ingest::StructuralError before touching any state.
    BatchResult import_rows(const std::vector<ingest::RawRecord>& rows, const ingest::ProviderMapping& mapping);
    BatchResult import_fills(const std::vector<ingest::ApiFill>& fills);

    // Seeds the ledger with previously persisted trades and deposit lots.
    // A restored trade is retracted once an import holds one of its source
    // rows or fills again and no longer produces it.
    std::size_t restore(const std::vector<Trade>& trades, const std::vector<Acquisition>& acquisitions = {});

    std::vector<Trade> trades() const;
    const std::vector<ingest::TransactionEvent>& events() const { return events_; }
    const PipelineConfig& config() const { return config_; }

private:
    void apply(GroupingResult grouping, std::set<std::string>& source_ids,
               const std::set<std::string>& source_refs, BatchResult& result);
    void post_deposit(const ingest::TransactionEvent& event, BatchResult& result);
    void report_error(BatchResult& result, std::string message) const;
    void report_warning(BatchResult& result, std::string message) const;
    void log_result(const char* source, const BatchResult& result) const;

    LotLedger& ledger_;
    const PriceSource& prices_;
    PipelineConfig config_;
    TradeGrouper grouper_;

    std::vector<ingest::TransactionEvent> events_;
    std::set<std::string> event_refs_;
    std::vector<ingest::ApiFill> fills_;
    std::set<std::string> fill_refs_;

    std::map<std::string, Trade> trades_;
    std::set<std::string> row_trade_ids_;
    std::set<std::string> fill_trade_ids_;
    std::set<std::string> restored_ids_;     // not yet regrouped since restore
};

void to_json(nlohmann::json& json, const BatchResult& result);

} // namespace accounting
