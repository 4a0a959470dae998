#include "accounting/import_pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace accounting {
namespace {

void add_bounded(std::vector<std::string>& list, std::size_t& count, std::string message, std::size_t limit) {
    ++count;
    if (list.size() < limit) {
        list.push_back(std::move(message));
    }
}

} // namespace

ImportPipeline::ImportPipeline(LotLedger& ledger, const PriceSource& prices, PipelineConfig config)
    : ledger_(ledger),
      prices_(prices),
      config_(std::move(config)),
      grouper_(config_.grouper, prices_) {
    if (config_.grouper.owner.empty()) {
        throw std::invalid_argument("ImportPipeline requires an owner");
    }
}

BatchResult ImportPipeline::import_rows(const std::vector<ingest::RawRecord>& rows,
                                        const ingest::ProviderMapping& mapping) {
    // Structural problems throw here, before the event log is touched.
    const auto batch = ingest::normalize_batch(rows, mapping);

    BatchResult result;
    const auto rebuilds_before = ledger_.rebuild_count();

    result.rows_read = batch.rows_read;
    result.ignored = batch.ignored;
    result.duplicates = batch.duplicates;
    result.parse_errors = batch.count(ingest::IssueKind::ParseError);
    result.missing_fields = batch.count(ingest::IssueKind::MissingField);
    result.zero_amounts = batch.count(ingest::IssueKind::ZeroAmount);
    for (const auto& entry : batch.unknown_operations) {
        result.unknown_operations += entry.second;
    }

    for (const auto& issue : batch.issues) {
        if (issue.kind == ingest::IssueKind::Duplicate || issue.kind == ingest::IssueKind::ZeroAmount) {
            report_warning(result, issue.message);
        } else {
            report_error(result, issue.message);
        }
    }

    for (const auto& event : batch.events) {
        if (event_refs_.insert(event.source_ref).second) {
            events_.push_back(event);
            ++result.events_accepted;
        } else {
            ++result.duplicates;
        }
    }

    apply(grouper_.group(events_), row_trade_ids_, event_refs_, result);
    result.ledger_rebuilds = ledger_.rebuild_count() - rebuilds_before;
    log_result("rows", result);
    return result;
}

BatchResult ImportPipeline::import_fills(const std::vector<ingest::ApiFill>& fills) {
    BatchResult result;
    const auto rebuilds_before = ledger_.rebuild_count();

    result.rows_read = fills.size();
    for (const auto& fill : fills) {
        if (fill.external_id.empty()) {
            ++result.parse_errors;
            report_error(result, "Fill of " + fill.asset + " at " + ingest::format_utc(fill.timestamp) +
                                 " has no external id");
            continue;
        }
        if (fill_refs_.insert(config_.grouper.provider + ":" + fill.external_id).second) {
            fills_.push_back(fill);
            ++result.events_accepted;
        } else {
            ++result.duplicates;
        }
    }

    apply(grouper_.from_fills(fills_), fill_trade_ids_, fill_refs_, result);
    result.ledger_rebuilds = ledger_.rebuild_count() - rebuilds_before;
    log_result("fills", result);
    return result;
}

std::size_t ImportPipeline::restore(const std::vector<Trade>& trades, const std::vector<Acquisition>& acquisitions) {
    std::size_t posted = 0;
    for (const auto& acquisition : acquisitions) {
        ledger_.post_acquisition(acquisition);
        ++posted;
    }
    for (const auto& trade : trades) {
        if (trade.side == TradeSide::Buy) {
            ledger_.post_buy(trade);
        } else {
            ledger_.post_sell(trade);
        }
        trades_[trade.id] = trade;
        auto& source_ids = trade.bucket_key.rfind(kFillBucketPrefix, 0) == 0 ? fill_trade_ids_ : row_trade_ids_;
        source_ids.insert(trade.id);
        restored_ids_.insert(trade.id);
        ++posted;
    }
    return posted;
}

std::vector<Trade> ImportPipeline::trades() const {
    std::vector<Trade> result;
    result.reserve(trades_.size());
    for (const auto& entry : trades_) {
        result.push_back(entry.second);
    }
    std::stable_sort(result.begin(), result.end(), [](const Trade& a, const Trade& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp < b.timestamp;
        }
        return a.sequence < b.sequence;
    });
    return result;
}

void ImportPipeline::apply(GroupingResult grouping, std::set<std::string>& source_ids,
                           const std::set<std::string>& source_refs, BatchResult& result) {
    result.discarded_trades += grouping.discarded_trades;
    result.grouping_errors += grouping.errors.size();
    for (const auto& error : grouping.errors) {
        report_error(result, error.describe());
    }
    for (auto& warning : grouping.warnings) {
        report_warning(result, std::move(warning));
    }

    std::set<std::string> produced;
    for (const auto& trade : grouping.trades) {
        produced.insert(trade.id);
        auto it = trades_.find(trade.id);
        if (it == trades_.end()) {
            ++result.trades_created;
            result.upserted.push_back(trade);
            trades_.emplace(trade.id, trade);
        } else if (!same_economics(it->second, trade)) {
            ++result.trades_updated;
            result.upserted.push_back(trade);
            it->second = trade;
        } else {
            ++result.trades_unchanged;
        }
    }

    // Trades this source produced before but no longer does. A restored
    // trade whose inputs were not supplied again stays as it is.
    std::set<std::string> kept = produced;
    for (const auto& id : source_ids) {
        if (produced.count(id) != 0) {
            restored_ids_.erase(id);
            continue;
        }
        const auto it = trades_.find(id);
        if (it == trades_.end()) {
            continue;
        }
        if (restored_ids_.count(id) != 0) {
            const auto& refs = it->second.source_refs;
            const auto resupplied = std::any_of(refs.begin(), refs.end(), [&source_refs](const std::string& ref) {
                return source_refs.count(ref) != 0;
            });
            if (!resupplied) {
                kept.insert(id);
                continue;
            }
            restored_ids_.erase(id);
        }
        ledger_.remove_posting(it->second.owner, it->second.asset, id);
        trades_.erase(it);
        result.retracted.push_back(id);
        ++result.trades_retracted;
    }
    source_ids = std::move(kept);

    struct Pending {
        Timestamp at{};
        const Trade* trade = nullptr;
        const ingest::TransactionEvent* transfer = nullptr;
    };
    std::vector<Pending> pending;
    pending.reserve(grouping.trades.size() + grouping.passthrough.size());
    for (const auto& trade : grouping.trades) {
        pending.push_back(Pending{trade.timestamp, &trade, nullptr});
    }
    for (const auto& event : grouping.passthrough) {
        pending.push_back(Pending{event.timestamp, nullptr, &event});
    }
    std::stable_sort(pending.begin(), pending.end(), [](const Pending& a, const Pending& b) {
        return a.at < b.at;
    });

    for (const auto& item : pending) {
        if (item.transfer != nullptr) {
            post_deposit(*item.transfer, result);
            continue;
        }

        const auto& trade = *item.trade;
        PostStatus status = PostStatus::Unchanged;
        try {
            if (trade.side == TradeSide::Buy) {
                ledger_.post_buy(trade, &status);
                if (status == PostStatus::Created) {
                    ++result.lots_created;
                }
            } else {
                ledger_.post_sell(trade, &status);
                if (status == PostStatus::Created) {
                    ++result.disposals_posted;
                }
            }
        } catch (const LedgerError& e) {
            report_error(result, std::string("Ledger rejected trade: ") + e.what());
        }
    }

    for (const auto& disposal : ledger_.all_disposals()) {
        if (disposal.owner != config_.grouper.owner || !disposal.needs_review ||
            produced.count(disposal.trade_id) == 0) {
            continue;
        }
        ++result.needs_review;
        report_warning(result, "Disposal " + disposal.trade_id + " of " + ingest::format_decimal(disposal.amount) +
                                   " " + disposal.asset + " needs review: " +
                                   ingest::format_decimal(disposal.unmatched_amount) + " unmatched");
    }
}

void ImportPipeline::post_deposit(const ingest::TransactionEvent& event, BatchResult& result) {
    // Withdrawals and transfers leave the lot queue untouched.
    if (!config_.deposits_create_lots || event.operation_kind != ingest::OperationKind::Deposit ||
        event.signed_amount <= 0 || grouper_.is_quote(event.asset)) {
        return;
    }

    auto price = prices_.historical_price(event.asset, event.timestamp);
    if (!price && config_.grouper.fallback_price_usd) {
        price = config_.grouper.fallback_price_usd;
        report_warning(result, "Deposit " + event.source_ref + " of " + event.asset +
                                   " valued at fallback price " + ingest::format_decimal(*price));
    }
    if (!price) {
        report_warning(result, "Deposit " + event.source_ref + " of " + event.asset +
                                   " has no historical price, no lot created");
        return;
    }

    Acquisition acquisition;
    acquisition.id = event.source_ref;
    acquisition.owner = config_.grouper.owner;
    acquisition.asset = event.asset;
    acquisition.acquired_at = event.timestamp;
    acquisition.amount = event.signed_amount;
    acquisition.cost_usd = event.signed_amount * *price;

    PostStatus status = PostStatus::Unchanged;
    try {
        ledger_.post_acquisition(acquisition, &status);
    } catch (const LedgerError& e) {
        report_error(result, std::string("Ledger rejected deposit: ") + e.what());
        return;
    }
    if (status == PostStatus::Created) {
        ++result.lots_created;
    }
    if (status != PostStatus::Unchanged) {
        result.acquisitions.push_back(std::move(acquisition));
    }
}

void ImportPipeline::report_error(BatchResult& result, std::string message) const {
    add_bounded(result.errors, result.error_count, std::move(message), config_.max_reported_errors);
}

void ImportPipeline::report_warning(BatchResult& result, std::string message) const {
    add_bounded(result.warnings, result.warning_count, std::move(message), config_.max_reported_errors);
}

void ImportPipeline::log_result(const char* source, const BatchResult& result) const {
    if (!config_.verbose) {
        return;
    }
    std::cout << "[Import] " << config_.grouper.provider << " " << source << " for " << config_.grouper.owner
              << ": read=" << result.rows_read
              << " accepted=" << result.events_accepted
              << " duplicates=" << result.duplicates
              << " created=" << result.trades_created
              << " updated=" << result.trades_updated
              << " lots=" << result.lots_created
              << " disposals=" << result.disposals_posted << std::endl;
    if (result.error_count > 0) {
        std::cerr << "[Import] " << result.error_count << " errors (grouping=" << result.grouping_errors
                  << ", parse=" << result.parse_errors
                  << ", unknown operations=" << result.unknown_operations << ")" << std::endl;
    }
    if (result.needs_review > 0) {
        std::cerr << "[Import] WARNING: " << result.needs_review << " disposals need review" << std::endl;
    }
}

void to_json(nlohmann::json& json, const BatchResult& result) {
    json = nlohmann::json{
        {"rows_read", result.rows_read},
        {"events_accepted", result.events_accepted},
        {"duplicates", result.duplicates},
        {"ignored", result.ignored},
        {"trades_created", result.trades_created},
        {"trades_updated", result.trades_updated},
        {"trades_unchanged", result.trades_unchanged},
        {"trades_retracted", result.trades_retracted},
        {"discarded_trades", result.discarded_trades},
        {"lots_created", result.lots_created},
        {"disposals_posted", result.disposals_posted},
        {"needs_review", result.needs_review},
        {"grouping_errors", result.grouping_errors},
        {"parse_errors", result.parse_errors},
        {"unknown_operations", result.unknown_operations},
        {"missing_fields", result.missing_fields},
        {"zero_amounts", result.zero_amounts},
        {"ledger_rebuilds", result.ledger_rebuilds},
        {"error_count", result.error_count},
        {"warning_count", result.warning_count},
        {"errors", result.errors},
        {"warnings", result.warnings},
    };
}

} // namespace accounting
