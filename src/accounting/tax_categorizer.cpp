#include "accounting/tax_categorizer.hpp"

#include <algorithm>
#include <map>

namespace accounting {
namespace {

bool in_period(Timestamp at, Timestamp start, Timestamp end) {
    return at >= start && at <= end;
}

void add_portion(TermTotals& totals, const LotConsumption& portion) {
    totals.proceeds_usd += portion.proceeds_usd;
    totals.cost_basis_usd += portion.cost_basis_usd;
    totals.pnl_usd += portion.pnl_usd;
    ++totals.portions;
}

nlohmann::json optional_decimal(const std::optional<Decimal>& value) {
    if (!value) {
        return nullptr;
    }
    return ingest::format_decimal(*value);
}

} // namespace

TaxSummary categorize(const std::vector<Disposal>& disposals, Timestamp period_start, Timestamp period_end) {
    TaxSummary summary;
    summary.period_start = period_start;
    summary.period_end = period_end;

    std::map<std::string, MonthlyTotals> months;
    for (const auto& disposal : disposals) {
        if (!in_period(disposal.disposed_at, period_start, period_end)) {
            continue;
        }

        ++summary.disposal_count;
        summary.deductible_fees_usd += disposal.fee_usd;

        auto& month = months[ingest::month_key(disposal.disposed_at)];
        month.month = ingest::month_key(disposal.disposed_at);
        ++month.disposal_count;

        Decimal matched_proceeds{0};
        for (const auto& portion : disposal.portions) {
            if (portion.is_short_term) {
                add_portion(summary.short_term, portion);
                add_portion(month.short_term, portion);
            } else {
                add_portion(summary.long_term, portion);
                add_portion(month.long_term, portion);
            }
            matched_proceeds += portion.proceeds_usd;
        }

        if (disposal.needs_review) {
            ++summary.needs_review_count;
            summary.unmatched_amount += disposal.unmatched_amount;
            summary.unmatched_proceeds_usd += disposal.net_proceeds_usd - matched_proceeds;
        }
    }

    summary.proceeds_usd = summary.short_term.proceeds_usd + summary.long_term.proceeds_usd;
    summary.cost_basis_usd = summary.short_term.cost_basis_usd + summary.long_term.cost_basis_usd;
    summary.total_pnl_usd = summary.short_term.pnl_usd + summary.long_term.pnl_usd;

    summary.months.reserve(months.size());
    for (auto& entry : months) {
        summary.months.push_back(std::move(entry.second));
    }
    return summary;
}

std::vector<CapitalGainEntry> capital_gain_entries(const std::vector<Disposal>& disposals,
                                                   Timestamp period_start, Timestamp period_end) {
    std::vector<CapitalGainEntry> entries;
    for (const auto& disposal : disposals) {
        if (!in_period(disposal.disposed_at, period_start, period_end)) {
            continue;
        }

        Decimal matched_proceeds{0};
        for (const auto& portion : disposal.portions) {
            CapitalGainEntry entry;
            entry.description = ingest::format_decimal(portion.amount_consumed) + " " + disposal.asset;
            entry.asset = disposal.asset;
            entry.amount = portion.amount_consumed;
            entry.trade_id = disposal.trade_id;
            entry.lot_id = portion.lot_id;
            entry.acquired_at = portion.acquired_at;
            entry.disposed_at = disposal.disposed_at;
            entry.proceeds_usd = portion.proceeds_usd;
            entry.cost_basis_usd = portion.cost_basis_usd;
            entry.gain_usd = portion.pnl_usd;
            entry.is_short_term = portion.is_short_term;
            entries.push_back(std::move(entry));
            matched_proceeds += portion.proceeds_usd;
        }

        if (disposal.needs_review && disposal.unmatched_amount > 0) {
            CapitalGainEntry entry;
            entry.description = ingest::format_decimal(disposal.unmatched_amount) + " " + disposal.asset;
            entry.asset = disposal.asset;
            entry.amount = disposal.unmatched_amount;
            entry.trade_id = disposal.trade_id;
            entry.disposed_at = disposal.disposed_at;
            entry.proceeds_usd = disposal.net_proceeds_usd - matched_proceeds;
            entry.needs_review = true;
            entries.push_back(std::move(entry));
        }
    }

    std::stable_sort(entries.begin(), entries.end(), [](const CapitalGainEntry& a, const CapitalGainEntry& b) {
        return a.disposed_at < b.disposed_at;
    });
    return entries;
}

std::vector<FeeTotal> fee_summary(const std::vector<Trade>& trades, Timestamp period_start, Timestamp period_end) {
    std::map<std::string, FeeTotal> totals;
    for (const auto& trade : trades) {
        if (!in_period(trade.timestamp, period_start, period_end) || trade.fee_amount <= 0 || trade.fee_asset.empty()) {
            continue;
        }
        auto& total = totals[trade.fee_asset];
        total.asset = trade.fee_asset;
        total.amount += trade.fee_amount;
        // Same-asset fees were taken out of net_amount; value them at the trade's price.
        if (trade.fee_asset == trade.asset) {
            total.usd += trade.fee_amount * trade.unit_price_usd;
        } else {
            total.usd += trade.fee_usd;
        }
        ++total.trade_count;
    }

    std::vector<FeeTotal> result;
    result.reserve(totals.size());
    for (auto& entry : totals) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

void to_json(nlohmann::json& json, const TermTotals& totals) {
    json = nlohmann::json{
        {"proceeds_usd", ingest::format_decimal(totals.proceeds_usd)},
        {"cost_basis_usd", ingest::format_decimal(totals.cost_basis_usd)},
        {"pnl_usd", ingest::format_decimal(totals.pnl_usd)},
        {"portions", totals.portions},
    };
}

void to_json(nlohmann::json& json, const MonthlyTotals& totals) {
    json = nlohmann::json{
        {"month", totals.month},
        {"short_term", totals.short_term},
        {"long_term", totals.long_term},
        {"disposal_count", totals.disposal_count},
    };
}

void to_json(nlohmann::json& json, const TaxSummary& summary) {
    json = nlohmann::json{
        {"period_start", ingest::format_utc(summary.period_start)},
        {"period_end", ingest::format_utc(summary.period_end)},
        {"short_term", summary.short_term},
        {"long_term", summary.long_term},
        {"proceeds_usd", ingest::format_decimal(summary.proceeds_usd)},
        {"cost_basis_usd", ingest::format_decimal(summary.cost_basis_usd)},
        {"total_pnl_usd", ingest::format_decimal(summary.total_pnl_usd)},
        {"deductible_fees_usd", ingest::format_decimal(summary.deductible_fees_usd)},
        {"unmatched_amount", ingest::format_decimal(summary.unmatched_amount)},
        {"unmatched_proceeds_usd", ingest::format_decimal(summary.unmatched_proceeds_usd)},
        {"disposal_count", summary.disposal_count},
        {"needs_review_count", summary.needs_review_count},
        {"months", summary.months},
    };
}

void to_json(nlohmann::json& json, const CapitalGainEntry& entry) {
    json = nlohmann::json{
        {"description", entry.description},
        {"asset", entry.asset},
        {"amount", ingest::format_decimal(entry.amount)},
        {"trade_id", entry.trade_id},
        {"lot_id", entry.lot_id},
        {"acquired_at", entry.acquired_at ? nlohmann::json(ingest::format_utc(*entry.acquired_at)) : nlohmann::json()},
        {"disposed_at", ingest::format_utc(entry.disposed_at)},
        {"proceeds_usd", ingest::format_decimal(entry.proceeds_usd)},
        {"cost_basis_usd", optional_decimal(entry.cost_basis_usd)},
        {"gain_usd", optional_decimal(entry.gain_usd)},
        {"term", entry.is_short_term ? "short" : "long"},
        {"needs_review", entry.needs_review},
    };
}

void to_json(nlohmann::json& json, const FeeTotal& total) {
    json = nlohmann::json{
        {"asset", total.asset},
        {"amount", ingest::format_decimal(total.amount)},
        {"usd", ingest::format_decimal(total.usd)},
        {"trade_count", total.trade_count},
    };
}

} // namespace accounting
