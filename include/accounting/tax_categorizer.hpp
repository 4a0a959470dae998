#pragma once

#include "accounting/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace accounting {

struct TermTotals {
    Decimal proceeds_usd{0};
    Decimal cost_basis_usd{0};
    Decimal pnl_usd{0};
    std::size_t portions = 0;
};

struct MonthlyTotals {
    std::string month;          // YYYY-MM
    TermTotals short_term;
    TermTotals long_term;
    std::size_t disposal_count = 0;
};

// Recomputed from a disposal set on every call.
struct TaxSummary {
    Timestamp period_start{};
    Timestamp period_end{};
    TermTotals short_term;
    TermTotals long_term;
    Decimal proceeds_usd{0};          // matched portions only
    Decimal cost_basis_usd{0};
    Decimal total_pnl_usd{0};
    Decimal deductible_fees_usd{0};
    Decimal unmatched_amount{0};
    Decimal unmatched_proceeds_usd{0};
    std::size_t disposal_count = 0;
    std::size_t needs_review_count = 0;
    std::vector<MonthlyTotals> months;
};

// One line of a capital-gains form. Unmatched remainders of a disposal
// appear as their own line without acquisition date or basis.
struct CapitalGainEntry {
    std::string description;    // "600.399 DOGE"
    std::string asset;
    Decimal amount{0};
    std::string trade_id;
    std::string lot_id;
    std::optional<Timestamp> acquired_at;
    Timestamp disposed_at{};
    Decimal proceeds_usd{0};
    std::optional<Decimal> cost_basis_usd;
    std::optional<Decimal> gain_usd;
    bool is_short_term = true;
    bool needs_review = false;
};

struct FeeTotal {
    std::string asset;
    Decimal amount{0};
    Decimal usd{0};
    std::size_t trade_count = 0;
};

// Period bounds are inclusive.
TaxSummary categorize(const std::vector<Disposal>& disposals, Timestamp period_start, Timestamp period_end);

std::vector<CapitalGainEntry> capital_gain_entries(const std::vector<Disposal>& disposals,
                                                   Timestamp period_start, Timestamp period_end);

std::vector<FeeTotal> fee_summary(const std::vector<Trade>& trades, Timestamp period_start, Timestamp period_end);

void to_json(nlohmann::json& json, const TermTotals& totals);
void to_json(nlohmann::json& json, const MonthlyTotals& totals);
void to_json(nlohmann::json& json, const TaxSummary& summary);
void to_json(nlohmann::json& json, const CapitalGainEntry& entry);
void to_json(nlohmann::json& json, const FeeTotal& total);

} // namespace accounting
