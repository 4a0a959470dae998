#pragma once

#include "accounting/price_source.hpp"
#include "accounting/types.hpp"
#include "ingest/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace accounting {

// Bucket keys of trades built from exchange fills start with this.
constexpr const char* kFillBucketPrefix = "fill:";

struct GrouperConfig {
    std::string owner;
    std::string provider = "binance";
    std::set<std::string> quote_assets{"USDT", "USDC", "BUSD", "USD"};
    bool drop_internal_transfers = true;
    // Used when a historical price is missing. Unset means the bucket is
    // reported as a GroupingError instead.
    std::optional<Decimal> fallback_price_usd;
};

struct GroupingResult {
    std::vector<Trade> trades;
    std::vector<ingest::TransactionEvent> passthrough;   // deposits, withdrawals, kept transfers
    std::vector<GroupingError> errors;
    std::vector<std::string> warnings;
    std::size_t dropped_transfers = 0;
    std::size_t discarded_trades = 0;                     // net_amount <= 0
};

// Splits `total` by `weights`; the last part takes the remainder so the
// parts always sum to `total` exactly.
std::vector<Decimal> distribute_proportionally(const Decimal& total, const std::vector<Decimal>& weights);

// Collapses the legs of one real-world trade into canonical Trades.
class TradeGrouper {
public:
    TradeGrouper(GrouperConfig config, const PriceSource& prices);

    GroupingResult group(const std::vector<ingest::TransactionEvent>& events) const;

    // Exchange-API fills are already one trade each; transfers pass through.
    GroupingResult from_fills(const std::vector<ingest::ApiFill>& fills) const;

    [[nodiscard]] bool is_quote(const std::string& asset) const;
    [[nodiscard]] const GrouperConfig& config() const { return config_; }

private:
    enum class LegRole { Acquired, Proceeds, Disposed, Payment, Fee, Unexpected };

    struct Leg {
        const ingest::TransactionEvent* event = nullptr;
        LegRole role = LegRole::Unexpected;
    };

    using SubGroup = std::vector<Leg>;

    LegRole classify_trade_leg(const ingest::TransactionEvent& event) const;
    LegRole classify_convert_leg(const ingest::TransactionEvent& event) const;

    std::vector<SubGroup> split_independent(const std::vector<Leg>& legs) const;

    void resolve_trade_group(const std::string& bucket_key, const SubGroup& group,
                             GroupingResult& result) const;
    void resolve_convert_group(const std::string& bucket_key, const SubGroup& group,
                               GroupingResult& result) const;

    std::optional<Decimal> price_with_fallback(const std::string& asset, Timestamp at,
                                               const std::string& context,
                                               GroupingResult& result) const;

    Trade make_trade(const std::string& bucket_key, TradeKind kind, TradeSide side,
                     const std::string& asset, Timestamp at) const;

    void emit(Trade trade, GroupingResult& result) const;

    GrouperConfig config_;
    const PriceSource& prices_;
};

} // namespace accounting
