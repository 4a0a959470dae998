#pragma once

#include "ingest/decimal.hpp"
#include "ingest/time_utils.hpp"
#include "ingest/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace accounting {

using ingest::Decimal;
using ingest::Timestamp;

enum class TradeSide { Buy, Sell };
enum class TradeKind { Buy, Sell, Convert };

std::string to_string(TradeSide side);
std::string to_string(TradeKind kind);

// Canonical trade. `side` says whether the asset was acquired or disposed;
// CONVERT trades carry the side of their leg.
struct Trade {
    std::string id;
    std::string owner;
    std::string provider;
    TradeKind kind = TradeKind::Buy;
    TradeSide side = TradeSide::Buy;
    Timestamp timestamp{};
    std::string asset;
    Decimal net_amount{0};
    Decimal counter_value_usd{0};
    Decimal unit_price_usd{0};
    Decimal fee_amount{0};
    std::string fee_asset;
    Decimal fee_usd{0};           // USD fees not already deducted from net_amount
    std::string bucket_key;
    std::vector<std::string> source_refs;
    std::size_t sequence = 0;     // ordering among trades sharing a timestamp
};

// True when two trades with the same id describe the same economics.
bool same_economics(const Trade& lhs, const Trade& rhs);

std::string make_trade_id(const std::string& owner,
                          const std::string& provider,
                          const std::string& bucket_key,
                          TradeKind kind,
                          TradeSide side,
                          const std::string& asset);

// A lot-creating event that is not a trade: deposit, airdrop, reward.
struct Acquisition {
    std::string id;
    std::string owner;
    std::string asset;
    Timestamp acquired_at{};
    Decimal amount{0};
    Decimal cost_usd{0};
};

struct Lot {
    std::string id;
    std::string owner;
    std::string asset;
    Timestamp acquired_at{};
    Decimal original_amount{0};
    Decimal remaining_amount{0};
    Decimal unit_cost_usd{0};     // includes capitalized acquisition fees
    std::string source_id;        // trade id or deposit source_ref
};

struct LotConsumption {
    std::string lot_id;
    Timestamp acquired_at{};
    Decimal amount_consumed{0};
    Decimal cost_basis_usd{0};
    Decimal proceeds_usd{0};
    Decimal pnl_usd{0};
    bool is_short_term = true;
};

struct Disposal {
    std::string trade_id;
    std::string owner;
    std::string asset;
    Timestamp disposed_at{};
    Decimal amount{0};
    Decimal gross_proceeds_usd{0};
    Decimal fee_usd{0};
    Decimal net_proceeds_usd{0};
    std::vector<LotConsumption> portions;
    Decimal matched_amount{0};
    Decimal unmatched_amount{0};
    Decimal matched_cost_basis_usd{0};
    std::optional<Decimal> total_cost_basis_usd;   // null while any amount is unmatched
    std::optional<Decimal> realized_pnl_usd;       // null while any amount is unmatched
    bool needs_review = false;
};

// A bucket whose legs could not be balanced into trades.
struct GroupingError {
    std::string bucket_key;
    std::string reason;
    std::vector<ingest::TransactionEvent> legs;

    [[nodiscard]] std::string describe() const;
};

void to_json(nlohmann::json& json, const Trade& trade);
void from_json(const nlohmann::json& json, Trade& trade);
void to_json(nlohmann::json& json, const Acquisition& acquisition);
void from_json(const nlohmann::json& json, Acquisition& acquisition);
void to_json(nlohmann::json& json, const Lot& lot);
void to_json(nlohmann::json& json, const LotConsumption& portion);
void to_json(nlohmann::json& json, const Disposal& disposal);
void to_json(nlohmann::json& json, const GroupingError& error);

} // namespace accounting
