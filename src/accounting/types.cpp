#include "accounting/types.hpp"

#include "ingest/util.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace accounting {
namespace {

std::string decimal_text(const Decimal& value) {
    return ingest::format_decimal(value);
}

Decimal decimal_field(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json.at(key).is_null()) {
        return Decimal(0);
    }
    const auto& value = json.at(key);
    return ingest::parse_decimal(value.is_string() ? value.get<std::string>() : value.dump());
}

std::string exact_text(const Decimal& value) {
    return ingest::format_decimal_exact(value);
}

// Journal entries carry epoch milliseconds in "time"; "timestamp" is the
// readable form and the only one in older entries.
Timestamp timestamp_field(const nlohmann::json& json, const char* key) {
    if (json.contains("time") && json.at("time").is_number_integer()) {
        return ingest::from_epoch_ms(json.at("time").get<std::int64_t>());
    }
    const auto text = json.at(key).get<std::string>();
    const auto parsed = ingest::parse_timestamp(text, {"%Y-%m-%dT%H:%M:%SZ"});
    if (!parsed) {
        throw std::invalid_argument(std::string("Invalid timestamp in field '") + key + "': " + text);
    }
    return *parsed;
}

nlohmann::json optional_decimal(const std::optional<Decimal>& value) {
    if (!value) {
        return nullptr;
    }
    return decimal_text(*value);
}

} // namespace

std::string to_string(TradeSide side) {
    return side == TradeSide::Buy ? "BUY" : "SELL";
}

std::string to_string(TradeKind kind) {
    switch (kind) {
        case TradeKind::Buy: return "BUY";
        case TradeKind::Sell: return "SELL";
        case TradeKind::Convert: return "CONVERT";
    }
    return "BUY";
}

bool same_economics(const Trade& lhs, const Trade& rhs) {
    return lhs.id == rhs.id &&
           lhs.kind == rhs.kind &&
           lhs.side == rhs.side &&
           lhs.timestamp == rhs.timestamp &&
           lhs.asset == rhs.asset &&
           lhs.net_amount == rhs.net_amount &&
           lhs.counter_value_usd == rhs.counter_value_usd &&
           lhs.fee_amount == rhs.fee_amount &&
           lhs.fee_asset == rhs.fee_asset &&
           lhs.fee_usd == rhs.fee_usd;
}

std::string make_trade_id(const std::string& owner,
                          const std::string& provider,
                          const std::string& bucket_key,
                          TradeKind kind,
                          TradeSide side,
                          const std::string& asset) {
    const auto key = ingest::join({owner, provider, bucket_key, to_string(kind), to_string(side), asset}, '|');
    return ingest::sha256_hex(key).substr(0, 32);
}

std::string GroupingError::describe() const {
    std::ostringstream oss;
    oss << "Bucket " << bucket_key << ": " << reason << " [";
    for (std::size_t i = 0; i < legs.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << ingest::to_string(legs[i].operation_kind) << ' '
            << legs[i].asset << ' ' << ingest::format_decimal(legs[i].signed_amount);
    }
    oss << ']';
    return oss.str();
}

void to_json(nlohmann::json& json, const Trade& trade) {
    json = nlohmann::json{
        {"id", trade.id},
        {"owner", trade.owner},
        {"provider", trade.provider},
        {"kind", to_string(trade.kind)},
        {"side", to_string(trade.side)},
        {"time", ingest::to_epoch_ms(trade.timestamp)},
        {"timestamp", ingest::format_utc(trade.timestamp)},
        {"asset", trade.asset},
        {"net_amount", exact_text(trade.net_amount)},
        {"counter_value_usd", exact_text(trade.counter_value_usd)},
        {"unit_price_usd", exact_text(trade.unit_price_usd)},
        {"fee_amount", exact_text(trade.fee_amount)},
        {"fee_asset", trade.fee_asset},
        {"fee_usd", exact_text(trade.fee_usd)},
        {"bucket_key", trade.bucket_key},
        {"source_refs", trade.source_refs},
        {"sequence", trade.sequence},
    };
}

void from_json(const nlohmann::json& json, Trade& trade) {
    trade.id = json.at("id").get<std::string>();
    trade.owner = json.at("owner").get<std::string>();
    trade.provider = json.value("provider", std::string{});

    const auto kind = json.at("kind").get<std::string>();
    if (kind == "BUY") {
        trade.kind = TradeKind::Buy;
    } else if (kind == "SELL") {
        trade.kind = TradeKind::Sell;
    } else if (kind == "CONVERT") {
        trade.kind = TradeKind::Convert;
    } else {
        throw std::invalid_argument("Unknown trade kind '" + kind + "'");
    }

    const auto side = json.at("side").get<std::string>();
    if (side != "BUY" && side != "SELL") {
        throw std::invalid_argument("Unknown trade side '" + side + "'");
    }
    trade.side = side == "BUY" ? TradeSide::Buy : TradeSide::Sell;

    trade.timestamp = timestamp_field(json, "timestamp");
    trade.asset = json.at("asset").get<std::string>();
    trade.net_amount = decimal_field(json, "net_amount");
    trade.counter_value_usd = decimal_field(json, "counter_value_usd");
    trade.unit_price_usd = decimal_field(json, "unit_price_usd");
    trade.fee_amount = decimal_field(json, "fee_amount");
    trade.fee_asset = json.value("fee_asset", std::string{});
    trade.fee_usd = decimal_field(json, "fee_usd");
    trade.bucket_key = json.value("bucket_key", std::string{});
    trade.source_refs = json.value("source_refs", std::vector<std::string>{});
    trade.sequence = json.value("sequence", std::size_t{0});
}

void to_json(nlohmann::json& json, const Acquisition& acquisition) {
    json = nlohmann::json{
        {"id", acquisition.id},
        {"owner", acquisition.owner},
        {"asset", acquisition.asset},
        {"time", ingest::to_epoch_ms(acquisition.acquired_at)},
        {"timestamp", ingest::format_utc(acquisition.acquired_at)},
        {"amount", exact_text(acquisition.amount)},
        {"cost_usd", exact_text(acquisition.cost_usd)},
    };
}

void from_json(const nlohmann::json& json, Acquisition& acquisition) {
    acquisition.id = json.at("id").get<std::string>();
    acquisition.owner = json.at("owner").get<std::string>();
    acquisition.asset = json.at("asset").get<std::string>();
    acquisition.acquired_at = timestamp_field(json, "timestamp");
    acquisition.amount = decimal_field(json, "amount");
    acquisition.cost_usd = decimal_field(json, "cost_usd");
}

void to_json(nlohmann::json& json, const Lot& lot) {
    json = nlohmann::json{
        {"id", lot.id},
        {"owner", lot.owner},
        {"asset", lot.asset},
        {"acquired_at", ingest::format_utc(lot.acquired_at)},
        {"original_amount", decimal_text(lot.original_amount)},
        {"remaining_amount", decimal_text(lot.remaining_amount)},
        {"unit_cost_usd", decimal_text(lot.unit_cost_usd)},
        {"source_id", lot.source_id},
    };
}

void to_json(nlohmann::json& json, const LotConsumption& portion) {
    json = nlohmann::json{
        {"lot_id", portion.lot_id},
        {"acquired_at", ingest::format_utc(portion.acquired_at)},
        {"amount_consumed", decimal_text(portion.amount_consumed)},
        {"cost_basis_usd", decimal_text(portion.cost_basis_usd)},
        {"proceeds_usd", decimal_text(portion.proceeds_usd)},
        {"pnl_usd", decimal_text(portion.pnl_usd)},
        {"is_short_term", portion.is_short_term},
    };
}

void to_json(nlohmann::json& json, const Disposal& disposal) {
    json = nlohmann::json{
        {"trade_id", disposal.trade_id},
        {"owner", disposal.owner},
        {"asset", disposal.asset},
        {"disposed_at", ingest::format_utc(disposal.disposed_at)},
        {"amount", decimal_text(disposal.amount)},
        {"gross_proceeds_usd", decimal_text(disposal.gross_proceeds_usd)},
        {"fee_usd", decimal_text(disposal.fee_usd)},
        {"net_proceeds_usd", decimal_text(disposal.net_proceeds_usd)},
        {"portions", disposal.portions},
        {"matched_amount", decimal_text(disposal.matched_amount)},
        {"unmatched_amount", decimal_text(disposal.unmatched_amount)},
        {"matched_cost_basis_usd", decimal_text(disposal.matched_cost_basis_usd)},
        {"total_cost_basis_usd", optional_decimal(disposal.total_cost_basis_usd)},
        {"realized_pnl_usd", optional_decimal(disposal.realized_pnl_usd)},
        {"needs_review", disposal.needs_review},
    };
}

void to_json(nlohmann::json& json, const GroupingError& error) {
    nlohmann::json legs = nlohmann::json::array();
    for (const auto& leg : error.legs) {
        legs.push_back({
            {"timestamp", ingest::format_utc(leg.timestamp)},
            {"operation_kind", ingest::to_string(leg.operation_kind)},
            {"asset", leg.asset},
            {"signed_amount", decimal_text(leg.signed_amount)},
            {"source_ref", leg.source_ref},
        });
    }
    json = nlohmann::json{
        {"bucket_key", error.bucket_key},
        {"reason", error.reason},
        {"legs", legs},
    };
}

} // namespace accounting
