#include "accounting/trade_grouper.hpp"

#include "ingest/util.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace accounting {
namespace {

using ingest::OperationKind;
using ingest::TransactionEvent;

enum class BucketClass { Trade, Convert };

std::string bucket_class_name(BucketClass cls) {
    return cls == BucketClass::Trade ? "TRADE" : "CONVERT";
}

std::optional<BucketClass> bucket_class_of(OperationKind kind) {
    switch (kind) {
        case OperationKind::BuyLeg:
        case OperationKind::SellLeg:
        case OperationKind::SpendLeg:
        case OperationKind::RevenueLeg:
        case OperationKind::FeeLeg:
            return BucketClass::Trade;
        case OperationKind::ConvertLeg:
            return BucketClass::Convert;
        default:
            return std::nullopt;
    }
}

// Per-asset totals in first-seen order.
class AssetTotals {
public:
    void add(const std::string& asset, const Decimal& amount) {
        auto it = totals_.find(asset);
        if (it == totals_.end()) {
            order_.push_back(asset);
            totals_.emplace(asset, amount);
        } else {
            it->second += amount;
        }
    }

    bool empty() const { return order_.empty(); }
    bool contains(const std::string& asset) const { return totals_.count(asset) != 0; }
    const std::vector<std::string>& assets() const { return order_; }

    Decimal get(const std::string& asset) const {
        const auto it = totals_.find(asset);
        return it == totals_.end() ? Decimal(0) : it->second;
    }

    std::vector<Decimal> amounts() const {
        std::vector<Decimal> values;
        values.reserve(order_.size());
        for (const auto& asset : order_) {
            values.push_back(totals_.at(asset));
        }
        return values;
    }

private:
    std::vector<std::string> order_;
    std::map<std::string, Decimal> totals_;
};

template <typename Legs>
std::vector<TransactionEvent> raw_legs(const Legs& legs) {
    std::vector<TransactionEvent> events;
    events.reserve(legs.size());
    for (const auto& leg : legs) {
        events.push_back(*leg.event);
    }
    return events;
}

template <typename Legs>
std::vector<std::string> leg_refs(const Legs& legs) {
    std::vector<std::string> refs;
    refs.reserve(legs.size());
    for (const auto& leg : legs) {
        refs.push_back(leg.event->source_ref);
    }
    return refs;
}

template <typename Legs>
Timestamp earliest(const Legs& legs) {
    Timestamp at = legs.front().event->timestamp;
    for (const auto& leg : legs) {
        at = std::min(at, leg.event->timestamp);
    }
    return at;
}

TransactionEvent fill_as_event(const ingest::ApiFill& fill, OperationKind kind,
                               const Decimal& signed_amount, const std::string& source_ref) {
    TransactionEvent event;
    event.timestamp = fill.timestamp;
    event.operation_kind = kind;
    event.asset = ingest::to_upper_copy(ingest::trim(fill.asset));
    event.signed_amount = signed_amount;
    event.source_ref = source_ref;
    return event;
}

// Fees that do not belong to the traded asset itself, shared across the
// trades of one side of a group.
struct SharedFees {
    Decimal amount{0};      // in `asset`
    std::string asset;      // empty when the fees span several assets
    Decimal usd{0};
};

} // namespace

std::vector<Decimal> distribute_proportionally(const Decimal& total, const std::vector<Decimal>& weights) {
    std::vector<Decimal> parts;
    parts.reserve(weights.size());
    if (weights.empty()) {
        return parts;
    }

    Decimal weight_sum{0};
    for (const auto& weight : weights) {
        weight_sum += weight;
    }

    Decimal allocated{0};
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (i + 1 == weights.size()) {
            parts.push_back(Decimal(total - allocated));
            break;
        }
        Decimal part{0};
        if (weight_sum > 0) {
            part = total * weights[i] / weight_sum;
        }
        allocated += part;
        parts.push_back(part);
    }
    return parts;
}

TradeGrouper::TradeGrouper(GrouperConfig config, const PriceSource& prices)
    : config_(std::move(config)), prices_(prices) {
    std::set<std::string> quotes;
    for (const auto& asset : config_.quote_assets) {
        quotes.insert(ingest::to_upper_copy(asset));
    }
    config_.quote_assets = std::move(quotes);
}

bool TradeGrouper::is_quote(const std::string& asset) const {
    return config_.quote_assets.count(asset) != 0;
}

TradeGrouper::LegRole TradeGrouper::classify_trade_leg(const TransactionEvent& event) const {
    const bool quote = is_quote(event.asset);
    switch (event.operation_kind) {
        case OperationKind::FeeLeg:
            return LegRole::Fee;
        case OperationKind::BuyLeg:
        case OperationKind::RevenueLeg:
            if (event.signed_amount > 0) {
                return quote ? LegRole::Proceeds : LegRole::Acquired;
            }
            return LegRole::Unexpected;
        case OperationKind::SellLeg:
        case OperationKind::SpendLeg:
            if (event.signed_amount < 0) {
                return quote ? LegRole::Payment : LegRole::Disposed;
            }
            return LegRole::Unexpected;
        default:
            return LegRole::Unexpected;
    }
}

TradeGrouper::LegRole TradeGrouper::classify_convert_leg(const TransactionEvent& event) const {
    const bool quote = is_quote(event.asset);
    if (event.signed_amount > 0) {
        return quote ? LegRole::Proceeds : LegRole::Acquired;
    }
    if (event.signed_amount < 0) {
        return quote ? LegRole::Payment : LegRole::Disposed;
    }
    return LegRole::Unexpected;
}

// Two fills inside the same minute show up as a repeat of the leading leg
// after the first fill already balanced; that repeat opens the next group.
std::vector<TradeGrouper::SubGroup> TradeGrouper::split_independent(const std::vector<Leg>& legs) const {
    std::vector<SubGroup> groups;
    SubGroup current;
    std::set<std::pair<LegRole, std::string>> seen;
    bool has_in = false;
    bool has_out = false;

    for (const auto& leg : legs) {
        const auto key = std::make_pair(leg.role, leg.event->asset);
        const bool balanced = has_in && has_out;
        if (!current.empty() && balanced && leg.role == current.front().role && seen.count(key) != 0) {
            groups.push_back(std::move(current));
            current.clear();
            seen.clear();
            has_in = false;
            has_out = false;
        }

        current.push_back(leg);
        seen.insert(key);
        if (leg.role == LegRole::Acquired || leg.role == LegRole::Proceeds) {
            has_in = true;
        } else if (leg.role == LegRole::Disposed || leg.role == LegRole::Payment) {
            has_out = true;
        }
    }

    if (!current.empty()) {
        groups.push_back(std::move(current));
    }
    return groups;
}

GroupingResult TradeGrouper::group(const std::vector<TransactionEvent>& events) const {
    GroupingResult result;

    std::map<std::pair<std::string, BucketClass>, std::vector<const TransactionEvent*>> buckets;
    for (const auto& event : events) {
        switch (event.operation_kind) {
            case OperationKind::Transfer:
                if (config_.drop_internal_transfers) {
                    ++result.dropped_transfers;
                } else {
                    result.passthrough.push_back(event);
                }
                continue;
            case OperationKind::Deposit:
            case OperationKind::Withdrawal:
                result.passthrough.push_back(event);
                continue;
            case OperationKind::Ignored:
                continue;
            default:
                break;
        }

        const auto cls = bucket_class_of(event.operation_kind);
        if (!cls) {
            continue;
        }
        buckets[{ingest::minute_key(event.timestamp), *cls}].push_back(&event);
    }

    for (const auto& [key, bucket] : buckets) {
        const auto& [minute, cls] = key;

        std::vector<Leg> legs;
        legs.reserve(bucket.size());
        for (const auto* event : bucket) {
            const auto role = cls == BucketClass::Trade ? classify_trade_leg(*event)
                                                        : classify_convert_leg(*event);
            legs.push_back(Leg{event, role});
        }

        const auto groups = split_independent(legs);
        for (std::size_t index = 0; index < groups.size(); ++index) {
            const auto bucket_key = minute + "|" + bucket_class_name(cls) + "|" + std::to_string(index);
            if (cls == BucketClass::Trade) {
                resolve_trade_group(bucket_key, groups[index], result);
            } else {
                resolve_convert_group(bucket_key, groups[index], result);
            }
        }
    }

    std::stable_sort(result.trades.begin(), result.trades.end(), [](const Trade& a, const Trade& b) {
        return a.timestamp < b.timestamp;
    });
    for (std::size_t i = 0; i < result.trades.size(); ++i) {
        result.trades[i].sequence = i;
    }
    return result;
}

void TradeGrouper::resolve_trade_group(const std::string& bucket_key, const SubGroup& group,
                                       GroupingResult& result) const {
    const auto fail = [&](std::string reason) {
        result.errors.push_back(GroupingError{bucket_key, std::move(reason), raw_legs(group)});
    };

    AssetTotals acquired;
    AssetTotals disposed;
    AssetTotals fees;
    AssetTotals embedded_fees;
    Decimal payment{0};
    Decimal proceeds{0};
    const Timestamp at = earliest(group);

    for (const auto& leg : group) {
        const auto& event = *leg.event;
        const Decimal amount = ingest::abs_decimal(event.signed_amount);
        switch (leg.role) {
            case LegRole::Acquired:
                acquired.add(event.asset, amount);
                break;
            case LegRole::Disposed:
                disposed.add(event.asset, amount);
                break;
            case LegRole::Payment:
                payment += amount;
                break;
            case LegRole::Proceeds:
                proceeds += amount;
                break;
            case LegRole::Fee:
                fees.add(event.asset, amount);
                break;
            case LegRole::Unexpected:
                fail("unexpected sign on " + ingest::to_string(event.operation_kind) + " " + event.asset);
                return;
        }
        if (event.embedded_fee && (leg.role == LegRole::Acquired || leg.role == LegRole::Disposed)) {
            embedded_fees.add(event.asset, *event.embedded_fee);
        }
    }

    const bool buy_side = !acquired.empty() || payment > 0;
    const bool sell_side = !disposed.empty() || proceeds > 0;
    if (!buy_side && !sell_side) {
        fail("fee legs without a matching trade");
        return;
    }
    if (!acquired.empty() && payment == 0) {
        fail("acquired legs without a quote-currency spend leg");
        return;
    }
    if (acquired.empty() && payment > 0) {
        fail("quote-currency spend leg without an acquired asset");
        return;
    }
    if (!disposed.empty() && proceeds == 0) {
        fail("disposed legs without a quote-currency revenue leg");
        return;
    }
    if (disposed.empty() && proceeds > 0) {
        fail("quote-currency revenue leg without a disposed asset");
        return;
    }

    SharedFees shared;
    bool mixed_fee_assets = false;
    for (const auto& asset : fees.assets()) {
        if (acquired.contains(asset) || disposed.contains(asset)) {
            continue;
        }
        const Decimal amount = fees.get(asset);
        const auto price = price_with_fallback(asset, at, "fee leg", result);
        if (!price) {
            fail("no historical price for fee asset " + asset);
            return;
        }
        if (!mixed_fee_assets && shared.asset.empty()) {
            shared.asset = asset;
        } else if (asset != shared.asset) {
            mixed_fee_assets = true;
            shared.asset.clear();
            shared.amount = 0;
        }
        if (!mixed_fee_assets) {
            shared.amount += amount;
        }
        shared.usd += amount * *price;
    }

    const auto build_side = [&](const AssetTotals& legs, const Decimal& counter_total,
                                TradeKind kind, TradeSide side, bool carries_shared_fees) {
        const auto weights = legs.amounts();
        const auto counters = distribute_proportionally(counter_total, weights);
        const auto fee_usd = distribute_proportionally(carries_shared_fees ? shared.usd : Decimal(0), weights);
        const auto fee_amounts = distribute_proportionally(carries_shared_fees ? shared.amount : Decimal(0), weights);

        for (std::size_t i = 0; i < weights.size(); ++i) {
            const auto& asset = legs.assets()[i];
            // Explicit fee legs win over a fee quoted in the remark.
            const Decimal own_fee = fees.contains(asset) ? fees.get(asset) : embedded_fees.get(asset);

            Trade trade = make_trade(bucket_key, kind, side, asset, at);
            trade.net_amount = weights[i] - own_fee;
            trade.counter_value_usd = counters[i];
            trade.fee_usd = fee_usd[i];
            if (own_fee > 0) {
                trade.fee_amount = own_fee;
                trade.fee_asset = asset;
            } else if (fee_amounts[i] > 0) {
                trade.fee_amount = fee_amounts[i];
                trade.fee_asset = shared.asset;
            }
            trade.source_refs = leg_refs(group);
            emit(std::move(trade), result);
        }
    };

    // Quote and third-asset fees are charged on the sell side when a group
    // holds both.
    if (!disposed.empty()) {
        build_side(disposed, proceeds, TradeKind::Sell, TradeSide::Sell, true);
    }
    if (!acquired.empty()) {
        build_side(acquired, payment, TradeKind::Buy, TradeSide::Buy, disposed.empty());
    }
}

void TradeGrouper::resolve_convert_group(const std::string& bucket_key, const SubGroup& group,
                                         GroupingResult& result) const {
    const auto fail = [&](std::string reason) {
        result.errors.push_back(GroupingError{bucket_key, std::move(reason), raw_legs(group)});
    };

    AssetTotals acquired;
    AssetTotals disposed;
    Decimal cash_in{0};
    Decimal cash_out{0};
    const Timestamp at = earliest(group);

    for (const auto& leg : group) {
        const auto& event = *leg.event;
        const Decimal amount = ingest::abs_decimal(event.signed_amount);
        switch (leg.role) {
            case LegRole::Acquired:
                acquired.add(event.asset, amount);
                break;
            case LegRole::Disposed:
                disposed.add(event.asset, amount);
                break;
            case LegRole::Proceeds:
                cash_in += amount;
                break;
            case LegRole::Payment:
                cash_out += amount;
                break;
            case LegRole::Fee:
            case LegRole::Unexpected:
                fail("unexpected convert leg " + event.asset);
                return;
        }
    }

    const bool has_out = !disposed.empty() || cash_out > 0;
    const bool has_in = !acquired.empty() || cash_in > 0;
    if (!has_out) {
        fail("convert without a disposed leg");
        return;
    }
    if (!has_in) {
        fail("convert without an acquired leg");
        return;
    }
    if (acquired.empty() && disposed.empty()) {
        result.warnings.push_back("Bucket " + bucket_key + ": convert between quote currencies ignored");
        return;
    }

    // Quote-currency legs are cash and value the opposite side exactly.
    const auto value_side = [&](const AssetTotals& legs, bool opposite_is_cash_only,
                                const Decimal& cash) -> std::optional<std::vector<Decimal>> {
        if (opposite_is_cash_only) {
            return distribute_proportionally(cash, legs.amounts());
        }
        std::vector<Decimal> values;
        for (const auto& asset : legs.assets()) {
            const auto price = price_with_fallback(asset, at, "convert leg", result);
            if (!price) {
                fail("no historical price for " + asset + " at " + ingest::format_utc(at));
                return std::nullopt;
            }
            values.push_back(Decimal(legs.get(asset) * *price));
        }
        return values;
    };

    const auto disposed_values = value_side(disposed, acquired.empty(), cash_in);
    if (!disposed_values) {
        return;
    }
    const auto acquired_values = value_side(acquired, disposed.empty(), cash_out);
    if (!acquired_values) {
        return;
    }

    const auto emit_side = [&](const AssetTotals& legs, const std::vector<Decimal>& values, TradeSide side) {
        for (std::size_t i = 0; i < values.size(); ++i) {
            const auto& asset = legs.assets()[i];
            Trade trade = make_trade(bucket_key, TradeKind::Convert, side, asset, at);
            trade.net_amount = legs.get(asset);
            trade.counter_value_usd = values[i];
            trade.source_refs = leg_refs(group);
            emit(std::move(trade), result);
        }
    };

    emit_side(disposed, *disposed_values, TradeSide::Sell);
    emit_side(acquired, *acquired_values, TradeSide::Buy);
}

GroupingResult TradeGrouper::from_fills(const std::vector<ingest::ApiFill>& fills) const {
    GroupingResult result;

    std::vector<const ingest::ApiFill*> ordered;
    ordered.reserve(fills.size());
    for (const auto& fill : fills) {
        ordered.push_back(&fill);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        return a->timestamp < b->timestamp;
    });

    std::size_t transfer_sequence = 0;
    for (const auto* fill : ordered) {
        const auto type = ingest::to_lower_copy(ingest::trim(fill->type));
        const auto asset = ingest::to_upper_copy(ingest::trim(fill->asset));
        const auto source_ref = config_.provider + ":" + fill->external_id;
        const auto bucket_key = kFillBucketPrefix + fill->external_id;

        if (type == "deposit" || type == "withdrawal" || type == "transfer") {
            const auto kind = type == "deposit"     ? OperationKind::Deposit
                              : type == "withdrawal" ? OperationKind::Withdrawal
                                                     : OperationKind::Transfer;
            const Decimal signed_amount = kind == OperationKind::Withdrawal
                                              ? Decimal(-ingest::abs_decimal(fill->quantity))
                                              : ingest::abs_decimal(fill->quantity);
            auto event = fill_as_event(*fill, kind, signed_amount, source_ref);
            if (fill->quantity == 0) {
                result.errors.push_back(GroupingError{bucket_key, "zero-quantity " + type, {event}});
                continue;
            }
            if (kind == OperationKind::Transfer && config_.drop_internal_transfers) {
                ++result.dropped_transfers;
                continue;
            }
            event.sequence = transfer_sequence++;
            result.passthrough.push_back(std::move(event));
            continue;
        }

        const bool is_buy = type == "buy";
        const auto leg = fill_as_event(*fill, is_buy ? OperationKind::BuyLeg : OperationKind::SellLeg,
                                       is_buy ? fill->quantity : Decimal(-fill->quantity), source_ref);
        if (!is_buy && type != "sell") {
            result.errors.push_back(GroupingError{bucket_key, "unsupported fill type '" + fill->type + "'", {leg}});
            continue;
        }
        if (fill->quantity <= 0 || fill->price < 0) {
            result.errors.push_back(GroupingError{bucket_key, "fill with non-positive quantity or negative price", {leg}});
            continue;
        }

        const auto quote = ingest::to_upper_copy(ingest::trim(fill->quote_asset));
        const auto quote_usd = price_with_fallback(quote, fill->timestamp, "fill quote", result);
        if (!quote_usd) {
            result.errors.push_back(GroupingError{bucket_key, "no historical price for quote asset " + quote, {leg}});
            continue;
        }

        const auto side = is_buy ? TradeSide::Buy : TradeSide::Sell;
        Trade trade = make_trade(bucket_key, is_buy ? TradeKind::Buy : TradeKind::Sell, side, asset, fill->timestamp);
        trade.net_amount = fill->quantity;
        trade.counter_value_usd = fill->quantity * fill->price * *quote_usd;
        trade.source_refs = {source_ref};

        if (fill->fee_amount > 0) {
            const auto fee_asset = ingest::to_upper_copy(ingest::trim(fill->fee_asset));
            trade.fee_amount = fill->fee_amount;
            trade.fee_asset = fee_asset;
            if (fee_asset == asset) {
                trade.net_amount -= fill->fee_amount;
            } else if (fee_asset == quote) {
                trade.fee_usd = fill->fee_amount * *quote_usd;
            } else {
                const auto fee_price = price_with_fallback(fee_asset, fill->timestamp, "fill fee", result);
                if (!fee_price) {
                    result.errors.push_back(GroupingError{bucket_key, "no historical price for fee asset " + fee_asset, {leg}});
                    continue;
                }
                trade.fee_usd = fill->fee_amount * *fee_price;
            }
        }

        emit(std::move(trade), result);
    }

    for (std::size_t i = 0; i < result.trades.size(); ++i) {
        result.trades[i].sequence = i;
    }
    return result;
}

std::optional<Decimal> TradeGrouper::price_with_fallback(const std::string& asset, Timestamp at,
                                                         const std::string& context,
                                                         GroupingResult& result) const {
    if (is_quote(asset)) {
        return Decimal(1);
    }
    if (auto price = prices_.historical_price(asset, at)) {
        return price;
    }
    if (config_.fallback_price_usd) {
        result.warnings.push_back("No historical price for " + asset + " at " + ingest::format_utc(at) +
                                  " (" + context + "), using fallback " +
                                  ingest::format_decimal(*config_.fallback_price_usd));
        return config_.fallback_price_usd;
    }
    return std::nullopt;
}

Trade TradeGrouper::make_trade(const std::string& bucket_key, TradeKind kind, TradeSide side,
                               const std::string& asset, Timestamp at) const {
    Trade trade;
    trade.id = make_trade_id(config_.owner, config_.provider, bucket_key, kind, side, asset);
    trade.owner = config_.owner;
    trade.provider = config_.provider;
    trade.kind = kind;
    trade.side = side;
    trade.timestamp = at;
    trade.asset = asset;
    trade.bucket_key = bucket_key;
    return trade;
}

void TradeGrouper::emit(Trade trade, GroupingResult& result) const {
    if (trade.net_amount <= 0) {
        ++result.discarded_trades;
        result.warnings.push_back("Bucket " + trade.bucket_key + ": discarded " + to_string(trade.kind) + " " +
                                  trade.asset + " with non-positive net amount " +
                                  ingest::format_decimal(trade.net_amount));
        return;
    }
    trade.unit_price_usd = trade.counter_value_usd / trade.net_amount;
    result.trades.push_back(std::move(trade));
}

} // namespace accounting
