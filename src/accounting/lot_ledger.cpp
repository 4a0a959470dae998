#include "accounting/lot_ledger.hpp"

#include <algorithm>
#include <iostream>

namespace accounting {
namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

const std::string& posting_id(const std::variant<Acquisition, Trade>& entry) {
    return std::visit([](const auto& value) -> const std::string& { return value.id; }, entry);
}

Timestamp posting_time(const std::variant<Acquisition, Trade>& entry) {
    return std::visit(overloaded{
        [](const Acquisition& acquisition) { return acquisition.acquired_at; },
        [](const Trade& trade) { return trade.timestamp; },
    }, entry);
}

bool same_acquisition(const Acquisition& lhs, const Acquisition& rhs) {
    return lhs.id == rhs.id &&
           lhs.owner == rhs.owner &&
           lhs.asset == rhs.asset &&
           lhs.acquired_at == rhs.acquired_at &&
           lhs.amount == rhs.amount &&
           lhs.cost_usd == rhs.cost_usd;
}

void require_postable(const Trade& trade, TradeSide expected, const char* operation) {
    if (trade.side != expected) {
        throw LedgerError(std::string(operation) + ": trade " + trade.id + " has side " + to_string(trade.side));
    }
    if (trade.id.empty() || trade.owner.empty() || trade.asset.empty()) {
        throw LedgerError(std::string(operation) + ": trade is missing id, owner or asset");
    }
    if (trade.net_amount <= 0) {
        throw LedgerError(std::string(operation) + ": trade " + trade.id + " has non-positive net amount");
    }
}

void set_status(PostStatus* status, PostStatus value) {
    if (status != nullptr) {
        *status = value;
    }
}

void advance(std::optional<Timestamp>& latest, Timestamp at) {
    if (!latest || *latest < at) {
        latest = at;
    }
}

} // namespace

Acquisition acquisition_from_trade(const Trade& trade) {
    Acquisition acquisition;
    acquisition.id = trade.id;
    acquisition.owner = trade.owner;
    acquisition.asset = trade.asset;
    acquisition.acquired_at = trade.timestamp;
    acquisition.amount = trade.net_amount;
    // Acquisition fees not already taken out of net_amount are capitalized.
    acquisition.cost_usd = trade.counter_value_usd + trade.fee_usd;
    return acquisition;
}

Lot LotLedger::post_buy(const Trade& trade, PostStatus* status) {
    require_postable(trade, TradeSide::Buy, "post_buy");
    return post_acquisition(acquisition_from_trade(trade), status);
}

Lot LotLedger::post_acquisition(const Acquisition& acquisition, PostStatus* status) {
    if (acquisition.id.empty() || acquisition.owner.empty() || acquisition.asset.empty()) {
        throw LedgerError("post_acquisition: acquisition is missing id, owner or asset");
    }
    if (acquisition.amount <= 0 || acquisition.cost_usd < 0) {
        throw LedgerError("post_acquisition: acquisition " + acquisition.id + " has invalid amount or cost");
    }

    auto& book = book_for(acquisition.owner, acquisition.asset);
    std::lock_guard<std::mutex> lock(book.mutex);
    return upsert_acquisition(book, acquisition, status);
}

Lot LotLedger::upsert_acquisition(KeyBook& book, const Acquisition& acquisition, PostStatus* status) {
    const BookKey key{acquisition.owner, acquisition.asset};
    const auto find_lot = [&book](const std::string& id) {
        const auto it = std::find_if(book.lots.begin(), book.lots.end(),
                                     [&id](const Lot& lot) { return lot.id == id; });
        if (it == book.lots.end()) {
            throw LedgerError("Lot " + id + " missing after posting");
        }
        return *it;
    };

    auto existing = std::find_if(book.postings.begin(), book.postings.end(), [&](const Posting& posting) {
        return posting_id(posting.entry) == acquisition.id;
    });
    if (existing != book.postings.end()) {
        if (std::holds_alternative<Acquisition>(existing->entry) &&
            same_acquisition(std::get<Acquisition>(existing->entry), acquisition)) {
            set_status(status, PostStatus::Unchanged);
            return find_lot(acquisition.id);
        }
        existing->entry = acquisition;
        rebuild_book(book, key);
        set_status(status, PostStatus::Replaced);
        return find_lot(acquisition.id);
    }

    book.postings.push_back(Posting{acquisition, book.next_order++});
    set_status(status, PostStatus::Created);

    if (book.latest_disposal_at && acquisition.acquired_at < *book.latest_disposal_at) {
        rebuild_book(book, key);
        return find_lot(acquisition.id);
    }
    return apply_acquisition(book, acquisition);
}

Disposal LotLedger::post_sell(const Trade& trade, PostStatus* status) {
    require_postable(trade, TradeSide::Sell, "post_sell");

    const BookKey key{trade.owner, trade.asset};
    auto& book = book_for(trade.owner, trade.asset);
    std::lock_guard<std::mutex> lock(book.mutex);

    const auto find_disposal = [&book](const std::string& id) {
        const auto it = std::find_if(book.disposals.begin(), book.disposals.end(),
                                     [&id](const Disposal& disposal) { return disposal.trade_id == id; });
        if (it == book.disposals.end()) {
            throw LedgerError("Disposal " + id + " missing after posting");
        }
        return *it;
    };

    auto existing = std::find_if(book.postings.begin(), book.postings.end(), [&](const Posting& posting) {
        return posting_id(posting.entry) == trade.id;
    });
    if (existing != book.postings.end()) {
        if (std::holds_alternative<Trade>(existing->entry) &&
            same_economics(std::get<Trade>(existing->entry), trade)) {
            set_status(status, PostStatus::Unchanged);
            return find_disposal(trade.id);
        }
        existing->entry = trade;
        rebuild_book(book, key);
        set_status(status, PostStatus::Replaced);
        return find_disposal(trade.id);
    }

    book.postings.push_back(Posting{trade, book.next_order++});
    set_status(status, PostStatus::Created);

    // A sale dated before something already posted changes what later sales consumed.
    if (book.latest_posting_at && trade.timestamp < *book.latest_posting_at) {
        rebuild_book(book, key);
        return find_disposal(trade.id);
    }
    return apply_sale(book, trade);
}

bool LotLedger::remove_posting(const std::string& owner, const std::string& asset, const std::string& id) {
    auto* book = find_book(owner, asset);
    if (book == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(book->mutex);
    const auto it = std::find_if(book->postings.begin(), book->postings.end(), [&id](const Posting& posting) {
        return posting_id(posting.entry) == id;
    });
    if (it == book->postings.end()) {
        return false;
    }
    book->postings.erase(it);
    rebuild_book(*book, BookKey{owner, asset});
    return true;
}

void LotLedger::rebuild(const std::string& owner, const std::string& asset) {
    auto* book = find_book(owner, asset);
    if (book == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(book->mutex);
    rebuild_book(*book, BookKey{owner, asset});
}

void LotLedger::rebuild_all() {
    for (const auto& [key, book] : books()) {
        std::lock_guard<std::mutex> lock(book->mutex);
        rebuild_book(*book, key);
    }
}

Lot LotLedger::apply_acquisition(KeyBook& book, const Acquisition& acquisition) const {
    Lot lot;
    lot.id = acquisition.id;
    lot.owner = acquisition.owner;
    lot.asset = acquisition.asset;
    lot.acquired_at = acquisition.acquired_at;
    lot.original_amount = acquisition.amount;
    lot.remaining_amount = acquisition.amount;
    lot.unit_cost_usd = acquisition.cost_usd / acquisition.amount;
    lot.source_id = acquisition.id;

    // Ties keep posting order.
    const auto position = std::upper_bound(book.lots.begin(), book.lots.end(), lot.acquired_at,
                                           [](Timestamp at, const Lot& other) { return at < other.acquired_at; });
    book.lots.insert(position, lot);
    advance(book.latest_posting_at, acquisition.acquired_at);
    return lot;
}

Disposal LotLedger::apply_sale(KeyBook& book, const Trade& trade) const {
    Disposal disposal;
    disposal.trade_id = trade.id;
    disposal.owner = trade.owner;
    disposal.asset = trade.asset;
    disposal.disposed_at = trade.timestamp;
    disposal.amount = trade.net_amount;
    disposal.gross_proceeds_usd = trade.counter_value_usd;
    disposal.fee_usd = trade.fee_usd;
    disposal.net_proceeds_usd = trade.counter_value_usd - trade.fee_usd;

    Decimal remaining = trade.net_amount;
    Decimal allocated_proceeds{0};
    for (auto& lot : book.lots) {
        if (remaining <= 0) {
            break;
        }
        if (lot.remaining_amount <= 0) {
            continue;
        }

        const Decimal consumed = lot.remaining_amount < remaining ? lot.remaining_amount : remaining;
        lot.remaining_amount -= consumed;
        remaining -= consumed;

        LotConsumption portion;
        portion.lot_id = lot.id;
        portion.acquired_at = lot.acquired_at;
        portion.amount_consumed = consumed;
        portion.cost_basis_usd = consumed * lot.unit_cost_usd;
        if (remaining == 0) {
            portion.proceeds_usd = disposal.net_proceeds_usd - allocated_proceeds;
        } else {
            portion.proceeds_usd = disposal.net_proceeds_usd * consumed / trade.net_amount;
        }
        allocated_proceeds += portion.proceeds_usd;
        portion.pnl_usd = portion.proceeds_usd - portion.cost_basis_usd;
        portion.is_short_term = ingest::days_between(lot.acquired_at, trade.timestamp) <= 365;

        disposal.matched_amount += consumed;
        disposal.matched_cost_basis_usd += portion.cost_basis_usd;
        disposal.portions.push_back(std::move(portion));
    }

    disposal.unmatched_amount = remaining;
    if (remaining > 0) {
        // Never invent a basis for the unmatched part.
        disposal.needs_review = true;
    } else {
        disposal.total_cost_basis_usd = disposal.matched_cost_basis_usd;
        disposal.realized_pnl_usd = Decimal(disposal.net_proceeds_usd - disposal.matched_cost_basis_usd);
    }

    book.disposals.push_back(disposal);
    advance(book.latest_posting_at, trade.timestamp);
    advance(book.latest_disposal_at, trade.timestamp);
    return disposal;
}

void LotLedger::rebuild_book(KeyBook& book, const BookKey& key) {
    std::cout << "[Ledger] Rebuilding " << key.second << " lots for " << key.first
              << " from " << book.postings.size() << " postings" << std::endl;

    book.lots.clear();
    book.disposals.clear();
    book.latest_posting_at.reset();
    book.latest_disposal_at.reset();

    std::vector<const Posting*> ordered;
    ordered.reserve(book.postings.size());
    for (const auto& posting : book.postings) {
        ordered.push_back(&posting);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Posting* a, const Posting* b) {
        const auto at_a = posting_time(a->entry);
        const auto at_b = posting_time(b->entry);
        if (at_a != at_b) {
            return at_a < at_b;
        }
        return a->order < b->order;
    });

    for (const auto* posting : ordered) {
        std::visit(overloaded{
            [&](const Acquisition& acquisition) { apply_acquisition(book, acquisition); },
            [&](const Trade& trade) { apply_sale(book, trade); },
        }, posting->entry);
    }
    ++rebuild_count_;
}

LotLedger::KeyBook& LotLedger::book_for(const std::string& owner, const std::string& asset) {
    const BookKey key{owner, asset};
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        const auto it = books_.find(key);
        if (it != books_.end()) {
            return *it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto& slot = books_[key];
    if (!slot) {
        slot = std::make_unique<KeyBook>();
    }
    return *slot;
}

LotLedger::KeyBook* LotLedger::find_book(const std::string& owner, const std::string& asset) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    const auto it = books_.find(BookKey{owner, asset});
    return it == books_.end() ? nullptr : it->second.get();
}

std::vector<std::pair<LotLedger::BookKey, LotLedger::KeyBook*>> LotLedger::books() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    std::vector<std::pair<BookKey, KeyBook*>> result;
    result.reserve(books_.size());
    for (const auto& [key, book] : books_) {
        result.emplace_back(key, book.get());
    }
    return result;
}

std::vector<Lot> LotLedger::lots(const std::string& owner, const std::string& asset) const {
    auto* book = find_book(owner, asset);
    if (book == nullptr) {
        return {};
    }
    std::lock_guard<std::mutex> lock(book->mutex);
    return book->lots;
}

std::vector<Lot> LotLedger::snapshot() const {
    std::vector<Lot> result;
    for (const auto& entry : books()) {
        std::lock_guard<std::mutex> lock(entry.second->mutex);
        result.insert(result.end(), entry.second->lots.begin(), entry.second->lots.end());
    }
    return result;
}

std::vector<Disposal> LotLedger::disposals(const std::string& owner, const std::string& asset) const {
    auto* book = find_book(owner, asset);
    if (book == nullptr) {
        return {};
    }
    std::lock_guard<std::mutex> lock(book->mutex);
    return book->disposals;
}

std::vector<Disposal> LotLedger::all_disposals() const {
    std::vector<Disposal> result;
    for (const auto& entry : books()) {
        std::lock_guard<std::mutex> lock(entry.second->mutex);
        result.insert(result.end(), entry.second->disposals.begin(), entry.second->disposals.end());
    }
    std::stable_sort(result.begin(), result.end(), [](const Disposal& a, const Disposal& b) {
        return a.disposed_at < b.disposed_at;
    });
    return result;
}

std::vector<Holding> LotLedger::holdings(const std::string& owner) const {
    std::vector<Holding> result;
    for (const auto& entry : books()) {
        if (entry.first.first != owner) {
            continue;
        }
        Holding holding;
        holding.asset = entry.first.second;
        {
            std::lock_guard<std::mutex> lock(entry.second->mutex);
            for (const auto& lot : entry.second->lots) {
                if (lot.remaining_amount <= 0) {
                    continue;
                }
                holding.quantity += lot.remaining_amount;
                holding.cost_basis_usd += lot.remaining_amount * lot.unit_cost_usd;
                ++holding.open_lots;
            }
        }
        if (holding.open_lots > 0) {
            result.push_back(std::move(holding));
        }
    }
    return result;
}

UnrealizedPosition LotLedger::unrealized_pnl(const std::string& owner, const std::string& asset,
                                             const Decimal& price_usd) const {
    UnrealizedPosition position;
    position.asset = asset;
    for (const auto& lot : lots(owner, asset)) {
        if (lot.remaining_amount <= 0) {
            continue;
        }
        position.quantity += lot.remaining_amount;
        position.cost_basis_usd += lot.remaining_amount * lot.unit_cost_usd;
    }
    position.market_value_usd = position.quantity * price_usd;
    position.unrealized_pnl_usd = position.market_value_usd - position.cost_basis_usd;
    return position;
}

} // namespace accounting
