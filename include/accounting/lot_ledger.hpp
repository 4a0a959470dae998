#pragma once

#include "accounting/types.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace accounting {

class LedgerError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

enum class PostStatus { Created, Unchanged, Replaced };

struct Holding {
    std::string asset;
    Decimal quantity{0};
    Decimal cost_basis_usd{0};   // remaining_amount * unit_cost over open lots
    std::size_t open_lots = 0;
};

struct UnrealizedPosition {
    std::string asset;
    Decimal quantity{0};
    Decimal cost_basis_usd{0};
    Decimal market_value_usd{0};
    Decimal unrealized_pnl_usd{0};
};

// FIFO lot engine. One book per (owner, asset); every posting to a book is
// serialized by that book's mutex. Books keep their postings so that any key
// can be rebuilt from scratch.
class LotLedger {
public:
    LotLedger() = default;
    LotLedger(const LotLedger&) = delete;
    LotLedger& operator=(const LotLedger&) = delete;

    Lot post_buy(const Trade& trade, PostStatus* status = nullptr);
    Lot post_acquisition(const Acquisition& acquisition, PostStatus* status = nullptr);
    Disposal post_sell(const Trade& trade, PostStatus* status = nullptr);

    // Drops a posting (a trade that regrouping no longer produces) and rebuilds the key.
    bool remove_posting(const std::string& owner, const std::string& asset, const std::string& id);

    void rebuild(const std::string& owner, const std::string& asset);
    void rebuild_all();

    std::vector<Lot> lots(const std::string& owner, const std::string& asset) const;
    std::vector<Lot> snapshot() const;
    std::vector<Disposal> disposals(const std::string& owner, const std::string& asset) const;
    std::vector<Disposal> all_disposals() const;

    std::vector<Holding> holdings(const std::string& owner) const;
    UnrealizedPosition unrealized_pnl(const std::string& owner, const std::string& asset,
                                      const Decimal& price_usd) const;

    [[nodiscard]] std::size_t rebuild_count() const { return rebuild_count_.load(); }

private:
    using BookKey = std::pair<std::string, std::string>;   // owner, asset

    struct Posting {
        std::variant<Acquisition, Trade> entry;   // Trade postings are sales
        std::size_t order = 0;
    };

    struct KeyBook {
        std::mutex mutex;
        std::vector<Posting> postings;
        std::vector<Lot> lots;             // ordered by acquired_at, then posting order
        std::vector<Disposal> disposals;   // in posting order
        std::optional<Timestamp> latest_posting_at;
        std::optional<Timestamp> latest_disposal_at;
        std::size_t next_order = 0;
    };

    KeyBook& book_for(const std::string& owner, const std::string& asset);
    KeyBook* find_book(const std::string& owner, const std::string& asset) const;
    std::vector<std::pair<BookKey, KeyBook*>> books() const;

    Lot upsert_acquisition(KeyBook& book, const Acquisition& acquisition, PostStatus* status);
    Lot apply_acquisition(KeyBook& book, const Acquisition& acquisition) const;
    Disposal apply_sale(KeyBook& book, const Trade& trade) const;
    void rebuild_book(KeyBook& book, const BookKey& key);

    mutable std::shared_mutex registry_mutex_;
    std::map<BookKey, std::unique_ptr<KeyBook>> books_;
    std::atomic<std::size_t> rebuild_count_{0};
};

Acquisition acquisition_from_trade(const Trade& trade);

} // namespace accounting
