#pragma once

#include "accounting/types.hpp"

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace accounting {

class JournalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TradeJournalConfig {
    std::filesystem::path storage_path;
};

// Latest entry per id, each list ordered by time.
struct JournalContents {
    std::vector<Trade> trades;
    std::vector<Acquisition> acquisitions;
};

// Append-only JSON-lines record of upserted trades and deposit acquisitions.
// Replaying it restores the ledger after a restart.
class TradeJournal {
public:
    explicit TradeJournal(TradeJournalConfig config);

    JournalContents load();

    void append(const Trade& trade);
    void append(const Acquisition& acquisition);
    void retract(const std::string& trade_id);

    [[nodiscard]] std::size_t entry_count() const { return entry_count_; }
    const std::filesystem::path& path() const { return config_.storage_path; }

private:
    void ensure_directory() const;
    void persist(const nlohmann::json& json);

    TradeJournalConfig config_;
    std::size_t entry_count_ = 0;
};

} // namespace accounting
