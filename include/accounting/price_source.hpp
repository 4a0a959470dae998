#pragma once

#include "accounting/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace accounting {

// Historical USD price lookup supplied by a collaborator.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    virtual std::optional<Decimal> historical_price(const std::string& asset, Timestamp at) const = 0;
};

// In-memory daily close table. A lookup uses the latest price on or before
// the requested UTC day, no older than `max_staleness_days`.
class PriceTable : public PriceSource {
public:
    explicit PriceTable(int max_staleness_days = 3);

    // {"BTC": {"2024-06-19": "65000.12", ...}, ...}
    static PriceTable from_json(const nlohmann::json& document, int max_staleness_days = 3);

    void set_price(const std::string& asset, Timestamp day, const Decimal& price_usd);
    void add_stable_asset(const std::string& asset);

    std::optional<Decimal> historical_price(const std::string& asset, Timestamp at) const override;

    [[nodiscard]] std::size_t size() const;

private:
    int max_staleness_days_;
    std::set<std::string> stable_assets_;
    std::map<std::string, std::map<std::int64_t, Decimal>> prices_;
};

PriceTable load_price_table(const std::filesystem::path& path, int max_staleness_days = 3);

} // namespace accounting
