#include "accounting/price_source.hpp"

#include "ingest/provider_mapping.hpp"
#include "ingest/util.hpp"

#include <fstream>

namespace accounting {

PriceTable::PriceTable(int max_staleness_days)
    : max_staleness_days_(max_staleness_days),
      stable_assets_{"USD", "USDT", "USDC", "BUSD"} {}

PriceTable PriceTable::from_json(const nlohmann::json& document, int max_staleness_days) {
    if (!document.is_object()) {
        throw ingest::StructuralError("Price table must be a JSON object keyed by asset");
    }

    PriceTable table{max_staleness_days};
    for (const auto& [asset, days] : document.items()) {
        if (!days.is_object()) {
            throw ingest::StructuralError("Prices for " + asset + " must be an object keyed by date");
        }
        for (const auto& [day, price] : days.items()) {
            const auto parsed_day = ingest::parse_timestamp(day, {"%Y-%m-%d"});
            if (!parsed_day) {
                throw ingest::StructuralError("Invalid price date '" + day + "' for " + asset);
            }
            Decimal value;
            try {
                value = ingest::parse_decimal(price.is_string() ? price.get<std::string>() : price.dump());
            } catch (const ingest::DecimalParseError& ex) {
                throw ingest::StructuralError("Price for " + asset + " on " + day + ": " + ex.what());
            }
            if (value < 0) {
                throw ingest::StructuralError("Negative price for " + asset + " on " + day);
            }
            table.set_price(asset, *parsed_day, value);
        }
    }
    return table;
}

void PriceTable::set_price(const std::string& asset, Timestamp day, const Decimal& price_usd) {
    prices_[ingest::to_upper_copy(asset)][ingest::utc_day_number(day)] = price_usd;
}

void PriceTable::add_stable_asset(const std::string& asset) {
    stable_assets_.insert(ingest::to_upper_copy(asset));
}

std::optional<Decimal> PriceTable::historical_price(const std::string& asset, Timestamp at) const {
    const auto symbol = ingest::to_upper_copy(asset);
    if (stable_assets_.count(symbol) != 0) {
        return Decimal(1);
    }

    const auto series = prices_.find(symbol);
    if (series == prices_.end() || series->second.empty()) {
        return std::nullopt;
    }

    const auto day = ingest::utc_day_number(at);
    auto it = series->second.upper_bound(day);
    if (it == series->second.begin()) {
        return std::nullopt;
    }
    --it;
    if (day - it->first > max_staleness_days_) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PriceTable::size() const {
    std::size_t total = 0;
    for (const auto& [asset, series] : prices_) {
        total += series.size();
    }
    return total;
}

PriceTable load_price_table(const std::filesystem::path& path, int max_staleness_days) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open price table " + path.string());
    }

    nlohmann::json document;
    try {
        input >> document;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ingest::StructuralError("Malformed price table " + path.string() + ": " + ex.what());
    }
    return PriceTable::from_json(document, max_staleness_days);
}

} // namespace accounting
