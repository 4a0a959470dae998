#include "accounting/trade_journal.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <map>

namespace accounting {

TradeJournal::TradeJournal(TradeJournalConfig config)
    : config_(std::move(config)) {
    if (config_.storage_path.empty()) {
        throw std::invalid_argument("TradeJournal storage path not set");
    }
}

namespace {

constexpr const char* kAcquisitionEntry = "acquisition";

} // namespace

JournalContents TradeJournal::load() {
    entry_count_ = 0;

    ensure_directory();
    std::ifstream input(config_.storage_path);
    if (!input.good()) {
        return {};
    }

    std::map<std::string, Trade> latest;
    std::map<std::string, Acquisition> acquisitions;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        try {
            const auto json = nlohmann::json::parse(line);
            if (json.value("entry", std::string{}) == kAcquisitionEntry) {
                auto acquisition = json.get<Acquisition>();
                acquisitions[acquisition.id] = std::move(acquisition);
            } else if (json.value("retracted", false)) {
                latest.erase(json.at("id").get<std::string>());
            } else {
                auto trade = json.get<Trade>();
                latest[trade.id] = std::move(trade);
            }
            ++entry_count_;
        } catch (const nlohmann::json::exception& e) {
            throw JournalError("Malformed journal entry at " + config_.storage_path.string() + ":" +
                               std::to_string(line_number) + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw JournalError("Invalid journal entry at " + config_.storage_path.string() + ":" +
                               std::to_string(line_number) + ": " + e.what());
        }
    }

    JournalContents contents;
    contents.trades.reserve(latest.size());
    for (auto& entry : latest) {
        contents.trades.push_back(std::move(entry.second));
    }
    std::stable_sort(contents.trades.begin(), contents.trades.end(), [](const Trade& a, const Trade& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp < b.timestamp;
        }
        return a.sequence < b.sequence;
    });

    contents.acquisitions.reserve(acquisitions.size());
    for (auto& entry : acquisitions) {
        contents.acquisitions.push_back(std::move(entry.second));
    }
    std::stable_sort(contents.acquisitions.begin(), contents.acquisitions.end(),
                     [](const Acquisition& a, const Acquisition& b) { return a.acquired_at < b.acquired_at; });
    return contents;
}

void TradeJournal::append(const Trade& trade) {
    persist(nlohmann::json(trade));
}

void TradeJournal::append(const Acquisition& acquisition) {
    auto json = nlohmann::json(acquisition);
    json["entry"] = kAcquisitionEntry;
    persist(json);
}

void TradeJournal::retract(const std::string& trade_id) {
    persist(nlohmann::json{{"id", trade_id}, {"retracted", true}});
}

void TradeJournal::ensure_directory() const {
    const auto dir = config_.storage_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

void TradeJournal::persist(const nlohmann::json& json) {
    ensure_directory();

    std::ofstream output(config_.storage_path, std::ios::app);
    if (!output.good()) {
        throw JournalError("Failed to append to trade journal at " + config_.storage_path.string());
    }
    output << json.dump() << '\n';
    if (!output.good()) {
        throw JournalError("Failed to write trade journal at " + config_.storage_path.string());
    }
    ++entry_count_;
}

} // namespace accounting
