#include "ingest/provider_mapping.hpp"

#include "ingest/util.hpp"

#include <utility>

namespace ingest {
namespace {

std::string column_or(const nlohmann::json& columns, const char* key, const std::string& fallback) {
    if (!columns.contains(key)) {
        return fallback;
    }
    if (!columns.at(key).is_string()) {
        throw StructuralError(std::string("Mapping column '") + key + "' must be a string");
    }
    return columns.at(key).get<std::string>();
}

} // namespace

ProviderMapping::ProviderMapping()
    : ProviderMapping("unknown", ColumnNames{}) {}

ProviderMapping::ProviderMapping(std::string provider, ColumnNames columns)
    : provider_(std::move(provider)),
      columns_(std::move(columns)),
      timestamp_formats_(default_timestamp_formats()) {}

ProviderMapping ProviderMapping::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw StructuralError("Provider mapping must be a JSON object");
    }
    if (!document.contains("provider") || !document.at("provider").is_string()) {
        throw StructuralError("Provider mapping requires a 'provider' name");
    }
    if (!document.contains("operations") || !document.at("operations").is_object()) {
        throw StructuralError("Provider mapping requires an 'operations' object");
    }

    ColumnNames columns;
    if (document.contains("columns")) {
        const auto& c = document.at("columns");
        if (!c.is_object()) {
            throw StructuralError("Mapping 'columns' must be an object");
        }
        columns.timestamp = column_or(c, "timestamp", columns.timestamp);
        columns.operation = column_or(c, "operation", columns.operation);
        columns.asset = column_or(c, "asset", columns.asset);
        columns.amount = column_or(c, "amount", columns.amount);
        columns.remark = column_or(c, "remark", columns.remark);
        columns.external_id = column_or(c, "id", columns.external_id);
    }

    ProviderMapping mapping{document.at("provider").get<std::string>(), columns};

    for (const auto& [label, kind_json] : document.at("operations").items()) {
        if (!kind_json.is_string()) {
            throw StructuralError("Operation '" + label + "' must map to a kind name");
        }
        const auto kind = operation_kind_from_string(kind_json.get<std::string>());
        if (!kind) {
            throw StructuralError("Operation '" + label + "' maps to unknown kind '" +
                                  kind_json.get<std::string>() + "'");
        }
        mapping.add_operation(label, *kind);
    }

    if (document.contains("timestamp_formats")) {
        const auto& formats = document.at("timestamp_formats");
        if (!formats.is_array() || formats.empty()) {
            throw StructuralError("'timestamp_formats' must be a non-empty array");
        }
        std::vector<std::string> parsed;
        for (const auto& format : formats) {
            if (!format.is_string()) {
                throw StructuralError("Timestamp formats must be strings");
            }
            parsed.push_back(format.get<std::string>());
        }
        mapping.set_timestamp_formats(std::move(parsed));
    }

    if (document.contains("asset_aliases")) {
        for (const auto& [alias, symbol] : document.at("asset_aliases").items()) {
            if (!symbol.is_string()) {
                throw StructuralError("Asset alias '" + alias + "' must map to a symbol");
            }
            mapping.add_asset_alias(alias, symbol.get<std::string>());
        }
    }

    return mapping;
}

ProviderMapping ProviderMapping::binance_transaction_history() {
    ProviderMapping mapping{"binance", ColumnNames{}};

    mapping.add_operation("Transaction Buy", OperationKind::BuyLeg);
    mapping.add_operation("Transaction Sold", OperationKind::SellLeg);
    mapping.add_operation("Transaction Sell", OperationKind::SellLeg);
    mapping.add_operation("Transaction Spend", OperationKind::SpendLeg);
    mapping.add_operation("Transaction Revenue", OperationKind::RevenueLeg);
    mapping.add_operation("Transaction Fee", OperationKind::FeeLeg);

    mapping.add_operation("Binance Convert", OperationKind::ConvertLeg);
    mapping.add_operation("Token Swap", OperationKind::ConvertLeg);
    mapping.add_operation("Small Assets Exchange BNB", OperationKind::ConvertLeg);

    mapping.add_operation("Deposit", OperationKind::Deposit);
    mapping.add_operation("Receive", OperationKind::Deposit);
    mapping.add_operation("Airdrop Assets", OperationKind::Deposit);
    mapping.add_operation("Staking Rewards", OperationKind::Deposit);
    mapping.add_operation("Distribution", OperationKind::Deposit);
    mapping.add_operation("Cashback Voucher", OperationKind::Deposit);
    mapping.add_operation("Card Cashback", OperationKind::Deposit);
    mapping.add_operation("Commission Fee Shared With You", OperationKind::Deposit);
    mapping.add_operation("Crypto Box", OperationKind::Deposit);

    mapping.add_operation("Withdraw", OperationKind::Withdrawal);
    mapping.add_operation("Send", OperationKind::Withdrawal);
    mapping.add_operation("Card Spending", OperationKind::Withdrawal);

    mapping.add_operation("Transfer Between Main and Funding Wallet", OperationKind::Transfer);
    mapping.add_operation("Transfer Between Main and Funding", OperationKind::Transfer);
    mapping.add_operation("Transfer Between Main and Margin", OperationKind::Transfer);
    mapping.add_operation("Transfer Funds to Spot", OperationKind::Transfer);
    mapping.add_operation("Transfer Funds to Funding Wallet", OperationKind::Transfer);

    mapping.add_operation("Token Swap - Distribution", OperationKind::Ignored);
    mapping.add_operation("Asset Recovery", OperationKind::Ignored);
    mapping.add_operation("P2P Trading", OperationKind::Ignored);

    mapping.add_asset_alias("WETH", "ETH");
    mapping.add_asset_alias("WBTC", "BTC");

    return mapping;
}

std::optional<OperationKind> ProviderMapping::lookup(const std::string& label) const {
    const auto it = operations_.find(trim(label));
    if (it == operations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ProviderMapping::canonical_asset(const std::string& symbol) const {
    auto normalized = to_upper_copy(trim(symbol));
    const auto it = asset_aliases_.find(normalized);
    if (it != asset_aliases_.end()) {
        return it->second;
    }
    return normalized;
}

std::vector<std::string> ProviderMapping::required_columns() const {
    return {columns_.timestamp, columns_.operation, columns_.asset, columns_.amount};
}

void ProviderMapping::add_operation(const std::string& label, OperationKind kind) {
    operations_[trim(label)] = kind;
}

void ProviderMapping::add_asset_alias(const std::string& alias, const std::string& symbol) {
    asset_aliases_[to_upper_copy(trim(alias))] = to_upper_copy(trim(symbol));
}

void ProviderMapping::set_timestamp_formats(std::vector<std::string> formats) {
    timestamp_formats_ = std::move(formats);
}

} // namespace ingest
