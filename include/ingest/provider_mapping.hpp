#pragma once

#include "ingest/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ingest {

// Input that cannot be processed at all (missing columns, malformed mapping).
class StructuralError : public std::runtime_error {
public:
    explicit StructuralError(const std::string& message)
        : std::runtime_error(message) {}
};

struct ColumnNames {
    std::string timestamp = "UTC_Time";
    std::string operation = "Operation";
    std::string asset = "Coin";
    std::string amount = "Change";
    std::string remark = "Remark";
    std::string external_id;      // empty when the provider has no id column
};

// Data-only description of one provider's export: column names, the
// operation label dictionary, timestamp formats and asset aliases.
class ProviderMapping {
public:
    ProviderMapping();
    ProviderMapping(std::string provider, ColumnNames columns);

    static ProviderMapping from_json(const nlohmann::json& document);
    static ProviderMapping binance_transaction_history();

    [[nodiscard]] const std::string& provider() const { return provider_; }
    [[nodiscard]] const ColumnNames& columns() const { return columns_; }
    [[nodiscard]] const std::vector<std::string>& timestamp_formats() const { return timestamp_formats_; }

    [[nodiscard]] std::optional<OperationKind> lookup(const std::string& label) const;

    // Upper-cased, trimmed and alias-resolved symbol.
    [[nodiscard]] std::string canonical_asset(const std::string& symbol) const;

    [[nodiscard]] std::vector<std::string> required_columns() const;

    void add_operation(const std::string& label, OperationKind kind);
    void add_asset_alias(const std::string& alias, const std::string& symbol);
    void set_timestamp_formats(std::vector<std::string> formats);

    [[nodiscard]] std::size_t operation_count() const { return operations_.size(); }

private:
    std::string provider_;
    ColumnNames columns_;
    std::map<std::string, OperationKind> operations_;
    std::map<std::string, std::string> asset_aliases_;
    std::vector<std::string> timestamp_formats_;
};

} // namespace ingest
