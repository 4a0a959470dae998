#pragma once

#include "ingest/decimal.hpp"
#include "ingest/time_utils.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace ingest {

enum class OperationKind {
    BuyLeg,
    SellLeg,
    SpendLeg,
    RevenueLeg,
    FeeLeg,
    ConvertLeg,
    Transfer,
    Deposit,
    Withdrawal,
    Ignored
};

std::string to_string(OperationKind kind);
std::optional<OperationKind> operation_kind_from_string(const std::string& name);

// Canonical, provider-independent event. Immutable once created.
struct TransactionEvent {
    Timestamp timestamp{};
    OperationKind operation_kind = OperationKind::Ignored;
    std::string asset;
    Decimal signed_amount{0};
    std::string source_ref;
    std::string remark;
    std::optional<Decimal> embedded_fee;
    std::size_t sequence = 0;   // position in the originating batch
};

// One provider row, keyed by column name.
struct RawRecord {
    std::size_t row_index = 0;
    std::map<std::string, std::string> fields;

    [[nodiscard]] std::optional<std::string> field(const std::string& column) const;
};

// A normalized exchange-API fill or transfer.
struct ApiFill {
    std::string type;             // buy, sell, deposit, withdrawal, transfer
    std::string asset;
    std::string quote_asset = "USDT";
    Decimal quantity{0};
    Decimal price{0};             // quote per unit
    Decimal fee_amount{0};
    std::string fee_asset;
    std::string external_id;
    Timestamp timestamp{};
};

} // namespace ingest
