#include "ingest/types.hpp"

#include "ingest/util.hpp"

#include <array>
#include <utility>

namespace ingest {
namespace {

const std::array<std::pair<OperationKind, const char*>, 10>& kind_names() {
    static const std::array<std::pair<OperationKind, const char*>, 10> names = {{
        {OperationKind::BuyLeg, "BUY_LEG"},
        {OperationKind::SellLeg, "SELL_LEG"},
        {OperationKind::SpendLeg, "SPEND_LEG"},
        {OperationKind::RevenueLeg, "REVENUE_LEG"},
        {OperationKind::FeeLeg, "FEE_LEG"},
        {OperationKind::ConvertLeg, "CONVERT_LEG"},
        {OperationKind::Transfer, "TRANSFER"},
        {OperationKind::Deposit, "DEPOSIT"},
        {OperationKind::Withdrawal, "WITHDRAWAL"},
        {OperationKind::Ignored, "IGNORED"},
    }};
    return names;
}

} // namespace

std::string to_string(OperationKind kind) {
    for (const auto& [value, name] : kind_names()) {
        if (value == kind) {
            return name;
        }
    }
    return "IGNORED";
}

std::optional<OperationKind> operation_kind_from_string(const std::string& name) {
    const auto upper = to_upper_copy(trim(name));
    for (const auto& [value, label] : kind_names()) {
        if (upper == label) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> RawRecord::field(const std::string& column) const {
    const auto it = fields.find(column);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace ingest
