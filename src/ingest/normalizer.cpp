#include "ingest/normalizer.hpp"

#include "ingest/util.hpp"

#include <regex>
#include <unordered_set>

namespace ingest {
namespace {

bool is_placeholder(const std::string& value) {
    const auto lower = to_lower_copy(trim(value));
    return lower.empty() || lower == "nan" || lower == "null" || lower == "none";
}

RecordIssue make_issue(IssueKind kind, std::size_t row_index, std::string message,
                       std::string label = {}) {
    RecordIssue issue;
    issue.kind = kind;
    issue.row_index = row_index;
    issue.message = "Row " + std::to_string(row_index) + ": " + std::move(message);
    issue.label = std::move(label);
    return issue;
}

NormalizeOutcome issue_outcome(RecordIssue issue) {
    NormalizeOutcome outcome;
    outcome.issue = std::move(issue);
    return outcome;
}

} // namespace

std::string to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::ParseError: return "parse_error";
        case IssueKind::UnknownOperation: return "unknown_operation";
        case IssueKind::MissingField: return "missing_field";
        case IssueKind::ZeroAmount: return "zero_amount";
        case IssueKind::Duplicate: return "duplicate";
    }
    return "parse_error";
}

std::size_t NormalizedBatch::count(IssueKind kind) const {
    std::size_t total = 0;
    for (const auto& issue : issues) {
        if (issue.kind == kind) {
            ++total;
        }
    }
    return total;
}

std::optional<Decimal> extract_fee_from_remark(const std::string& remark) {
    if (is_placeholder(remark)) {
        return std::nullopt;
    }

    static const std::regex fee_then_amount(R"(fee[^0-9]*?([0-9]+(?:\.[0-9]+)?))");
    static const std::regex amount_then_fee(R"(([0-9]+(?:\.[0-9]+)?)[^0-9]*?fee)");

    const auto lower = to_lower_copy(remark);
    std::smatch match;
    if (std::regex_search(lower, match, fee_then_amount) ||
        std::regex_search(lower, match, amount_then_fee)) {
        try {
            const auto fee = parse_decimal(match[1].str());
            if (fee > 0) {
                return fee;
            }
        } catch (const DecimalParseError&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

NormalizeOutcome normalize(const RawRecord& raw, const ProviderMapping& mapping) {
    const auto& columns = mapping.columns();
    const auto row = raw.row_index;

    const auto label = raw.field(columns.operation);
    if (!label || is_placeholder(*label)) {
        return issue_outcome(make_issue(IssueKind::MissingField, row, "Missing operation label"));
    }

    const auto kind = mapping.lookup(*label);
    if (!kind) {
        return issue_outcome(make_issue(IssueKind::UnknownOperation, row,
                                        "Unknown operation '" + trim(*label) + "'", trim(*label)));
    }
    if (*kind == OperationKind::Ignored) {
        NormalizeOutcome outcome;
        outcome.ignored = true;
        return outcome;
    }

    const auto timestamp_text = raw.field(columns.timestamp).value_or("");
    const auto timestamp = parse_timestamp(timestamp_text, mapping.timestamp_formats());
    if (!timestamp) {
        return issue_outcome(make_issue(IssueKind::ParseError, row,
                                        "Invalid timestamp format '" + timestamp_text + "'"));
    }

    const auto asset_text = raw.field(columns.asset).value_or("");
    if (is_placeholder(asset_text)) {
        return issue_outcome(make_issue(IssueKind::MissingField, row, "Missing asset symbol"));
    }

    const auto amount_text = raw.field(columns.amount).value_or("");
    Decimal amount;
    try {
        amount = parse_decimal(amount_text);
    } catch (const DecimalParseError&) {
        return issue_outcome(make_issue(IssueKind::ParseError, row,
                                        "Invalid amount format '" + amount_text + "'"));
    }
    if (is_zero(amount)) {
        return issue_outcome(make_issue(IssueKind::ZeroAmount, row, "Zero amount skipped"));
    }

    TransactionEvent event;
    event.timestamp = *timestamp;
    event.operation_kind = *kind;
    event.asset = mapping.canonical_asset(asset_text);
    event.signed_amount = amount;

    std::string external_id;
    if (!columns.external_id.empty()) {
        external_id = trim(raw.field(columns.external_id).value_or(""));
    }
    event.source_ref = mapping.provider() + ":" +
                       (is_placeholder(external_id) ? "row-" + std::to_string(row) : external_id);

    if (!columns.remark.empty()) {
        const auto remark = raw.field(columns.remark).value_or("");
        if (!is_placeholder(remark)) {
            event.remark = trim(remark);
            event.embedded_fee = extract_fee_from_remark(event.remark);
        }
    }

    NormalizeOutcome outcome;
    outcome.event = std::move(event);
    return outcome;
}

NormalizedBatch normalize_batch(const std::vector<RawRecord>& rows, const ProviderMapping& mapping) {
    const auto required = mapping.required_columns();
    for (const auto& row : rows) {
        for (const auto& column : required) {
            if (row.fields.find(column) == row.fields.end()) {
                throw StructuralError("Row " + std::to_string(row.row_index) +
                                      " is missing required column '" + column + "' for provider " +
                                      mapping.provider());
            }
        }
    }

    NormalizedBatch batch;
    batch.rows_read = rows.size();
    std::unordered_set<std::string> seen_refs;

    for (const auto& row : rows) {
        auto outcome = normalize(row, mapping);

        if (outcome.ignored) {
            ++batch.ignored;
            continue;
        }

        if (outcome.issue) {
            if (outcome.issue->kind == IssueKind::UnknownOperation) {
                const auto count = ++batch.unknown_operations[outcome.issue->label];
                if (count > 1) {
                    continue;
                }
            }
            batch.issues.push_back(std::move(*outcome.issue));
            continue;
        }

        auto& event = *outcome.event;
        if (!seen_refs.insert(event.source_ref).second) {
            ++batch.duplicates;
            batch.issues.push_back(make_issue(IssueKind::Duplicate, row.row_index,
                                              "Duplicate source reference '" + event.source_ref + "'"));
            continue;
        }

        event.sequence = batch.events.size();
        batch.events.push_back(std::move(event));
    }

    return batch;
}

} // namespace ingest
