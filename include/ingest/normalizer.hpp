#pragma once

#include "ingest/provider_mapping.hpp"
#include "ingest/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ingest {

enum class IssueKind {
    ParseError,
    UnknownOperation,
    MissingField,
    ZeroAmount,
    Duplicate
};

std::string to_string(IssueKind kind);

struct RecordIssue {
    IssueKind kind = IssueKind::ParseError;
    std::size_t row_index = 0;
    std::string message;
    std::string label;    // operation label for UnknownOperation
};

struct NormalizeOutcome {
    std::optional<TransactionEvent> event;
    std::optional<RecordIssue> issue;
    bool ignored = false;  // mapped to IGNORED: dropped silently
};

struct NormalizedBatch {
    std::vector<TransactionEvent> events;
    std::vector<RecordIssue> issues;
    std::map<std::string, std::size_t> unknown_operations;  // label -> occurrences
    std::size_t rows_read = 0;
    std::size_t ignored = 0;
    std::size_t duplicates = 0;

    [[nodiscard]] std::size_t count(IssueKind kind) const;
};

// Maps one provider row to a canonical event. Pure; never throws for bad
// row content, problems come back in `issue`.
NormalizeOutcome normalize(const RawRecord& raw, const ProviderMapping& mapping);

// Normalizes a whole batch. Throws StructuralError before looking at any row
// content when a row lacks one of the mapping's required columns.
NormalizedBatch normalize_batch(const std::vector<RawRecord>& rows, const ProviderMapping& mapping);

// "fee 0.5 USDT" / "0.5 fee" style remarks.
std::optional<Decimal> extract_fee_from_remark(const std::string& remark);

} // namespace ingest
