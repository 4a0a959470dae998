#pragma once

#include "ingest/provider_mapping.hpp"
#include "ingest/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <vector>

namespace ingest {

// JSON object of column -> value. Non-string scalars are rendered as text.
RawRecord raw_record_from_json(const nlohmann::json& object, std::size_t row_index);

// Exchange fill, e.g. {"type":"buy","asset":"BTC","quantity":"0.1","price":"30000",
// "fee_amount":"0.0001","fee_asset":"BTC","external_id":"42","time":1718766724000}
ApiFill fill_from_json(const nlohmann::json& object);

// One JSON object per line; blank lines skipped. Rows are numbered from 1.
std::vector<RawRecord> load_raw_records(const std::filesystem::path& path);
std::vector<ApiFill> load_fills(const std::filesystem::path& path);

ProviderMapping load_provider_mapping(const std::filesystem::path& path);

} // namespace ingest
