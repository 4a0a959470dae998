#include "ingest/record_reader.hpp"

#include "ingest/util.hpp"

#include <fstream>
#include <functional>
#include <string>

namespace ingest {
namespace {

std::string scalar_to_string(const nlohmann::json& value) {
    if (value.is_null()) {
        return {};
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw StructuralError("Expected a scalar value, got " + value.dump());
}

std::string get_string(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key)) {
        return {};
    }
    return scalar_to_string(obj.at(key));
}

Decimal get_decimal(const nlohmann::json& obj, const char* key) {
    const auto text = get_string(obj, key);
    if (text.empty()) {
        return Decimal(0);
    }
    try {
        return parse_decimal(text);
    } catch (const DecimalParseError& ex) {
        throw StructuralError(std::string("Fill field '") + key + "': " + ex.what());
    }
}

void for_each_json_line(const std::filesystem::path& path,
                        const std::function<void(const nlohmann::json&, std::size_t)>& handler) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open " + path.string());
    }

    std::string line;
    std::size_t line_number = 0;
    std::size_t record_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& ex) {
            throw StructuralError(path.string() + ":" + std::to_string(line_number) +
                                  ": malformed JSON (" + ex.what() + ")");
        }
        handler(json, ++record_number);
    }
}

} // namespace

RawRecord raw_record_from_json(const nlohmann::json& object, std::size_t row_index) {
    if (!object.is_object()) {
        throw StructuralError("Row " + std::to_string(row_index) + " is not a JSON object");
    }

    RawRecord record;
    record.row_index = row_index;
    for (const auto& [column, value] : object.items()) {
        record.fields.emplace(column, scalar_to_string(value));
    }
    return record;
}

ApiFill fill_from_json(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw StructuralError("Fill must be a JSON object");
    }
    for (const char* key : {"type", "asset", "quantity", "external_id"}) {
        if (!object.contains(key)) {
            throw StructuralError(std::string("Fill is missing required field '") + key + "'");
        }
    }

    ApiFill fill;
    fill.type = to_lower_copy(trim(get_string(object, "type")));
    fill.asset = to_upper_copy(trim(get_string(object, "asset")));
    if (object.contains("quote_asset")) {
        fill.quote_asset = to_upper_copy(trim(get_string(object, "quote_asset")));
    }
    fill.quantity = get_decimal(object, "quantity");
    fill.price = get_decimal(object, "price");
    fill.fee_amount = get_decimal(object, "fee_amount");
    fill.fee_asset = to_upper_copy(trim(get_string(object, "fee_asset")));
    fill.external_id = trim(get_string(object, "external_id"));

    if (object.contains("time") && object.at("time").is_number_integer()) {
        fill.timestamp = from_epoch_ms(object.at("time").get<std::int64_t>());
    } else if (object.contains("timestamp")) {
        const auto text = get_string(object, "timestamp");
        const auto parsed = parse_timestamp(text);
        if (!parsed) {
            throw StructuralError("Fill " + fill.external_id + " has an unparseable timestamp '" + text + "'");
        }
        fill.timestamp = *parsed;
    } else {
        throw StructuralError("Fill " + fill.external_id + " has no 'time' or 'timestamp'");
    }

    return fill;
}

std::vector<RawRecord> load_raw_records(const std::filesystem::path& path) {
    std::vector<RawRecord> records;
    for_each_json_line(path, [&records](const nlohmann::json& json, std::size_t index) {
        records.push_back(raw_record_from_json(json, index));
    });
    return records;
}

std::vector<ApiFill> load_fills(const std::filesystem::path& path) {
    std::vector<ApiFill> fills;
    for_each_json_line(path, [&fills](const nlohmann::json& json, std::size_t) {
        fills.push_back(fill_from_json(json));
    });
    return fills;
}

ProviderMapping load_provider_mapping(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open provider mapping " + path.string());
    }

    nlohmann::json document;
    try {
        input >> document;
    } catch (const nlohmann::json::parse_error& ex) {
        throw StructuralError("Malformed provider mapping " + path.string() + ": " + ex.what());
    }
    return ProviderMapping::from_json(document);
}

} // namespace ingest
