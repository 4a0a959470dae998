#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ingest {

using Timestamp = std::chrono::system_clock::time_point;

struct CivilTime {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// Formats tried by parse_timestamp when a mapping does not supply its own.
const std::vector<std::string>& default_timestamp_formats();

// Supported directives: %Y %m %d %H %M %S and %% ; anything else must match literally.
// Day, month, hour, minute and second accept one or two digits. Always UTC.
std::optional<Timestamp> parse_timestamp(const std::string& text,
                                         const std::vector<std::string>& formats);
std::optional<Timestamp> parse_timestamp(const std::string& text);

Timestamp make_utc(int year, unsigned month, unsigned day,
                   int hour = 0, int minute = 0, int second = 0);
CivilTime to_civil(Timestamp ts);

Timestamp floor_to_minute(Timestamp ts);

std::string minute_key(Timestamp ts);   // 2024-06-19T03:12
std::string format_utc(Timestamp ts);   // 2024-06-19T03:12:04Z
std::string date_key(Timestamp ts);     // 2024-06-19
std::string month_key(Timestamp ts);    // 2024-06

std::int64_t utc_day_number(Timestamp ts);

// Whole calendar days from the UTC date of `from` to the UTC date of `to`.
std::int64_t days_between(Timestamp from, Timestamp to);

// First and last second of a calendar year.
std::pair<Timestamp, Timestamp> year_bounds(int year);

std::int64_t to_epoch_ms(Timestamp ts);
Timestamp from_epoch_ms(std::int64_t epoch_ms);

} // namespace ingest
