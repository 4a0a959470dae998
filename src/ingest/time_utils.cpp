#include "ingest/time_utils.hpp"

#include "ingest/util.hpp"

#include <cctype>
#include <cstdio>

namespace ingest {
namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
    std::int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(int year, unsigned month, unsigned day) {
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = floor_div(y, 400);
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (static_cast<std::int64_t>(month) + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(day) - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(std::int64_t days, int& year, unsigned& month, unsigned& day) {
    days += 719468;
    const std::int64_t era = floor_div(days, 146097);
    const std::int64_t doe = days - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool read_number(const std::string& text, std::size_t& pos,
                 std::size_t min_digits, std::size_t max_digits, int& out) {
    std::size_t digits = 0;
    int value = 0;
    while (pos < text.size() && digits < max_digits &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
        value = value * 10 + (text[pos] - '0');
        ++pos;
        ++digits;
    }
    if (digits < min_digits) {
        return false;
    }
    out = value;
    return true;
}

std::optional<CivilTime> parse_with_format(const std::string& text, const std::string& format) {
    CivilTime civil;
    int month = 1;
    int day = 1;
    std::size_t pos = 0;

    for (std::size_t i = 0; i < format.size(); ++i) {
        const char f = format[i];
        if (f != '%') {
            if (pos >= text.size() || text[pos] != f) {
                return std::nullopt;
            }
            ++pos;
            continue;
        }

        if (++i >= format.size()) {
            return std::nullopt;
        }

        bool ok = false;
        switch (format[i]) {
            case 'Y': ok = read_number(text, pos, 4, 4, civil.year); break;
            case 'm': ok = read_number(text, pos, 1, 2, month); break;
            case 'd': ok = read_number(text, pos, 1, 2, day); break;
            case 'H': ok = read_number(text, pos, 1, 2, civil.hour); break;
            case 'M': ok = read_number(text, pos, 1, 2, civil.minute); break;
            case 'S': ok = read_number(text, pos, 1, 2, civil.second); break;
            case '%':
                ok = pos < text.size() && text[pos] == '%';
                if (ok) {
                    ++pos;
                }
                break;
            default:
                return std::nullopt;
        }
        if (!ok) {
            return std::nullopt;
        }
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    if (month < 1 || month > 12) {
        return std::nullopt;
    }
    civil.month = static_cast<unsigned>(month);
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(civil.year, civil.month)) {
        return std::nullopt;
    }
    civil.day = static_cast<unsigned>(day);
    if (civil.hour > 23 || civil.minute > 59 || civil.second > 59) {
        return std::nullopt;
    }
    return civil;
}

std::int64_t epoch_seconds(Timestamp ts) {
    using namespace std::chrono;
    return floor_div(duration_cast<milliseconds>(ts.time_since_epoch()).count(), 1000);
}

} // namespace

const std::vector<std::string>& default_timestamp_formats() {
    static const std::vector<std::string> formats = {
        "%d/%m/%Y %H:%M",
        "%d/%m/%Y %H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d %H:%M",
        "%d-%m-%Y %H:%M",
        "%Y-%m-%dT%H:%M:%SZ",
    };
    return formats;
}

std::optional<Timestamp> parse_timestamp(const std::string& text,
                                         const std::vector<std::string>& formats) {
    const auto cleaned = trim(text);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    for (const auto& format : formats) {
        if (const auto civil = parse_with_format(cleaned, format)) {
            return make_utc(civil->year, civil->month, civil->day,
                            civil->hour, civil->minute, civil->second);
        }
    }
    return std::nullopt;
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    return parse_timestamp(text, default_timestamp_formats());
}

Timestamp make_utc(int year, unsigned month, unsigned day, int hour, int minute, int second) {
    const std::int64_t seconds = days_from_civil(year, month, day) * kSecondsPerDay +
                                 hour * 3600 + minute * 60 + second;
    return Timestamp{std::chrono::seconds(seconds)};
}

CivilTime to_civil(Timestamp ts) {
    const std::int64_t seconds = epoch_seconds(ts);
    const std::int64_t days = floor_div(seconds, kSecondsPerDay);
    const std::int64_t of_day = seconds - days * kSecondsPerDay;

    CivilTime civil;
    civil_from_days(days, civil.year, civil.month, civil.day);
    civil.hour = static_cast<int>(of_day / 3600);
    civil.minute = static_cast<int>((of_day % 3600) / 60);
    civil.second = static_cast<int>(of_day % 60);
    return civil;
}

Timestamp floor_to_minute(Timestamp ts) {
    const std::int64_t seconds = epoch_seconds(ts);
    return Timestamp{std::chrono::seconds(floor_div(seconds, 60) * 60)};
}

std::string minute_key(Timestamp ts) {
    const auto c = to_civil(ts);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d",
                  c.year, c.month, c.day, c.hour, c.minute);
    return buffer;
}

std::string format_utc(Timestamp ts) {
    const auto c = to_civil(ts);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  c.year, c.month, c.day, c.hour, c.minute, c.second);
    return buffer;
}

std::string date_key(Timestamp ts) {
    const auto c = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month, c.day);
    return buffer;
}

std::string month_key(Timestamp ts) {
    const auto c = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u", c.year, c.month);
    return buffer;
}

std::int64_t utc_day_number(Timestamp ts) {
    return floor_div(epoch_seconds(ts), kSecondsPerDay);
}

std::int64_t days_between(Timestamp from, Timestamp to) {
    return utc_day_number(to) - utc_day_number(from);
}

std::pair<Timestamp, Timestamp> year_bounds(int year) {
    return {make_utc(year, 1, 1), make_utc(year, 12, 31, 23, 59, 59)};
}

std::int64_t to_epoch_ms(Timestamp ts) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(std::int64_t epoch_ms) {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(epoch_ms))};
}

} // namespace ingest
