#include "ingest/decimal.hpp"

#include "ingest/util.hpp"

#include <cctype>
#include <ios>
#include <limits>

namespace ingest {
namespace {

bool is_decimal_literal(const std::string& text) {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }

    std::size_t digits = 0;
    bool seen_dot = false;
    for (; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (std::isdigit(c)) {
            ++digits;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
    }
    if (digits == 0) {
        return false;
    }
    if (i == text.size()) {
        return true;
    }

    if (text[i] != 'e' && text[i] != 'E') {
        return false;
    }
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }
    std::size_t exponent_digits = 0;
    for (; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        ++exponent_digits;
    }
    return exponent_digits > 0;
}

} // namespace

Decimal parse_decimal(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : trim(text)) {
        if (c != ',') {
            cleaned.push_back(c);
        }
    }

    if (!is_decimal_literal(cleaned)) {
        throw DecimalParseError(text);
    }
    return Decimal(cleaned);
}

std::string format_decimal(const Decimal& value, int max_fraction_digits) {
    std::string text = value.str(max_fraction_digits, std::ios_base::fixed);

    const auto dot = text.find('.');
    if (dot != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }

    if (text == "-0") {
        return "0";
    }
    return text;
}

std::string format_decimal_exact(const Decimal& value) {
    if (value == 0) {
        return "0";
    }
    std::string text = value.str(std::numeric_limits<Decimal>::max_digits10, std::ios_base::scientific);

    // Drop trailing mantissa zeros: "2.5000e+00" -> "2.5e+00".
    const auto exponent = text.find_first_of("eE");
    if (exponent != std::string::npos && text.find('.') < exponent) {
        auto end = exponent;
        while (text[end - 1] == '0') {
            --end;
        }
        if (text[end - 1] == '.') {
            --end;
        }
        text.erase(end, exponent - end);
    }
    return text;
}

Decimal abs_decimal(const Decimal& value) {
    return value < 0 ? Decimal(-value) : value;
}

bool is_zero(const Decimal& value) {
    return value == 0;
}

} // namespace ingest
