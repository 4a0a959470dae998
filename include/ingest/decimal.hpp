#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <stdexcept>
#include <string>

namespace ingest {

// Quantities and USD values. 50 significant decimal digits.
using Decimal = boost::multiprecision::cpp_dec_float_50;

class DecimalParseError : public std::invalid_argument {
public:
    explicit DecimalParseError(const std::string& text)
        : std::invalid_argument("Invalid decimal value: '" + text + "'") {}
};

// Accepts an optional sign, thousands separators and an optional exponent.
Decimal parse_decimal(const std::string& text);

// Fixed notation with at most `max_fraction_digits` digits, trailing zeros trimmed.
std::string format_decimal(const Decimal& value, int max_fraction_digits = 18);

// Scientific notation with every stored digit; parse_decimal reads it back
// to the identical value.
std::string format_decimal_exact(const Decimal& value);

Decimal abs_decimal(const Decimal& value);

bool is_zero(const Decimal& value);

} // namespace ingest
