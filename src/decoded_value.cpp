#include "decoded_value.hpp"
#include <algorithm>
#include <cstdlib>

namespace {

double powerOfTen(int exponent) {
    double result = 1.0;
    for (int i = 0; i < exponent; ++i) {
        result *= 10.0;
    }
    return result;
}

int64_t rescale(int64_t mantissa, int extra_decimals) {
    for (int i = 0; i < extra_decimals; ++i) {
        mantissa *= 10;
    }
    return mantissa;
}

} // namespace

double DecimalValue::toDouble() const {
    // 10^n is exact in a double for the decimals a Scale allows, so the
    // division yields the double closest to the decimal value.
    return static_cast<double>(mantissa) / powerOfTen(decimals);
}

std::string DecimalValue::toString() const {
    const bool negative = mantissa < 0;
    uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(mantissa) : static_cast<uint64_t>(mantissa);
    std::string digits = std::to_string(magnitude);
    if (decimals > 0) {
        if (digits.size() <= static_cast<size_t>(decimals)) {
            digits.insert(0, static_cast<size_t>(decimals) + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - static_cast<size_t>(decimals), 1, '.');
    }
    return negative ? "-" + digits : digits;
}

bool DecimalValue::operator==(const DecimalValue& other) const {
    const int common = std::max(decimals, other.decimals);
    return rescale(mantissa, common - decimals) == rescale(other.mantissa, common - other.decimals);
}

std::string DecodedValue::text() const {
    std::string shown;
    if (const DecimalValue* n = number()) {
        shown = n->toString();
        if (!unit.empty()) {
            shown += " " + unit;
        }
    } else if (const std::string* l = label()) {
        shown = *l;
    }
    return shown;
}

bool DecodedValue::operator==(const DecodedValue& other) const {
    return key == other.key && value == other.value && unit == other.unit && raw == other.raw &&
           timestamp == other.timestamp && stale == other.stale && last_error == other.last_error;
}
