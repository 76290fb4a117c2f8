#ifndef DECODED_VALUE_H
#define DECODED_VALUE_H

#include "poll_error.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

/**
 * @struct DecimalValue
 * @brief Fixed-point number: mantissa / 10^decimals.
 *
 * Raw 235 at scale 0.1 is {235, 1} and prints as "23.5"; raw 10000 at scale
 * 0.01 is {10000, 2} and prints as "100.00".
 */
struct DecimalValue {
    int64_t mantissa = 0;
    int decimals = 0;

    double toDouble() const;
    std::string toString() const;

    /// Numeric equality: {15, 1} equals {150, 2}.
    bool operator==(const DecimalValue& other) const;
    bool operator!=(const DecimalValue& other) const { return !(*this == other); }
};

/// @brief A decoded number or a status label.
using Value = std::variant<DecimalValue, std::string>;

/**
 * @struct DecodedValue
 * @brief The latest known value of one register.
 */
struct DecodedValue {
    std::string key;
    Value value;
    std::string unit;
    int64_t raw = 0; ///< Integer before scaling, or the status code
    std::chrono::system_clock::time_point timestamp; ///< Time of the last successful decode
    bool stale = false;
    /// Why the value is stale, or an UnknownStatusCode note on a fresh ENUM value.
    std::optional<PollError> last_error;

    const DecimalValue* number() const { return std::get_if<DecimalValue>(&value); }
    const std::string* label() const { return std::get_if<std::string>(&value); }

    /// @brief Value and unit as displayed, e.g. "23.5 °C" or "Heizbetrieb".
    std::string text() const;

    bool operator==(const DecodedValue& other) const;
};

#endif // DECODED_VALUE_H
