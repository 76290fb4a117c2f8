#ifndef DECODER_H
#define DECODER_H

#include "decoded_value.hpp"
#include "register_map.hpp"
#include <chrono>
#include <cstdint>
#include <variant>
#include <vector>

/// @brief Either a decoded value or the reason decoding failed.
using DecodeResult = std::variant<DecodedValue, PollError>;

/**
 * @class Decoder
 * @brief Pure conversion of raw register words into typed, scaled values.
 *
 * Nothing here performs I/O or keeps state; decoding the same words twice with
 * the same timestamp yields equal results.
 */
class Decoder {
public:
    /**
     * @brief Decodes the words of one register.
     * @param descriptor The register being decoded.
     * @param words Exactly descriptor.words raw words, high word first.
     * @param timestamp Time the words were read.
     * @return The decoded value, or MalformedPayload / InvalidValue.
     */
    static DecodeResult decode(const RegisterDescriptor& descriptor,
                               const std::vector<uint16_t>& words,
                               std::chrono::system_clock::time_point timestamp);

    /**
     * @brief Extracts the words belonging to @p descriptor from a group response.
     *
     * Returns fewer words than the descriptor needs when the response is short,
     * which decode() then reports as MalformedPayload.
     */
    static std::vector<uint16_t> sliceWords(const RequestGroup& group,
                                            const std::vector<uint16_t>& words,
                                            const RegisterDescriptor& descriptor);

    /// @brief Raw integer for a rule: sign-extended for S16/S32, zero-extended otherwise.
    static int64_t toRawInteger(DecodeRule rule, const std::vector<uint16_t>& words);

    /// @brief Label for a status code, or "unknown (code N)" when the table lacks it.
    static std::string statusLabel(const RegisterDescriptor& descriptor, int64_t code);

    /// @brief raw * multiplier / 10^decimals, exactly.
    static DecimalValue applyScale(int64_t raw, const Scale& scale);
};

#endif // DECODER_H
