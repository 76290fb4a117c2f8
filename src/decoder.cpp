#include "decoder.hpp"
#include <algorithm>
#include <cstddef>

DecodeResult Decoder::decode(const RegisterDescriptor& descriptor,
                             const std::vector<uint16_t>& words,
                             std::chrono::system_clock::time_point timestamp) {
    if (words.size() != wordsFor(descriptor.rule)) {
        return PollError{ErrorKind::MalformedPayload, 0,
                         descriptor.key + ": expected " + std::to_string(wordsFor(descriptor.rule)) +
                             " word(s), got " + std::to_string(words.size())};
    }

    const int64_t raw = toRawInteger(descriptor.rule, words);

    if ((descriptor.valid_min && raw < *descriptor.valid_min) ||
        (descriptor.valid_max && raw > *descriptor.valid_max)) {
        return PollError{ErrorKind::InvalidValue, 0,
                         descriptor.key + ": raw value " + std::to_string(raw) + " out of range"};
    }

    DecodedValue decoded;
    decoded.key = descriptor.key;
    decoded.unit = descriptor.unit;
    decoded.raw = raw;
    decoded.timestamp = timestamp;

    if (descriptor.rule == DecodeRule::ENUM) {
        decoded.value = statusLabel(descriptor, raw);
        if (!descriptor.status_table || descriptor.status_table->count(raw) == 0) {
            decoded.last_error = PollError{ErrorKind::UnknownStatusCode, static_cast<int>(raw),
                                           descriptor.key + ": code not in table '" + descriptor.table_name + "'"};
        }
    } else {
        decoded.value = applyScale(raw, descriptor.scale);
    }
    return decoded;
}

std::vector<uint16_t> Decoder::sliceWords(const RequestGroup& group,
                                          const std::vector<uint16_t>& words,
                                          const RegisterDescriptor& descriptor) {
    if (descriptor.address < group.start) {
        return {};
    }
    const size_t offset = descriptor.address - group.start;
    if (offset >= words.size()) {
        return {};
    }
    const size_t end = std::min(words.size(), offset + descriptor.words);
    return std::vector<uint16_t>(words.begin() + static_cast<std::ptrdiff_t>(offset),
                                 words.begin() + static_cast<std::ptrdiff_t>(end));
}

int64_t Decoder::toRawInteger(DecodeRule rule, const std::vector<uint16_t>& words) {
    switch (rule) {
        case DecodeRule::U16:
        case DecodeRule::ENUM:
            return words[0];
        case DecodeRule::S16:
            return static_cast<int16_t>(words[0]);
        case DecodeRule::U32: {
            uint32_t high = words[0];
            uint32_t low = words[1];
            return (high << 16) | low;
        }
        case DecodeRule::S32: {
            // Sign belongs to the composed 32-bit value, not to either word.
            uint32_t high = words[0];
            uint32_t low = words[1];
            uint32_t uval = (high << 16) | low;
            return static_cast<int32_t>(uval);
        }
    }
    return 0;
}

std::string Decoder::statusLabel(const RegisterDescriptor& descriptor, int64_t code) {
    if (descriptor.status_table) {
        auto it = descriptor.status_table->find(code);
        if (it != descriptor.status_table->end()) {
            return it->second;
        }
    }
    return "unknown (code " + std::to_string(code) + ")";
}

DecimalValue Decoder::applyScale(int64_t raw, const Scale& scale) {
    return DecimalValue{raw * scale.multiplier, scale.decimals};
}
