#include "register_map.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace {

// Largest |raw| a rule can produce.
int64_t maxMagnitude(DecodeRule rule) {
    switch (rule) {
        case DecodeRule::U16:
        case DecodeRule::ENUM:
            return 0xFFFF;
        case DecodeRule::S16:
            return 0x8000;
        case DecodeRule::U32:
            return 0xFFFFFFFFLL;
        case DecodeRule::S32:
            return 0x80000000LL;
    }
    return 0xFFFFFFFFLL;
}

// Scaled mantissas stay below this so that rescaling to 9 decimals cannot overflow.
constexpr int64_t MAX_SCALED_MAGNITUDE = std::numeric_limits<int64_t>::max() / 1000000000LL;

} // namespace

Scale Scale::parse(const std::string& text) {
    const std::string::size_type dot = text.find('.');
    const std::string whole = text.substr(0, dot);
    const std::string fraction = dot == std::string::npos ? std::string() : text.substr(dot + 1);

    auto all_digits = [](const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    };
    if ((whole.empty() && fraction.empty()) || !all_digits(whole) || !all_digits(fraction)) {
        throw std::invalid_argument("Invalid scale factor: '" + text + "'");
    }
    if (whole.size() + fraction.size() > 12 || fraction.size() > 9) {
        throw std::invalid_argument("Scale factor has too many digits: '" + text + "'");
    }

    Scale scale;
    scale.multiplier = std::stoll(whole.empty() ? std::string("0") : whole);
    for (char c : fraction) {
        scale.multiplier = scale.multiplier * 10 + (c - '0');
    }
    scale.decimals = static_cast<int>(fraction.size());
    if (scale.multiplier <= 0) {
        throw std::invalid_argument("Scale factor must be positive: '" + text + "'");
    }
    return scale;
}

uint16_t wordsFor(DecodeRule rule) {
    switch (rule) {
        case DecodeRule::U16:
        case DecodeRule::S16:
        case DecodeRule::ENUM:
            return 1;
        case DecodeRule::U32:
        case DecodeRule::S32:
            return 2;
    }
    return 1;
}

const char* toString(DecodeRule rule) {
    switch (rule) {
        case DecodeRule::U16: return "U16";
        case DecodeRule::S16: return "S16";
        case DecodeRule::U32: return "U32";
        case DecodeRule::S32: return "S32";
        case DecodeRule::ENUM: return "ENUM";
    }
    return "?";
}

std::vector<RequestGroup> groupIntoRequests(const std::vector<RegisterDescriptor>& descriptors,
                                            uint16_t max_count,
                                            uint16_t max_gap) {
    std::vector<RegisterDescriptor> sorted = descriptors;
    std::stable_sort(sorted.begin(), sorted.end(), [](const RegisterDescriptor& a, const RegisterDescriptor& b) {
        return a.address < b.address;
    });

    std::vector<RequestGroup> groups;
    uint32_t group_end = 0;
    for (const auto& descriptor : sorted) {
        if (!groups.empty()) {
            RequestGroup& current = groups.back();
            const uint32_t merged_end = std::max(group_end, descriptor.endAddress());
            const bool close_enough = descriptor.address <= group_end + max_gap;
            if (close_enough && merged_end - current.start <= max_count) {
                current.registers.push_back(descriptor);
                group_end = merged_end;
                current.count = static_cast<uint16_t>(group_end - current.start);
                continue;
            }
        }
        RequestGroup group;
        group.start = descriptor.address;
        group.count = descriptor.words;
        group.registers.push_back(descriptor);
        group_end = descriptor.endAddress();
        groups.push_back(std::move(group));
    }
    return groups;
}

RegisterMap::RegisterMap(std::vector<RegisterDescriptor> initial_descriptors)
    : descriptors(std::move(initial_descriptors)) {
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const RegisterDescriptor& reg = descriptors[i];
        const std::string where = "register '" + reg.key + "'";

        if (reg.key.empty()) {
            throw std::invalid_argument("Register #" + std::to_string(i) + " has no key");
        }
        if (!index.emplace(reg.key, i).second) {
            throw std::invalid_argument("Duplicate " + where);
        }
        if (reg.words != wordsFor(reg.rule)) {
            throw std::invalid_argument(where + ": rule " + toString(reg.rule) + " needs " +
                                        std::to_string(wordsFor(reg.rule)) + " word(s), got " +
                                        std::to_string(reg.words));
        }
        if (reg.scale.multiplier > MAX_SCALED_MAGNITUDE / maxMagnitude(reg.rule)) {
            throw std::invalid_argument(where + ": scale factor too large for rule " + toString(reg.rule));
        }
        if (reg.endAddress() > 0x10000) {
            throw std::invalid_argument(where + ": address range exceeds 0xFFFF");
        }
        if (reg.rule == DecodeRule::ENUM) {
            if (!reg.status_table) {
                throw std::invalid_argument(where + ": ENUM rule without a status table");
            }
            if (!reg.scale.isUnit()) {
                throw std::invalid_argument(where + ": ENUM rule cannot be scaled");
            }
        }
        if (reg.valid_min && reg.valid_max && *reg.valid_min > *reg.valid_max) {
            throw std::invalid_argument(where + ": valid_min is greater than valid_max");
        }
    }
}

std::vector<RegisterDescriptor> RegisterMap::describeEnabled() const {
    std::vector<RegisterDescriptor> enabled;
    std::copy_if(descriptors.begin(), descriptors.end(), std::back_inserter(enabled),
                 [](const RegisterDescriptor& reg) { return reg.enabled; });
    return enabled;
}

const RegisterDescriptor* RegisterMap::find(const std::string& key) const {
    auto it = index.find(key);
    if (it == index.end()) {
        return nullptr;
    }
    return &descriptors[it->second];
}

RegisterMap RegisterMap::withOverrides(const std::set<std::string>& enable,
                                       const std::set<std::string>& disable) const {
    std::vector<RegisterDescriptor> copy = descriptors;
    for (const auto& key : enable) {
        if (disable.count(key) != 0) {
            throw std::invalid_argument("Register '" + key + "' is both enabled and disabled");
        }
    }
    auto apply = [&](const std::set<std::string>& keys, bool flag) {
        for (const auto& key : keys) {
            auto it = index.find(key);
            if (it == index.end()) {
                throw std::invalid_argument("Unknown register '" + key + "' in override list");
            }
            copy[it->second].enabled = flag;
        }
    };
    apply(enable, true);
    apply(disable, false);
    return RegisterMap(std::move(copy));
}
