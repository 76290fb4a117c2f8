#ifndef REGISTER_MAP_H
#define REGISTER_MAP_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

/// @brief Largest register count a single "read holding registers" request may carry.
constexpr uint16_t MAX_READ_REGISTERS = 125;

/// @brief Defines how the raw words of a register are turned into a value.
enum class DecodeRule {
    U16,  ///< Unsigned 16 bit
    S16,  ///< Signed 16 bit, two's complement
    U32,  ///< Unsigned 32 bit, high word first
    S32,  ///< Signed 32 bit, high word first, sign applied to the composed value
    ENUM  ///< Status code translated through a lookup table
};

/// @brief Maps status codes to labels for ENUM registers.
using StatusTable = std::map<int64_t, std::string>;

/**
 * @struct Scale
 * @brief An exact decimal scale factor: multiplier / 10^decimals.
 *
 * "0.1" is {1, 1}, "0.01" is {1, 2}, "10" is {10, 0}. Keeping the factor in this
 * form lets the decoder produce fixed-point results without binary rounding.
 */
struct Scale {
    int64_t multiplier = 1;
    int decimals = 0;

    /**
     * @brief Parses a positive decimal literal such as "0.1", "10" or "0.25".
     * @throw std::invalid_argument if the text is not a positive decimal number.
     */
    static Scale parse(const std::string& text);

    bool isUnit() const { return multiplier == 1 && decimals == 0; }

    bool operator==(const Scale& other) const {
        return multiplier == other.multiplier && decimals == other.decimals;
    }
};

/**
 * @struct RegisterDescriptor
 * @brief Static description of one data point in the vendor register map.
 *
 * Loaded once from the register-map file and never modified afterwards.
 */
struct RegisterDescriptor {
    std::string key;
    std::string name;
    uint16_t address = 0;
    uint16_t words = 1;
    DecodeRule rule = DecodeRule::U16;
    Scale scale;
    std::string unit;
    bool enabled = true;
    std::string group;
    bool once = false; ///< Read only on the first successful cycle of a session
    std::string table_name;
    std::shared_ptr<const StatusTable> status_table;
    std::optional<int64_t> valid_min;
    std::optional<int64_t> valid_max;

    /// One past the last register this descriptor occupies.
    uint32_t endAddress() const { return static_cast<uint32_t>(address) + words; }
};

/// @brief Number of words a decode rule consumes.
uint16_t wordsFor(DecodeRule rule);

const char* toString(DecodeRule rule);

/**
 * @struct RequestGroup
 * @brief One planned read request covering one or more descriptors.
 */
struct RequestGroup {
    uint16_t start = 0;
    uint16_t count = 0;
    std::vector<RegisterDescriptor> registers;
};

/**
 * @brief Partitions descriptors into the fewest contiguous read requests.
 *
 * Descriptors are merged when their ranges overlap, touch, or are separated by at
 * most @p max_gap unused registers, as long as the merged span stays within
 * @p max_count registers. A descriptor is never split across two requests.
 *
 * @param descriptors The descriptors to plan, in any order.
 * @param max_count Maximum registers per request.
 * @param max_gap Unused registers tolerated between two merged descriptors.
 * @return Groups ordered by start address.
 */
std::vector<RequestGroup> groupIntoRequests(const std::vector<RegisterDescriptor>& descriptors,
                                            uint16_t max_count = MAX_READ_REGISTERS,
                                            uint16_t max_gap = 0);

/**
 * @class RegisterMap
 * @brief Ordered, validated catalog of register descriptors.
 *
 * Construction validates every descriptor and throws on the first
 * inconsistency, so a broken map stops the program at startup instead of
 * failing on every poll.
 */
class RegisterMap {
public:
    /**
     * @brief Builds the map from descriptors in presentation order.
     * @throw std::invalid_argument on duplicate keys, a word count that does not
     *        match the decode rule, an address span beyond 0xFFFF, an ENUM
     *        register without a status table, or an empty valid range.
     */
    explicit RegisterMap(std::vector<RegisterDescriptor> descriptors);

    /// @brief All descriptors in map order, enabled or not.
    const std::vector<RegisterDescriptor>& all() const { return descriptors; }

    /// @brief The enabled descriptors in map order.
    std::vector<RegisterDescriptor> describeEnabled() const;

    /// @brief Looks a descriptor up by key; nullptr when the key is unknown.
    const RegisterDescriptor* find(const std::string& key) const;

    size_t size() const { return descriptors.size(); }

    /**
     * @brief Returns a copy with the enabled flags overridden for the given keys.
     * @throw std::invalid_argument if a key is unknown or listed in both sets.
     */
    RegisterMap withOverrides(const std::set<std::string>& enable,
                              const std::set<std::string>& disable) const;

private:
    std::vector<RegisterDescriptor> descriptors;
    std::unordered_map<std::string, size_t> index;
};

#endif // REGISTER_MAP_H
