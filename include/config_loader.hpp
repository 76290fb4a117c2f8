#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "connection_descriptor.hpp"
#include "register_map.hpp"
#include <set>
#include <string>

/**
 * @struct PollerConfig
 * @brief Top-level structure to hold the parsed poller configuration.
 */
struct PollerConfig {
    ConnectionDescriptor connection;
    PollingOptions polling;
    std::string register_map_file; ///< Resolved against the config file's directory
    std::set<std::string> enable;  ///< Registers to enable regardless of the map default
    std::set<std::string> disable; ///< Registers to disable regardless of the map default
};

/**
 * @class ConfigLoader
 * @brief Parses the YAML poller configuration and register-map files.
 *
 * This class uses the yaml-cpp library. Every parse error is reported as an
 * exception naming the offending entry, so a bad file stops the program
 * before the first poll.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses the poller configuration file.
     * @param filename The path to the YAML configuration file.
     * @return A PollerConfig with defaults filled in.
     * @throw std::runtime_error if the file cannot be opened or parsed.
     */
    static PollerConfig loadConfig(const std::string& filename);

    /**
     * @brief Parses poller configuration text.
     * @param yaml The YAML document.
     * @param base_dir Directory the register_map path is relative to.
     */
    static PollerConfig parseConfig(const std::string& yaml, const std::string& base_dir);

    /**
     * @brief Loads and validates a register-map file.
     * @throw std::runtime_error if the file cannot be parsed or the map is inconsistent.
     */
    static RegisterMap loadRegisterMap(const std::string& filename);

    /// @brief Parses register-map text.
    static RegisterMap parseRegisterMap(const std::string& yaml);
};

#endif // CONFIG_LOADER_H
