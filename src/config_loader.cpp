#include "config_loader.hpp"
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <stdexcept>

// Helper to convert string to enum
DecodeRule to_rule(const std::string& s) {
    if (s == "U16") return DecodeRule::U16;
    if (s == "S16") return DecodeRule::S16;
    if (s == "U32") return DecodeRule::U32;
    if (s == "S32") return DecodeRule::S32;
    if (s == "ENUM") return DecodeRule::ENUM;
    throw std::runtime_error("Invalid decode rule: " + s);
}

// Integers may be written in decimal or as 0x-prefixed hex.
int64_t to_integer(const YAML::Node& node, const std::string& field) {
    const std::string text = node.as<std::string>();
    try {
        size_t used = 0;
        const int64_t value = std::stoll(text, &used, 0);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer for '" + field + "': " + text);
    }
}

std::set<std::string> to_key_set(const YAML::Node& node) {
    std::set<std::string> keys;
    if (node) {
        for (const auto& item : node) {
            keys.insert(item.as<std::string>());
        }
    }
    return keys;
}

// Checked before narrowing so out-of-range values cannot wrap into valid ones.
int64_t to_ranged(const YAML::Node& node, const std::string& field, int64_t min, int64_t max) {
    const int64_t value = to_integer(node, field);
    if (value < min || value > max) {
        throw std::runtime_error("'" + field + "' must be between " + std::to_string(min) + " and " +
                                 std::to_string(max));
    }
    return value;
}

// Durations are capped at the longest poll interval, so they stay far from chrono overflow.
std::chrono::milliseconds to_millis(const YAML::Node& node, const std::string& field) {
    return std::chrono::milliseconds(to_ranged(node, field, 0, MAX_POLL_INTERVAL.count()));
}

PollerConfig parse_config(const YAML::Node& root, const std::string& base_dir) {
    PollerConfig config;

    // Load Connection
    const auto& conn_node = root["connection"];
    if (!conn_node) {
        throw std::runtime_error("Missing 'connection' section");
    }
    if (!conn_node["host"]) {
        throw std::runtime_error("Missing 'connection.host'");
    }
    config.connection.host = conn_node["host"].as<std::string>();
    if (conn_node["port"]) {
        config.connection.port = static_cast<int>(to_ranged(conn_node["port"], "port", 1, 65535));
    }

    // "slave" and "device_id" are older names of the unit identifier.
    int unit_fields = 0;
    for (const char* name : {"unit_id", "device_id", "slave"}) {
        if (conn_node[name]) {
            config.connection.unit_id = static_cast<int>(to_ranged(conn_node[name], name, 0, 255));
            ++unit_fields;
        }
    }
    if (unit_fields > 1) {
        throw std::runtime_error("Only one of 'unit_id', 'device_id' or 'slave' may be given");
    }

    if (conn_node["scan_interval_s"] && conn_node["interval_ms"]) {
        throw std::runtime_error("Only one of 'scan_interval_s' or 'interval_ms' may be given");
    }
    if (conn_node["scan_interval_s"]) {
        const auto max_seconds = std::chrono::duration_cast<std::chrono::seconds>(MAX_POLL_INTERVAL).count();
        config.connection.poll_interval =
            std::chrono::seconds(to_ranged(conn_node["scan_interval_s"], "scan_interval_s", 1, max_seconds));
    } else if (conn_node["interval_ms"]) {
        config.connection.poll_interval = std::chrono::milliseconds(
            to_ranged(conn_node["interval_ms"], "interval_ms", 1, MAX_POLL_INTERVAL.count()));
    }

    try {
        config.connection.validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid connection settings: ") + e.what());
    }

    // Load Polling Options
    const auto& poll_node = root["polling"];
    if (poll_node) {
        if (poll_node["max_gap"]) {
            config.polling.max_gap =
                static_cast<uint16_t>(to_ranged(poll_node["max_gap"], "max_gap", 0, MAX_READ_REGISTERS));
        }
        if (poll_node["request_pause_ms"]) {
            config.polling.request_pause = to_millis(poll_node["request_pause_ms"], "request_pause_ms");
        }
        if (poll_node["response_timeout_ms"]) {
            config.polling.response_timeout = to_millis(poll_node["response_timeout_ms"], "response_timeout_ms");
        }
        if (poll_node["backoff_base_ms"]) {
            config.polling.backoff_base = to_millis(poll_node["backoff_base_ms"], "backoff_base_ms");
        }
        if (poll_node["backoff_max_ms"]) {
            config.polling.backoff_max = to_millis(poll_node["backoff_max_ms"], "backoff_max_ms");
        }
        if (poll_node["disconnect_between_cycles"]) {
            config.polling.disconnect_between_cycles = poll_node["disconnect_between_cycles"].as<bool>();
        }
    }

    // Load Register Selection
    if (!root["register_map"]) {
        throw std::runtime_error("Missing 'register_map'");
    }
    std::filesystem::path map_path(root["register_map"].as<std::string>());
    if (map_path.is_relative() && !base_dir.empty()) {
        map_path = std::filesystem::path(base_dir) / map_path;
    }
    config.register_map_file = map_path.string();
    config.enable = to_key_set(root["enable"]);
    config.disable = to_key_set(root["disable"]);
    return config;
}

RegisterMap parse_register_map(const YAML::Node& root) {
    // Load Status Tables
    std::map<std::string, std::shared_ptr<const StatusTable>> tables;
    const auto& table_nodes = root["status_tables"];
    if (table_nodes) {
        for (const auto& entry : table_nodes) {
            StatusTable table;
            const std::string table_name = entry.first.as<std::string>();
            for (const auto& code : entry.second) {
                table[to_integer(code.first, table_name)] = code.second.as<std::string>();
            }
            tables[table_name] = std::make_shared<const StatusTable>(std::move(table));
        }
    }

    // Load Registers
    const auto& reg_nodes = root["registers"];
    if (!reg_nodes || !reg_nodes.IsSequence()) {
        throw std::runtime_error("Missing 'registers' list");
    }
    std::vector<RegisterDescriptor> descriptors;
    for (const auto& node : reg_nodes) {
        RegisterDescriptor reg;
        if (!node["key"] || !node["address"] || !node["rule"]) {
            throw std::runtime_error("Register entries need 'key', 'address' and 'rule'");
        }
        reg.key = node["key"].as<std::string>();
        reg.name = node["name"] ? node["name"].as<std::string>() : reg.key;

        const int64_t address = to_integer(node["address"], reg.key + ".address");
        if (address < 0 || address > 0xFFFF) {
            throw std::runtime_error("Register '" + reg.key + "': address out of range");
        }
        reg.address = static_cast<uint16_t>(address);
        reg.rule = to_rule(node["rule"].as<std::string>());
        reg.words = node["words"] ? static_cast<uint16_t>(to_ranged(node["words"], reg.key + ".words", 1, 2))
                                  : wordsFor(reg.rule);

        if (node["scale"]) {
            try {
                reg.scale = Scale::parse(node["scale"].as<std::string>());
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error("Register '" + reg.key + "': " + e.what());
            }
        }
        reg.unit = node["unit"] ? node["unit"].as<std::string>() : "";
        reg.enabled = node["enabled"] ? node["enabled"].as<bool>() : true;
        reg.group = node["group"] ? node["group"].as<std::string>() : "";
        reg.once = node["once"] ? node["once"].as<bool>() : false;

        if (node["table"]) {
            reg.table_name = node["table"].as<std::string>();
            auto it = tables.find(reg.table_name);
            if (it == tables.end()) {
                throw std::runtime_error("Register '" + reg.key + "': unknown status table '" + reg.table_name + "'");
            }
            reg.status_table = it->second;
        }
        if (node["valid_min"]) {
            reg.valid_min = to_integer(node["valid_min"], reg.key + ".valid_min");
        }
        if (node["valid_max"]) {
            reg.valid_max = to_integer(node["valid_max"], reg.key + ".valid_max");
        }
        descriptors.push_back(std::move(reg));
    }

    try {
        return RegisterMap(std::move(descriptors));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid register map: ") + e.what());
    }
}

PollerConfig ConfigLoader::loadConfig(const std::string& filename) {
    YAML::Node root = YAML::LoadFile(filename);
    return parse_config(root, std::filesystem::path(filename).parent_path().string());
}

PollerConfig ConfigLoader::parseConfig(const std::string& yaml, const std::string& base_dir) {
    return parse_config(YAML::Load(yaml), base_dir);
}

RegisterMap ConfigLoader::loadRegisterMap(const std::string& filename) {
    return parse_register_map(YAML::LoadFile(filename));
}

RegisterMap ConfigLoader::parseRegisterMap(const std::string& yaml) {
    return parse_register_map(YAML::Load(yaml));
}
