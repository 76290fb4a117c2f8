#include "connection_descriptor.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <stdexcept>
#include <sys/socket.h>

bool isValidHost(const std::string& host) {
    if (host.empty()) {
        return false;
    }

    unsigned char buffer[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, host.c_str(), buffer) == 1 || inet_pton(AF_INET6, host.c_str(), buffer) == 1) {
        return true;
    }

    // Host name: dot-separated labels of letters, digits and '-'.
    std::string::size_type begin = 0;
    while (true) {
        const std::string::size_type dot = host.find('.', begin);
        const std::string label = host.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (label.empty() || label.size() > 63) {
            return false;
        }
        const bool ok = std::all_of(label.begin(), label.end(), [](unsigned char c) {
            return std::isalnum(c) != 0 || c == '-';
        });
        if (!ok) {
            return false;
        }
        if (dot == std::string::npos) {
            return true;
        }
        begin = dot + 1;
    }
}

void ConnectionDescriptor::validate() const {
    if (!isValidHost(host)) {
        throw std::invalid_argument("Invalid host: '" + host + "'");
    }
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("Invalid port: " + std::to_string(port));
    }
    if (unit_id < 0 || unit_id > 255) {
        throw std::invalid_argument("Invalid unit id: " + std::to_string(unit_id));
    }
    if (poll_interval.count() <= 0 || poll_interval > MAX_POLL_INTERVAL) {
        throw std::invalid_argument("Poll interval must be between 1 and " +
                                    std::to_string(MAX_POLL_INTERVAL.count()) + " ms");
    }
}

ConnectionSettings::ConnectionSettings(ConnectionDescriptor initial)
    : descriptor(std::move(initial)) {}

ConnectionDescriptor ConnectionSettings::get() const {
    std::lock_guard<std::mutex> lock(settings_mutex);
    return descriptor;
}

std::chrono::milliseconds ConnectionSettings::pollInterval() const {
    std::lock_guard<std::mutex> lock(settings_mutex);
    return descriptor.poll_interval;
}

void ConnectionSettings::setPollInterval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(settings_mutex);
    descriptor.poll_interval = interval;
}

void ConnectionSettings::replace(const ConnectionDescriptor& replacement) {
    std::lock_guard<std::mutex> lock(settings_mutex);
    descriptor = replacement;
}
