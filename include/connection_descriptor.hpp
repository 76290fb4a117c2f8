#ifndef CONNECTION_DESCRIPTOR_H
#define CONNECTION_DESCRIPTOR_H

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

/// @brief Longest accepted poll interval, one day.
constexpr std::chrono::milliseconds MAX_POLL_INTERVAL{24 * 60 * 60 * 1000};

/**
 * @struct ConnectionDescriptor
 * @brief Where the controller lives and how often it is polled.
 *
 * unit_id is the Modbus unit identifier, known as "slave" or "device id" in
 * other stacks. It is part of every request frame, so changing it needs a new
 * session just like host and port.
 */
struct ConnectionDescriptor {
    std::string host;
    int port = 502;
    int unit_id = 247;
    std::chrono::milliseconds poll_interval{60000};

    /// @brief True if both descriptors address the same device.
    bool sameEndpoint(const ConnectionDescriptor& other) const {
        return host == other.host && port == other.port && unit_id == other.unit_id;
    }

    /**
     * @brief Checks host syntax, port 1-65535, unit id 0-255 and an interval of at most MAX_POLL_INTERVAL.
     * @throw std::invalid_argument naming the offending field.
     */
    void validate() const;

    bool operator==(const ConnectionDescriptor& other) const {
        return sameEndpoint(other) && poll_interval == other.poll_interval;
    }
};

/// @brief True for an IPv4/IPv6 literal or a DNS-style host name.
bool isValidHost(const std::string& host);

/**
 * @struct PollingOptions
 * @brief Tuning knobs for the poll loop and the Modbus session.
 */
struct PollingOptions {
    uint16_t max_gap = 0;                          ///< Unused registers allowed inside one request
    std::chrono::milliseconds request_pause{0};    ///< Pause between two requests of a cycle
    bool disconnect_between_cycles = false;
    std::chrono::milliseconds response_timeout{10000};
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_max{60000};
};

/**
 * @class ConnectionSettings
 * @brief Synchronized holder of the current connection descriptor.
 *
 * The poll loop reads the interval at every cycle boundary, so a new interval
 * takes effect without restarting the loop.
 */
class ConnectionSettings {
public:
    explicit ConnectionSettings(ConnectionDescriptor initial = {});

    ConnectionDescriptor get() const;
    std::chrono::milliseconds pollInterval() const;
    void setPollInterval(std::chrono::milliseconds interval);
    void replace(const ConnectionDescriptor& descriptor);

private:
    mutable std::mutex settings_mutex;
    ConnectionDescriptor descriptor;
};

#endif // CONNECTION_DESCRIPTOR_H
