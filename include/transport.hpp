#ifndef TRANSPORT_H
#define TRANSPORT_H

#include "connection_descriptor.hpp"
#include "poll_error.hpp"
#include "register_map.hpp"
#include <chrono>
#include <cstdint>
#include <variant>
#include <vector>

/// @brief Words read by one request, or why the request failed.
using ReadResult = std::variant<std::vector<uint16_t>, PollError>;

/**
 * @class Transport
 * @brief A request/response link to a single Modbus device.
 *
 * Implementations are used from one thread at a time: the poll loop owns the
 * transport while it runs, and the scheduler only touches it after joining
 * that thread.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Opens a session to the device described by @p descriptor.
     *
     * The descriptor is remembered even when the attempt fails, so later reads
     * can reconnect on their own.
     * @return True if the session is up.
     */
    virtual bool connect(const ConnectionDescriptor& descriptor) = 0;

    /// @brief Reads @p count holding registers starting at @p address.
    virtual ReadResult readRegisters(uint16_t address, uint16_t count) = 0;

    /// @brief Releases the socket. Safe to call when already closed.
    virtual void close() = 0;

    virtual bool isConnected() const = 0;

    /// @brief Time left until the backoff policy allows the next reconnect attempt.
    virtual std::chrono::milliseconds retryDelay() const = 0;

    virtual uint16_t maxRegistersPerRequest() const { return MAX_READ_REGISTERS; }
};

#endif // TRANSPORT_H
