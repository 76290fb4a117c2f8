#ifndef MODBUS_SESSION_H
#define MODBUS_SESSION_H

#include "backoff_policy.hpp"
#include "transport.hpp"
#include <chrono>
#include <string>
#include <modbus/modbus.h>

/**
 * @class ModbusSession
 * @brief Modbus TCP client session built on libmodbus.
 *
 * A read that fails with ConnectionLost or Timeout drops the socket. The next
 * read reconnects once before giving up. Consecutive failures push the next
 * reconnect attempt out according to the backoff policy, and any answer from
 * the device resets it.
 */
class ModbusSession : public Transport {
public:
    /**
     * @param response_timeout How long a request may wait for its response.
     * @param backoff Delay policy for reconnect attempts.
     */
    explicit ModbusSession(std::chrono::milliseconds response_timeout = std::chrono::milliseconds(10000),
                           BackoffPolicy backoff = BackoffPolicy());

    ~ModbusSession() override;

    ModbusSession(const ModbusSession&) = delete;
    ModbusSession& operator=(const ModbusSession&) = delete;

    bool connect(const ConnectionDescriptor& descriptor) override;
    ReadResult readRegisters(uint16_t address, uint16_t count) override;
    void close() override;
    bool isConnected() const override { return connected; }
    std::chrono::milliseconds retryDelay() const override;
    uint16_t maxRegistersPerRequest() const override { return MODBUS_MAX_READ_REGISTERS; }

    int consecutiveFailures() const { return backoff.consecutiveFailures(); }

    /**
     * @brief Maps a libmodbus errno value to the failure taxonomy.
     * @param error_number errno as left by a failed libmodbus call.
     * @param context Text prepended to the message, e.g. "read 29+8".
     */
    static PollError classifyError(int error_number, const std::string& context);

private:
    /// @brief Creates the libmodbus context and connects, honouring the backoff delay.
    bool open();

    /// @brief Drops the socket after a link failure and advances the backoff.
    void markDisconnected();

    void recordFailure();
    void releaseContext();

    ConnectionDescriptor descriptor;
    std::chrono::milliseconds response_timeout;
    BackoffPolicy backoff;
    std::chrono::steady_clock::time_point next_attempt;
    modbus_t *ctx;
    bool connected;
    bool configured;
};

#endif // MODBUS_SESSION_H
