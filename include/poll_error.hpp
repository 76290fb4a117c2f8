#ifndef POLL_ERROR_H
#define POLL_ERROR_H

#include <string>

/// @brief Failure categories reported by the transport and the decoder.
enum class ErrorKind {
    ConnectionLost,    ///< Socket closed, refused or reconnect deferred by backoff
    Timeout,           ///< No response within the response timeout
    ProtocolError,     ///< Exception response or malformed frame from the device
    MalformedPayload,  ///< Word count does not match the register descriptor
    UnknownStatusCode, ///< Status code missing from the lookup table (non-fatal)
    InvalidValue       ///< Raw value outside the descriptor's valid range
};

/**
 * @struct PollError
 * @brief A runtime failure recorded against a request group or a single register.
 *
 * Runtime failures are values, not exceptions: they are attached to the
 * affected registers and never abort a poll cycle.
 */
struct PollError {
    ErrorKind kind;
    int code = 0; ///< Modbus exception / libmodbus code for ProtocolError, status code for UnknownStatusCode
    std::string message;

    /// True for failures that say nothing about the device's data, only about the link.
    bool isTransport() const {
        return kind == ErrorKind::ConnectionLost || kind == ErrorKind::Timeout;
    }

    bool operator==(const PollError& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

const char* toString(ErrorKind kind);

/// @brief Human-readable one-line description, e.g. "ProtocolError(2): Illegal data address".
std::string describe(const PollError& error);

#endif // POLL_ERROR_H
