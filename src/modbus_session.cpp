#include "modbus_session.hpp"
#include <cerrno>
#include <iostream>

ModbusSession::ModbusSession(std::chrono::milliseconds timeout, BackoffPolicy policy)
    : response_timeout(timeout), backoff(policy), next_attempt(), ctx(nullptr), connected(false), configured(false) {}

ModbusSession::~ModbusSession() {
    close();
    releaseContext();
}

bool ModbusSession::connect(const ConnectionDescriptor& target) {
    if (configured && !descriptor.sameEndpoint(target)) {
        // Unit id is baked into the context, so a new endpoint needs a new context.
        close();
        releaseContext();
        backoff.reset();
        next_attempt = std::chrono::steady_clock::time_point();
    }
    descriptor = target;
    configured = true;
    if (connected) {
        return true;
    }
    return open();
}

bool ModbusSession::open() {
    if (!configured) {
        return false;
    }
    if (std::chrono::steady_clock::now() < next_attempt) {
        return false;
    }

    if (ctx == nullptr) {
        const std::string service = std::to_string(descriptor.port);
        ctx = modbus_new_tcp_pi(descriptor.host.c_str(), service.c_str());
        if (ctx == nullptr) {
            std::cerr << "Failed to create modbus context: " << modbus_strerror(errno) << std::endl;
            recordFailure();
            return false;
        }
        if (modbus_set_slave(ctx, descriptor.unit_id) == -1) {
            std::cerr << "Invalid unit id " << descriptor.unit_id << ": " << modbus_strerror(errno) << std::endl;
            releaseContext();
            recordFailure();
            return false;
        }
        const auto total_us = std::chrono::duration_cast<std::chrono::microseconds>(response_timeout).count();
        modbus_set_response_timeout(ctx, static_cast<uint32_t>(total_us / 1000000),
                                    static_cast<uint32_t>(total_us % 1000000));
    }

    if (modbus_connect(ctx) == -1) {
        std::cerr << "Unable to connect to " << descriptor.host << ":" << descriptor.port << ": "
                  << modbus_strerror(errno) << std::endl;
        recordFailure();
        return false;
    }

    connected = true;
    std::cout << "Connected to " << descriptor.host << ":" << descriptor.port << " (unit " << descriptor.unit_id
              << ")" << std::endl;
    return true;
}

ReadResult ModbusSession::readRegisters(uint16_t address, uint16_t count) {
    const std::string context = "read " + std::to_string(address) + "+" + std::to_string(count);

    if (!connected && !open()) {
        return PollError{ErrorKind::ConnectionLost, 0, context + ": not connected"};
    }

    std::vector<uint16_t> words(count);
    int rc = modbus_read_registers(ctx, address, count, words.data());
    if (rc == -1) {
        PollError error = classifyError(errno, context);
        if (error.isTransport()) {
            markDisconnected();
        } else {
            // The device answered, so the link itself is fine.
            backoff.reset();
        }
        return error;
    }

    backoff.reset();
    if (rc != count) {
        return PollError{ErrorKind::ProtocolError, 0,
                         context + ": got " + std::to_string(rc) + " register(s)"};
    }
    return words;
}

void ModbusSession::close() {
    if (ctx != nullptr && connected) {
        modbus_close(ctx);
        std::cout << "Closed connection to " << descriptor.host << ":" << descriptor.port << std::endl;
    }
    connected = false;
}

std::chrono::milliseconds ModbusSession::retryDelay() const {
    const auto now = std::chrono::steady_clock::now();
    if (now >= next_attempt) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(next_attempt - now);
}

PollError ModbusSession::classifyError(int error_number, const std::string& context) {
    const std::string message = context + ": " + modbus_strerror(error_number);
    if (error_number == ETIMEDOUT) {
        return PollError{ErrorKind::Timeout, 0, message};
    }
    switch (error_number) {
        case EMBXILFUN:
        case EMBXILADD:
        case EMBXILVAL:
        case EMBXSFAIL:
        case EMBXACK:
        case EMBXSBUSY:
        case EMBXNACK:
        case EMBXMEMPAR:
        case EMBXGPATH:
        case EMBXGTAR:
        case EMBBADCRC:
        case EMBBADDATA:
        case EMBBADEXC:
        case EMBMDATA:
        case EMBBADSLAVE:
            return PollError{ErrorKind::ProtocolError, error_number - MODBUS_ENOBASE, message};
        default:
            return PollError{ErrorKind::ConnectionLost, 0, message};
    }
}

void ModbusSession::markDisconnected() {
    if (ctx != nullptr) {
        modbus_close(ctx);
    }
    connected = false;
    recordFailure();
}

void ModbusSession::recordFailure() {
    backoff.recordFailure();
    next_attempt = std::chrono::steady_clock::now() + backoff.currentDelay();
}

void ModbusSession::releaseContext() {
    if (ctx) {
        modbus_free(ctx);
        ctx = nullptr;
    }
}
