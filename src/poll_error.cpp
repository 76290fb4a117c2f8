#include "poll_error.hpp"

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionLost: return "ConnectionLost";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::ProtocolError: return "ProtocolError";
        case ErrorKind::MalformedPayload: return "MalformedPayload";
        case ErrorKind::UnknownStatusCode: return "UnknownStatusCode";
        case ErrorKind::InvalidValue: return "InvalidValue";
    }
    return "Unknown";
}

std::string describe(const PollError& error) {
    std::string text = toString(error.kind);
    if (error.kind == ErrorKind::ProtocolError || error.kind == ErrorKind::UnknownStatusCode) {
        text += "(" + std::to_string(error.code) + ")";
    }
    if (!error.message.empty()) {
        text += ": " + error.message;
    }
    return text;
}
