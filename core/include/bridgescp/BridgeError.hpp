// Error taxonomy shared by the transport and the orchestration layer.
#pragma once
#include <string>

namespace bridgescp {

enum class ErrorCode {
    None,
    Authentication,         // missing or rejected credentials
    Transport,              // network/handshake/channel or remote I/O failure
    Timeout,                // a bounded operation exceeded its deadline
    SourceUnavailable,      // transfer source metadata could not be read
    PoisonedState,          // a synchronization primitive failed
    LockContention,         // reserved: locks block, nothing reports this today
    InvalidStateTransition, // operation not allowed in the current state
    InvalidArgument
};

const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode   code = ErrorCode::None;
    std::string message;

    explicit operator bool() const { return code != ErrorCode::None; }

    void set(ErrorCode c, std::string msg) {
        code = c;
        message = std::move(msg);
    }
    void clear() {
        code = ErrorCode::None;
        message.clear();
    }
    // "TransportError: connection refused"
    std::string describe() const;
};

} // namespace bridgescp
