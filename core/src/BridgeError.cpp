#include "bridgescp/BridgeError.hpp"

namespace bridgescp {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "None";
    case ErrorCode::Authentication:
        return "AuthenticationError";
    case ErrorCode::Transport:
        return "TransportError";
    case ErrorCode::Timeout:
        return "Timeout";
    case ErrorCode::SourceUnavailable:
        return "SourceUnavailable";
    case ErrorCode::PoisonedState:
        return "PoisonedState";
    case ErrorCode::LockContention:
        return "LockContention";
    case ErrorCode::InvalidStateTransition:
        return "InvalidStateTransition";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

std::string Error::describe() const {
    if (message.empty())
        return errorCodeName(code);
    return std::string(errorCodeName(code)) + ": " + message;
}

} // namespace bridgescp
