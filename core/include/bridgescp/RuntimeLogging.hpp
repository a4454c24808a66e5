// Controls whether host names, user names and paths reach the logs.
#pragma once
#include <string>

namespace bridgescp {

// True only when BRIDGESCP_ENV names a development environment (dev,
// development, local, debug) and BRIDGESCP_LOG_SENSITIVE is a true flag
// (1, true, yes, on). Read from the environment on every call.
bool sensitiveLoggingEnabled();

// value unchanged when sensitive logging is on; otherwise "<redacted:N>"
// with N the length, or "<empty>".
std::string redacted(const std::string &value);

} // namespace bridgescp
