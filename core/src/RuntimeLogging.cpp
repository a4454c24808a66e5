#include "bridgescp/RuntimeLogging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

namespace bridgescp {

namespace {

// Trimmed, lower-cased value of an environment variable ("" when unset).
std::string envWord(const char *name) {
    const char *raw = std::getenv(name);
    if (!raw)
        return {};
    std::string v(raw);
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return v;
}

bool oneOf(const std::string &v, std::initializer_list<const char *> words) {
    return std::any_of(words.begin(), words.end(),
                       [&](const char *w) { return v == w; });
}

} // namespace

bool sensitiveLoggingEnabled() {
    return oneOf(envWord("BRIDGESCP_ENV"), {"dev", "development", "local", "debug"}) &&
           oneOf(envWord("BRIDGESCP_LOG_SENSITIVE"), {"1", "true", "yes", "on"});
}

std::string redacted(const std::string &value) {
    if (sensitiveLoggingEnabled())
        return value;
    if (value.empty())
        return "<empty>";
    return "<redacted:" + std::to_string(value.size()) + ">";
}

} // namespace bridgescp
