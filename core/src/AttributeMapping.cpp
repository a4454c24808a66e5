#include "bridgescp/AttributeMapping.hpp"

namespace bridgescp {

std::uint32_t windowsToPosix(const WindowsAttributes& a) {
    std::uint32_t mode = 0400;  // owner read
    if (!a.readOnly) mode |= 0300;
    if (!a.hidden) {
        mode |= 0040;
        if (!a.readOnly) mode |= 0030;
        if (!a.system) mode |= 0005;
    }
    return mode;
}

WindowsAttributes posixToWindows(std::uint32_t mode) {
    WindowsAttributes a;
    a.readOnly = (mode & 0200) == 0;
    a.hidden   = (mode & 0004) == 0;
    a.system   = (mode & 0001) == 0;
    a.archive  = true;
    return a;
}

std::string formatPermissions(std::uint32_t mode) {
    std::string s(10, '-');
    switch (mode & 0170000) {
        case 0040000: s[0] = 'd'; break;
        case 0120000: s[0] = 'l'; break;
        default: break;
    }
    const char flags[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (1u << (8 - i))) s[static_cast<std::size_t>(i + 1)] = flags[i];
    }
    return s;
}

} // namespace bridgescp
