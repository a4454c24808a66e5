// Translation between Windows file attributes and POSIX permission bits.
#pragma once
#include <cstdint>
#include <string>

namespace bridgescp {

struct WindowsAttributes {
    bool readOnly = false;
    bool hidden   = false;
    bool system   = false;
    bool archive  = true;

    bool operator==(const WindowsAttributes& o) const {
        return readOnly == o.readOnly && hidden == o.hidden &&
               system == o.system && archive == o.archive;
    }
    bool operator!=(const WindowsAttributes& o) const { return !(*this == o); }
};

// Permission bits only (no file type). The owner can always read.
std::uint32_t windowsToPosix(const WindowsAttributes& attrs);

// Only the permission bits of mode are considered; archive is always set.
WindowsAttributes posixToWindows(std::uint32_t mode);

// "drwxr-xr-x" style rendering; the first character reflects the file type.
std::string formatPermissions(std::uint32_t mode);

} // namespace bridgescp
