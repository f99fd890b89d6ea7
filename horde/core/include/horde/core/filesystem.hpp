#pragma once

#include <string>

namespace horde::core {

// Text file helpers for settings and clip manifests
struct FileSystem {
    // True for an existing regular file
    static bool exists(const std::string& path);

    // Empty string when the file cannot be read
    static std::string read_text(const std::string& path);

    // Creates missing parent directories. Writes a sibling temp file first
    // and renames it over the target, so a failed save leaves the old file.
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace horde::core
