#include <horde/core/filesystem.hpp>
#include <horde/core/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace horde::core {

namespace fs = std::filesystem;

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(fs::path(path), ec);
}

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        log(LogLevel::Debug, "[FileSystem] Cannot open " + path);
        return {};
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    fs::path target(path);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            log(LogLevel::Error, "[FileSystem] Cannot create directory for " + path + ": " + ec.message());
            return false;
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!(file << text)) {
            log(LogLevel::Error, "[FileSystem] Cannot write " + temp.string());
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        log(LogLevel::Error, "[FileSystem] Cannot replace " + path + ": " + ec.message());
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

} // namespace horde::core
