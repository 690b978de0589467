#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace prodintel {

std::string FileUtils::joinPaths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;
    return (fs::path(base) / fs::path(relative)).string();
}

void FileUtils::ensureDirectoryExists(const std::string& path) {
    if (path.empty()) return;

    std::error_code ec;
    if (fs::is_directory(path, ec)) return;

    fs::create_directories(path, ec);
    if (ec) {
        throw FileIOException("FileUtils", "Failed to create directory '" + path + "': " + ec.message());
    }
}

bool FileUtils::fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> FileUtils::readLines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FileIOException("FileUtils", "Failed to open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace prodintel
