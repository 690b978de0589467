#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>
#include <vector>

namespace prodintel {

/**
 * @brief Small filesystem helpers shared by the loader, the writer and the CLI
 */
class FileUtils {
public:
    static std::string joinPaths(const std::string& base, const std::string& relative);

    /**
     * @brief Create a directory (and parents) if it does not already exist
     * @throws FileIOException if the directory cannot be created
     */
    static void ensureDirectoryExists(const std::string& path);

    static bool fileExists(const std::string& path);

    /**
     * @brief Read all lines of a text file, stripping a trailing '\r' from each
     * @throws FileIOException if the file cannot be opened
     */
    static std::vector<std::string> readLines(const std::string& path);
};

} // namespace prodintel

#endif // FILE_UTILS_HPP
