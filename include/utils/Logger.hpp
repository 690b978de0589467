#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>

namespace prodintel {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Process-wide logger
 *
 * Messages are tagged with the emitting component and written to stderr,
 * and additionally to a log file once one is attached with setLogFile().
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Mirror all subsequent messages into a file (appending)
     * @param filepath Path of the log file
     * @return false if the file could not be opened
     */
    bool setLogFile(const std::string& filepath);
    void closeLogFile();

    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warning(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);

    static LogLevel parseLevel(const std::string& name);
    static std::string levelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    void log(LogLevel level, const std::string& source, const std::string& message);

    LogLevel level_ = LogLevel::INFO;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

} // namespace prodintel

#endif // LOGGER_HPP
