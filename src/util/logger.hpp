#ifndef REDACTOR_UTIL_LOGGER_HPP
#define REDACTOR_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <array>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cstddef>
#include <stdexcept>
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief Process-wide diagnostics for the redactor.
 *
 * Every line goes to stderr, and optionally to a log file as well. stdout
 * carries redacted document text only, so this file never writes to std::cout.
 *
 * A line looks like:
 *   [2024-05-01 12:00:00][WARN] CandidateScanner: line 3 is 90000 bytes long ...
 *
 * The logger also counts the messages it was asked to emit per level, whether
 * or not the threshold let them through. The redact command and the tests use
 * those counts to tell whether a run raised warnings.
 *
 * USAGE:
 *   @code
 *   logger::setLogLevel(logger::parseLogLevel(runConfig.logLevel));
 *   logger::warn("ValidatorGateway: validator for 'ipv4_address' crashed");
 *   size_t warnings = logger::messageCount(logger::LogLevel::WARN);
 *   @endcode
 */

namespace redactor {
namespace util {
namespace logger {

/**
 * @brief Severity of a message, in increasing order.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

constexpr size_t LOG_LEVEL_COUNT = 5;

/**
 * @brief The tag printed between brackets for a level.
 */
inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a level name as accepted by `logLevel` and `--log-level`.
 *        Case-insensitive; "warning" is accepted for WARN.
 * @throw std::invalid_argument on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") {
        return LogLevel::WARN;
    }
    for (size_t i = 0; i < LOG_LEVEL_COUNT; ++i) {
        LogLevel level = static_cast<LogLevel>(i);
        std::string candidate = levelName(level);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == candidate) {
            return level;
        }
    }
    throw std::invalid_argument("logger: unknown log level '" + name + "'");
}

/**
 * @class Logger
 * @brief The single sink of the process. Every public member locks the same
 *        mutex, so scanner threads and the main thread can log concurrently
 *        without interleaving lines.
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Messages below this level are counted but not written.
     *        The default is WARN, so a normal run only reports problems.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return threshold_;
    }

    /**
     * @brief Also write every emitted line to filename.
     * @param append Keep the existing content instead of truncating it.
     * @return false if the file cannot be opened; stderr logging is unaffected.
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto mode = append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc);
        auto file = std::make_unique<std::ofstream>(filename, mode);
        if (!file->is_open()) {
            std::cerr << "[Logger] cannot open log file " << filename << "\n";
            return false;
        }
        logFile_ = std::move(file);
        return true;
    }

    /// Close the log file, if any. stderr output continues.
    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logFile_.reset();
    }

    /**
     * @brief Number of messages logged at level since start or the last
     *        resetCounts(), including those below the threshold.
     */
    size_t messageCount(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_[static_cast<size_t>(level)];
    }

    void resetCounts()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counts_.fill(0);
    }

    void write(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[static_cast<size_t>(level)];
        if (level < threshold_) {
            return;
        }

        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << "\n";
        const std::string text = line.str();

        std::cerr << text;
        std::cerr.flush();
        if (logFile_) {
            (*logFile_) << text;
            logFile_->flush();
        }
    }

private:
    Logger()
        : threshold_(LogLevel::WARN)
    {
        counts_.fill(0);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel threshold_;
    std::array<size_t, LOG_LEVEL_COUNT> counts_;
    std::unique_ptr<std::ofstream> logFile_;
};

// ----------------------------------------------------------------------------
//  Shortcuts to the global Logger
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline size_t messageCount(LogLevel level)
{
    return Logger::getInstance().messageCount(level);
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::DEBUG, msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::INFO, msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::WARN, msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::ERROR, msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::CRITICAL, msg);
}

} // namespace logger
} // namespace util
} // namespace redactor

#endif // REDACTOR_UTIL_LOGGER_HPP
