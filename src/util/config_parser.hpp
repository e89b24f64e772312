#ifndef REDACTOR_UTIL_CONFIG_PARSER_HPP
#define REDACTOR_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <vector>
#include <algorithm>
#include <cctype>
#include <mutex>
#include "config/run_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads the `redact.conf` settings file into a config::RunConfig, and
 *        provides the line-level helpers shared by the catalog loader.
 *
 * FORMAT:
 *   # comment
 *   validatorTimeoutSeconds = 10
 *   validatorFailurePolicy  = fatal
 *   scanThreads             = 4
 *   logLevel                = info
 *   logFile                 = /var/log/redact.log
 *
 * USAGE:
 *   @code
 *   redactor::config::RunConfig runConfig;
 *   redactor::util::ConfigParser parser(runConfig);
 *   parser.loadFromFile("/etc/redact/redact.conf");
 *   @endcode
 */

namespace redactor {
namespace util {

/**
 * @brief Trim leading/trailing whitespace from a string in place.
 */
inline void trim(std::string &s)
{
    static const std::string whitespace = " \t\r\n";
    auto pos = s.find_first_not_of(whitespace);
    if (pos == std::string::npos) {
        s.clear();
        return;
    }
    s.erase(0, pos);
    pos = s.find_last_not_of(whitespace);
    if (pos != std::string::npos) {
        s.erase(pos + 1);
    }
}

/**
 * @brief A trimmed, non-blank, non-comment line together with its 1-based line number.
 */
struct ConfigLine
{
    size_t number;
    std::string text;
};

/**
 * @brief Read every uncommented line of a file.
 * @throw std::runtime_error if the file cannot be opened.
 */
inline std::vector<ConfigLine> readUncommentedLines(const std::string &filepath)
{
    std::ifstream inFile(filepath);
    if (!inFile.is_open()) {
        throw std::runtime_error("ConfigParser: cannot open " + filepath);
    }

    std::vector<ConfigLine> lines;
    std::string line;
    size_t number = 0;
    while (std::getline(inFile, line)) {
        ++number;
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        lines.push_back({number, line});
    }
    return lines;
}

/**
 * @class ConfigParser
 * @brief Minimal parser that reads a plain text key=value settings file into RunConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(config::RunConfig &runConfig)
        : runConfig_(runConfig)
    {
    }

    /**
     * @brief Parse the file line by line, storing recognized keys in runConfig_.
     * @throw std::runtime_error if the file can't be opened or lines are malformed.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logger::info("ConfigParser: Loading settings from " + filepath);

        for (const auto &line : readUncommentedLines(filepath)) {
            auto pos = line.text.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: " + filepath + ":" +
                                         std::to_string(line.number) +
                                         ": invalid line (no '='): " + line.text);
            }
            std::string key = line.text.substr(0, pos);
            std::string val = line.text.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    /**
     * @brief Apply a single setting; used for file lines and command-line overrides alike.
     * @throw std::runtime_error on a malformed value.
     */
    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "validatorTimeoutSeconds") {
            runConfig_.validatorTimeoutSeconds = parseUInt(val);
            logger::debug("ConfigParser: validatorTimeoutSeconds set to " + val);
        }
        else if (key == "validatorFailurePolicy") {
            runConfig_.validatorFailurePolicy = parsePolicy(val);
            logger::debug("ConfigParser: validatorFailurePolicy set to " + val);
        }
        else if (key == "scanThreads") {
            runConfig_.scanThreads = parseUInt(val);
            logger::debug("ConfigParser: scanThreads set to " + val);
        }
        else if (key == "maxLineLength") {
            runConfig_.maxLineLength = parseUInt(val);
            logger::debug("ConfigParser: maxLineLength set to " + val);
        }
        else if (key == "logLevel") {
            try {
                logger::parseLogLevel(val);
            }
            catch (const std::invalid_argument &ex) {
                throw std::runtime_error(std::string("ConfigParser: ") + ex.what());
            }
            runConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            runConfig_.logFile = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }

private:
    config::RunConfig &runConfig_;
    std::mutex mutex_;

    inline uint64_t parseUInt(const std::string &val) const
    {
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size() || val[0] == '-') {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    inline config::ValidatorFailurePolicy parsePolicy(const std::string &val) const
    {
        if (val == "disable") {
            return config::ValidatorFailurePolicy::Disable;
        }
        if (val == "fatal") {
            return config::ValidatorFailurePolicy::Fatal;
        }
        throw std::runtime_error("ConfigParser: validatorFailurePolicy must be 'disable' or 'fatal', got '" +
                                 val + "'");
    }
};

} // namespace util
} // namespace redactor

#endif // REDACTOR_UTIL_CONFIG_PARSER_HPP
