#ifndef REDACTOR_APP_REDACT_COMMAND_HPP
#define REDACTOR_APP_REDACT_COMMAND_HPP

#include <string>
#include <vector>
#include <map>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <filesystem>
#include <system_error>
#include "config/run_config.hpp"
#include "../catalog/catalog_loader.hpp"
#include "../engine/redaction_engine.hpp"
#include "../io/document_io.hpp"
#include "../io/mapping_writer.hpp"
#include "../util/config_parser.hpp"
#include "../util/logger.hpp"

/**
 * @file redact_command.hpp
 * @brief The `redact` command: argument parsing and the batch driver around
 *        RedactionEngine. main.cpp only forwards to runRedactCommand().
 *
 * EXIT STATUS:
 *   0  success
 *   1  usage or configuration error (nothing was written)
 *   2  at least one input or output file failed; the others were processed
 *
 * With an output directory, each redacted file keeps its input's file name.
 * When two different inputs share a file name, the first one listed is written
 * and every later one is reported as a file error instead of overwriting it.
 */

namespace redactor {
namespace app {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_CONFIG_ERROR = 1,
    EXIT_FILE_ERROR = 2
};

class UsageError : public std::runtime_error
{
public:
    explicit UsageError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @struct CommandOptions
 * @brief Parsed command line. Settings given as flags are kept as key/value
 *        overrides and applied after the settings file.
 */
struct CommandOptions
{
    std::vector<std::string> configDirectories;
    bool noDefault = false;
    std::vector<std::string> secrets;
    std::string writeSubstitutions;
    std::string outputDirectory;
    std::string settingsFile;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> files;
    bool help = false;
};

inline std::string usageText(const std::string &programName)
{
    return "Redact files by replacing secret values by placeholders.\n\n"
           "Usage: " + programName + " [options] <file>...\n\n"
           "Options:\n"
           "  -c, --conf <dir>...              additional configuration directories\n"
           "  -n, --no-default                 don't use ~/.redact and /etc/redact\n"
           "  -s, --secrets <name>...          only redact those secret types\n"
           "  -w, --write-substitutions <dir>  write the substitutions to that directory\n"
           "  -o, --output-dir <dir>           write redacted files there instead of stdout\n"
           "      --settings <file>            run settings file (default: first redact.conf)\n"
           "      --log-level <level>          debug, info, warn, error, critical\n"
           "      --log-file <file>            also write log lines to that file\n"
           "      --validator-timeout <sec>    bound on one validator run, 0 = none\n"
           "      --fail-on-validator-error    abort when a validator cannot run\n"
           "  -h, --help                       show this help\n";
}

/**
 * @brief Parse argv. Multi-value options consume arguments until the next one
 *        starting with '-'; use "--" to start the file list explicitly.
 * @throw UsageError on malformed arguments.
 */
inline CommandOptions parseArguments(int argc, char **argv)
{
    CommandOptions options;
    bool filesOnly = false;

    auto takeValue = [&](int &i, const std::string &flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError("missing value for " + flag);
        }
        return argv[++i];
    };
    auto takeList = [&](int &i, const std::string &flag, std::vector<std::string> &dest) {
        size_t before = dest.size();
        while (i + 1 < argc && argv[i + 1][0] != '-') {
            dest.push_back(argv[++i]);
        }
        if (dest.size() == before) {
            throw UsageError("missing value for " + flag);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (filesOnly || arg.empty() || arg[0] != '-' || arg == "-") {
            options.files.push_back(arg);
        }
        else if (arg == "--") {
            filesOnly = true;
        }
        else if (arg == "-h" || arg == "--help") {
            options.help = true;
        }
        else if (arg == "-c" || arg == "--conf") {
            takeList(i, arg, options.configDirectories);
        }
        else if (arg == "-n" || arg == "--no-default") {
            options.noDefault = true;
        }
        else if (arg == "-s" || arg == "--secrets") {
            takeList(i, arg, options.secrets);
        }
        else if (arg == "-w" || arg == "--write-substitutions") {
            options.writeSubstitutions = takeValue(i, arg);
        }
        else if (arg == "-o" || arg == "--output-dir") {
            options.outputDirectory = takeValue(i, arg);
        }
        else if (arg == "--settings") {
            options.settingsFile = takeValue(i, arg);
        }
        else if (arg == "--log-level") {
            options.overrides.emplace_back("logLevel", takeValue(i, arg));
        }
        else if (arg == "--log-file") {
            options.overrides.emplace_back("logFile", takeValue(i, arg));
        }
        else if (arg == "--validator-timeout") {
            options.overrides.emplace_back("validatorTimeoutSeconds", takeValue(i, arg));
        }
        else if (arg == "--fail-on-validator-error") {
            options.overrides.emplace_back("validatorFailurePolicy", "fatal");
        }
        else {
            throw UsageError("unknown option " + arg);
        }
    }

    if (options.help) {
        return options;
    }
    if (options.noDefault && options.configDirectories.empty()) {
        throw UsageError("cannot use --no-default without --conf");
    }
    if (options.files.empty()) {
        throw UsageError("no input file given");
    }
    return options;
}

/**
 * @brief Configuration directories in precedence order.
 */
inline std::vector<std::string> resolveDirectories(const CommandOptions &options)
{
    std::vector<std::string> dirs = options.configDirectories;
    if (!options.noDefault) {
        for (const auto &dir : catalog::CatalogLoader::defaultDirectories()) {
            dirs.push_back(dir);
        }
    }
    return dirs;
}

/**
 * @brief Defaults, then the settings file, then command-line overrides.
 *        Also applies the logging settings.
 * @throw std::runtime_error on a malformed settings file or override.
 */
inline config::RunConfig resolveRunConfig(const CommandOptions &options,
                                          const std::vector<std::string> &directories)
{
    config::RunConfig runConfig;
    util::ConfigParser parser(runConfig);

    std::string settings = options.settingsFile.empty()
        ? catalog::CatalogLoader::findSettingsFile(directories)
        : options.settingsFile;
    if (!settings.empty()) {
        parser.loadFromFile(settings);
    }
    for (const auto &kv : options.overrides) {
        parser.applyKeyValue(kv.first, kv.second);
    }

    util::logger::setLogLevel(util::logger::parseLogLevel(runConfig.logLevel));
    if (!runConfig.logFile.empty() && !util::logger::enableFileOutput(runConfig.logFile, true)) {
        util::logger::warn("[redact] logging to stderr only");
    }
    return runConfig;
}

/**
 * @brief Run the whole command. Redacted text goes to out unless an output
 *        directory was requested.
 */
inline int runRedactCommand(const CommandOptions &options, std::ostream &out)
{
    std::vector<std::string> directories = resolveDirectories(options);

    config::RunConfig runConfig;
    catalog::Catalog secretCatalog;
    try {
        runConfig = resolveRunConfig(options, directories);
        catalog::CatalogLoader loader(runConfig);
        secretCatalog = loader.load(directories, options.secrets);
    }
    catch (const std::exception &ex) {
        util::logger::error(std::string("[redact] ") + ex.what());
        return EXIT_CONFIG_ERROR;
    }

    std::vector<std::string> typeNames;
    for (const auto &secretType : secretCatalog) {
        typeNames.push_back(secretType.name);
    }

    int status = EXIT_OK;

    // Unreadable files are dropped from the batch, the rest still share one registry.
    std::vector<std::string> paths;
    std::vector<std::string> documents;
    for (const auto &file : options.files) {
        try {
            documents.push_back(io::readDocument(file));
            paths.push_back(file);
        }
        catch (const std::exception &ex) {
            util::logger::error(std::string("[redact] ") + ex.what());
            status = EXIT_FILE_ERROR;
        }
    }

    engine::RedactionEngine redactionEngine(std::move(secretCatalog), runConfig);
    std::vector<std::string> redacted;
    try {
        redacted = redactionEngine.redactBatch(documents);
    }
    catch (const engine::ValidatorInvocationError &ex) {
        util::logger::critical(std::string("[redact] ") + ex.what());
        return EXIT_CONFIG_ERROR;
    }

    if (!options.outputDirectory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(options.outputDirectory, ec);
        if (ec) {
            util::logger::error("[redact] cannot create " + options.outputDirectory + ": " + ec.message());
            return EXIT_FILE_ERROR;
        }
    }

    std::map<std::string, std::string> targets; // output path -> input written there
    for (size_t i = 0; i < redacted.size(); ++i) {
        if (options.outputDirectory.empty()) {
            out << redacted[i];
            continue;
        }
        std::string target = io::outputPathFor(paths[i], options.outputDirectory);
        auto claim = targets.emplace(target, paths[i]);
        if (!claim.second) {
            if (!io::sameDocumentPath(claim.first->second, paths[i])) {
                util::logger::error("[redact] " + paths[i] + " not written: " + target +
                                    " already holds " + claim.first->second);
                status = EXIT_FILE_ERROR;
            }
            continue;
        }
        try {
            io::writeDocument(target, redacted[i]);
        }
        catch (const std::exception &ex) {
            util::logger::error(std::string("[redact] ") + ex.what());
            status = EXIT_FILE_ERROR;
        }
    }
    out.flush();

    if (!options.writeSubstitutions.empty()) {
        try {
            io::writeMappingFiles(options.writeSubstitutions, redactionEngine.exportMapping(), typeNames);
        }
        catch (const std::exception &ex) {
            util::logger::error(std::string("[redact] ") + ex.what());
            status = EXIT_FILE_ERROR;
        }
    }

    util::logger::info("[redact] " + std::to_string(paths.size()) + " files redacted, " +
                       std::to_string(redactionEngine.registry().size()) + " secrets known, " +
                       std::to_string(util::logger::messageCount(util::logger::LogLevel::WARN)) +
                       " warnings");
    return status;
}

} // namespace app
} // namespace redactor

#endif // REDACTOR_APP_REDACT_COMMAND_HPP
