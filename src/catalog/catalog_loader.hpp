#ifndef REDACTOR_CATALOG_CATALOG_LOADER_HPP
#define REDACTOR_CATALOG_CATALOG_LOADER_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include "config/run_config.hpp"
#include "../util/config_parser.hpp"
#include "../util/logger.hpp"
#include "../engine/process_validator.hpp"
#include "secret_type.hpp"

/**
 * @file catalog_loader.hpp
 * @brief Resolves the secret-type catalog from an ordered list of configuration
 *        directories.
 *
 * LAYOUT of one configuration directory:
 *   <dir>/patterns/<secret type>       one regular expression per line
 *   <dir>/substitutions/<secret type>  "secret = placeholder" per line
 *   <dir>/validators/<secret type>     executable taking the candidate as argv[1]
 *   <dir>/redact.conf                  run settings (see util/config_parser.hpp)
 *
 * RULES:
 *   - For each (secret type, kind) the first file found across the directories
 *     wins; directories are given highest precedence first. Missing directories
 *     are skipped silently.
 *   - Blank lines and lines starting with '#' are ignored everywhere.
 *   - A substitution line is split at its LAST '='; both sides are trimmed.
 *   - A type with neither patterns nor substitutions is skipped with a warning.
 *   - The catalog is ordered by secret-type name.
 *   - Malformed content raises ConfigurationError.
 *
 * USAGE:
 *   @code
 *   CatalogLoader loader(runConfig);
 *   Catalog catalog = loader.load({"./conf", "/etc/redact"}, {"hostname"});
 *   @endcode
 */

namespace redactor {
namespace catalog {

class CatalogLoader
{
public:
    static constexpr const char *PATTERNS = "patterns";
    static constexpr const char *SUBSTITUTIONS = "substitutions";
    static constexpr const char *VALIDATORS = "validators";
    static constexpr const char *SETTINGS_FILE = "redact.conf";

    explicit CatalogLoader(const config::RunConfig &runConfig = config::RunConfig())
        : runConfig_(runConfig)
    {
    }

    /**
     * @brief `~/.redact` then `/etc/redact`.
     */
    static std::vector<std::string> defaultDirectories()
    {
        std::vector<std::string> dirs;
        const char *home = std::getenv("HOME");
        if (home && *home) {
            dirs.push_back((std::filesystem::path(home) / ".redact").string());
        }
        dirs.push_back("/etc/redact");
        return dirs;
    }

    /**
     * @brief Path of the first `redact.conf` in the ordered directories, or "" if none.
     */
    static std::string findSettingsFile(const std::vector<std::string> &orderedDirectories)
    {
        for (const auto &dir : orderedDirectories) {
            std::error_code ec;
            auto candidate = std::filesystem::path(dir) / SETTINGS_FILE;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate.string();
            }
        }
        return "";
    }

    /**
     * @brief Merge the directories into a catalog.
     * @param orderedDirectories highest precedence first.
     * @param only if non-empty, keep only the named secret types.
     * @throw ConfigurationError on malformed files or an empty result.
     */
    Catalog load(const std::vector<std::string> &orderedDirectories,
                 const std::vector<std::string> &only = {}) const
    {
        std::map<std::string, Sources> sources = discover(orderedDirectories);

        std::set<std::string> wanted(only.begin(), only.end());
        for (const auto &name : wanted) {
            if (sources.find(name) == sources.end()) {
                util::logger::warn("CatalogLoader: no configuration found for secret type '" + name + "'");
            }
        }

        Catalog catalog;
        for (const auto &entry : sources) {
            if (!wanted.empty() && wanted.count(entry.first) == 0) {
                continue;
            }
            SecretType secretType = build(entry.first, entry.second);
            if (secretType.patterns.empty() && secretType.substitutions.empty()) {
                util::logger::warn("CatalogLoader: secret type '" + entry.first +
                                   "' has neither patterns nor substitutions, skipped");
                continue;
            }
            util::logger::info("CatalogLoader: loaded secret type '" + secretType.name + "' (" +
                               std::to_string(secretType.patterns.size()) + " patterns, " +
                               std::to_string(secretType.substitutions.size()) + " substitutions" +
                               (secretType.validator ? ", validated)" : ")"));
            catalog.push_back(std::move(secretType));
        }

        if (catalog.empty()) {
            throw ConfigurationError("CatalogLoader: couldn't parse any configuration file");
        }
        return catalog;
    }

    /**
     * @brief Parse a substitutions file ("secret = placeholder" lines).
     * @throw ConfigurationError on a line without '=' or with an empty side.
     */
    static std::vector<Substitution> parseSubstitutions(const std::string &path)
    {
        std::vector<Substitution> substitutions;
        std::map<std::string, size_t> seen;
        for (const auto &line : readLines(path)) {
            auto pos = line.text.rfind('=');
            if (pos == std::string::npos) {
                throw ConfigurationError("CatalogLoader: " + path + ":" + std::to_string(line.number) +
                                         ": expected 'secret = placeholder'");
            }
            std::string secret = line.text.substr(0, pos);
            std::string placeholder = line.text.substr(pos + 1);
            util::trim(secret);
            util::trim(placeholder);
            if (secret.empty() || placeholder.empty()) {
                throw ConfigurationError("CatalogLoader: " + path + ":" + std::to_string(line.number) +
                                         ": secret and placeholder must not be empty");
            }

            auto dup = seen.find(secret);
            if (dup != seen.end()) {
                util::logger::warn("CatalogLoader: " + path + ":" + std::to_string(line.number) +
                                   ": secret defined twice, the later line wins");
                substitutions[dup->second].placeholder = placeholder;
                continue;
            }
            seen.emplace(secret, substitutions.size());
            substitutions.push_back({secret, placeholder});
        }
        return substitutions;
    }

    /**
     * @brief Compile a patterns file, one rule per line.
     * @throw ConfigurationError naming the file and line of a bad rule.
     */
    static std::vector<PatternRule> parsePatterns(const std::string &path)
    {
        std::vector<PatternRule> rules;
        for (const auto &line : readLines(path)) {
            try {
                rules.emplace_back(line.text);
            }
            catch (const ConfigurationError &ex) {
                throw ConfigurationError("CatalogLoader: " + path + ":" + std::to_string(line.number) +
                                         ": " + ex.what());
            }
        }
        return rules;
    }

private:
    struct Sources
    {
        std::string patterns;
        std::string substitutions;
        std::string validator;
    };

    std::map<std::string, Sources> discover(const std::vector<std::string> &orderedDirectories) const
    {
        std::map<std::string, Sources> sources;
        for (const auto &dir : orderedDirectories) {
            collect(dir, PATTERNS, sources, &Sources::patterns);
            collect(dir, SUBSTITUTIONS, sources, &Sources::substitutions);
            collect(dir, VALIDATORS, sources, &Sources::validator);
        }
        return sources;
    }

    static void collect(const std::string &dir, const char *kind,
                        std::map<std::string, Sources> &sources,
                        std::string Sources::*slot)
    {
        std::error_code ec;
        std::filesystem::path kindDir = std::filesystem::path(dir) / kind;
        if (!std::filesystem::is_directory(kindDir, ec)) {
            return;
        }

        std::filesystem::directory_iterator it(kindDir, ec);
        if (ec) {
            util::logger::warn("CatalogLoader: cannot list " + kindDir.string() + ": " + ec.message());
            return;
        }
        for (const auto &entry : it) {
            std::string name = entry.path().filename().string();
            if (name.empty() || name[0] == '.' || !entry.is_regular_file(ec)) {
                continue;
            }
            std::string &path = sources[name].*slot;
            if (path.empty()) {
                path = entry.path().string();
            }
        }
    }

    SecretType build(const std::string &name, const Sources &src) const
    {
        SecretType secretType;
        secretType.name = name;
        if (!src.patterns.empty()) {
            secretType.patterns = parsePatterns(src.patterns);
        }
        if (!src.substitutions.empty()) {
            secretType.substitutions = parseSubstitutions(src.substitutions);
        }
        if (!src.validator.empty()) {
            if (access(src.validator.c_str(), X_OK) != 0) {
                util::logger::warn("CatalogLoader: validator " + src.validator +
                                   " is not executable, '" + name + "' candidates will not be confirmed");
            }
            auto timeout = std::chrono::seconds(runConfig_.validatorTimeoutSeconds);
            secretType.validator = std::make_shared<engine::ProcessValidator>(
                src.validator, std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
        }
        return secretType;
    }

    static std::vector<util::ConfigLine> readLines(const std::string &path)
    {
        try {
            return util::readUncommentedLines(path);
        }
        catch (const std::runtime_error &ex) {
            throw ConfigurationError(std::string("CatalogLoader: ") + ex.what());
        }
    }

    config::RunConfig runConfig_;
};

} // namespace catalog
} // namespace redactor

#endif // REDACTOR_CATALOG_CATALOG_LOADER_HPP
