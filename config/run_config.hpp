#ifndef REDACTOR_CONFIG_RUN_CONFIG_HPP
#define REDACTOR_CONFIG_RUN_CONFIG_HPP

#include <string>
#include <cstdint>
#include <vector>

/**
 * @file run_config.hpp
 * @brief Settings for a single redaction run (one invocation of `redact`).
 *
 * USAGE:
 *   - Populated from defaults, then a `redact.conf` settings file through
 *     util/config_parser.hpp, then command-line flags.
 *   - The secret-type catalog itself is NOT part of these settings; it is
 *     resolved separately by catalog/catalog_loader.hpp.
 */

namespace redactor {
namespace config {

/**
 * @brief What the validator gateway does when a validator cannot be launched
 *        or dies on a signal.
 */
enum class ValidatorFailurePolicy {
    Disable, ///< warn, treat the candidate as rejected, keep running
    Fatal    ///< abort the run
};

/**
 * @struct RunConfig
 * @brief Holds the tunables of a run:
 *   - validatorTimeoutSeconds: upper bound on one validator process (0 = unbounded).
 *   - validatorFailurePolicy: see ValidatorFailurePolicy.
 *   - scanThreads: worker threads used to scan a batch (0 = hardware concurrency).
 *   - maxLineLength: lines longer than this are not scanned (0 = unbounded).
 *   - logLevel / logFile: passed to util::logger.
 */
struct RunConfig
{
    /**
     * @brief Construct a RunConfig with defaults:
     *   validatorTimeoutSeconds = 30
     *   validatorFailurePolicy = Disable
     *   scanThreads = 0
     *   maxLineLength = 8192
     *   logLevel = "warn"
     */
    RunConfig()
        : validatorTimeoutSeconds(30),
          validatorFailurePolicy(ValidatorFailurePolicy::Disable),
          scanThreads(0),
          maxLineLength(8192),
          logLevel("warn")
    {
    }

    uint64_t validatorTimeoutSeconds;
    ValidatorFailurePolicy validatorFailurePolicy;
    uint64_t scanThreads;
    uint64_t maxLineLength;

    /// One of debug, info, warn, error, critical.
    std::string logLevel;

    /// When non-empty, log lines are mirrored to this file.
    std::string logFile;
};

} // namespace config
} // namespace redactor

#endif // REDACTOR_CONFIG_RUN_CONFIG_HPP
