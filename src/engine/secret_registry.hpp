#ifndef REDACTOR_ENGINE_SECRET_REGISTRY_HPP
#define REDACTOR_ENGINE_SECRET_REGISTRY_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <mutex>
#include "../util/logger.hpp"
#include "candidate_scanner.hpp"
#include "validator_gateway.hpp"

/**
 * @file secret_registry.hpp
 * @brief The run-scoped, authoritative secret -> placeholder map.
 *
 * DESIGN GOALS:
 *   - The secret text is the identity key, across all secret types: the first
 *     type to register a text owns it, later types reuse its placeholder.
 *   - Predefined substitutions are registered before any candidate is looked at
 *     and never go through a validator.
 *   - A discovered secret of type T gets "T<index>"; the index starts at 0 and
 *     advances once per newly registered secret of T, in confirmation order.
 *     An index whose placeholder is already used by a predefined substitution
 *     is skipped, so re-supplied mapping files never collide with new numbers.
 *   - Registration order is kept and is what exportMapping() returns.
 *   - Lookup plus registration happen under one lock, so concurrent callers
 *     still see one writer at a time.
 *
 * USAGE:
 *   @code
 *   SecretRegistry registry;
 *   registry.registerPredefined("hostname", "db01.internal.domain", "DB");
 *   auto placeholder = registry.registerCandidate(candidate, gateway);
 *   if (placeholder) { ... }
 *   @endcode
 */

namespace redactor {
namespace engine {

enum class SecretOrigin {
    Predefined,
    Validated
};

/**
 * @struct Secret
 * @brief One confirmed secret. Created once, never modified afterwards.
 */
struct Secret
{
    std::string text;
    std::string secretTypeName;
    std::string placeholder;
    SecretOrigin origin;
};

/**
 * @struct MappingEntry
 * @brief One row of an exported mapping (persistable as "secret = placeholder").
 */
struct MappingEntry
{
    std::string secretType;
    std::string secretText;
    std::string placeholder;
};

class SecretRegistry
{
public:
    SecretRegistry() = default;

    SecretRegistry(const SecretRegistry&) = delete;
    SecretRegistry& operator=(const SecretRegistry&) = delete;

    /**
     * @brief Register a predefined substitution.
     * @return false if the text was already owned (by this or an earlier type);
     *         the existing mapping is kept.
     */
    bool registerPredefined(const std::string &secretTypeName,
                            const std::string &text,
                            const std::string &placeholder)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = byText_.find(text);
        if (existing != byText_.end()) {
            const Secret &owner = secrets_[existing->second];
            if (owner.secretTypeName != secretTypeName || owner.placeholder != placeholder) {
                util::logger::warn("SecretRegistry: predefined secret for '" + secretTypeName +
                                   "' already mapped to " + owner.placeholder + " by '" +
                                   owner.secretTypeName + "', keeping the first mapping");
            }
            return false;
        }
        reservedPlaceholders_.insert(placeholder);
        insertLocked({text, secretTypeName, placeholder, SecretOrigin::Predefined});
        return true;
    }

    /**
     * @brief Resolve a candidate: reuse an existing placeholder, or confirm it
     *        through the gateway and assign the next placeholder of its type.
     * @return The placeholder, or std::nullopt if the candidate was rejected.
     * @throw ValidatorInvocationError when the gateway runs with the Fatal policy.
     */
    std::optional<std::string> registerCandidate(const Candidate &candidate, ValidatorGateway &gateway)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = byText_.find(candidate.text);
        if (existing != byText_.end()) {
            return secrets_[existing->second].placeholder;
        }

        const catalog::SecretType &secretType = *candidate.secretType;
        if (!gateway.confirm(secretType, candidate.text)) {
            return std::nullopt;
        }

        std::string placeholder = nextPlaceholderLocked(secretType.name);
        insertLocked({candidate.text, secretType.name, placeholder, SecretOrigin::Validated});
        util::logger::debug("SecretRegistry: registered " + placeholder);
        return placeholder;
    }

    /**
     * @brief The placeholder of a registered text, or std::nullopt ("not a secret").
     */
    std::optional<std::string> lookup(const std::string &text) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byText_.find(text);
        if (it == byText_.end()) {
            return std::nullopt;
        }
        return secrets_[it->second].placeholder;
    }

    std::optional<Secret> find(const std::string &text) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byText_.find(text);
        if (it == byText_.end()) {
            return std::nullopt;
        }
        return secrets_[it->second];
    }

    /// Snapshot of every secret, in registration order.
    std::vector<Secret> secrets() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return secrets_;
    }

    std::vector<MappingEntry> exportMapping() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MappingEntry> entries;
        entries.reserve(secrets_.size());
        for (const auto &secret : secrets_) {
            entries.push_back({secret.secretTypeName, secret.text, secret.placeholder});
        }
        return entries;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return secrets_.size();
    }

private:
    void insertLocked(Secret secret)
    {
        byText_.emplace(secret.text, secrets_.size());
        secrets_.push_back(std::move(secret));
    }

    std::string nextPlaceholderLocked(const std::string &secretTypeName)
    {
        size_t &counter = counters_[secretTypeName];
        std::string placeholder = secretTypeName + std::to_string(counter++);
        while (reservedPlaceholders_.count(placeholder) != 0) {
            placeholder = secretTypeName + std::to_string(counter++);
        }
        return placeholder;
    }

    std::vector<Secret> secrets_;
    std::unordered_map<std::string, size_t> byText_;
    std::unordered_map<std::string, size_t> counters_;
    std::unordered_set<std::string> reservedPlaceholders_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace redactor

#endif // REDACTOR_ENGINE_SECRET_REGISTRY_HPP
