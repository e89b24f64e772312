#ifndef REDACTOR_ENGINE_VALIDATOR_GATEWAY_HPP
#define REDACTOR_ENGINE_VALIDATOR_GATEWAY_HPP

#include <string>
#include <unordered_map>
#include <mutex>
#include "../catalog/secret_type.hpp"
#include "../util/logger.hpp"
#include "config/run_config.hpp"
#include "validator.hpp"

/**
 * @file validator_gateway.hpp
 * @brief Single entry point for confirming pattern-derived candidates.
 *
 * DESIGN:
 *   - No validator on the secret type: every candidate is confirmed.
 *   - Otherwise the validator runs at most once per (secret type, text) for the
 *     lifetime of the gateway; the cached answer serves every later occurrence,
 *     whichever rule produced it.
 *   - ValidatorInvocationError handling depends on the ValidatorFailurePolicy:
 *       Disable: warn, cache a rejection. A LaunchFailed error also disables the
 *                secret type, so no further process is spawned for it.
 *       Fatal:   rethrow.
 *
 * USAGE:
 *   @code
 *   ValidatorGateway gateway(config::ValidatorFailurePolicy::Disable);
 *   if (gateway.confirm(secretType, "10.0.0.1")) { ... }
 *   @endcode
 */

namespace redactor {
namespace engine {

class ValidatorGateway
{
public:
    explicit ValidatorGateway(config::ValidatorFailurePolicy policy = config::ValidatorFailurePolicy::Disable)
        : policy_(policy)
    {
    }

    /**
     * @brief Decide whether text, found by one of secretType's rules, is a secret.
     * @throw ValidatorInvocationError under the Fatal policy.
     */
    bool confirm(const catalog::SecretType &secretType, const std::string &text)
    {
        if (!secretType.validator) {
            return true;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        TypeState &state = states_[secretType.name];

        auto cached = state.decisions.find(text);
        if (cached != state.decisions.end()) {
            return cached->second;
        }
        if (state.disabled) {
            state.decisions.emplace(text, false);
            return false;
        }

        bool confirmed = false;
        try {
            ++state.invocations;
            confirmed = secretType.validator->validate(text);
        }
        catch (const ValidatorInvocationError &ex) {
            if (policy_ == config::ValidatorFailurePolicy::Fatal) {
                throw;
            }
            util::logger::warn("ValidatorGateway: secret type '" + secretType.name + "': " + ex.what());
            if (ex.kind() == ValidatorInvocationError::Kind::LaunchFailed) {
                state.disabled = true;
                util::logger::warn("ValidatorGateway: validator " + secretType.validator->describe() +
                                   " disabled, remaining '" + secretType.name +
                                   "' candidates are treated as unconfirmed");
            }
            confirmed = false;
        }

        state.decisions.emplace(text, confirmed);
        util::logger::debug("ValidatorGateway: " + secretType.name + " candidate " +
                            (confirmed ? "confirmed" : "rejected"));
        return confirmed;
    }

    /// Number of times the validator of that secret type was actually called.
    size_t invocationCount(const std::string &secretTypeName) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(secretTypeName);
        return it == states_.end() ? 0 : it->second.invocations;
    }

    bool isDisabled(const std::string &secretTypeName) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(secretTypeName);
        return it != states_.end() && it->second.disabled;
    }

private:
    struct TypeState
    {
        std::unordered_map<std::string, bool> decisions;
        size_t invocations = 0;
        bool disabled = false;
    };

    config::ValidatorFailurePolicy policy_;
    std::unordered_map<std::string, TypeState> states_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace redactor

#endif // REDACTOR_ENGINE_VALIDATOR_GATEWAY_HPP
