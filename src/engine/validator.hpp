#ifndef REDACTOR_ENGINE_VALIDATOR_HPP
#define REDACTOR_ENGINE_VALIDATOR_HPP

#include <string>
#include <functional>
#include <stdexcept>
#include <utility>

/**
 * @file validator.hpp
 * @brief The narrow "is this candidate really a secret?" interface.
 *
 * A secret type may carry a Validator. The ValidatorGateway calls it once per
 * distinct candidate text and caches the answer. Two implementations exist:
 *   - ProcessValidator (process_validator.hpp): runs an external executable,
 *     exit status 0 means confirmed.
 *   - FunctionValidator (below): wraps an in-process callable.
 */

namespace redactor {
namespace engine {

/**
 * @class ValidatorInvocationError
 * @brief The validator could not give an answer at all (as opposed to answering "no").
 */
class ValidatorInvocationError : public std::runtime_error
{
public:
    enum class Kind {
        LaunchFailed, ///< missing or non-executable file, fork/exec failure
        Crashed       ///< terminated by a signal instead of exiting
    };

    ValidatorInvocationError(Kind kind, const std::string &what)
        : std::runtime_error(what)
        , kind_(kind)
    {
    }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/**
 * @class Validator
 * @brief Decides whether a pattern-derived candidate is a genuine secret.
 */
class Validator
{
public:
    virtual ~Validator() = default;

    /**
     * @brief Return true if candidate is confirmed as a secret.
     * @throw ValidatorInvocationError if no decision could be obtained.
     */
    virtual bool validate(const std::string &candidate) = 0;

    /// Human readable identity for log lines (e.g. the executable path).
    virtual std::string describe() const = 0;
};

/**
 * @class FunctionValidator
 * @brief Validator backed by a plain callable.
 */
class FunctionValidator : public Validator
{
public:
    using Predicate = std::function<bool(const std::string &)>;

    explicit FunctionValidator(Predicate predicate, std::string label = "function")
        : predicate_(std::move(predicate))
        , label_(std::move(label))
    {
    }

    bool validate(const std::string &candidate) override
    {
        return predicate_(candidate);
    }

    std::string describe() const override
    {
        return label_;
    }

private:
    Predicate predicate_;
    std::string label_;
};

} // namespace engine
} // namespace redactor

#endif // REDACTOR_ENGINE_VALIDATOR_HPP
