#ifndef REDACTOR_CATALOG_SECRET_TYPE_HPP
#define REDACTOR_CATALOG_SECRET_TYPE_HPP

#include <string>
#include <vector>
#include <regex>
#include <memory>
#include <stdexcept>
#include "../engine/validator.hpp"

/**
 * @file secret_type.hpp
 * @brief The data model of the secret-type catalog: pattern rules, predefined
 *        substitutions and the optional validator of each secret type.
 *
 * A catalog is resolved once (see catalog_loader.hpp) and is read-only for the
 * rest of the run.
 */

namespace redactor {
namespace catalog {

/**
 * @class ConfigurationError
 * @brief Raised while building the catalog. Always fatal, before any document is touched.
 */
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @class PatternRule
 * @brief A compiled regular expression with zero or one capturing group.
 *
 * With a group, the candidate is the group's text; without one, the candidate
 * is the whole match. Expressions use ECMAScript syntax with `multiline`, so
 * `^` and `$` anchor at line boundaries of the document.
 */
class PatternRule
{
public:
    /**
     * @throw ConfigurationError if the expression is invalid or declares more
     *        than one capturing group.
     */
    explicit PatternRule(const std::string &source)
        : source_(source)
    {
        try {
            regex_ = std::regex(source_, std::regex::ECMAScript | std::regex::multiline);
        }
        catch (const std::regex_error &ex) {
            throw ConfigurationError("PatternRule: invalid regular expression \"" + source_ +
                                     "\": " + ex.what());
        }
        if (regex_.mark_count() > 1) {
            throw ConfigurationError("PatternRule: regular expression \"" + source_ +
                                     "\" is invalid, it should have at most 1 capturing group");
        }
    }

    const std::string &source() const { return source_; }
    const std::regex &regex() const { return regex_; }
    bool hasCaptureGroup() const { return regex_.mark_count() == 1; }

    /**
     * @brief The candidate text carried by one match of this rule.
     *        An unmatched optional group yields an empty string.
     */
    std::string extract(const std::smatch &match) const
    {
        return hasCaptureGroup() ? match.str(1) : match.str(0);
    }

private:
    std::string source_;
    std::regex regex_;
};

/**
 * @struct Substitution
 * @brief A predefined secret -> placeholder pair. Several secrets may share a placeholder.
 */
struct Substitution
{
    std::string secret;
    std::string placeholder;
};

/**
 * @struct SecretType
 * @brief A named category of secrets. The name doubles as placeholder prefix.
 */
struct SecretType
{
    std::string name;
    std::vector<PatternRule> patterns;
    std::vector<Substitution> substitutions;

    /// Null when pattern matches are accepted without confirmation.
    std::shared_ptr<engine::Validator> validator;
};

/// Ordered, resolved list of secret types; declaration order drives scan order.
using Catalog = std::vector<SecretType>;

} // namespace catalog
} // namespace redactor

#endif // REDACTOR_CATALOG_SECRET_TYPE_HPP
