#ifndef REDACTOR_ENGINE_CANDIDATE_SCANNER_HPP
#define REDACTOR_ENGINE_CANDIDATE_SCANNER_HPP

#include <string>
#include <vector>
#include <regex>
#include <cstddef>
#include <utility>
#include "../catalog/secret_type.hpp"
#include "../util/logger.hpp"

/**
 * @file candidate_scanner.hpp
 * @brief Applies the pattern rules of the catalog to a document and lists every
 *        potential secret, without judging any of them.
 *
 * DESIGN:
 *   - Secret types are scanned in catalog order, rules in declaration order,
 *     matches left to right (non-overlapping per rule).
 *   - Matching is done one line at a time, so no match spans a newline.
 *     Lines longer than maxLineLength are skipped with a warning: std::regex
 *     recurses once per matched character and would exhaust the stack on a
 *     very long line. Secrets identified elsewhere are still replaced there.
 *   - Duplicates and overlaps across rules are kept; the registry resolves them.
 *   - Empty candidates (a rule whose group matched nothing) are dropped, since
 *     an empty text cannot be substituted.
 *   - Stateless and pure: safe to call from several threads at once.
 */

namespace redactor {
namespace engine {

/**
 * @struct Candidate
 * @brief A substring extracted by a pattern rule, not yet confirmed.
 */
struct Candidate
{
    std::string text;
    const catalog::SecretType *secretType; ///< owned by the catalog
    const catalog::PatternRule *rule;      ///< owned by secretType
    size_t position;                       ///< offset of the candidate in the document
};

/// Longest line handed to std::regex by default; 0 disables the limit.
constexpr size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/**
 * @struct LineRange
 * @brief [begin, end) of one line of a document, newline excluded.
 */
struct LineRange
{
    size_t begin;
    size_t end;
};

/**
 * @brief The lines of document that may be scanned, in order. Each line longer
 *        than maxLineLength is left out and reported once.
 */
inline std::vector<LineRange> scannableLines(const std::string &document, size_t maxLineLength)
{
    std::vector<LineRange> lines;
    size_t lineNumber = 0;
    size_t begin = 0;
    while (begin < document.size()) {
        ++lineNumber;
        size_t newline = document.find('\n', begin);
        size_t end = newline == std::string::npos ? document.size() : newline;
        if (maxLineLength == 0 || end - begin <= maxLineLength) {
            lines.push_back({begin, end});
        }
        else {
            util::logger::warn("CandidateScanner: line " + std::to_string(lineNumber) + " is " +
                               std::to_string(end - begin) + " bytes long (limit " +
                               std::to_string(maxLineLength) + "), not scanned");
        }
        if (newline == std::string::npos) {
            break;
        }
        begin = newline + 1;
    }
    return lines;
}

inline void scanLines(const catalog::SecretType &secretType,
                      const std::string &document,
                      const std::vector<LineRange> &lines,
                      std::vector<Candidate> &candidates)
{
    for (const auto &rule : secretType.patterns) {
        size_t group = rule.hasCaptureGroup() ? 1 : 0;
        for (const auto &line : lines) {
            auto first = document.begin() + static_cast<std::ptrdiff_t>(line.begin);
            auto last = document.begin() + static_cast<std::ptrdiff_t>(line.end);
            auto end = std::sregex_iterator();
            for (auto it = std::sregex_iterator(first, last, rule.regex()); it != end; ++it) {
                const std::smatch &match = *it;
                std::string text = rule.extract(match);
                if (text.empty()) {
                    continue;
                }
                candidates.push_back({std::move(text), &secretType, &rule,
                                      line.begin + static_cast<size_t>(match.position(group))});
            }
        }
    }
}

/**
 * @brief Candidates produced by one secret type.
 */
inline std::vector<Candidate> scanSecretType(const catalog::SecretType &secretType,
                                             const std::string &document,
                                             size_t maxLineLength = DEFAULT_MAX_LINE_LENGTH)
{
    std::vector<Candidate> candidates;
    scanLines(secretType, document, scannableLines(document, maxLineLength), candidates);
    return candidates;
}

/**
 * @brief Candidates for the whole catalog, in catalog/rule/position order.
 */
inline std::vector<Candidate> scanDocument(const catalog::Catalog &catalog,
                                           const std::string &document,
                                           size_t maxLineLength = DEFAULT_MAX_LINE_LENGTH)
{
    std::vector<Candidate> candidates;
    std::vector<LineRange> lines = scannableLines(document, maxLineLength);
    for (const auto &secretType : catalog) {
        scanLines(secretType, document, lines, candidates);
    }
    return candidates;
}

} // namespace engine
} // namespace redactor

#endif // REDACTOR_ENGINE_CANDIDATE_SCANNER_HPP
