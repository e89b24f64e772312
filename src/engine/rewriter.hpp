#ifndef REDACTOR_ENGINE_REWRITER_HPP
#define REDACTOR_ENGINE_REWRITER_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <algorithm>
#include "secret_registry.hpp"

/**
 * @file rewriter.hpp
 * @brief Replaces every occurrence of every registered secret in a document.
 *
 * Secrets are tried longest first (ties broken by byte order). Each one claims
 * the spans where it occurs in the original text, skipping any occurrence that
 * intersects a span already claimed by a longer secret. The output is then
 * assembled from the claimed spans in document order, so a placeholder is
 * never re-examined and a shorter secret can never split a longer one, even
 * when the two only partly overlap.
 *
 * Build a Rewriter only after registration for the whole batch is complete.
 */

namespace redactor {
namespace engine {

class Rewriter
{
public:
    explicit Rewriter(const std::vector<Secret> &secrets)
    {
        entries_.reserve(secrets.size());
        for (const auto &secret : secrets) {
            if (!secret.text.empty()) {
                entries_.push_back({secret.text, secret.placeholder});
            }
        }
        std::sort(entries_.begin(), entries_.end(), [](const Entry &a, const Entry &b) {
            if (a.text.size() != b.text.size()) {
                return a.text.size() > b.text.size();
            }
            return a.text < b.text;
        });
    }

    explicit Rewriter(const SecretRegistry &registry)
        : Rewriter(registry.secrets())
    {
    }

    std::string rewrite(const std::string &document) const
    {
        std::vector<bool> claimed(document.size(), false);
        std::vector<Span> spans;

        for (size_t index = 0; index < entries_.size(); ++index) {
            const std::string &text = entries_[index].text;
            size_t pos = document.find(text);
            while (pos != std::string::npos) {
                size_t stop = pos + text.size();
                auto first = claimed.begin() + static_cast<std::ptrdiff_t>(pos);
                auto last = claimed.begin() + static_cast<std::ptrdiff_t>(stop);
                if (std::find(first, last, true) == last) {
                    std::fill(first, last, true);
                    spans.push_back({pos, text.size(), index});
                    pos = document.find(text, stop);
                }
                else {
                    pos = document.find(text, pos + 1);
                }
            }
        }

        std::sort(spans.begin(), spans.end(), [](const Span &a, const Span &b) {
            return a.start < b.start;
        });

        std::string out;
        out.reserve(document.size());
        size_t pos = 0;
        for (const auto &span : spans) {
            out.append(document, pos, span.start - pos);
            out += entries_[span.entry].placeholder;
            pos = span.start + span.length;
        }
        out.append(document, pos, std::string::npos);
        return out;
    }

private:
    struct Entry
    {
        std::string text;
        std::string placeholder;
    };

    struct Span
    {
        size_t start;
        size_t length;
        size_t entry;   ///< index into entries_
    };

    std::vector<Entry> entries_;   ///< longest first
};

} // namespace engine
} // namespace redactor

#endif // REDACTOR_ENGINE_REWRITER_HPP
