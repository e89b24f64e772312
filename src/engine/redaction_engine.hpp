#ifndef REDACTOR_ENGINE_REDACTION_ENGINE_HPP
#define REDACTOR_ENGINE_REDACTION_ENGINE_HPP

#include <string>
#include <vector>
#include <utility>
#include "../catalog/secret_type.hpp"
#include "../util/logger.hpp"
#include "../util/thread_pool.hpp"
#include "config/run_config.hpp"
#include "candidate_scanner.hpp"
#include "validator_gateway.hpp"
#include "secret_registry.hpp"
#include "rewriter.hpp"

/**
 * @file redaction_engine.hpp
 * @brief End-to-end redaction of one document or a batch of documents.
 *
 * One RedactionEngine is one run: it owns the catalog, the secret registry and
 * the validator cache, so every document passed to the same engine shares
 * placeholders and numbering.
 *
 * PIPELINE (per call):
 *   1. scan     - every pattern rule over every document (parallel for batches)
 *   2. register - candidates in document, then catalog/rule/position order;
 *                 validation happens here, on the calling thread only
 *   3. rewrite  - each document against the complete registry
 *
 * Step 2 finishes before step 3 starts, which is what lets an occurrence that
 * precedes its identifying match still be replaced.
 *
 * USAGE:
 *   @code
 *   RedactionEngine engine(std::move(catalog), runConfig);
 *   std::string clean = engine.redact(text);
 *   auto rows = engine.exportMapping();
 *   @endcode
 */

namespace redactor {
namespace engine {

class RedactionEngine
{
public:
    /**
     * @brief Take ownership of the catalog and register its predefined substitutions
     *        (catalog order, then declaration order).
     */
    RedactionEngine(catalog::Catalog secretCatalog, const config::RunConfig &runConfig = config::RunConfig())
        : catalog_(std::move(secretCatalog))
        , runConfig_(runConfig)
        , gateway_(runConfig.validatorFailurePolicy)
    {
        for (const auto &secretType : catalog_) {
            for (const auto &substitution : secretType.substitutions) {
                registry_.registerPredefined(secretType.name, substitution.secret, substitution.placeholder);
            }
        }
        util::logger::info("RedactionEngine: " + std::to_string(catalog_.size()) + " secret types, " +
                           std::to_string(registry_.size()) + " predefined secrets");
    }

    RedactionEngine(const RedactionEngine&) = delete;
    RedactionEngine& operator=(const RedactionEngine&) = delete;

    /**
     * @brief Redact a single document. Safe to call repeatedly; each call extends
     *        the same registry.
     * @throw ValidatorInvocationError under the Fatal validator policy.
     */
    std::string redact(const std::string &document)
    {
        registerCandidates(scanDocument(catalog_, document, maxLineLength()));
        Rewriter rewriter(registry_);
        return rewriter.rewrite(document);
    }

    /**
     * @brief Redact documents as one batch: a secret identified in any of them is
     *        replaced in all of them.
     * @return Redacted texts, result i belongs to documents[i].
     */
    std::vector<std::string> redactBatch(const std::vector<std::string> &documents)
    {
        std::vector<std::vector<Candidate>> perDocument;
        if (documents.size() > 1) {
            util::ThreadPool pool(static_cast<size_t>(runConfig_.scanThreads));
            const catalog::Catalog &scanCatalog = catalog_;
            size_t limit = maxLineLength();
            perDocument = pool.mapOrdered(documents, [&scanCatalog, limit](const std::string &document) {
                return scanDocument(scanCatalog, document, limit);
            });
        }
        else {
            for (const auto &document : documents) {
                perDocument.push_back(scanDocument(catalog_, document, maxLineLength()));
            }
        }

        for (const auto &candidates : perDocument) {
            registerCandidates(candidates);
        }

        Rewriter rewriter(registry_);
        std::vector<std::string> results;
        results.reserve(documents.size());
        for (const auto &document : documents) {
            results.push_back(rewriter.rewrite(document));
        }
        return results;
    }

    /// The run's mapping in registration order.
    std::vector<MappingEntry> exportMapping() const
    {
        return registry_.exportMapping();
    }

    const catalog::Catalog &secretCatalog() const { return catalog_; }
    const SecretRegistry &registry() const { return registry_; }
    const ValidatorGateway &gateway() const { return gateway_; }

private:
    size_t maxLineLength() const { return static_cast<size_t>(runConfig_.maxLineLength); }

    void registerCandidates(const std::vector<Candidate> &candidates)
    {
        size_t confirmed = 0;
        for (const auto &candidate : candidates) {
            if (registry_.registerCandidate(candidate, gateway_)) {
                ++confirmed;
            }
        }
        util::logger::debug("RedactionEngine: " + std::to_string(candidates.size()) + " candidates, " +
                            std::to_string(confirmed) + " resolved to placeholders");
    }

    catalog::Catalog catalog_;
    config::RunConfig runConfig_;
    ValidatorGateway gateway_;
    SecretRegistry registry_;
};

} // namespace engine
} // namespace redactor

#endif // REDACTOR_ENGINE_REDACTION_ENGINE_HPP
