#ifndef PIIANON_ANONYMIZERS_ANONYMIZER_HPP
#define PIIANON_ANONYMIZERS_ANONYMIZER_HPP

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "anonymizers/anonymization_policy.hpp"
#include "anonymizers/fake_data_generator.hpp"
#include "anonymizers/masker.hpp"
#include "anonymizers/replacement_cache.hpp"
#include "core/span.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

/**
 * @file anonymizer.hpp
 * @brief Applies the configured strategy to resolved spans and rewrites text.
 *
 * DESIGN GOALS:
 *   - anonymize() maps one span to its replacement;
 *   - anonymizeBatch() splices replacements in descending start order, so
 *     earlier offsets stay valid while later text changes length;
 *   - replace and hash results go through the ReplacementCache, so one
 *     value gets one replacement for as long as the cache lives.
 *
 * USAGE:
 *   @code
 *   piianon::anonymizers::Anonymizer anonymizer(policy);
 *   piianon::anonymizers::ReplacementCache cache;
 *   std::string out = anonymizer.anonymizeBatch(resolvedSpans, text, cache);
 *   @endcode
 */

namespace piianon {
namespace anonymizers {

class Anonymizer
{
public:
    explicit Anonymizer(const AnonymizationPolicy &policy)
        : policy_(policy),
          masker_(policy)
    {
        if (policy_.strategy == Strategy::Replace) {
            generator_ = FakeDataGenerator::create(policy_.replaceLocale, policy_.hasReplaceSeed, policy_.replaceSeed);
            if (!generator_) {
                util::logger::warn("Anonymizer: no fake data for locale '" + policy_.replaceLocale +
                                   "', replacements fall back to [CATEGORY_FAKE]");
            }
        }
    }

    Strategy strategy() const { return policy_.strategy; }
    const AnonymizationPolicy& policy() const { return policy_; }

    std::string anonymize(const core::Span &span, ReplacementCache &cache)
    {
        switch (policy_.strategy) {
            case Strategy::Redact:
                return redact(span);
            case Strategy::Mask:
                return masker_.mask(span.category(), span.value());
            case Strategy::Replace:
                return replace(span, cache);
            case Strategy::Hash:
                return cache.getOrCreate(span.category(), span.value(), [this, &span]() { return hash(span); });
        }
        return redact(span);
    }

    /**
     * @brief Rewrite @p text with every span replaced.
     * @throw std::invalid_argument if a span lies outside @p text or two spans overlap.
     */
    std::string anonymizeBatch(const std::vector<core::Span> &spans, const std::string &text,
                               ReplacementCache &cache)
    {
        std::vector<const core::Span*> ordered;
        ordered.reserve(spans.size());
        for (const auto &s : spans) {
            if (s.end() > text.size()) {
                throw std::invalid_argument("Anonymizer: span [" + std::to_string(s.start()) + ", " +
                                            std::to_string(s.end()) + ") outside text of length " +
                                            std::to_string(text.size()));
            }
            ordered.push_back(&s);
        }
        std::sort(ordered.begin(), ordered.end(), [](const core::Span *a, const core::Span *b) {
            return a->start() > b->start();
        });
        for (size_t i = 1; i < ordered.size(); ++i) {
            if (ordered[i]->overlaps(*ordered[i - 1])) {
                throw std::invalid_argument("Anonymizer: overlapping spans at " +
                                            std::to_string(ordered[i]->start()) + " and " +
                                            std::to_string(ordered[i - 1]->start()));
            }
        }

        std::string out = text;
        for (const core::Span *s : ordered) {
            out.replace(s->start(), s->length(), anonymize(*s, cache));
        }
        return out;
    }

private:
    std::string redact(const core::Span &span) const
    {
        if (policy_.redactTypeSpecific) {
            return "[" + span.category() + "_REDACTED]";
        }
        return policy_.redactToken;
    }

    std::string replace(const core::Span &span, ReplacementCache &cache)
    {
        if (!generator_) {
            return "[" + span.category() + "_FAKE]";
        }
        return cache.getOrCreate(span.category(), span.value(), [this, &span]() {
            return generator_->generate(span.category(), span.value(), policy_.preserveFormat);
        });
    }

    std::string hash(const core::Span &span) const
    {
        std::string digest = util::hashing::hexDigest(policy_.hashSalt + span.value(), policy_.hashAlgorithm);
        if (policy_.hashTruncateLength > 0 && digest.size() > policy_.hashTruncateLength) {
            digest.resize(policy_.hashTruncateLength);
        }
        if (policy_.hashPrefix) {
            return span.category() + "_" + digest;
        }
        return digest;
    }

    AnonymizationPolicy policy_;
    Masker masker_;
    std::unique_ptr<FakeDataGenerator> generator_;
};

} // namespace anonymizers
} // namespace piianon

#endif // PIIANON_ANONYMIZERS_ANONYMIZER_HPP
