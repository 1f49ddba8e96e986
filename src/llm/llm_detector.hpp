#ifndef PIIANON_LLM_LLM_DETECTOR_HPP
#define PIIANON_LLM_LLM_DETECTOR_HPP

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/span.hpp"
#include "detection/false_positive_filter.hpp"
#include "detection/span_detector.hpp"
#include "llm/chat_backend.hpp"
#include "llm/llm_client.hpp"
#include "llm/llm_response_parser.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file llm_detector.hpp
 * @brief Second-pass detection through a chat model.
 *
 * DESIGN GOALS:
 *   - LlmDetector is an ordinary SpanDetector: one text in, located spans out,
 *     every span at a fixed confidence of 0.85;
 *   - LlmSecondPass fans a batch out over a ThreadPool sized to the
 *     concurrency limit and returns results in input order;
 *   - a request that still fails after the client's retries costs only that
 *     text's findings, never the batch.
 *
 * USAGE:
 *   @code
 *   auto backend = std::make_shared<piianon::llm::LlmClient>(cfg.llm);
 *   piianon::llm::LlmDetector detector(backend, cfg.llm.systemPrompt, lexicon);
 *   piianon::llm::LlmSecondPass pass(detector, cfg.llm.maxConcurrent);
 *   auto perText = pass.detectBatch(texts);
 *   @endcode
 */

namespace piianon {
namespace llm {

constexpr double kLlmConfidence = 0.85;

class LlmDetector : public detection::SpanDetector
{
public:
    /**
     * @param systemPrompt Empty selects defaultSystemPrompt().
     * @param lexicon Known non-PII words; name-like findings containing one are dropped.
     */
    LlmDetector(std::shared_ptr<ChatBackend> backend, const std::string &systemPrompt,
                std::unordered_set<std::string> lexicon = detection::builtinFalsePositiveWords())
        : backend_(std::move(backend)),
          systemPrompt_(systemPrompt.empty() ? defaultSystemPrompt() : systemPrompt),
          lexicon_(std::move(lexicon))
    {
    }

    std::string name() const override { return "llm"; }

    /**
     * @throw LlmError when the backend fails.
     */
    std::vector<core::Span> detect(const std::string &text) override
    {
        if (!backend_ || shouldSkip(text)) {
            return {};
        }
        return locate(backend_->complete(systemPrompt_, text), text);
    }

    /**
     * @brief Turn a raw reply into spans over @p text.
     */
    std::vector<core::Span> locate(const std::string &reply, const std::string &text) const
    {
        std::vector<core::Span> spans;
        for (const auto &item : parseItems(reply)) {
            const std::string category = normalizeType(item.type);

            if (detection::isLexiconCategory(category) && containsLexiconWord(item.value)) {
                util::logger::debug("LlmDetector: dropped known non-PII " + category + " finding");
                continue;
            }

            size_t start = 0;
            size_t end = 0;
            if (!findPosition(item.value, text, start, end)) {
                util::logger::debug("LlmDetector: " + category + " finding not present in text");
                continue;
            }
            spans.push_back(core::spanOver(text, category, start, end, kLlmConfidence,
                                           core::SpanSource::LlmOracle));
        }
        return spans;
    }

    const std::string& systemPrompt() const { return systemPrompt_; }

private:
    bool containsLexiconWord(const std::string &value) const
    {
        for (const auto &w : util::splitWords(util::toLower(value))) {
            if (lexicon_.count(w)) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<ChatBackend> backend_;
    std::string systemPrompt_;
    std::unordered_set<std::string> lexicon_;
};

class LlmSecondPass
{
public:
    LlmSecondPass(LlmDetector &detector, uint32_t maxConcurrent, bool showProgress = false)
        : detector_(detector),
          maxConcurrent_(std::max<uint32_t>(1, maxConcurrent)),
          showProgress_(showProgress)
    {
    }

    /**
     * @return One span list per input text, in input order. Empty, blank and
     *         fully redacted texts get an empty list without a request.
     */
    std::vector<std::vector<core::Span>> detectBatch(const std::vector<std::string> &texts)
    {
        std::vector<std::vector<core::Span>> results(texts.size());

        std::vector<size_t> pending;
        for (size_t i = 0; i < texts.size(); ++i) {
            if (!shouldSkip(texts[i])) {
                pending.push_back(i);
            }
        }
        if (pending.empty()) {
            return results;
        }

        const size_t poolSize = std::min<size_t>(maxConcurrent_, pending.size());
        if (showProgress_) {
            util::logger::info("LlmSecondPass: " + std::to_string(pending.size()) + " texts, " +
                               std::to_string(poolSize) + " concurrent");
        }

        std::vector<std::future<std::vector<core::Span>>> futures;
        futures.reserve(pending.size());
        {
            util::ThreadPool pool(poolSize);
            for (size_t idx : pending) {
                const std::string &text = texts[idx];
                futures.push_back(pool.enqueue([this, &text]() { return detector_.detect(text); }));
            }

            size_t done = 0;
            for (size_t k = 0; k < futures.size(); ++k) {
                const size_t idx = pending[k];
                try {
                    results[idx] = futures[k].get();
                }
                catch (const std::exception &ex) {
                    util::logger::error("LlmSecondPass: record " + std::to_string(idx) + " failed: " + ex.what());
                    results[idx].clear();
                }
                ++done;
                if (showProgress_ && (done % 100 == 0 || done == futures.size())) {
                    util::logger::info("LlmSecondPass: " + std::to_string(done) + "/" +
                                       std::to_string(futures.size()) + " done");
                }
            }
        }
        return results;
    }

private:
    LlmDetector &detector_;
    uint32_t maxConcurrent_;
    bool showProgress_;
};

} // namespace llm
} // namespace piianon

#endif // PIIANON_LLM_LLM_DETECTOR_HPP
