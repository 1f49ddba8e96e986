#ifndef PIIANON_CORE_PIPELINE_HPP
#define PIIANON_CORE_PIPELINE_HPP

#include <memory>
#include <string>
#include <vector>

#include "anonymizers/anonymizer.hpp"
#include "anonymizers/replacement_cache.hpp"
#include "config/pipeline_config.hpp"
#include "core/audit_log.hpp"
#include "core/pipeline_state.hpp"
#include "core/span.hpp"
#include "detection/entity_normalizer.hpp"
#include "detection/false_positive_filter.hpp"
#include "detection/ner_oracle.hpp"
#include "llm/chat_backend.hpp"
#include "llm/llm_detector.hpp"
#include "recognizers/pattern_recognizer_set.hpp"

/**
 * @file pipeline.hpp
 * @brief Detect -> filter -> reconcile -> anonymize for one text.
 *
 * DESIGN GOALS:
 *   - Normalize once; every detector runs on the normalized text and every
 *     span takes its value from the original text at the same offsets.
 *   - NER oracle failures are warnings, unless detection.require_ner is set,
 *     in which case the run fails and its output is discarded.
 *   - The optional LLM pass treats the anonymized text as new input and
 *     appends its spans and audit entries.
 *   - A Pipeline is not thread-safe; parallel callers build one each. Only
 *     the replacement cache may be shared between them.
 *
 * USAGE:
 *   @code
 *   piianon::core::Pipeline pipeline(cfg, piianon::core::createNerOracle(cfg));
 *   auto result = pipeline.process("Contact John Doe at john.doe@company.com");
 *   if (result.success()) {
 *       std::cout << result.anonymizedText;
 *   }
 *   @endcode
 */

namespace piianon {
namespace core {

struct PipelineResult
{
    std::string anonymizedText;

    /// Resolved spans of the main pass, offsets into the input text.
    std::vector<Span> spans;
    /// Resolved spans of the LLM pass, offsets into the main-pass output.
    std::vector<Span> llmSpans;

    size_t piiFound = 0;
    size_t llmPiiFound = 0;
    size_t piiAnonymized = 0;

    std::vector<AuditEntry> auditEntries;
    PipelineState finalState = PipelineState::Idle;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool success() const { return finalState == PipelineState::Done; }
};

/**
 * @brief Presidio-compatible oracle for ner.endpoint, or nullptr when no endpoint is set.
 */
std::shared_ptr<detection::NerOracle> createNerOracle(const config::PipelineConfig &cfg);

/**
 * @brief Chat client for llm_detection, or nullptr when the LLM pass is disabled.
 */
std::shared_ptr<llm::ChatBackend> createChatBackend(const config::PipelineConfig &cfg);

class Pipeline
{
public:
    /**
     * @param nerOracle Optional NER engine.
     * @param chat Optional chat backend; enables the LLM second pass.
     * @param sharedCache Cache shared with other pipelines; a private one is made when null.
     */
    explicit Pipeline(const config::PipelineConfig &cfg,
                      std::shared_ptr<detection::NerOracle> nerOracle = nullptr,
                      std::shared_ptr<llm::ChatBackend> chat = nullptr,
                      std::shared_ptr<anonymizers::ReplacementCache> sharedCache = nullptr);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Full run, including the LLM pass when a chat backend was given.
     *        Never throws; failures are reported through the result.
     */
    PipelineResult process(const std::string &text);

    /**
     * @brief Main pass only. On success the result is left in state Anonymizing,
     *        ready for runSecondPass() or finish().
     */
    PipelineResult runFirstPass(const std::string &text);

    /**
     * @brief Filter, reconcile and apply LLM spans found on result.anonymizedText.
     */
    void runSecondPass(PipelineResult &result, const std::vector<Span> &llmSpans);

    /// Close a main-pass-only result.
    void finish(PipelineResult &result);

    bool hasSecondPass() const { return static_cast<bool>(llmDetector_); }

    /// Null when the LLM pass is disabled.
    llm::LlmDetector* llmDetector() { return llmDetector_.get(); }

    const anonymizers::Anonymizer& anonymizer() const { return anonymizer_; }
    anonymizers::ReplacementCache& cache() { return *cache_; }

private:
    std::vector<Span> detectAll(const std::string &original, const std::string &normalized,
                                PipelineResult &result);

    void recordAudit(PipelineResult &result, const std::vector<Span> &spans, int pass) const;

    void failRun(PipelineResult &result, PipelineStateMachine &machine, const std::string &message) const;

    config::PipelineConfig config_;
    detection::EntityNormalizer normalizer_;
    recognizers::PatternRecognizerSet rules_;
    std::unique_ptr<detection::NerDetector> ner_;
    detection::FalsePositiveFilter filter_;
    detection::FalsePositiveFilter secondPassFilter_;
    anonymizers::Anonymizer anonymizer_;
    std::shared_ptr<anonymizers::ReplacementCache> cache_;
    std::unique_ptr<llm::LlmDetector> llmDetector_;
};

} // namespace core
} // namespace piianon

#endif // PIIANON_CORE_PIPELINE_HPP
