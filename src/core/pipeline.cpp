#include "core/pipeline.hpp"

#include <exception>

#include "detection/presidio_http_oracle.hpp"
#include "detection/span_reconciler.hpp"
#include "llm/llm_client.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

namespace piianon {
namespace core {

namespace {

recognizers::ContextSettings contextFromConfig(const config::DetectionConfig &cfg)
{
    recognizers::ContextSettings ctx;
    ctx.boost = cfg.contextBoost;
    ctx.minScoreWithContext = cfg.contextMinScore;
    ctx.window = cfg.contextWindow;
    return ctx;
}

// LLM findings carry their own labels and a fixed score, so the allow-list
// and the threshold do not apply to them.
detection::FilterSettings secondPassSettings(const config::PipelineConfig &cfg)
{
    detection::FilterSettings s = detection::FilterSettings::fromConfig(cfg);
    s.allowedCategories.clear();
    s.confidenceThreshold = 0.0;
    return s;
}

// Re-anchor spans found on the normalized text onto the original text.
std::vector<Span> reanchor(const std::vector<Span> &spans, const std::string &original)
{
    std::vector<Span> out;
    out.reserve(spans.size());
    for (const auto &s : spans) {
        out.push_back(spanOver(original, s.category(), s.start(), s.end(), s.confidence(), s.source()));
    }
    return out;
}

} // namespace

std::shared_ptr<detection::NerOracle> createNerOracle(const config::PipelineConfig &cfg)
{
    const std::string endpoint = util::expandEnv(cfg.detection.nerEndpoint);
    if (util::trimmed(endpoint).empty()) {
        return nullptr;
    }
    util::logger::info("Pipeline: NER oracle at " + endpoint);
    return std::make_shared<detection::PresidioHttpOracle>(endpoint, static_cast<long>(cfg.detection.nerTimeoutSeconds));
}

std::shared_ptr<llm::ChatBackend> createChatBackend(const config::PipelineConfig &cfg)
{
    if (!cfg.llm.enabled) {
        return nullptr;
    }
    const std::string baseUrl = util::expandEnv(cfg.llm.baseUrl);
    if (util::trimmed(baseUrl).empty()) {
        util::logger::warn("Pipeline: llm_detection.enabled is set but no base_url is configured");
        return nullptr;
    }
    util::logger::info("Pipeline: LLM second pass with model " + cfg.llm.model);
    return std::make_shared<llm::LlmClient>(cfg.llm);
}

Pipeline::Pipeline(const config::PipelineConfig &cfg,
                   std::shared_ptr<detection::NerOracle> nerOracle,
                   std::shared_ptr<llm::ChatBackend> chat,
                   std::shared_ptr<anonymizers::ReplacementCache> sharedCache)
    : config_(cfg),
      normalizer_(),
      rules_(recognizers::builtinRuleTable(), contextFromConfig(cfg.detection), cfg.detection.entities),
      filter_(detection::FilterSettings::fromConfig(cfg)),
      secondPassFilter_(secondPassSettings(cfg)),
      anonymizer_(anonymizers::AnonymizationPolicy::fromConfig(cfg.anonymization)),
      cache_(sharedCache ? std::move(sharedCache) : std::make_shared<anonymizers::ReplacementCache>())
{
    if (nerOracle) {
        ner_ = std::make_unique<detection::NerDetector>(std::move(nerOracle), cfg.detection.language,
                                                        cfg.detection.confidenceThreshold);
    }
    if (chat) {
        llmDetector_ = std::make_unique<llm::LlmDetector>(std::move(chat), cfg.llm.systemPrompt,
                                                          filter_.settings().lexicon);
    }
}

PipelineResult Pipeline::process(const std::string &text)
{
    PipelineResult result = runFirstPass(text);
    if (result.finalState != PipelineState::Anonymizing) {
        return result;
    }
    if (!llmDetector_) {
        finish(result);
        return result;
    }

    std::vector<Span> llmSpans;
    try {
        llmSpans = llmDetector_->detect(result.anonymizedText);
    }
    catch (const std::exception &ex) {
        util::logger::error(std::string("Pipeline: LLM pass failed: ") + ex.what());
        result.warnings.push_back(std::string("LLM pass failed: ") + ex.what());
    }
    runSecondPass(result, llmSpans);
    return result;
}

PipelineResult Pipeline::runFirstPass(const std::string &text)
{
    PipelineResult result;
    PipelineStateMachine machine;

    try {
        machine.advance(PipelineState::Normalizing);
        const std::string normalized = config_.detection.normalizeCaps ? normalizer_.normalize(text) : text;

        machine.advance(PipelineState::Detecting);
        std::vector<Span> raw = detectAll(text, normalized, result);
        if (!result.errors.empty()) {
            failRun(result, machine, result.errors.back());
            return result;
        }

        machine.advance(PipelineState::Filtering);
        std::vector<Span> filtered = filter_.apply(raw, text);

        machine.advance(PipelineState::Reconciling);
        result.spans = detection::SpanReconciler::reconcile(filtered);
        result.piiFound = result.spans.size();

        machine.advance(PipelineState::Anonymizing);
        result.anonymizedText = anonymizer_.anonymizeBatch(result.spans, text, *cache_);
        result.piiAnonymized = result.spans.size();
        recordAudit(result, result.spans, 1);

        util::logger::debug("Pipeline: " + std::to_string(raw.size()) + " raw, " +
                            std::to_string(filtered.size()) + " filtered, " +
                            std::to_string(result.spans.size()) + " resolved");
    }
    catch (const std::exception &ex) {
        failRun(result, machine, ex.what());
        return result;
    }

    result.finalState = machine.state();
    return result;
}

void Pipeline::runSecondPass(PipelineResult &result, const std::vector<Span> &llmSpans)
{
    PipelineStateMachine machine(result.finalState);
    try {
        machine.advance(PipelineState::SecondPassDetecting);
        std::vector<Span> filtered = secondPassFilter_.apply(llmSpans, result.anonymizedText);
        std::vector<Span> resolved = detection::SpanReconciler::reconcile(filtered);

        machine.advance(PipelineState::SecondPassAnonymizing);
        if (!resolved.empty()) {
            result.anonymizedText = anonymizer_.anonymizeBatch(resolved, result.anonymizedText, *cache_);
            util::logger::debug("Pipeline: LLM pass anonymized " + std::to_string(resolved.size()) + " more");
        }
        result.llmPiiFound = resolved.size();
        result.piiAnonymized += resolved.size();
        recordAudit(result, resolved, 2);
        result.llmSpans.insert(result.llmSpans.end(), resolved.begin(), resolved.end());

        machine.advance(PipelineState::Done);
    }
    catch (const std::exception &ex) {
        failRun(result, machine, ex.what());
        return;
    }
    result.finalState = machine.state();
}

void Pipeline::finish(PipelineResult &result)
{
    PipelineStateMachine machine(result.finalState);
    machine.advance(PipelineState::Done);
    result.finalState = machine.state();
}

std::vector<Span> Pipeline::detectAll(const std::string &original, const std::string &normalized,
                                      PipelineResult &result)
{
    std::vector<Span> raw = reanchor(rules_.detect(normalized), original);

    if (ner_) {
        try {
            auto nerSpans = reanchor(ner_->detect(normalized), original);
            raw.insert(raw.end(), nerSpans.begin(), nerSpans.end());
        }
        catch (const detection::OracleError &ex) {
            if (config_.detection.requireNer) {
                util::logger::error(std::string("Pipeline: NER oracle failed: ") + ex.what());
                result.errors.push_back(std::string("NER oracle failed: ") + ex.what());
            } else {
                util::logger::warn(std::string("Pipeline: NER oracle failed, continuing with rules only: ") +
                                   ex.what());
                result.warnings.push_back(std::string("NER oracle failed: ") + ex.what());
            }
        }
    }
    return raw;
}

void Pipeline::recordAudit(PipelineResult &result, const std::vector<Span> &spans, int pass) const
{
    const std::string strategy = anonymizers::strategyName(anonymizer_.strategy());
    for (const auto &s : spans) {
        AuditEntry e;
        e.category = s.category();
        e.position = s.start();
        e.strategy = strategy;
        e.timestamp = isoUtcNow();
        e.pass = pass;
        result.auditEntries.push_back(e);
    }
}

void Pipeline::failRun(PipelineResult &result, PipelineStateMachine &machine, const std::string &message) const
{
    util::logger::error("Pipeline: run failed in state " + std::string(stateName(machine.state())) + ": " + message);
    if (result.errors.empty() || result.errors.back() != message) {
        result.errors.push_back(message);
    }
    if (!isTerminal(machine.state())) {
        machine.fail();
    }
    result.finalState = machine.state();
    result.anonymizedText.clear();
}

} // namespace core
} // namespace piianon
