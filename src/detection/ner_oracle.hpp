#ifndef PIIANON_DETECTION_NER_ORACLE_HPP
#define PIIANON_DETECTION_NER_ORACLE_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/span.hpp"
#include "detection/span_detector.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file ner_oracle.hpp
 * @brief Contract for an external named-entity recognizer and the detector
 *        that adapts it to the pipeline.
 */

namespace piianon {
namespace detection {

struct OracleSpan
{
    size_t start;
    size_t end;
    std::string label;
    double score;
};

/**
 * @class NerOracle
 * @brief Opaque NER engine. Offsets are byte offsets into the text passed in.
 */
class NerOracle
{
public:
    virtual ~NerOracle() = default;

    /**
     * @throw OracleError when the engine is unavailable or answers garbage.
     */
    virtual std::vector<OracleSpan> analyze(const std::string &text, const std::string &language,
                                            double scoreThreshold) = 0;
};

/**
 * @brief Map engine-specific labels onto the categories used everywhere else.
 */
inline std::string canonicalLabel(const std::string &label)
{
    static const std::unordered_map<std::string, std::string> aliases = {
        {"EMAIL_ADDRESS", "EMAIL"},
        {"PHONE_NUMBER", "PHONE"},
        {"US_SSN", "SSN"},
        {"IP", "IP_ADDRESS"},
        {"ORG", "ORGANIZATION"},
        {"GPE", "LOCATION"},
        {"LOC", "LOCATION"},
        {"PER", "PERSON"},
        {"NAME", "PERSON"},
    };
    std::string upper = util::toUpper(label);
    auto it = aliases.find(upper);
    return it == aliases.end() ? upper : it->second;
}

/**
 * @class NerDetector
 * @brief SpanDetector over a NerOracle. Drops out-of-range and below-threshold
 *        results; oracle failures propagate as OracleError.
 */
class NerDetector : public SpanDetector
{
public:
    NerDetector(std::shared_ptr<NerOracle> oracle, std::string language, double scoreThreshold)
        : oracle_(std::move(oracle)),
          language_(std::move(language)),
          threshold_(scoreThreshold)
    {
    }

    std::string name() const override { return "ner"; }

    std::vector<core::Span> detect(const std::string &text) override
    {
        std::vector<core::Span> spans;
        if (!oracle_ || text.empty()) {
            return spans;
        }

        for (const auto &r : oracle_->analyze(text, language_, threshold_)) {
            if (r.end > text.size() || r.start >= r.end) {
                util::logger::warn("NerDetector: discarding out-of-range result [" + std::to_string(r.start) +
                                   ", " + std::to_string(r.end) + ")");
                continue;
            }
            if (!(r.score >= threshold_) || r.score > 1.0) {
                continue;
            }
            spans.push_back(core::spanOver(text, canonicalLabel(r.label), r.start, r.end, r.score,
                                           core::SpanSource::NerOracle));
        }
        return spans;
    }

private:
    std::shared_ptr<NerOracle> oracle_;
    std::string language_;
    double threshold_;
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_NER_ORACLE_HPP
