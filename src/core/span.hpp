#ifndef PIIANON_CORE_SPAN_HPP
#define PIIANON_CORE_SPAN_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @file span.hpp
 * @brief The detected-PII record every stage of the pipeline exchanges.
 *
 * A Span is a half-open byte range [start, end) of UTF-8 text, tagged with a
 * category, a confidence in [0, 1] and the detector kind that produced it.
 * Construction validates the range and confidence and throws
 * std::invalid_argument on violation: a bad span is a detector bug.
 * Spans are immutable; stages that change a category build a new Span.
 */

namespace piianon {
namespace core {

/**
 * @brief Which detector produced a span. Order doubles as the dedup tie-break.
 */
enum class SpanSource {
    Rule = 0,
    NerOracle,
    LlmOracle
};

inline const char* sourceName(SpanSource source)
{
    switch (source) {
        case SpanSource::Rule:      return "rule";
        case SpanSource::NerOracle: return "ner";
        case SpanSource::LlmOracle: return "llm";
    }
    return "rule";
}

class Span
{
public:
    /**
     * @throw std::invalid_argument if end <= start, or confidence is outside [0, 1]
     *        (NaN included), or category is empty.
     */
    Span(std::string category, std::string value, size_t start, size_t end,
         double confidence, SpanSource source)
        : category_(std::move(category)),
          value_(std::move(value)),
          start_(start),
          end_(end),
          confidence_(confidence),
          source_(source)
    {
        if (category_.empty()) {
            throw std::invalid_argument("Span: empty category");
        }
        if (start_ >= end_) {
            throw std::invalid_argument("Span: start (" + std::to_string(start_) +
                                        ") must be < end (" + std::to_string(end_) + ")");
        }
        if (!(confidence_ >= 0.0 && confidence_ <= 1.0)) {
            throw std::invalid_argument("Span: confidence " + std::to_string(confidence_) +
                                        " outside [0, 1]");
        }
    }

    const std::string& category() const { return category_; }
    const std::string& value() const { return value_; }
    size_t start() const { return start_; }
    size_t end() const { return end_; }
    double confidence() const { return confidence_; }
    SpanSource source() const { return source_; }

    size_t length() const { return end_ - start_; }

    bool overlaps(const Span &other) const
    {
        return !(end_ <= other.start_ || start_ >= other.end_);
    }

    /// Same position and value under another category.
    Span withCategory(const std::string &category) const
    {
        return Span(category, value_, start_, end_, confidence_, source_);
    }

    /// Same position with another confidence.
    Span withConfidence(double confidence) const
    {
        return Span(category_, value_, start_, end_, confidence, source_);
    }

private:
    std::string category_;
    std::string value_;
    size_t start_;
    size_t end_;
    double confidence_;
    SpanSource source_;
};

inline bool overlaps(const Span &a, const Span &b)
{
    return a.overlaps(b);
}

/**
 * @brief Build a span over @p text, taking the value from the text itself.
 * @throw std::invalid_argument if the range falls outside the text.
 */
inline Span spanOver(const std::string &text, const std::string &category, size_t start, size_t end,
                     double confidence, SpanSource source)
{
    if (end > text.size()) {
        throw std::invalid_argument("Span: end (" + std::to_string(end) +
                                    ") beyond text length " + std::to_string(text.size()));
    }
    if (start >= end) {
        throw std::invalid_argument("Span: start (" + std::to_string(start) +
                                    ") must be < end (" + std::to_string(end) + ")");
    }
    return Span(category, text.substr(start, end - start), start, end, confidence, source);
}

} // namespace core
} // namespace piianon

#endif // PIIANON_CORE_SPAN_HPP
