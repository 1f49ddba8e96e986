#ifndef PIIANON_RECOGNIZERS_PATTERN_RECOGNIZER_SET_HPP
#define PIIANON_RECOGNIZERS_PATTERN_RECOGNIZER_SET_HPP

#include <algorithm>
#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/span.hpp"
#include "detection/span_detector.hpp"
#include "recognizers/recognizer_rule.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file pattern_recognizer_set.hpp
 * @brief Runs every compiled rule over a text and emits scored spans.
 *
 * DESIGN GOALS:
 *   - Each rule pattern reports all of its non-overlapping matches; different
 *     patterns and rules may overlap freely (the reconciler sorts that out).
 *   - Context boost: a rule keyword found shortly before a match lifts the score
 *     to max(score + boost, minScoreWithContext), capped at 1.0.
 *   - Checksum validators set passing matches to 1.0 and drop failing ones;
 *     format validators only drop.
 *
 * USAGE:
 *   @code
 *   using namespace piianon::recognizers;
 *
 *   PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{});
 *   auto spans = rules.detect("Call me on 0412 345 678");
 *   // spans[0].category() == "AU_PHONE_NUMBER", confidence 1.0 ("call" boost)
 *   @endcode
 */

namespace piianon {
namespace recognizers {

struct ContextSettings
{
    double boost = 0.35;
    double minScoreWithContext = 0.4;
    /// Bytes before the match searched for keywords.
    size_t window = 50;
};

class PatternRecognizerSet : public detection::SpanDetector
{
public:
    /**
     * @param rules Shared compiled rule table.
     * @param context Context-boost settings.
     * @param allowedCategories When non-empty, only rules of these categories run.
     */
    PatternRecognizerSet(std::shared_ptr<const RuleTable> rules,
                         ContextSettings context,
                         const std::vector<std::string> &allowedCategories = {})
        : rules_(std::move(rules)),
          context_(context),
          allowed_(allowedCategories.begin(), allowedCategories.end())
    {
        if (!rules_) {
            throw std::invalid_argument("PatternRecognizerSet: null rule table");
        }
    }

    std::string name() const override { return "rules"; }

    std::vector<core::Span> detect(const std::string &text) override
    {
        return scan(text);
    }

    /**
     * @brief Const scan; detect() forwards here.
     */
    std::vector<core::Span> scan(const std::string &text) const
    {
        std::vector<core::Span> spans;
        if (text.empty()) {
            return spans;
        }

        const std::string lowered = util::toLower(text);

        for (const auto &rule : *rules_) {
            if (!allowed_.empty() && allowed_.count(rule.category()) == 0) {
                continue;
            }
            for (const auto &pattern : rule.patterns()) {
                auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.regex);
                for (auto it = begin; it != std::sregex_iterator(); ++it) {
                    const std::smatch &m = *it;
                    if (!m[pattern.group].matched || m.length(pattern.group) == 0) {
                        continue;
                    }
                    size_t start = static_cast<size_t>(m.position(pattern.group));
                    size_t end = start + static_cast<size_t>(m.length(pattern.group));
                    std::string value = m.str(pattern.group);

                    double score = pattern.score;
                    if (rule.validator() != ValidatorKind::None) {
                        if (!runValidator(rule.validator(), value)) {
                            continue;
                        }
                        if (isChecksumValidator(rule.validator())) {
                            score = 1.0;
                        }
                    }
                    if (score < 1.0 && hasContext(lowered, rule.context(), start)) {
                        score = std::min(1.0, std::max(score + context_.boost, context_.minScoreWithContext));
                    }

                    spans.emplace_back(rule.category(), value, start, end, score, core::SpanSource::Rule);
                }
            }
        }

        util::logger::debug("PatternRecognizerSet: " + std::to_string(spans.size()) + " raw spans");
        return spans;
    }

private:
    static bool isWordByte(char c)
    {
        return util::isAsciiAlpha(c) || util::isAsciiDigit(c) || c == '_';
    }

    /**
     * @brief Whole-word, case-insensitive keyword search in the window before @p matchStart.
     */
    bool hasContext(const std::string &lowered, const std::vector<std::string> &keywords,
                    size_t matchStart) const
    {
        if (keywords.empty()) {
            return false;
        }
        size_t windowStart = matchStart > context_.window ? matchStart - context_.window : 0;
        const std::string window = lowered.substr(windowStart, matchStart - windowStart);

        for (const auto &kw : keywords) {
            size_t pos = window.find(kw);
            while (pos != std::string::npos) {
                bool leftOk = pos == 0 || !isWordByte(window[pos - 1]) || !isWordByte(kw.front());
                size_t after = pos + kw.size();
                bool rightOk = after >= window.size() || !isWordByte(window[after]) || !isWordByte(kw.back());
                if (leftOk && rightOk) {
                    return true;
                }
                pos = window.find(kw, pos + 1);
            }
        }
        return false;
    }

    std::shared_ptr<const RuleTable> rules_;
    ContextSettings context_;
    std::unordered_set<std::string> allowed_;
};

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_PATTERN_RECOGNIZER_SET_HPP
