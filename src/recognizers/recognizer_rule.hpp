#ifndef PIIANON_RECOGNIZERS_RECOGNIZER_RULE_HPP
#define PIIANON_RECOGNIZERS_RECOGNIZER_RULE_HPP

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "recognizers/checksum.hpp"

/**
 * @file recognizer_rule.hpp
 * @brief Declarative rule data and its compiled, immutable form.
 *
 * A RuleDefinition is plain data: category, ordered patterns with base scores,
 * context keywords and an optional validator. compileRules() turns a list of
 * definitions into a RuleTable once; the table is then shared read-only by
 * every PatternRecognizerSet (std::regex matching on a const regex is safe
 * from several threads).
 */

namespace piianon {
namespace recognizers {

/**
 * @brief Optional post-match check. Checksum kinds raise a passing match to
 *        confidence 1.0; format kinds only reject.
 */
enum class ValidatorKind {
    None,
    Luhn,
    UsSsn,
    AuTfn,
    AuMedicare,
    AuAbn,
    AuAcn
};

inline bool isChecksumValidator(ValidatorKind kind)
{
    return kind == ValidatorKind::Luhn || kind == ValidatorKind::AuTfn ||
           kind == ValidatorKind::AuMedicare || kind == ValidatorKind::AuAbn ||
           kind == ValidatorKind::AuAcn;
}

/**
 * @brief Run a validator over the matched text. ValidatorKind::None always passes.
 */
inline bool runValidator(ValidatorKind kind, const std::string &value)
{
    switch (kind) {
        case ValidatorKind::None:       return true;
        case ValidatorKind::Luhn:       return checksum::luhn(value);
        case ValidatorKind::UsSsn:      return checksum::usSsn(value);
        case ValidatorKind::AuTfn:      return checksum::auTfn(value);
        case ValidatorKind::AuMedicare: return checksum::auMedicare(value);
        case ValidatorKind::AuAbn:      return checksum::auAbn(value);
        case ValidatorKind::AuAcn:      return checksum::auAcn(value);
    }
    return false;
}

struct PatternSpec
{
    std::string name;
    std::string regex;
    double score;
    /// Capture group reported as the span; 0 is the whole match.
    int group;
    bool caseInsensitive;
};

struct RuleDefinition
{
    std::string category;
    std::vector<PatternSpec> patterns;
    std::vector<std::string> context;
    ValidatorKind validator;
};

struct CompiledPattern
{
    std::string name;
    std::regex regex;
    double score;
    int group;
};

/**
 * @class RecognizerRule
 * @brief One category's compiled patterns. Immutable after construction.
 */
class RecognizerRule
{
public:
    /**
     * @throw std::invalid_argument if a pattern fails to compile or its score is outside [0, 1].
     */
    explicit RecognizerRule(const RuleDefinition &def)
        : category_(def.category),
          validator_(def.validator)
    {
        for (const auto &ctx : def.context) {
            context_.push_back(util::toLower(ctx));
        }
        for (const auto &p : def.patterns) {
            if (p.score < 0.0 || p.score > 1.0) {
                throw std::invalid_argument("RecognizerRule: pattern '" + p.name + "' has score outside [0, 1]");
            }
            auto flags = std::regex::ECMAScript | std::regex::optimize;
            if (p.caseInsensitive) {
                flags |= std::regex::icase;
            }
            try {
                patterns_.push_back(CompiledPattern{p.name, std::regex(p.regex, flags), p.score, p.group});
            }
            catch (const std::regex_error &ex) {
                throw std::invalid_argument("RecognizerRule: pattern '" + p.name + "' for " +
                                            def.category + " does not compile: " + ex.what());
            }
            if (p.group < 0 || static_cast<size_t>(p.group) > patterns_.back().regex.mark_count()) {
                throw std::invalid_argument("RecognizerRule: pattern '" + p.name + "' reports missing group " +
                                            std::to_string(p.group));
            }
        }
    }

    const std::string& category() const { return category_; }
    const std::vector<CompiledPattern>& patterns() const { return patterns_; }
    const std::vector<std::string>& context() const { return context_; }
    ValidatorKind validator() const { return validator_; }

private:
    std::string category_;
    std::vector<CompiledPattern> patterns_;
    std::vector<std::string> context_;
    ValidatorKind validator_;
};

using RuleTable = std::vector<RecognizerRule>;

inline std::shared_ptr<const RuleTable> compileRules(const std::vector<RuleDefinition> &defs)
{
    auto table = std::make_shared<RuleTable>();
    table->reserve(defs.size());
    for (const auto &def : defs) {
        table->emplace_back(def);
    }
    return table;
}

/**
 * @brief The built-in rule definitions (see builtin_rules.cpp).
 */
const std::vector<RuleDefinition>& builtinRuleDefinitions();

/**
 * @brief The built-in rules, compiled on first use and shared process-wide.
 */
std::shared_ptr<const RuleTable> builtinRuleTable();

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_RECOGNIZER_RULE_HPP
