#ifndef PIIANON_DETECTION_FALSE_POSITIVE_FILTER_HPP
#define PIIANON_DETECTION_FALSE_POSITIVE_FILTER_HPP

#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/span.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file false_positive_filter.hpp
 * @brief Post-detection cleanup of raw spans.
 *
 * Steps, per span:
 *   1. noisy categories (DATE_TIME, CARDINAL, ...) are dropped;
 *   2. PERSON/ORGANIZATION/LOCATION words are checked against the lexicon of
 *      known non-PII terms, using the category as detected (PERSON: first word
 *      only);
 *   3. ORGANIZATION/LOCATION becomes PERSON after a personal title, or when the
 *      span is one capitalized, not all-caps word longer than two characters
 *      (the second rule can be switched off);
 *   4. the entity allow-list and the confidence threshold apply;
 *   5. whitelisted values are dropped unless blacklisted. A blacklisted value
 *      skips the lexicon, the threshold and the whitelist.
 */

namespace piianon {
namespace detection {

/**
 * @brief Built-in lexicon: workplace, network and Australian telco vocabulary
 *        that NER models tend to tag as names, organisations or places.
 */
inline const std::unordered_set<std::string>& builtinFalsePositiveWords()
{
    static const std::unordered_set<std::string> words = {
        // technical
        "upload", "download", "sync", "backup", "update", "install", "login", "logout",
        "signup", "signin", "reset", "refresh",
        // business
        "credit", "debit", "account", "balance", "payment", "invoice", "service", "support",
        "sales", "billing", "admin", "system", "customer", "client", "user", "member",
        // network
        "speed", "ping", "latency", "bandwidth", "upstream", "downstream", "mbps", "kbps", "gbps",
        // telco and internal systems
        "telstra", "console", "mica", "bill", "siebel", "flexcab", "debitors", "pega",
        "braintree", "salesforce",
        // states and territories
        "nsw", "vic", "qld", "wa", "sa", "tas", "act", "nt",
        // time zones
        "aest", "aedt", "acst", "acdt", "awst", "awdt",
        // agencies and common terms
        "medicare", "centrelink", "driver", "license", "licence", "tio", "acma", "bpay", "paypal",
        // workflow
        "escalated", "provisioning", "activated", "cancelled", "canceled", "retention",
        "winback", "churn",
        // abbreviations
        "dob", "eta", "asap", "tba", "tbd", "fyi", "pm", "am"
    };
    return words;
}

inline const std::unordered_set<std::string>& personalTitles()
{
    static const std::unordered_set<std::string> titles = {
        "mr", "mrs", "ms", "miss", "dr", "prof", "rev", "sir", "dame", "lord", "lady"
    };
    return titles;
}

/**
 * @brief Categories whose values are checked against the lexicon. Includes the
 *        raw labels LLMs and NER models use for the same classes.
 */
inline bool isLexiconCategory(const std::string &category)
{
    return category == "PERSON" || category == "ORGANIZATION" || category == "LOCATION" ||
           category == "ORG" || category == "GPE" || category == "LOC" || category == "NRP";
}

inline std::unordered_set<std::string> toSet(const std::vector<std::string> &v)
{
    return std::unordered_set<std::string>(v.begin(), v.end());
}

struct FilterSettings
{
    FilterSettings()
        : lexicon(builtinFalsePositiveWords()),
          reclassifySingleWord(true),
          confidenceThreshold(0.5)
    {
    }

    std::unordered_set<std::string> skipCategories{"DATE_TIME", "CARDINAL", "ORDINAL", "QUANTITY", "MONEY"};
    std::unordered_set<std::string> lexicon;
    bool reclassifySingleWord;
    std::unordered_set<std::string> allowedCategories;
    double confidenceThreshold;

    std::unordered_set<std::string> whitelistEmails;
    std::unordered_set<std::string> whitelistDomains;
    std::vector<std::regex> whitelistPatterns;
    std::unordered_set<std::string> blacklist;

    /**
     * @brief Build from the run configuration. Whitelist regexes that do not
     *        compile are skipped with a warning.
     */
    static FilterSettings fromConfig(const config::PipelineConfig &cfg)
    {
        FilterSettings s;
        s.skipCategories = toSet(cfg.detection.skipEntities);
        if (!cfg.detection.falsePositiveWords.empty()) {
            s.lexicon = toSet(cfg.detection.falsePositiveWords);
        }
        s.lexicon.insert(cfg.detection.extraFalsePositiveWords.begin(), cfg.detection.extraFalsePositiveWords.end());
        s.reclassifySingleWord = cfg.detection.reclassifySingleWord;
        s.allowedCategories = toSet(cfg.detection.entities);
        s.confidenceThreshold = cfg.detection.confidenceThreshold;

        s.whitelistEmails = toSet(cfg.lists.whitelistEmails);
        s.whitelistDomains = toSet(cfg.lists.whitelistDomains);
        for (const auto &p : cfg.lists.whitelistPatterns) {
            try {
                s.whitelistPatterns.emplace_back(p, std::regex::ECMAScript);
            }
            catch (const std::regex_error &ex) {
                util::logger::warn("FalsePositiveFilter: ignoring whitelist pattern '" + p + "': " + ex.what());
            }
        }
        s.blacklist = toSet(cfg.lists.blacklist);
        return s;
    }
};

class FalsePositiveFilter
{
public:
    FalsePositiveFilter()
        : settings_()
    {
    }

    explicit FalsePositiveFilter(FilterSettings settings)
        : settings_(std::move(settings))
    {
    }

    /**
     * @param spans Raw spans over @p text.
     * @param text The text the spans index into (needed for the title look-behind).
     */
    std::vector<core::Span> apply(const std::vector<core::Span> &spans, const std::string &text) const
    {
        std::vector<core::Span> kept;
        kept.reserve(spans.size());

        for (const auto &raw : spans) {
            if (settings_.skipCategories.count(raw.category())) {
                continue;
            }

            bool blacklisted = settings_.blacklist.count(raw.value()) > 0;

            // The lexicon sees the category the detector reported.
            if (!blacklisted && isLexiconCategory(raw.category()) &&
                hitsLexicon(raw.value(), raw.category() == "PERSON"))
            {
                util::logger::debug("FalsePositiveFilter: lexicon drop at " + std::to_string(raw.start()) + " (" +
                                    raw.category() + ")");
                continue;
            }

            core::Span span = reclassify(raw, text);
            if (!settings_.allowedCategories.empty() && settings_.allowedCategories.count(span.category()) == 0) {
                continue;
            }
            if (blacklisted) {
                kept.push_back(span);
                continue;
            }
            if (span.confidence() < settings_.confidenceThreshold) {
                continue;
            }
            if (isWhitelisted(span.value())) {
                util::logger::debug("FalsePositiveFilter: whitelisted value at " + std::to_string(span.start()));
                continue;
            }
            kept.push_back(span);
        }
        return kept;
    }

    /**
     * @brief True if any word of @p value is a lexicon entry (only the first word
     *        when @p firstWordOnly).
     */
    bool hitsLexicon(const std::string &value, bool firstWordOnly = false) const
    {
        const auto words = util::splitWords(util::toLower(value));
        for (size_t i = 0; i < words.size(); ++i) {
            if (settings_.lexicon.count(words[i])) {
                return true;
            }
            if (firstWordOnly) {
                break;
            }
        }
        return false;
    }

    bool isWhitelisted(const std::string &value) const
    {
        if (settings_.whitelistEmails.count(value)) {
            return true;
        }
        auto at = value.find('@');
        if (at != std::string::npos && settings_.whitelistDomains.count(util::toLower(value.substr(at + 1)))) {
            return true;
        }
        for (const auto &re : settings_.whitelistPatterns) {
            if (std::regex_search(value, re)) {
                return true;
            }
        }
        return false;
    }

    const FilterSettings& settings() const { return settings_; }

private:
    static bool isOrgOrLocation(const std::string &category)
    {
        return category == "ORGANIZATION" || category == "LOCATION" ||
               category == "ORG" || category == "GPE" || category == "LOC";
    }

    core::Span reclassify(const core::Span &span, const std::string &text) const
    {
        if (!isOrgOrLocation(span.category())) {
            return span;
        }

        // (a) title immediately before the span
        size_t from = span.start() > 10 ? span.start() - 10 : 0;
        const auto before = util::splitWords(util::toLower(text.substr(from, span.start() - from)));
        if (!before.empty()) {
            std::string last = before.back();
            while (!last.empty() && last.back() == '.') {
                last.pop_back();
            }
            if (personalTitles().count(last)) {
                util::logger::debug("FalsePositiveFilter: span at " + std::to_string(span.start()) +
                                    " follows a title, now PERSON");
                return span.withCategory("PERSON");
            }
        }

        // (b) one capitalized word that is not an acronym
        if (settings_.reclassifySingleWord) {
            const std::string &v = span.value();
            if (util::splitWords(v).size() == 1 && v.size() > 2 &&
                v[0] >= 'A' && v[0] <= 'Z' && util::toUpper(v) != v)
            {
                return span.withCategory("PERSON");
            }
        }
        return span;
    }

    FilterSettings settings_;
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_FALSE_POSITIVE_FILTER_HPP
