#ifndef PIIANON_CONFIG_PIPELINE_CONFIG_HPP
#define PIIANON_CONFIG_PIPELINE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file pipeline_config.hpp
 * @brief Typed configuration for a piianon run.
 *
 * USAGE:
 *   - Construct with defaults, then let util::ConfigParser apply the merged
 *     key=value layers (file, environment, CLI) on top.
 *   - Each section mirrors one dotted key prefix ("detection.", "anonymization.", ...).
 */

namespace piianon {
namespace config {

/**
 * @struct DetectionConfig
 * @brief Keys under "detection." and "ner.".
 */
struct DetectionConfig
{
    DetectionConfig()
        : language("en"),
          confidenceThreshold(0.5),
          contextBoost(0.35),
          contextMinScore(0.4),
          contextWindow(50),
          skipEntities{"DATE_TIME", "CARDINAL", "ORDINAL", "QUANTITY", "MONEY"},
          reclassifySingleWord(true),
          normalizeCaps(true),
          requireNer(false),
          nerTimeoutSeconds(30)
    {
    }

    std::string language;

    /// Entity allow-list. Empty means every category is reported.
    std::vector<std::string> entities;

    /// Spans below this confidence are dropped (the comparison is >=).
    double confidenceThreshold;

    double contextBoost;
    double contextMinScore;

    /// Bytes scanned before a match when looking for context keywords.
    uint32_t contextWindow;

    /// Noisy categories dropped before any other filtering.
    std::vector<std::string> skipEntities;

    /// Replaces the built-in false-positive lexicon when non-empty.
    std::vector<std::string> falsePositiveWords;

    /// Added on top of whichever lexicon is active.
    std::vector<std::string> extraFalsePositiveWords;

    /// Single capitalized ORGANIZATION/LOCATION words are treated as PERSON.
    bool reclassifySingleWord;

    /// Title-case "MR JOHN SMITH" style runs before the NER oracle sees them.
    bool normalizeCaps;

    /// A failing NER oracle fails the run instead of degrading to rules only.
    bool requireNer;

    /// Base URL of a Presidio-compatible analyzer. Empty disables the NER oracle.
    std::string nerEndpoint;

    uint32_t nerTimeoutSeconds;
};

/**
 * @struct AnonymizationConfig
 * @brief Keys under "anonymization.".
 */
struct AnonymizationConfig
{
    AnonymizationConfig()
        : strategy("redact"),
          redactToken("[REDACTED]"),
          redactTypeSpecific(true),
          maskChar('*'),
          emailVisibleChars(1),
          phoneVisibleChars(3),
          ssnVisibleChars(4),
          creditCardVisibleChars(4),
          replaceLocale("en_US"),
          hasReplaceSeed(false),
          replaceSeed(0),
          preserveFormat(true),
          hashAlgorithm("sha256"),
          hashSalt("default_salt_change_in_production"),
          hashPrefix(true),
          hashTruncateLength(8)
    {
    }

    /// One of redact, mask, replace, hash. Unknown names fall back to redact.
    std::string strategy;

    std::string redactToken;
    bool redactTypeSpecific;

    char maskChar;
    uint32_t emailVisibleChars;
    uint32_t phoneVisibleChars;
    uint32_t ssnVisibleChars;
    uint32_t creditCardVisibleChars;

    std::string replaceLocale;
    bool hasReplaceSeed;
    uint64_t replaceSeed;
    bool preserveFormat;

    std::string hashAlgorithm;
    std::string hashSalt;
    bool hashPrefix;
    /// 0 keeps the full hex digest.
    uint32_t hashTruncateLength;
};

/**
 * @struct ProcessingConfig
 * @brief Keys under "processing.".
 */
struct ProcessingConfig
{
    ProcessingConfig()
        : createAuditLog(true),
          backupOriginal(false),
          outputSuffix("_anonymized"),
          sharedReplacementCache(false),
          workers(1),
          showProgress(true)
    {
    }

    bool createAuditLog;

    /// Optional SQLite database receiving audit entries in addition to the JSON file.
    std::string auditDbPath;

    bool backupOriginal;
    std::string outputSuffix;

    /// One replacement cache shared by all CSV workers instead of one per worker.
    bool sharedReplacementCache;

    uint32_t workers;
    bool showProgress;
};

/**
 * @struct LlmConfig
 * @brief Keys under "llm_detection.".
 */
struct LlmConfig
{
    LlmConfig()
        : enabled(false),
          baseUrl("https://api.openai.com/v1"),
          apiKey("${OPENAI_API_KEY}"),
          model("gpt-4o-mini"),
          maxConcurrent(50),
          maxRetries(3),
          timeoutSeconds(30)
    {
    }

    bool enabled;
    std::string baseUrl;
    std::string apiKey;
    std::string model;

    /// Empty selects the built-in prompt.
    std::string systemPrompt;

    uint32_t maxConcurrent;
    uint32_t maxRetries;
    uint32_t timeoutSeconds;
};

/**
 * @struct FilterListsConfig
 * @brief "whitelist." keys and the "blacklist" key.
 */
struct FilterListsConfig
{
    std::vector<std::string> whitelistEmails;
    std::vector<std::string> whitelistDomains;
    std::vector<std::string> whitelistPatterns;
    std::vector<std::string> blacklist;
};

struct LoggingConfig
{
    LoggingConfig()
        : level("INFO")
    {
    }

    std::string level;
    std::string file;
};

/**
 * @struct PipelineConfig
 * @brief Everything a run needs, with the built-in defaults as the first layer.
 */
struct PipelineConfig
{
    DetectionConfig detection;
    AnonymizationConfig anonymization;
    ProcessingConfig processing;
    LlmConfig llm;
    FilterListsConfig lists;
    LoggingConfig logging;
};

} // namespace config
} // namespace piianon

#endif // PIIANON_CONFIG_PIPELINE_CONFIG_HPP
