#ifndef PIIANON_UTIL_CONFIG_PARSER_HPP
#define PIIANON_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/pipeline_config.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file config_parser.hpp
 * @brief Layered "key=value" configuration for piianon.
 *
 * DESIGN GOALS:
 *   - Keys are dotted paths ("anonymization.mask.char=#"), one per line.
 *     Lines starting with '#' and blank lines are ignored.
 *   - A ConfigLayer is the flat map of one source. Layers are merged in order
 *     defaults -> overrides file -> environment -> CLI; a later layer replaces
 *     only the leaves it names, so nested sections merge key by key.
 *   - Unknown keys, malformed lines and bad values are warnings. The field keeps
 *     its previous value and the run continues.
 *
 * USAGE:
 *   @code
 *   using namespace piianon::util;
 *
 *   piianon::config::PipelineConfig cfg;
 *   ConfigLayer merged;
 *   mergeLayer(merged, ConfigParser::parseFile("piianon.conf"));
 *   mergeLayer(merged, ConfigParser::environmentLayer());
 *   mergeLayer(merged, cliLayer);
 *
 *   ConfigParser parser(cfg);
 *   parser.applyLayer(merged);
 *   @endcode
 */

namespace piianon {
namespace util {

using ConfigLayer = std::map<std::string, std::string>;

/**
 * @brief Overlay @p overlay onto @p base, leaf by leaf.
 */
inline void mergeLayer(ConfigLayer &base, const ConfigLayer &overlay)
{
    for (const auto &kv : overlay) {
        base[kv.first] = kv.second;
    }
}

/**
 * @class ConfigParser
 * @brief Reads key=value sources into layers and applies layers onto a PipelineConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(piianon::config::PipelineConfig &cfg)
        : cfg_(cfg)
    {
    }

    /**
     * @brief Parse key=value lines from a stream. Malformed lines are skipped with a warning.
     */
    static ConfigLayer parseStream(std::istream &in, const std::string &sourceName = "<stream>")
    {
        ConfigLayer layer;
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                logger::warn("ConfigParser: " + sourceName + ":" + std::to_string(lineNo) +
                             ": ignoring line without '=': " + line);
                continue;
            }
            std::string key = trimmed(line.substr(0, pos));
            std::string val = trimmed(line.substr(pos + 1));
            if (key.empty()) {
                logger::warn("ConfigParser: " + sourceName + ":" + std::to_string(lineNo) +
                             ": ignoring line with empty key");
                continue;
            }
            layer[key] = val;
        }
        return layer;
    }

    /**
     * @brief Parse a config file. A missing file is a warning and yields an empty layer.
     * @param found Optional out-flag telling whether the file could be opened.
     */
    static ConfigLayer parseFile(const std::string &filepath, bool *found = nullptr)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            if (found) {
                *found = false;
            }
            return ConfigLayer{};
        }
        if (found) {
            *found = true;
        }
        logger::info("ConfigParser: Loading config from " + filepath);
        return parseStream(inFile, filepath);
    }

    /**
     * @brief Environment overrides: PII_ANONYMIZE_SALT and PII_ANONYMIZE_LOG_LEVEL.
     */
    static ConfigLayer environmentLayer()
    {
        ConfigLayer layer;
        if (const char *salt = std::getenv("PII_ANONYMIZE_SALT")) {
            if (*salt) {
                layer["anonymization.hash.salt"] = salt;
            }
        }
        if (const char *level = std::getenv("PII_ANONYMIZE_LOG_LEVEL")) {
            if (*level) {
                layer["logging.level"] = level;
            }
        }
        return layer;
    }

    /**
     * @brief Apply every key of a (merged) layer onto the referenced config.
     */
    void applyLayer(const ConfigLayer &layer)
    {
        for (const auto &kv : layer) {
            applyKeyValue(kv.first, kv.second);
        }
    }

    /**
     * @brief Convenience for a single file applied straight onto the config.
     * @return false if the file was missing (defaults are kept).
     */
    bool loadFromFile(const std::string &filepath)
    {
        bool found = false;
        ConfigLayer layer = parseFile(filepath, &found);
        applyLayer(layer);
        return found;
    }

    /**
     * @brief Map one dotted key onto its typed field.
     */
    void applyKeyValue(const std::string &key, const std::string &val)
    {
        auto &det = cfg_.detection;
        auto &anon = cfg_.anonymization;
        auto &proc = cfg_.processing;
        auto &llm = cfg_.llm;

        // detection.*
        if (key == "detection.language") { det.language = val; }
        else if (key == "detection.entities") { det.entities = upperList(val); }
        else if (key == "detection.confidence_threshold") { setUnitDouble(key, val, det.confidenceThreshold); }
        else if (key == "detection.context_boost") { setUnitDouble(key, val, det.contextBoost); }
        else if (key == "detection.context_min_score") { setUnitDouble(key, val, det.contextMinScore); }
        else if (key == "detection.context_window") { setUInt(key, val, det.contextWindow); }
        else if (key == "detection.skip_entities") { det.skipEntities = upperList(val); }
        else if (key == "detection.false_positive_words") { det.falsePositiveWords = lowerList(val); }
        else if (key == "detection.extra_false_positive_words") { det.extraFalsePositiveWords = lowerList(val); }
        else if (key == "detection.reclassify_single_word") { setBool(key, val, det.reclassifySingleWord); }
        else if (key == "detection.normalize_caps") { setBool(key, val, det.normalizeCaps); }
        else if (key == "detection.require_ner") { setBool(key, val, det.requireNer); }
        else if (key == "ner.endpoint") { det.nerEndpoint = val; }
        else if (key == "ner.timeout") { setUInt(key, val, det.nerTimeoutSeconds); }

        // anonymization.*
        else if (key == "anonymization.strategy") { anon.strategy = toLower(val); }
        else if (key == "anonymization.redact.token") { anon.redactToken = val; }
        else if (key == "anonymization.redact.type_specific") { setBool(key, val, anon.redactTypeSpecific); }
        else if (key == "anonymization.mask.char") {
            if (val.size() == 1) {
                anon.maskChar = val[0];
            } else {
                warnValue(key, val, "expected a single character");
            }
        }
        else if (key == "anonymization.mask.email_visible_chars") { setUInt(key, val, anon.emailVisibleChars); }
        else if (key == "anonymization.mask.phone_visible_chars") { setUInt(key, val, anon.phoneVisibleChars); }
        else if (key == "anonymization.mask.ssn_visible_chars") { setUInt(key, val, anon.ssnVisibleChars); }
        else if (key == "anonymization.mask.credit_card_visible_chars") { setUInt(key, val, anon.creditCardVisibleChars); }
        else if (key == "anonymization.replace.locale") { anon.replaceLocale = val; }
        else if (key == "anonymization.replace.seed") {
            if (val.empty()) {
                anon.hasReplaceSeed = false;
            } else {
                uint64_t seed = 0;
                if (parseUInt(val, seed)) {
                    anon.replaceSeed = seed;
                    anon.hasReplaceSeed = true;
                } else {
                    warnValue(key, val, "expected an unsigned integer");
                }
            }
        }
        else if (key == "anonymization.replace.preserve_format") { setBool(key, val, anon.preserveFormat); }
        else if (key == "anonymization.hash.algorithm") { anon.hashAlgorithm = toLower(val); }
        else if (key == "anonymization.hash.salt") { anon.hashSalt = val; }
        else if (key == "anonymization.hash.prefix") { setBool(key, val, anon.hashPrefix); }
        else if (key == "anonymization.hash.truncate_length") { setUInt(key, val, anon.hashTruncateLength); }

        // processing.*
        else if (key == "processing.create_audit_log") { setBool(key, val, proc.createAuditLog); }
        else if (key == "processing.audit_db") { proc.auditDbPath = val; }
        else if (key == "processing.backup_original") { setBool(key, val, proc.backupOriginal); }
        else if (key == "processing.output_suffix") { proc.outputSuffix = val; }
        else if (key == "processing.shared_replacement_cache") { setBool(key, val, proc.sharedReplacementCache); }
        else if (key == "processing.workers") { setUInt(key, val, proc.workers); }
        else if (key == "processing.show_progress") { setBool(key, val, proc.showProgress); }

        // llm_detection.*
        else if (key == "llm_detection.enabled") { setBool(key, val, llm.enabled); }
        else if (key == "llm_detection.base_url") { llm.baseUrl = val; }
        else if (key == "llm_detection.api_key") { llm.apiKey = val; }
        else if (key == "llm_detection.model") { llm.model = val; }
        else if (key == "llm_detection.system_prompt") { llm.systemPrompt = val; }
        else if (key == "llm_detection.settings.max_concurrent") { setUInt(key, val, llm.maxConcurrent); }
        else if (key == "llm_detection.settings.max_retries") { setUInt(key, val, llm.maxRetries); }
        else if (key == "llm_detection.settings.timeout") { setUInt(key, val, llm.timeoutSeconds); }

        // whitelist.* / blacklist
        else if (key == "whitelist.emails") { cfg_.lists.whitelistEmails = splitList(val); }
        else if (key == "whitelist.domains") { cfg_.lists.whitelistDomains = lowerList(val); }
        else if (startsWith(key, "whitelist.patterns.")) {
            // Regexes may contain commas, so each one gets its own leaf key.
            if (!val.empty()) {
                cfg_.lists.whitelistPatterns.push_back(val);
            }
        }
        else if (key == "blacklist") { cfg_.lists.blacklist = splitList(val); }

        // logging.*
        else if (key == "logging.level") { cfg_.logging.level = val; }
        else if (key == "logging.file") { cfg_.logging.file = val; }

        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }

private:
    piianon::config::PipelineConfig &cfg_;

    static std::vector<std::string> upperList(const std::string &val)
    {
        std::vector<std::string> out = splitList(val);
        for (auto &s : out) {
            s = toUpper(s);
        }
        return out;
    }

    static std::vector<std::string> lowerList(const std::string &val)
    {
        std::vector<std::string> out = splitList(val);
        for (auto &s : out) {
            s = toLower(s);
        }
        return out;
    }

    static void warnValue(const std::string &key, const std::string &val, const std::string &why)
    {
        logger::warn("ConfigParser: Invalid value '" + val + "' for '" + key + "' (" + why +
                     "), keeping previous value");
    }

    static bool parseUInt(const std::string &val, uint64_t &out)
    {
        if (val.empty() || val[0] == '-') {
            return false;
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                return false;
            }
            out = n;
            return true;
        }
        catch (const std::exception &) {
            return false;
        }
    }

    static void setUInt(const std::string &key, const std::string &val, uint32_t &field)
    {
        uint64_t n = 0;
        if (!parseUInt(val, n) || n > UINT32_MAX) {
            warnValue(key, val, "expected an unsigned integer");
            return;
        }
        field = static_cast<uint32_t>(n);
    }

    static void setUnitDouble(const std::string &key, const std::string &val, double &field)
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size() || d < 0.0 || d > 1.0) {
                warnValue(key, val, "expected a number in [0, 1]");
                return;
            }
            field = d;
        }
        catch (const std::exception &) {
            warnValue(key, val, "expected a number in [0, 1]");
        }
    }

    static void setBool(const std::string &key, const std::string &val, bool &field)
    {
        std::string v = toLower(val);
        if (v == "true" || v == "yes" || v == "on" || v == "1") {
            field = true;
        } else if (v == "false" || v == "no" || v == "off" || v == "0") {
            field = false;
        } else {
            warnValue(key, val, "expected true or false");
        }
    }
};

} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_CONFIG_PARSER_HPP
