#ifndef PIIANON_ANONYMIZERS_ANONYMIZATION_POLICY_HPP
#define PIIANON_ANONYMIZERS_ANONYMIZATION_POLICY_HPP

#include <cstdint>
#include <string>

#include "config/pipeline_config.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file anonymization_policy.hpp
 * @brief Strategy tag plus every per-category option, fixed for one run.
 */

namespace piianon {
namespace anonymizers {

enum class Strategy {
    Redact,
    Mask,
    Replace,
    Hash
};

inline const char* strategyName(Strategy s)
{
    switch (s) {
        case Strategy::Redact:  return "redact";
        case Strategy::Mask:    return "mask";
        case Strategy::Replace: return "replace";
        case Strategy::Hash:    return "hash";
    }
    return "redact";
}

/**
 * @brief Case-insensitive strategy lookup. Unknown names warn and yield Redact.
 */
inline Strategy parseStrategy(const std::string &name)
{
    const std::string n = util::toLower(util::trimmed(name));
    if (n == "redact")  return Strategy::Redact;
    if (n == "mask")    return Strategy::Mask;
    if (n == "replace") return Strategy::Replace;
    if (n == "hash")    return Strategy::Hash;
    util::logger::warn("AnonymizationPolicy: unknown strategy '" + name + "', using redact");
    return Strategy::Redact;
}

struct AnonymizationPolicy
{
    Strategy strategy = Strategy::Redact;

    std::string redactToken = "[REDACTED]";
    bool redactTypeSpecific = true;

    char maskChar = '*';
    uint32_t emailVisibleChars = 1;
    uint32_t phoneVisibleChars = 3;
    uint32_t ssnVisibleChars = 4;
    uint32_t creditCardVisibleChars = 4;

    std::string replaceLocale = "en_US";
    bool hasReplaceSeed = false;
    uint64_t replaceSeed = 0;
    bool preserveFormat = true;

    std::string hashAlgorithm = "sha256";
    std::string hashSalt = "default_salt_change_in_production";
    bool hashPrefix = true;
    /// 0 keeps the full digest.
    uint32_t hashTruncateLength = 8;

    /**
     * @brief Build from "anonymization." settings. An unsupported hash algorithm
     *        warns and falls back to sha256.
     */
    static AnonymizationPolicy fromConfig(const config::AnonymizationConfig &cfg)
    {
        AnonymizationPolicy p;
        p.strategy = parseStrategy(cfg.strategy);
        p.redactToken = cfg.redactToken;
        p.redactTypeSpecific = cfg.redactTypeSpecific;
        p.maskChar = cfg.maskChar;
        p.emailVisibleChars = cfg.emailVisibleChars;
        p.phoneVisibleChars = cfg.phoneVisibleChars;
        p.ssnVisibleChars = cfg.ssnVisibleChars;
        p.creditCardVisibleChars = cfg.creditCardVisibleChars;
        p.replaceLocale = cfg.replaceLocale;
        p.hasReplaceSeed = cfg.hasReplaceSeed;
        p.replaceSeed = cfg.replaceSeed;
        p.preserveFormat = cfg.preserveFormat;

        p.hashAlgorithm = util::toLower(cfg.hashAlgorithm);
        if (!util::hashing::isSupportedAlgorithm(p.hashAlgorithm)) {
            util::logger::warn("AnonymizationPolicy: unsupported hash algorithm '" + cfg.hashAlgorithm +
                               "', using sha256");
            p.hashAlgorithm = "sha256";
        }
        p.hashSalt = cfg.hashSalt;
        p.hashPrefix = cfg.hashPrefix;
        p.hashTruncateLength = cfg.hashTruncateLength;
        return p;
    }
};

} // namespace anonymizers
} // namespace piianon

#endif // PIIANON_ANONYMIZERS_ANONYMIZATION_POLICY_HPP
