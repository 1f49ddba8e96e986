#ifndef PIIANON_CORE_AUDIT_LOG_HPP
#define PIIANON_CORE_AUDIT_LOG_HPP

#include <chrono>
#include <ctime>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @file audit_log.hpp
 * @brief What was anonymized, where, and how. Never the original value.
 *
 * JSON layout written beside each output file:
 *   {
 *     "timestamp": "2024-05-01T10:00:00Z",
 *     "strategy": "redact",
 *     "total_anonymized": 2,
 *     "entries": [{"pii_type": "EMAIL", "position": 20, "strategy": "redact",
 *                  "timestamp": "...", "pass": 1}, ...]
 *   }
 */

namespace piianon {
namespace core {

/**
 * @brief Current UTC time as ISO-8601 with a trailing 'Z'.
 */
inline std::string isoUtcNow()
{
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tmUtc{};
    gmtime_r(&t, &tmUtc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
    return std::string(buf);
}

struct AuditEntry
{
    std::string category;
    size_t position = 0;
    std::string strategy;
    std::string timestamp;
    /// 1 for the main pass, 2 for the LLM second pass.
    int pass = 1;
};

inline nlohmann::json toJson(const AuditEntry &e)
{
    return nlohmann::json{
        {"pii_type", e.category},
        {"position", e.position},
        {"strategy", e.strategy},
        {"timestamp", e.timestamp},
        {"pass", e.pass}
    };
}

class AuditTrail
{
public:
    explicit AuditTrail(std::string strategy)
        : strategy_(std::move(strategy)),
          timestamp_(isoUtcNow())
    {
    }

    void append(const AuditEntry &entry) { entries_.push_back(entry); }

    void append(const std::vector<AuditEntry> &entries)
    {
        entries_.insert(entries_.end(), entries.begin(), entries.end());
    }

    const std::vector<AuditEntry>& entries() const { return entries_; }
    const std::string& strategy() const { return strategy_; }

    nlohmann::json toJson() const
    {
        nlohmann::json list = nlohmann::json::array();
        for (const auto &e : entries_) {
            list.push_back(core::toJson(e));
        }
        return nlohmann::json{
            {"timestamp", timestamp_},
            {"strategy", strategy_},
            {"total_anonymized", entries_.size()},
            {"entries", list}
        };
    }

private:
    std::string strategy_;
    std::string timestamp_;
    std::vector<AuditEntry> entries_;
};

} // namespace core
} // namespace piianon

#endif // PIIANON_CORE_AUDIT_LOG_HPP
