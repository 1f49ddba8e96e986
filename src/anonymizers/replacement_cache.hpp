#ifndef PIIANON_ANONYMIZERS_REPLACEMENT_CACHE_HPP
#define PIIANON_ANONYMIZERS_REPLACEMENT_CACHE_HPP

#include <map>
#include <mutex>
#include <string>
#include <utility>

/**
 * @file replacement_cache.hpp
 * @brief (category, original value) -> replacement, so repeated PII is
 *        replaced the same way everywhere it occurs.
 *
 * Each Pipeline owns one. When every worker must agree on replacements a
 * single instance is shared; lookup-or-insert then runs under the mutex so
 * two workers never generate different values for the same key.
 */

namespace piianon {
namespace anonymizers {

class ReplacementCache
{
public:
    ReplacementCache() = default;
    ReplacementCache(const ReplacementCache&) = delete;
    ReplacementCache& operator=(const ReplacementCache&) = delete;

    /**
     * @brief Return the cached replacement, or call @p make and remember its result.
     *        @p make runs with the cache locked.
     */
    template<typename Factory>
    std::string getOrCreate(const std::string &category, const std::string &value, Factory &&make)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::make_pair(category, value);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return it->second;
        }
        std::string replacement = make();
        entries_.emplace(std::move(key), replacement);
        return replacement;
    }

    bool lookup(const std::string &category, const std::string &value, std::string &out) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(std::make_pair(category, value));
        if (it == entries_.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::string> entries_;
};

} // namespace anonymizers
} // namespace piianon

#endif // PIIANON_ANONYMIZERS_REPLACEMENT_CACHE_HPP
