#ifndef PIIANON_DETECTION_SPAN_RECONCILER_HPP
#define PIIANON_DETECTION_SPAN_RECONCILER_HPP

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "core/span.hpp"

/**
 * @file span_reconciler.hpp
 * @brief Turns the union of every detector's spans into one non-overlapping list.
 *
 * DESIGN GOALS:
 *   - deduplicate: one span per (start, end, category), highest confidence wins,
 *     ties go to the lower SpanSource;
 *   - merge: walk spans ordered by (start, end, category) keeping a current
 *     winner; an overlapping span takes over only with strictly higher
 *     confidence, or equal confidence and strictly greater length;
 *   - the result depends only on the set of input spans, never on their order.
 *
 * USAGE:
 *   @code
 *   auto resolved = piianon::detection::SpanReconciler::reconcile(raw);
 *   // no two spans in resolved overlap; sorted by start
 *   @endcode
 */

namespace piianon {
namespace detection {

class SpanReconciler
{
public:
    static std::vector<core::Span> reconcile(const std::vector<core::Span> &spans)
    {
        return mergeOverlapping(deduplicate(spans));
    }

    /**
     * @brief Keep the best span per (start, end, category). Output is ordered by that key.
     */
    static std::vector<core::Span> deduplicate(const std::vector<core::Span> &spans)
    {
        using Key = std::tuple<size_t, size_t, std::string>;
        std::map<Key, size_t> best;

        for (size_t i = 0; i < spans.size(); ++i) {
            const auto &s = spans[i];
            Key key(s.start(), s.end(), s.category());
            auto it = best.find(key);
            if (it == best.end()) {
                best.emplace(key, i);
                continue;
            }
            const auto &current = spans[it->second];
            if (s.confidence() > current.confidence() ||
                (s.confidence() == current.confidence() && s.source() < current.source()))
            {
                it->second = i;
            }
        }

        std::vector<core::Span> out;
        out.reserve(best.size());
        for (const auto &kv : best) {
            out.push_back(spans[kv.second]);
        }
        return out;
    }

    /**
     * @brief Resolve overlaps. Input should already be deduplicated.
     */
    static std::vector<core::Span> mergeOverlapping(std::vector<core::Span> spans)
    {
        std::vector<core::Span> out;
        if (spans.empty()) {
            return out;
        }

        std::sort(spans.begin(), spans.end(), [](const core::Span &a, const core::Span &b) {
            return std::make_tuple(a.start(), a.end(), std::cref(a.category()), a.source()) <
                   std::make_tuple(b.start(), b.end(), std::cref(b.category()), b.source());
        });

        size_t winner = 0;
        for (size_t i = 1; i < spans.size(); ++i) {
            const auto &next = spans[i];
            const auto &current = spans[winner];
            if (next.overlaps(current)) {
                if (next.confidence() > current.confidence() ||
                    (next.confidence() == current.confidence() && next.length() > current.length()))
                {
                    winner = i;
                }
            } else {
                out.push_back(current);
                winner = i;
            }
        }
        out.push_back(spans[winner]);
        return out;
    }
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_SPAN_RECONCILER_HPP
