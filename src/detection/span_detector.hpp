#ifndef PIIANON_DETECTION_SPAN_DETECTOR_HPP
#define PIIANON_DETECTION_SPAN_DETECTOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "core/span.hpp"

namespace piianon {
namespace detection {

/**
 * @brief Raised by oracle-backed detectors when the oracle cannot be reached
 *        or answers with something unusable.
 */
class OracleError : public std::runtime_error
{
public:
    explicit OracleError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @class SpanDetector
 * @brief Anything that turns text into candidate spans: the rule set, the
 *        NER oracle, the LLM oracle. Offsets are byte offsets into @p text.
 */
class SpanDetector
{
public:
    virtual ~SpanDetector() = default;

    /// Short name used in log lines.
    virtual std::string name() const = 0;

    /**
     * @throw OracleError when an external oracle fails.
     */
    virtual std::vector<core::Span> detect(const std::string &text) = 0;
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_SPAN_DETECTOR_HPP
