#ifndef PIIANON_DETECTION_PRESIDIO_HTTP_ORACLE_HPP
#define PIIANON_DETECTION_PRESIDIO_HTTP_ORACLE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "detection/ner_oracle.hpp"
#include "util/http_client.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file presidio_http_oracle.hpp
 * @brief NerOracle backed by a Presidio-compatible analyzer service.
 *
 * Request:  POST <endpoint>/analyze
 *           {"text": "...", "language": "en", "score_threshold": 0.5}
 * Response: [{"entity_type": "PERSON", "start": 8, "end": 16, "score": 0.85}, ...]
 *
 * The service counts offsets in Unicode code points; they are converted to
 * UTF-8 byte offsets before they leave this class.
 */

namespace piianon {
namespace detection {

class PresidioHttpOracle : public NerOracle
{
public:
    PresidioHttpOracle(std::string endpoint, long timeoutSeconds)
        : m_endpoint(std::move(endpoint)),
          m_http(timeoutSeconds)
    {
        while (!m_endpoint.empty() && m_endpoint.back() == '/') {
            m_endpoint.pop_back();
        }
    }

    std::vector<OracleSpan> analyze(const std::string &text, const std::string &language,
                                    double scoreThreshold) override
    {
        nlohmann::json request = {
            {"text", text},
            {"language", language},
            {"score_threshold", scoreThreshold}
        };

        std::string body;
        try {
            body = request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        catch (const nlohmann::json::exception &ex) {
            throw OracleError(std::string("PresidioHttpOracle: cannot encode request: ") + ex.what());
        }

        util::HttpResponse resp = m_http.postJson(m_endpoint + "/analyze", body);
        if (!resp.transportOk) {
            throw OracleError("PresidioHttpOracle: request failed: " + resp.error);
        }
        if (!resp.ok()) {
            throw OracleError("PresidioHttpOracle: HTTP " + std::to_string(resp.status));
        }

        return parseAnalyzeResponse(resp.body, text);
    }

    /**
     * @brief Convert an /analyze reply for @p text into byte-offset spans.
     *        Items with missing or mistyped fields are skipped with a warning.
     * @throws OracleError if the body is not a JSON array.
     */
    static std::vector<OracleSpan> parseAnalyzeResponse(const std::string &body, const std::string &text)
    {
        nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array()) {
            throw OracleError("PresidioHttpOracle: response is not a JSON array");
        }

        const std::vector<size_t> offsets = util::codePointByteOffsets(text);
        const size_t codePoints = offsets.size() - 1;

        std::vector<OracleSpan> out;
        for (const auto &item : parsed) {
            if (!item.is_object() || !item.contains("entity_type") || !item.contains("start") ||
                !item.contains("end") || !item["start"].is_number_integer() || !item["end"].is_number_integer())
            {
                util::logger::warn("PresidioHttpOracle: skipping malformed result");
                continue;
            }
            if (item.contains("score") && !item["score"].is_number()) {
                util::logger::warn("PresidioHttpOracle: skipping result with a non-numeric score");
                continue;
            }
            long long start = item["start"].get<long long>();
            long long end = item["end"].get<long long>();
            if (start < 0 || end <= start || static_cast<size_t>(end) > codePoints) {
                util::logger::warn("PresidioHttpOracle: skipping result outside the text");
                continue;
            }
            OracleSpan span;
            span.start = offsets[static_cast<size_t>(start)];
            span.end = offsets[static_cast<size_t>(end)];
            span.label = item["entity_type"].is_string() ? item["entity_type"].get<std::string>() : "UNKNOWN";
            span.score = item.contains("score") ? item["score"].get<double>() : 0.0;
            out.push_back(span);
        }
        return out;
    }

private:
    std::string m_endpoint;
    util::HttpClient m_http;
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_PRESIDIO_HTTP_ORACLE_HPP
