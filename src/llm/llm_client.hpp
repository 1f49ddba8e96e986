#ifndef PIIANON_LLM_LLM_CLIENT_HPP
#define PIIANON_LLM_LLM_CLIENT_HPP

#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "config/pipeline_config.hpp"
#include "llm/chat_backend.hpp"
#include "llm/llm_response_parser.hpp"
#include "util/http_client.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file llm_client.hpp
 * @brief OpenAI-compatible chat-completions client (OpenAI, Azure OpenAI,
 *        Ollama and other compatible servers).
 *
 * DESIGN GOALS:
 *   - one client per run, shared by every second-pass task;
 *   - transport errors, 429 and 5xx are retried with exponential backoff,
 *     other statuses fail at once;
 *   - hosts containing "azure" authenticate with an "api-key" header,
 *     everything else with "Authorization: Bearer".
 *
 * USAGE:
 *   @code
 *   piianon::llm::LlmClient client(cfg.llm);
 *   std::string reply = client.complete(piianon::llm::defaultSystemPrompt(), text);
 *   @endcode
 */

namespace piianon {
namespace llm {

inline const std::string& defaultSystemPrompt()
{
    static const std::string prompt =
        "Find PII in text. Return JSON array only.\n"
        "\n"
        "DETECT: names, addresses, partial addresses, phones, emails, australian gov IDs, NBN codes (AVC/LOC)\n"
        "\n"
        "IGNORE: dates (unless DOB), account/case numbers, [BRACKETS_REDACTED] content\n"
        "\n"
        "Return ONLY sensitive value, not context. Example: \"medicare 2123456701\" \xE2\x86\x92 v=\"2123456701\"\n"
        "\n"
        "Format: [{\"t\":\"TYPE\",\"v\":\"value\"}]\n"
        "Empty: []";
    return prompt;
}

/// Build the chat-completions request body.
inline nlohmann::json buildChatRequest(const std::string &model, const std::string &systemPrompt,
                                       const std::string &userText)
{
    return nlohmann::json{
        {"model", model},
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", systemPrompt}},
            {{"role", "user"}, {"content", userText}}
        })}
    };
}

class LlmClient : public ChatBackend
{
public:
    /**
     * @param cfg "llm_detection." settings; $VAR references in the base URL
     *            and API key are expanded here.
     * @param backoffMillis Delay before the first retry; doubles per attempt.
     */
    explicit LlmClient(const config::LlmConfig &cfg, long backoffMillis = 500)
        : m_baseUrl(util::expandEnv(cfg.baseUrl)),
          m_apiKey(util::expandEnv(cfg.apiKey)),
          m_model(cfg.model),
          m_maxRetries(cfg.maxRetries),
          m_backoffMillis(backoffMillis),
          m_http(static_cast<long>(cfg.timeoutSeconds))
    {
        while (!m_baseUrl.empty() && m_baseUrl.back() == '/') {
            m_baseUrl.pop_back();
        }
        if (m_apiKey.empty()) {
            // local servers accept any key
            m_apiKey = "not-needed";
        }
    }

    std::string complete(const std::string &systemPrompt, const std::string &userText) override
    {
        const std::string url = m_baseUrl + "/chat/completions";
        std::string body;
        try {
            body = buildChatRequest(m_model, systemPrompt, userText)
                       .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        catch (const nlohmann::json::exception &ex) {
            throw LlmError(std::string("LlmClient: cannot encode request: ") + ex.what());
        }

        std::string lastError;
        for (uint32_t attempt = 0; attempt <= m_maxRetries; ++attempt) {
            if (attempt > 0) {
                long delay = std::min<long>(m_backoffMillis << std::min<uint32_t>(attempt - 1, 10), 30000);
                util::logger::debug("LlmClient: retry " + std::to_string(attempt) + " in " +
                                    std::to_string(delay) + " ms (" + lastError + ")");
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }

            util::HttpResponse resp = m_http.postJson(url, body, authHeaders());
            if (!resp.transportOk) {
                lastError = resp.error;
                continue;
            }
            if (resp.status == 429 || resp.status >= 500) {
                lastError = "HTTP " + std::to_string(resp.status);
                continue;
            }
            if (!resp.ok()) {
                throw LlmError("LlmClient: HTTP " + std::to_string(resp.status));
            }
            return extractContent(resp.body);
        }
        throw LlmError("LlmClient: giving up after " + std::to_string(m_maxRetries + 1) +
                       " attempts: " + lastError);
    }

    /**
     * @brief choices[0].message.content with <think> blocks removed.
     * @throw LlmError if the reply has no such field.
     */
    static std::string extractContent(const std::string &responseBody)
    {
        nlohmann::json parsed = nlohmann::json::parse(responseBody, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            throw LlmError("LlmClient: response is not a JSON object");
        }
        auto choices = parsed.find("choices");
        if (choices == parsed.end() || !choices->is_array() || choices->empty() || !(*choices)[0].is_object()) {
            throw LlmError("LlmClient: response has no choices");
        }
        auto message = (*choices)[0].find("message");
        if (message == (*choices)[0].end() || !message->is_object()) {
            throw LlmError("LlmClient: first choice has no message");
        }
        auto content = message->find("content");
        if (content == message->end() || !content->is_string()) {
            return std::string();
        }
        return util::trimmed(stripThinkBlocks(content->get<std::string>()));
    }

    bool isAzure() const
    {
        return util::toLower(m_baseUrl).find("azure") != std::string::npos;
    }

private:
    std::vector<std::string> authHeaders() const
    {
        if (isAzure()) {
            return {"api-key: " + m_apiKey};
        }
        return {"Authorization: Bearer " + m_apiKey};
    }

    std::string m_baseUrl;
    std::string m_apiKey;
    std::string m_model;
    uint32_t m_maxRetries;
    long m_backoffMillis;
    util::HttpClient m_http;
};

} // namespace llm
} // namespace piianon

#endif // PIIANON_LLM_LLM_CLIENT_HPP
