// Unit tests for the LLM second pass: reply parsing, span location and batching.

#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/pipeline_config.hpp"
#include "llm/llm_client.hpp"
#include "llm/llm_detector.hpp"
#include "llm/llm_response_parser.hpp"
#include "test_helpers.hpp"

using namespace piianon::llm;
using piianon::test::ScriptedChatBackend;

namespace {

std::shared_ptr<ScriptedChatBackend> replyWith(const std::string &reply)
{
    return std::make_shared<ScriptedChatBackend>([reply](const std::string &) { return reply; });
}

} // namespace

TEST(LlmResponseParserTest, SkipsIncompleteItems) {
    auto items = parseItems(R"([{"t":"PERSON","v":"John"},{"t":"EMAIL"}])");
    ASSERT_EQ(items.size(), (size_t)1);
    EXPECT_EQ(items[0].type, "PERSON");
    EXPECT_EQ(items[0].value, "John");
}

TEST(LlmResponseParserTest, AcceptsFencesLongKeysAndThinkBlocks) {
    auto fenced = parseItems("```json\n[{\"t\":\"PHONE\",\"v\":\"0412 345 678\"}]\n```");
    ASSERT_EQ(fenced.size(), (size_t)1);
    EXPECT_EQ(fenced[0].value, "0412 345 678");

    auto longKeys = parseItems(R"(Here you go: [{"type":"address","value":"12 Smith St"}] done)");
    ASSERT_EQ(longKeys.size(), (size_t)1);
    EXPECT_EQ(longKeys[0].type, "address");

    auto thinking = parseItems("<think>maybe [1,2]</think>[{\"t\":\"PERSON\",\"v\":\"Ann\"}]");
    ASSERT_EQ(thinking.size(), (size_t)1);
    EXPECT_EQ(thinking[0].value, "Ann");
}

TEST(LlmResponseParserTest, InvalidRepliesYieldNothing) {
    EXPECT_TRUE(parseItems("not json at all").empty());
    EXPECT_TRUE(parseItems("[{\"t\": broken").empty());
    EXPECT_TRUE(parseItems("[]").empty());
    EXPECT_TRUE(parseItems("{\"t\":\"PERSON\",\"v\":\"x\"}").empty());
}

TEST(LlmResponseParserTest, NormalizeType) {
    EXPECT_EQ(normalizeType("phone number"), "PHONE_NUMBER");
    EXPECT_EQ(normalizeType("au-tfn"), "AU_TFN");
}

TEST(LlmResponseParserTest, FindPosition) {
    const std::string text = "Call 0412 345 678 now";
    size_t start = 0;
    size_t end = 0;

    ASSERT_TRUE(findPosition("0412 345 678", text, start, end));
    EXPECT_EQ(start, (size_t)5);
    EXPECT_EQ(end, (size_t)17);

    start = end = 0;
    ASSERT_TRUE(findPosition("0412345678", text, start, end));
    EXPECT_EQ(start, (size_t)5);
    EXPECT_EQ(end, (size_t)17);

    ASSERT_TRUE(findPosition("CALL", text, start, end));
    EXPECT_EQ(start, (size_t)0);
    EXPECT_EQ(end, (size_t)4);

    EXPECT_FALSE(findPosition("0499 999 999", text, start, end));
    EXPECT_FALSE(findPosition("", text, start, end));
}

TEST(LlmResponseParserTest, SkipRules) {
    EXPECT_TRUE(isFullyRedacted("[PERSON_REDACTED] [EMAIL_REDACTED]"));
    EXPECT_FALSE(isFullyRedacted("[PERSON_REDACTED] lives here"));
    EXPECT_TRUE(shouldSkip("   "));
    EXPECT_TRUE(shouldSkip(""));
    EXPECT_FALSE(shouldSkip("Ring Bob"));
}

TEST(LlmDetectorTest, LocatesFindingsInText) {
    auto backend = replyWith(R"([{"t":"person","v":"Bob Jones"},{"t":"PHONE","v":"0412345678"}])");
    LlmDetector detector(backend, "");
    const std::string text = "Ring Bob Jones on 0412 345 678";

    auto spans = detector.detect(text);
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0].category(), "PERSON");
    EXPECT_EQ(spans[0].value(), "Bob Jones");
    EXPECT_DOUBLE_EQ(spans[0].confidence(), 0.85);
    EXPECT_EQ(spans[0].source(), piianon::core::SpanSource::LlmOracle);
    EXPECT_EQ(spans[1].value(), "0412 345 678");
    EXPECT_EQ(backend->calls.load(), 1);
}

TEST(LlmDetectorTest, DropsLexiconNamesAndMissingValues) {
    auto backend = replyWith(R"([{"t":"PERSON","v":"Customer Support"},{"t":"EMAIL","v":"ghost@nowhere.io"}])");
    LlmDetector detector(backend, "");
    EXPECT_TRUE(detector.detect("Contact Customer Support today").empty());
}

TEST(LlmDetectorTest, RedactedTextMakesNoRequest) {
    auto backend = replyWith("[]");
    LlmDetector detector(backend, "");
    EXPECT_TRUE(detector.detect("[PERSON_REDACTED]").empty());
    EXPECT_EQ(backend->calls.load(), 0);
}

TEST(LlmDetectorTest, SystemPromptSelection) {
    auto backend = replyWith("[]");
    LlmDetector custom(backend, "Only names.");
    custom.detect("some text");
    ASSERT_EQ(backend->prompts.size(), (size_t)1);
    EXPECT_EQ(backend->prompts[0], "Only names.");

    LlmDetector fallback(backend, "");
    EXPECT_EQ(fallback.systemPrompt(), defaultSystemPrompt());

    const std::string &prompt = defaultSystemPrompt();
    EXPECT_NE(prompt.find("PII"), std::string::npos);
    EXPECT_NE(prompt.find("JSON"), std::string::npos);
    EXPECT_NE(prompt.find("names"), std::string::npos);
    EXPECT_NE(prompt.find("addresses"), std::string::npos);
    EXPECT_NE(prompt.find("\"t\""), std::string::npos);
    EXPECT_NE(prompt.find("\"v\""), std::string::npos);
}

TEST(LlmClientTest, ChatRequestLayout) {
    auto body = buildChatRequest("gpt-4o-mini", "system text", "user text");
    EXPECT_EQ(body["model"], "gpt-4o-mini");
    ASSERT_EQ(body["messages"].size(), (size_t)2);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["messages"][0]["content"], "system text");
    EXPECT_EQ(body["messages"][1]["role"], "user");
    EXPECT_EQ(body["messages"][1]["content"], "user text");
}

TEST(LlmClientTest, ExtractContent) {
    EXPECT_EQ(LlmClient::extractContent(R"({"choices":[{"message":{"content":" [] "}}]})"), "[]");
    EXPECT_EQ(LlmClient::extractContent(
                  R"({"choices":[{"message":{"content":"<think>hmm</think>[{\"t\":\"X\",\"v\":\"y\"}]"}}]})"),
              "[{\"t\":\"X\",\"v\":\"y\"}]");
    EXPECT_THROW(LlmClient::extractContent("<html>"), LlmError);
    EXPECT_THROW(LlmClient::extractContent(R"({"choices":[]})"), LlmError);
}

TEST(LlmClientTest, AzureDetectionUsesExpandedUrl) {
    setenv("PIIANON_TEST_LLM_URL", "https://team.openai.azure.com/openai", 1);
    piianon::config::LlmConfig cfg;
    cfg.baseUrl = "${PIIANON_TEST_LLM_URL}";
    LlmClient azure(cfg);
    unsetenv("PIIANON_TEST_LLM_URL");
    EXPECT_TRUE(azure.isAzure());

    cfg.baseUrl = "http://localhost:8000/v1";
    LlmClient local(cfg);
    EXPECT_FALSE(local.isAzure());
}

TEST(LlmClientTest, UnreachableServerThrowsAfterRetries) {
    piianon::config::LlmConfig cfg;
    cfg.baseUrl = "http://127.0.0.1:1/v1";
    cfg.maxRetries = 1;
    cfg.timeoutSeconds = 2;
    LlmClient client(cfg, 1);
    EXPECT_THROW(client.complete("system", "text"), LlmError);
}

TEST(LlmSecondPassTest, ResultsKeepInputOrder) {
    auto backend = std::make_shared<ScriptedChatBackend>([](const std::string &text) {
        return "[{\"t\":\"PERSON\",\"v\":\"" + text.substr(text.find(' ') + 1) + "\"}]";
    });
    LlmDetector detector(backend, "");
    LlmSecondPass pass(detector, 4);

    std::vector<std::string> texts{"Hi Ann", "Hi Bob", "Hi Cy", "Hi Dee", "Hi Eve"};
    auto results = pass.detectBatch(texts);
    ASSERT_EQ(results.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        ASSERT_EQ(results[i].size(), (size_t)1);
        EXPECT_EQ(results[i][0].value(), texts[i].substr(3));
        EXPECT_EQ(results[i][0].start(), (size_t)3);
    }
}

TEST(LlmSecondPassTest, ConcurrencyIsBounded) {
    auto backend = replyWith("[]");
    backend->delay = std::chrono::milliseconds(20);
    LlmDetector detector(backend, "");
    LlmSecondPass pass(detector, 3);

    std::vector<std::string> texts(12, "plain text");
    pass.detectBatch(texts);
    EXPECT_EQ(backend->calls.load(), 12);
    EXPECT_LE(backend->maxInFlight.load(), 3);
    EXPECT_GE(backend->maxInFlight.load(), 1);
}

TEST(LlmSecondPassTest, SkippedAndFailingTextsGetEmptyLists) {
    auto backend = std::make_shared<ScriptedChatBackend>([](const std::string &text) -> std::string {
        if (text == "boom") {
            throw LlmError("scripted failure");
        }
        return "[{\"t\":\"PERSON\",\"v\":\"Ann\"}]";
    });
    LlmDetector detector(backend, "");
    LlmSecondPass pass(detector, 2);

    auto results = pass.detectBatch({"", "[EMAIL_REDACTED]", "boom", "Ask Ann"});
    ASSERT_EQ(results.size(), (size_t)4);
    EXPECT_TRUE(results[0].empty());
    EXPECT_TRUE(results[1].empty());
    EXPECT_TRUE(results[2].empty());
    ASSERT_EQ(results[3].size(), (size_t)1);
    EXPECT_EQ(results[3][0].value(), "Ann");
    EXPECT_EQ(backend->calls.load(), 2);
}
