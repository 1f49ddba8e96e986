// Unit tests for configuration layering and the small text utilities it relies on.

#include <gtest/gtest.h>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "anonymizers/replacement_cache.hpp"
#include "config/pipeline_config.hpp"
#include "test_helpers.hpp"
#include "util/config_parser.hpp"
#include "util/csv.hpp"
#include "util/string_utils.hpp"

using piianon::config::PipelineConfig;
using piianon::util::ConfigLayer;
using piianon::util::ConfigParser;

TEST(ConfigParserTest, ParseStreamSkipsCommentsAndBlankLines) {
    std::istringstream in(
        "# comment\n"
        "\n"
        "anonymization.strategy = mask\n"
        "  detection.entities = email, person \n"
        "# another comment\n");
    ConfigLayer layer = ConfigParser::parseStream(in);
    EXPECT_EQ(layer.size(), (size_t)2);
    EXPECT_EQ(layer["anonymization.strategy"], "mask");
    EXPECT_EQ(layer["detection.entities"], "email, person");
}

TEST(ConfigParserTest, ApplyLayerSetsTypedFields) {
    PipelineConfig cfg;
    ConfigParser parser(cfg);
    ConfigLayer layer{
        {"anonymization.strategy", "HASH"},
        {"anonymization.hash.truncate_length", "12"},
        {"anonymization.mask.char", "#"},
        {"anonymization.replace.seed", "42"},
        {"detection.entities", "email,person"},
        {"detection.confidence_threshold", "0.7"},
        {"detection.require_ner", "yes"},
        {"processing.workers", "3"},
        {"llm_detection.enabled", "true"},
        {"whitelist.domains", "Example.COM"},
        {"whitelist.patterns.0", "^test-[0-9]+$"},
        {"whitelist.patterns.1", "a,b"},
    };
    parser.applyLayer(layer);

    EXPECT_EQ(cfg.anonymization.strategy, "hash");
    EXPECT_EQ(cfg.anonymization.hashTruncateLength, 12u);
    EXPECT_EQ(cfg.anonymization.maskChar, '#');
    EXPECT_TRUE(cfg.anonymization.hasReplaceSeed);
    EXPECT_EQ(cfg.anonymization.replaceSeed, 42u);
    ASSERT_EQ(cfg.detection.entities.size(), (size_t)2);
    EXPECT_EQ(cfg.detection.entities[0], "EMAIL");
    EXPECT_EQ(cfg.detection.entities[1], "PERSON");
    EXPECT_DOUBLE_EQ(cfg.detection.confidenceThreshold, 0.7);
    EXPECT_TRUE(cfg.detection.requireNer);
    EXPECT_EQ(cfg.processing.workers, 3u);
    EXPECT_TRUE(cfg.llm.enabled);
    ASSERT_EQ(cfg.lists.whitelistDomains.size(), (size_t)1);
    EXPECT_EQ(cfg.lists.whitelistDomains[0], "example.com");
    ASSERT_EQ(cfg.lists.whitelistPatterns.size(), (size_t)2);
    EXPECT_EQ(cfg.lists.whitelistPatterns[1], "a,b");
}

// Bad values warn and leave the default in place
TEST(ConfigParserTest, InvalidValuesKeepDefaults) {
    PipelineConfig cfg;
    ConfigParser parser(cfg);
    parser.applyLayer({
        {"detection.confidence_threshold", "1.5"},
        {"anonymization.mask.char", "##"},
        {"processing.workers", "many"},
        {"processing.backup_original", "perhaps"},
        {"no.such.key", "1"},
    });
    PipelineConfig defaults;
    EXPECT_DOUBLE_EQ(cfg.detection.confidenceThreshold, defaults.detection.confidenceThreshold);
    EXPECT_EQ(cfg.anonymization.maskChar, '*');
    EXPECT_EQ(cfg.processing.workers, defaults.processing.workers);
    EXPECT_EQ(cfg.processing.backupOriginal, defaults.processing.backupOriginal);
}

TEST(ConfigParserTest, LaterLayersWin) {
    ConfigLayer merged{{"anonymization.strategy", "mask"}, {"logging.level", "INFO"}};
    piianon::util::mergeLayer(merged, ConfigLayer{{"anonymization.strategy", "hash"}});
    EXPECT_EQ(merged["anonymization.strategy"], "hash");
    EXPECT_EQ(merged["logging.level"], "INFO");
}

TEST(ConfigParserTest, EnvironmentLayer) {
    setenv("PII_ANONYMIZE_SALT", "pepper", 1);
    setenv("PII_ANONYMIZE_LOG_LEVEL", "DEBUG", 1);
    ConfigLayer env = ConfigParser::environmentLayer();
    unsetenv("PII_ANONYMIZE_SALT");
    unsetenv("PII_ANONYMIZE_LOG_LEVEL");

    EXPECT_EQ(env["anonymization.hash.salt"], "pepper");
    EXPECT_EQ(env["logging.level"], "DEBUG");
    EXPECT_TRUE(ConfigParser::environmentLayer().empty());
}

TEST(ConfigParserTest, FileLoading) {
    piianon::test::TempDir dir;
    const std::string path = dir.file("piianon.conf");
    piianon::test::writeText(path, "anonymization.strategy = replace\nprocessing.output_suffix = _clean\n");

    PipelineConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(path));
    EXPECT_EQ(cfg.anonymization.strategy, "replace");
    EXPECT_EQ(cfg.processing.outputSuffix, "_clean");

    bool found = true;
    ConfigLayer missing = ConfigParser::parseFile(dir.file("absent.conf"), &found);
    EXPECT_FALSE(found);
    EXPECT_TRUE(missing.empty());
}

TEST(StringUtilsTest, ExpandEnv) {
    setenv("PIIANON_TEST_HOST", "llm.local", 1);
    EXPECT_EQ(piianon::util::expandEnv("$PIIANON_TEST_HOST"), "llm.local");
    EXPECT_EQ(piianon::util::expandEnv("${PIIANON_TEST_HOST}"), "llm.local");
    EXPECT_EQ(piianon::util::expandEnv("https://${PIIANON_TEST_HOST}/api"), "https://llm.local/api");
    unsetenv("PIIANON_TEST_HOST");
    EXPECT_EQ(piianon::util::expandEnv("${PIIANON_TEST_HOST}"), "${PIIANON_TEST_HOST}");
    EXPECT_EQ(piianon::util::expandEnv("no variables"), "no variables");
}

TEST(StringUtilsTest, Lists) {
    std::vector<std::string> items = piianon::util::splitList(" a, b ,,c ");
    ASSERT_EQ(items.size(), (size_t)3);
    EXPECT_EQ(items[1], "b");
    EXPECT_EQ(piianon::util::join(items, "|"), "a|b|c");
    EXPECT_EQ(piianon::util::digitsOnly("+61 (04) 12-3"), "6104123");
}

TEST(CsvTest, ParsesQuotedFields) {
    auto records = piianon::util::csv::parse(
        "name,notes\r\n"
        "\"Smith, John\",\"said \"\"hi\"\"\"\n"
        "Jane,\"line one\nline two\"\n");
    ASSERT_EQ(records.size(), (size_t)3);
    EXPECT_EQ(records[1][0], "Smith, John");
    EXPECT_EQ(records[1][1], "said \"hi\"");
    EXPECT_EQ(records[2][1], "line one\nline two");
}

TEST(CsvTest, FormatsWithQuotingWhereNeeded) {
    EXPECT_EQ(piianon::util::csv::formatRecord({"plain", "a,b", "say \"x\""}),
              "plain,\"a,b\",\"say \"\"x\"\"\"\r\n");
    EXPECT_EQ(piianon::util::csv::quoteField("multi\nline"), "\"multi\nline\"");
}

TEST(CsvTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(piianon::util::csv::parse("a,\"open\n"), std::runtime_error);
}

TEST(ReplacementCacheTest, FactoryRunsOncePerKey) {
    piianon::anonymizers::ReplacementCache cache;
    int made = 0;
    auto factory = [&made]() { return "fake" + std::to_string(++made); };

    EXPECT_EQ(cache.getOrCreate("PERSON", "John", factory), "fake1");
    EXPECT_EQ(cache.getOrCreate("PERSON", "John", factory), "fake1");
    EXPECT_EQ(cache.getOrCreate("LOCATION", "John", factory), "fake2");
    EXPECT_EQ(cache.size(), (size_t)2);

    std::string out;
    EXPECT_TRUE(cache.lookup("PERSON", "John", out));
    EXPECT_EQ(out, "fake1");
    cache.clear();
    EXPECT_FALSE(cache.lookup("PERSON", "John", out));
}

TEST(ReplacementCacheTest, ConcurrentCallersShareOneValue) {
    piianon::anonymizers::ReplacementCache cache;
    std::atomic<int> made{0};
    std::vector<std::string> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i]() {
            seen[i] = cache.getOrCreate("EMAIL", "a@b.co", [&made]() {
                return "x" + std::to_string(made.fetch_add(1));
            });
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(made.load(), 1);
    for (const auto &s : seen) {
        EXPECT_EQ(s, "x0");
    }
}
