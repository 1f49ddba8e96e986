// Unit tests for the pipeline state machine, audit records and the NER oracle seam.

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/audit_log.hpp"
#include "core/audit_store.hpp"
#include "core/pipeline_state.hpp"
#include "detection/ner_oracle.hpp"
#include "detection/presidio_http_oracle.hpp"
#include "test_helpers.hpp"

using namespace piianon::core;

TEST(PipelineStateTest, SinglePassRun) {
    PipelineStateMachine sm;
    EXPECT_EQ(sm.state(), PipelineState::Idle);
    sm.advance(PipelineState::Normalizing);
    sm.advance(PipelineState::Detecting);
    sm.advance(PipelineState::Filtering);
    sm.advance(PipelineState::Reconciling);
    sm.advance(PipelineState::Anonymizing);
    sm.advance(PipelineState::Done);
    EXPECT_TRUE(isTerminal(sm.state()));
}

TEST(PipelineStateTest, SecondPassIsOnlyReachableAfterAnonymizing) {
    EXPECT_TRUE(isLegalTransition(PipelineState::Anonymizing, PipelineState::SecondPassDetecting));
    EXPECT_TRUE(isLegalTransition(PipelineState::SecondPassDetecting, PipelineState::SecondPassAnonymizing));
    EXPECT_TRUE(isLegalTransition(PipelineState::SecondPassAnonymizing, PipelineState::Done));
    EXPECT_FALSE(isLegalTransition(PipelineState::Reconciling, PipelineState::SecondPassDetecting));
    EXPECT_FALSE(isLegalTransition(PipelineState::SecondPassDetecting, PipelineState::Done));
}

TEST(PipelineStateTest, IllegalTransitionsThrow) {
    PipelineStateMachine sm;
    EXPECT_THROW(sm.advance(PipelineState::Detecting), std::logic_error);
    EXPECT_EQ(sm.state(), PipelineState::Idle);

    PipelineStateMachine done(PipelineState::Done);
    EXPECT_THROW(done.advance(PipelineState::Normalizing), std::logic_error);
    EXPECT_THROW(done.fail(), std::logic_error);
}

TEST(PipelineStateTest, AnyLiveStateCanFail) {
    for (PipelineState s : {PipelineState::Idle, PipelineState::Detecting, PipelineState::Anonymizing,
                            PipelineState::SecondPassAnonymizing})
    {
        PipelineStateMachine sm(s);
        sm.fail();
        EXPECT_EQ(sm.state(), PipelineState::Failed);
    }
    EXPECT_STREQ(stateName(PipelineState::SecondPassDetecting), "SecondPassDetecting");
}

TEST(AuditLogTest, TrailJsonNeverCarriesValues) {
    AuditTrail trail("mask");
    AuditEntry e;
    e.category = "EMAIL";
    e.position = 20;
    e.strategy = "mask";
    e.timestamp = isoUtcNow();
    trail.append(e);
    e.pass = 2;
    e.category = "PERSON";
    trail.append(std::vector<AuditEntry>{e});

    auto json = trail.toJson();
    EXPECT_EQ(json["strategy"], "mask");
    EXPECT_EQ(json["total_anonymized"], 2);
    ASSERT_EQ(json["entries"].size(), (size_t)2);
    EXPECT_EQ(json["entries"][0]["pii_type"], "EMAIL");
    EXPECT_EQ(json["entries"][0]["position"], 20);
    EXPECT_EQ(json["entries"][1]["pass"], 2);
    EXPECT_FALSE(json["entries"][0].contains("value"));
}

TEST(AuditLogTest, IsoTimestamp) {
    const std::string ts = isoUtcNow();
    ASSERT_EQ(ts.size(), (size_t)20);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}

TEST(AuditStoreTest, RecordsAndCounts) {
    piianon::test::TempDir dir;
    AuditStore store(dir.file("audit.db"));

    AuditEntry e;
    e.category = "EMAIL";
    e.position = 3;
    e.strategy = "redact";
    e.timestamp = isoUtcNow();

    EXPECT_EQ(store.count(), 0);
    ASSERT_TRUE(store.record("a.txt", {e, e}));
    ASSERT_TRUE(store.record("b.txt", {e}));
    EXPECT_EQ(store.count(), 3);
    EXPECT_EQ(store.count("a.txt"), 2);
    EXPECT_EQ(store.count("missing.txt"), 0);
}

TEST(AuditStoreTest, UnwritablePathFails) {
    AuditStore store("/nonexistent-piianon-dir/sub/audit.db");
    EXPECT_FALSE(store.record("a.txt", {}));
    EXPECT_EQ(store.count(), -1);
}

TEST(NerDetectorTest, MapsLabelsAndDropsBadResults) {
    using piianon::detection::OracleSpan;
    auto oracle = std::make_shared<piianon::test::ScriptedNerOracle>(std::vector<OracleSpan>{
        {0, 4, "PER", 0.9},
        {8, 14, "GPE", 0.3},
        {5, 99, "ORG", 0.9},
    });
    piianon::detection::NerDetector detector(oracle, "en", 0.5);

    auto spans = detector.detect("Anna in Sydney");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].category(), "PERSON");
    EXPECT_EQ(spans[0].value(), "Anna");
    EXPECT_EQ(spans[0].source(), SpanSource::NerOracle);

    oracle->failing = true;
    EXPECT_THROW(detector.detect("Anna"), piianon::detection::OracleError);
}

TEST(PresidioOracleTest, CodePointOffsets) {
    // "é" is two bytes, "€" three
    auto offsets = piianon::util::codePointByteOffsets("a\xC3\xA9\xE2\x82\xAC" "b");
    ASSERT_EQ(offsets.size(), (size_t)5);
    EXPECT_EQ(offsets[0], (size_t)0);
    EXPECT_EQ(offsets[1], (size_t)1);
    EXPECT_EQ(offsets[2], (size_t)3);
    EXPECT_EQ(offsets[3], (size_t)6);
    EXPECT_EQ(offsets[4], (size_t)7);
}

TEST(PresidioOracleTest, ParsesReplyAndSkipsMistypedItems) {
    using piianon::detection::PresidioHttpOracle;
    const std::string text = "Anna met \xC3\x89mile";
    const std::string body = R"([
        {"entity_type": "PERSON", "start": 0, "end": 4, "score": 0.85},
        {"entity_type": "PERSON", "start": 9, "end": 14, "score": "high"},
        {"entity_type": "PERSON", "start": "9", "end": 14, "score": 0.9},
        {"entity_type": "PERSON", "start": 9, "end": 14}
    ])";

    auto spans = PresidioHttpOracle::parseAnalyzeResponse(body, text);
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0].start, (size_t)0);
    EXPECT_EQ(spans[0].end, (size_t)4);
    EXPECT_DOUBLE_EQ(spans[0].score, 0.85);
    // code points 9..14 cover the six bytes of "Émile"
    EXPECT_EQ(spans[1].start, (size_t)9);
    EXPECT_EQ(spans[1].end, (size_t)15);
    EXPECT_DOUBLE_EQ(spans[1].score, 0.0);

    EXPECT_THROW(PresidioHttpOracle::parseAnalyzeResponse("{\"error\": 1}", text), piianon::detection::OracleError);
    EXPECT_THROW(PresidioHttpOracle::parseAnalyzeResponse("not json", text), piianon::detection::OracleError);
}

TEST(PresidioOracleTest, UnreachableEndpointThrows) {
    piianon::detection::PresidioHttpOracle oracle("http://127.0.0.1:1", 2);
    EXPECT_THROW(oracle.analyze("John Smith", "en", 0.5), piianon::detection::OracleError);
}
