// Unit tests for detection::SpanReconciler.

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "detection/span_reconciler.hpp"

using piianon::core::Span;
using piianon::core::SpanSource;
using piianon::detection::SpanReconciler;

namespace {

Span make(const std::string &category, size_t start, size_t end, double conf,
          SpanSource source = SpanSource::Rule)
{
    return Span(category, std::string(end - start, 'x'), start, end, conf, source);
}

} // namespace

TEST(SpanReconcilerTest, HigherConfidenceWinsOverlap) {
    auto out = SpanReconciler::reconcile({make("EMAIL", 0, 17, 0.7), make("PERSON", 0, 10, 0.9)});
    ASSERT_EQ(out.size(), (size_t)1);
    EXPECT_EQ(out[0].category(), "PERSON");
}

TEST(SpanReconcilerTest, EqualConfidenceLongerWins) {
    auto out = SpanReconciler::reconcile({make("PHONE", 5, 12, 0.8), make("AU_PHONE_NUMBER", 3, 15, 0.8)});
    ASSERT_EQ(out.size(), (size_t)1);
    EXPECT_EQ(out[0].category(), "AU_PHONE_NUMBER");
}

TEST(SpanReconcilerTest, DeduplicatesByPositionAndCategory) {
    auto out = SpanReconciler::reconcile({
        make("EMAIL", 0, 7, 0.6, SpanSource::Rule),
        make("EMAIL", 0, 7, 0.9, SpanSource::NerOracle),
    });
    ASSERT_EQ(out.size(), (size_t)1);
    EXPECT_DOUBLE_EQ(out[0].confidence(), 0.9);
    EXPECT_EQ(out[0].source(), SpanSource::NerOracle);
}

TEST(SpanReconcilerTest, DedupTieGoesToLowerSource) {
    auto out = SpanReconciler::deduplicate({
        make("EMAIL", 0, 7, 0.8, SpanSource::LlmOracle),
        make("EMAIL", 0, 7, 0.8, SpanSource::Rule),
    });
    ASSERT_EQ(out.size(), (size_t)1);
    EXPECT_EQ(out[0].source(), SpanSource::Rule);
}

TEST(SpanReconcilerTest, KeepsDisjointSpansSorted) {
    auto out = SpanReconciler::reconcile({make("B", 10, 12, 0.5), make("A", 0, 5, 0.5), make("C", 5, 10, 0.5)});
    ASSERT_EQ(out.size(), (size_t)3);
    EXPECT_EQ(out[0].start(), (size_t)0);
    EXPECT_EQ(out[1].start(), (size_t)5);
    EXPECT_EQ(out[2].start(), (size_t)10);
}

TEST(SpanReconcilerTest, ResultDoesNotDependOnInputOrder) {
    std::vector<Span> spans = {
        make("PERSON", 0, 8, 0.85), make("EMAIL", 4, 20, 0.9), make("PHONE", 18, 30, 0.6),
        make("PHONE", 25, 30, 0.95), make("LOCATION", 40, 46, 0.5),
    };
    auto forward = SpanReconciler::reconcile(spans);
    std::reverse(spans.begin(), spans.end());
    auto backward = SpanReconciler::reconcile(spans);

    ASSERT_EQ(forward.size(), backward.size());
    for (size_t i = 0; i < forward.size(); ++i) {
        EXPECT_EQ(forward[i].category(), backward[i].category());
        EXPECT_EQ(forward[i].start(), backward[i].start());
        EXPECT_EQ(forward[i].end(), backward[i].end());
    }
    for (size_t i = 1; i < forward.size(); ++i) {
        EXPECT_FALSE(forward[i].overlaps(forward[i - 1]));
    }
}

TEST(SpanReconcilerTest, EmptyInput) {
    EXPECT_TRUE(SpanReconciler::reconcile({}).empty());
}
