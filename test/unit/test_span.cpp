// Unit tests for core::Span and core::spanOver.

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>

#include "core/span.hpp"

using piianon::core::Span;
using piianon::core::SpanSource;
using piianon::core::spanOver;

TEST(SpanTest, HoldsItsFields) {
    Span s("EMAIL", "a@b.co", 4, 10, 0.9, SpanSource::Rule);
    EXPECT_EQ(s.category(), "EMAIL");
    EXPECT_EQ(s.value(), "a@b.co");
    EXPECT_EQ(s.start(), (size_t)4);
    EXPECT_EQ(s.end(), (size_t)10);
    EXPECT_EQ(s.length(), (size_t)6);
    EXPECT_DOUBLE_EQ(s.confidence(), 0.9);
    EXPECT_EQ(s.source(), SpanSource::Rule);
}

TEST(SpanTest, RejectsBadRanges) {
    EXPECT_THROW(Span("EMAIL", "", 5, 5, 0.5, SpanSource::Rule), std::invalid_argument);
    EXPECT_THROW(Span("EMAIL", "", 6, 5, 0.5, SpanSource::Rule), std::invalid_argument);
}

TEST(SpanTest, RejectsConfidenceOutsideUnitInterval) {
    EXPECT_THROW(Span("EMAIL", "x", 0, 1, 1.01, SpanSource::Rule), std::invalid_argument);
    EXPECT_THROW(Span("EMAIL", "x", 0, 1, -0.1, SpanSource::Rule), std::invalid_argument);
    EXPECT_THROW(Span("EMAIL", "x", 0, 1, std::numeric_limits<double>::quiet_NaN(), SpanSource::Rule),
                 std::invalid_argument);
    EXPECT_NO_THROW(Span("EMAIL", "x", 0, 1, 0.0, SpanSource::Rule));
    EXPECT_NO_THROW(Span("EMAIL", "x", 0, 1, 1.0, SpanSource::Rule));
}

TEST(SpanTest, RejectsEmptyCategory) {
    EXPECT_THROW(Span("", "x", 0, 1, 0.5, SpanSource::Rule), std::invalid_argument);
}

TEST(SpanTest, OverlapIsHalfOpen) {
    Span a("A", "hello", 0, 5, 0.5, SpanSource::Rule);
    Span b("B", "world", 5, 10, 0.5, SpanSource::Rule);
    Span c("C", "o w", 4, 7, 0.5, SpanSource::Rule);
    EXPECT_FALSE(a.overlaps(b));
    EXPECT_FALSE(b.overlaps(a));
    EXPECT_TRUE(a.overlaps(c));
    EXPECT_TRUE(c.overlaps(b));
}

TEST(SpanTest, SpanOverTakesValueFromText) {
    const std::string text = "Contact John Doe now";
    Span s = spanOver(text, "PERSON", 8, 16, 0.85, SpanSource::NerOracle);
    EXPECT_EQ(s.value(), "John Doe");
    EXPECT_THROW(spanOver(text, "PERSON", 8, 99, 0.85, SpanSource::NerOracle), std::invalid_argument);
}

TEST(SpanTest, WithCategoryKeepsPosition) {
    Span s("ORGANIZATION", "Sydney", 3, 9, 0.7, SpanSource::NerOracle);
    Span p = s.withCategory("PERSON");
    EXPECT_EQ(p.category(), "PERSON");
    EXPECT_EQ(p.start(), (size_t)3);
    EXPECT_EQ(p.value(), "Sydney");
    EXPECT_EQ(p.source(), SpanSource::NerOracle);
}
