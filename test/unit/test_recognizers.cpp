// Unit tests for the rule-based recognizers: built-in rules, checksum
// promotion, context boost and the category allow-list.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "recognizers/pattern_recognizer_set.hpp"
#include "recognizers/recognizer_rule.hpp"

using namespace piianon::recognizers;
using piianon::core::Span;

namespace {

const Span* findCategory(const std::vector<Span> &spans, const std::string &category)
{
    for (const auto &s : spans) {
        if (s.category() == category) {
            return &s;
        }
    }
    return nullptr;
}

std::shared_ptr<const RuleTable> testIdTable()
{
    return compileRules({
        RuleDefinition{"TEST_ID", {PatternSpec{"id", R"(\bX\d{4}\b)", 0.3, 0, false}},
                       {"ref", "ph"}, ValidatorKind::None}
    });
}

} // namespace

TEST(PatternRecognizerSetTest, FindsEmail) {
    PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{});
    auto spans = rules.detect("Contact john.doe@company.com today");
    const Span *email = findCategory(spans, "EMAIL");
    ASSERT_NE(email, nullptr);
    EXPECT_EQ(email->value(), "john.doe@company.com");
    EXPECT_EQ(email->start(), (size_t)8);
}

TEST(PatternRecognizerSetTest, AustralianMobileWithContext) {
    PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{});
    auto spans = rules.detect("Call me on 0412 345 678");
    const Span *phone = nullptr;
    for (const auto &s : spans) {
        if (s.category() == "AU_PHONE_NUMBER" && s.value() == "0412 345 678") {
            phone = &s;
        }
    }
    ASSERT_NE(phone, nullptr);
    EXPECT_EQ(phone->start(), (size_t)11);
    EXPECT_DOUBLE_EQ(phone->confidence(), 1.0);
}

TEST(PatternRecognizerSetTest, LuhnDecidesCreditCards) {
    PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{});

    auto valid = rules.detect("Card 4111 1111 1111 1111");
    const Span *card = findCategory(valid, "CREDIT_CARD");
    ASSERT_NE(card, nullptr);
    EXPECT_EQ(card->value(), "4111 1111 1111 1111");
    EXPECT_DOUBLE_EQ(card->confidence(), 1.0);

    auto invalid = rules.detect("Card 4111 1111 1111 1112");
    EXPECT_EQ(findCategory(invalid, "CREDIT_CARD"), nullptr);
}

TEST(PatternRecognizerSetTest, TaxFileNumberChecksum) {
    PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{});
    auto spans = rules.detect("TFN 123 456 782");
    const Span *tfn = findCategory(spans, "AU_TFN");
    ASSERT_NE(tfn, nullptr);
    EXPECT_EQ(tfn->value(), "123 456 782");
    EXPECT_DOUBLE_EQ(tfn->confidence(), 1.0);
}

TEST(PatternRecognizerSetTest, CaptureGroupReportsOnlyTheIdentifier) {
    PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{});
    auto spans = rules.detect("DOB: 12/03/1985");
    bool found = false;
    for (const auto &s : spans) {
        if (s.category() == "DATE_OF_BIRTH") {
            EXPECT_EQ(s.value(), "12/03/1985");
            EXPECT_EQ(s.start(), (size_t)5);
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST(PatternRecognizerSetTest, AllowListRestrictsRules) {
    PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{}, {"EMAIL"});
    auto spans = rules.detect("a@b.com or 0412 345 678");
    ASSERT_FALSE(spans.empty());
    for (const auto &s : spans) {
        EXPECT_EQ(s.category(), "EMAIL");
    }
}

TEST(PatternRecognizerSetTest, ContextKeywordBoostsScore) {
    PatternRecognizerSet rules(testIdTable(), ContextSettings{});

    auto plain = rules.detect("X1234");
    ASSERT_EQ(plain.size(), (size_t)1);
    EXPECT_NEAR(plain[0].confidence(), 0.3, 1e-9);

    auto boosted = rules.detect("ref X1234");
    ASSERT_EQ(boosted.size(), (size_t)1);
    EXPECT_NEAR(boosted[0].confidence(), 0.65, 1e-9);
}

TEST(PatternRecognizerSetTest, ContextKeywordsMatchWholeWords) {
    PatternRecognizerSet rules(testIdTable(), ContextSettings{});
    auto spans = rules.detect("graph X1234");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_NEAR(spans[0].confidence(), 0.3, 1e-9);
}

TEST(PatternRecognizerSetTest, ContextWindowLimitsLookBehind) {
    PatternRecognizerSet rules(testIdTable(), ContextSettings{0.35, 0.4, 5});
    auto spans = rules.detect("ref is here X1234");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_NEAR(spans[0].confidence(), 0.3, 1e-9);
}

TEST(PatternRecognizerSetTest, ContextRaisesToMinimumScore) {
    PatternRecognizerSet rules(testIdTable(), ContextSettings{0.05, 0.4, 50});
    auto spans = rules.detect("ref X1234");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_NEAR(spans[0].confidence(), 0.4, 1e-9);
}

TEST(PatternRecognizerSetTest, EmptyTextYieldsNothing) {
    PatternRecognizerSet rules(builtinRuleTable(), ContextSettings{});
    EXPECT_TRUE(rules.detect("").empty());
}

TEST(PatternRecognizerSetTest, LongEncodedTokenIsScannedSafely) {
    std::string blob;
    const std::string chunk = "QUJDREVGR0hJSktMTU5PUFFSU1RVVldYWVo0MTIzNDU2Nzg5+abc";
    while (blob.size() < 100000) {
        blob += chunk;
    }
    const std::string text = "attachment " + blob + " from 12 " + std::string(100000, 'x') +
                             " reply to jo@example.org";

    PatternRecognizerSet emailOnly(builtinRuleTable(), ContextSettings{}, {"EMAIL"});
    auto spans = emailOnly.detect(text);
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].value(), "jo@example.org");

    PatternRecognizerSet all(builtinRuleTable(), ContextSettings{});
    EXPECT_NE(findCategory(all.detect(text), "EMAIL"), nullptr);
}

TEST(RecognizerRuleTest, RejectsBrokenDefinitions) {
    EXPECT_THROW(compileRules({RuleDefinition{"BAD", {PatternSpec{"bad", "(", 0.5, 0, false}}, {},
                                              ValidatorKind::None}}),
                 std::invalid_argument);
    EXPECT_THROW(compileRules({RuleDefinition{"BAD", {PatternSpec{"score", "x", 1.5, 0, false}}, {},
                                              ValidatorKind::None}}),
                 std::invalid_argument);
    EXPECT_THROW(compileRules({RuleDefinition{"BAD", {PatternSpec{"group", "x", 0.5, 2, false}}, {},
                                              ValidatorKind::None}}),
                 std::invalid_argument);
}

TEST(RecognizerRuleTest, BuiltinTableIsShared) {
    EXPECT_EQ(builtinRuleTable().get(), builtinRuleTable().get());
    EXPECT_FALSE(builtinRuleTable()->empty());
}
