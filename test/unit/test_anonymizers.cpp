// Unit tests for masking, redaction, hashing and replacement.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "anonymizers/anonymization_policy.hpp"
#include "anonymizers/anonymizer.hpp"
#include "anonymizers/masker.hpp"
#include "anonymizers/replacement_cache.hpp"
#include "config/pipeline_config.hpp"
#include "util/hashing.hpp"

using namespace piianon::anonymizers;
using piianon::core::Span;
using piianon::core::SpanSource;

namespace {

Span span(const std::string &category, const std::string &value, size_t start = 0)
{
    return Span(category, value, start, start + value.size(), 0.9, SpanSource::Rule);
}

AnonymizationPolicy policyFor(Strategy strategy)
{
    AnonymizationPolicy p;
    p.strategy = strategy;
    return p;
}

} // namespace

TEST(MaskerTest, Email) {
    Masker m(AnonymizationPolicy{});
    EXPECT_EQ(m.mask("EMAIL", "john@example.com"), "j***@example.com");
    EXPECT_EQ(m.mask("EMAIL", "j@x.com"), "j*@x.com");
    // no '@': generic masking
    EXPECT_EQ(m.mask("EMAIL", "john"), "j***");
}

TEST(MaskerTest, PhoneKeepsLeadingDigitsAndSeparators) {
    Masker m(AnonymizationPolicy{});
    EXPECT_EQ(m.mask("PHONE", "555-123-4567"), "555-***-****");
    EXPECT_EQ(m.mask("AU_PHONE_NUMBER", "0412 345 678"), "041* *** ***");
}

TEST(MaskerTest, SsnKeepsLastDigits) {
    Masker m(AnonymizationPolicy{});
    EXPECT_EQ(m.mask("SSN", "234-56-7890"), "***-**-7890");
    EXPECT_EQ(m.mask("SSN", "12-34"), "1****");
}

TEST(MaskerTest, CreditCardKeepsLastDigits) {
    Masker m(AnonymizationPolicy{});
    EXPECT_EQ(m.mask("CREDIT_CARD", "4111 1111 1111 1111"), "**** **** **** 1111");
    EXPECT_EQ(m.mask("CREDIT_CARD", "4111"), "4***");
}

TEST(MaskerTest, IpAddresses) {
    Masker m(AnonymizationPolicy{});
    EXPECT_EQ(m.mask("IP_ADDRESS", "192.168.10.20"), "192.168.***.***");
    EXPECT_EQ(m.mask("IP_ADDRESS", "2001:db8:0:0:0:0:0:1"), "2001:db8:****:0:1");
}

TEST(MaskerTest, GenericAndCustomMaskChar) {
    AnonymizationPolicy p;
    p.maskChar = '#';
    Masker m(p);
    EXPECT_EQ(m.mask("PERSON", "Sydney"), "S#####");
    EXPECT_EQ(m.mask("PERSON", "x"), "#");
}

TEST(MaskerTest, MasksWholeCodePoints) {
    Masker m(AnonymizationPolicy{});
    // "Émile": the two-byte É survives intact, four letters follow
    EXPECT_EQ(m.mask("PERSON", "\xC3\x89mile"), "\xC3\x89****");
    EXPECT_EQ(m.mask("PERSON", "\xC3\x89"), "*");
    EXPECT_EQ(m.mask("LOCATION", "Z\xC3\xBCrich"), "Z*****");
    EXPECT_EQ(m.mask("EMAIL", "\xC3\xA9lodie@example.com"), "\xC3\xA9*****@example.com");
}

TEST(AnonymizerTest, RedactIsTypeSpecificByDefault) {
    Anonymizer a(policyFor(Strategy::Redact));
    ReplacementCache cache;
    EXPECT_EQ(a.anonymize(span("EMAIL", "a@b.co"), cache), "[EMAIL_REDACTED]");

    AnonymizationPolicy plain = policyFor(Strategy::Redact);
    plain.redactTypeSpecific = false;
    plain.redactToken = "<gone>";
    Anonymizer b(plain);
    EXPECT_EQ(b.anonymize(span("EMAIL", "a@b.co"), cache), "<gone>");
}

TEST(AnonymizerTest, BatchSplicesFromTheEnd) {
    const std::string text = "Email a@b.co and c@d.co";
    Anonymizer a(policyFor(Strategy::Redact));
    ReplacementCache cache;
    std::string out = a.anonymizeBatch({span("EMAIL", "a@b.co", 6), span("EMAIL", "c@d.co", 17)}, text, cache);
    EXPECT_EQ(out, "Email [EMAIL_REDACTED] and [EMAIL_REDACTED]");
}

TEST(AnonymizerTest, BatchRejectsOverlapsAndOutOfRange) {
    const std::string text = "Email a@b.co";
    Anonymizer a(policyFor(Strategy::Redact));
    ReplacementCache cache;
    EXPECT_THROW(a.anonymizeBatch({span("EMAIL", "a@b.co", 6), Span("PERSON", "l a", 4, 7, 0.9, SpanSource::Rule)},
                                  text, cache),
                 std::invalid_argument);
    EXPECT_THROW(a.anonymizeBatch({Span("EMAIL", "x", 6, 40, 0.9, SpanSource::Rule)}, text, cache),
                 std::invalid_argument);
}

TEST(AnonymizerTest, HashIsSaltedTruncatedAndPrefixed) {
    AnonymizationPolicy p = policyFor(Strategy::Hash);
    p.hashSalt = "";
    Anonymizer a(p);
    ReplacementCache cache;
    EXPECT_EQ(a.anonymize(span("EMAIL", "abc"), cache), "EMAIL_ba7816bf");

    p.hashPrefix = false;
    p.hashTruncateLength = 0;
    Anonymizer full(p);
    ReplacementCache other;
    EXPECT_EQ(full.anonymize(span("EMAIL", "abc"), other),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    p.hashSalt = "pepper";
    Anonymizer salted(p);
    ReplacementCache third;
    EXPECT_NE(salted.anonymize(span("EMAIL", "abc"), third),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(AnonymizerTest, ReplaceIsConsistentWithinACache) {
    AnonymizationPolicy p = policyFor(Strategy::Replace);
    p.hasReplaceSeed = true;
    p.replaceSeed = 7;
    Anonymizer a(p);
    ReplacementCache cache;

    std::string first = a.anonymize(span("PERSON", "John Smith"), cache);
    std::string second = a.anonymize(span("PERSON", "John Smith", 30), cache);
    EXPECT_EQ(first, second);
    EXPECT_NE(first.find(' '), std::string::npos);
    EXPECT_EQ(cache.size(), (size_t)1);

    std::string email = a.anonymize(span("EMAIL", "someone@corp.example"), cache);
    ASSERT_GE(email.size(), std::string("@corp.example").size());
    EXPECT_EQ(email.substr(email.size() - 13), "@corp.example");
}

TEST(AnonymizerTest, ReplaceWithoutLocaleTablesUsesPlaceholder) {
    AnonymizationPolicy p = policyFor(Strategy::Replace);
    p.replaceLocale = "xx_XX";
    Anonymizer a(p);
    ReplacementCache cache;
    EXPECT_EQ(a.anonymize(span("PERSON", "John"), cache), "[PERSON_FAKE]");
}

TEST(AnonymizationPolicyTest, FromConfig) {
    piianon::config::AnonymizationConfig cfg;
    cfg.strategy = "MASK";
    cfg.maskChar = '#';
    cfg.hashAlgorithm = "whirlpool";
    AnonymizationPolicy p = AnonymizationPolicy::fromConfig(cfg);
    EXPECT_EQ(p.strategy, Strategy::Mask);
    EXPECT_EQ(p.maskChar, '#');
    EXPECT_EQ(p.hashAlgorithm, "sha256");
}

TEST(AnonymizationPolicyTest, UnknownStrategyFallsBackToRedact) {
    EXPECT_EQ(parseStrategy("shred"), Strategy::Redact);
    EXPECT_EQ(parseStrategy(" Hash "), Strategy::Hash);
    EXPECT_STREQ(strategyName(Strategy::Replace), "replace");
}

TEST(HashingTest, KnownDigests) {
    using piianon::util::hashing::hexDigest;
    EXPECT_EQ(hexDigest("abc", "sha256"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hexDigest("abc", "md5"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hexDigest("abc", "sha1"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_THROW(hexDigest("abc", "crc32"), std::invalid_argument);
}
