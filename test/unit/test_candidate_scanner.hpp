#ifndef REDACTOR_TEST_UNIT_TEST_CANDIDATE_SCANNER_HPP
#define REDACTOR_TEST_UNIT_TEST_CANDIDATE_SCANNER_HPP

#include <gtest/gtest.h>
#include "engine/candidate_scanner.hpp"
#include "test_helpers.hpp"

namespace {

using redactor::catalog::ConfigurationError;
using redactor::catalog::PatternRule;
using redactor::engine::scanDocument;
using redactor::engine::scanSecretType;
using redactor::test::makeSecretType;

TEST(PatternRuleTest, WholeMatchWithoutGroup) {
    PatternRule rule(R"(\d+\.\d+\.\d+\.\d+)");
    EXPECT_FALSE(rule.hasCaptureGroup());
}

TEST(PatternRuleTest, RejectsMoreThanOneGroup) {
    EXPECT_THROW(PatternRule(R"((\w+)@(\w+))"), ConfigurationError);
}

TEST(PatternRuleTest, NonCapturingGroupsDoNotCount) {
    PatternRule rule(R"re(user "(.+)": login (?:successful|failed))re");
    EXPECT_TRUE(rule.hasCaptureGroup());
}

TEST(PatternRuleTest, RejectsInvalidExpression) {
    EXPECT_THROW(PatternRule("(unclosed"), ConfigurationError);
}

TEST(CandidateScannerTest, CapturedGroupIsTheCandidate) {
    auto type = makeSecretType("username", {R"re(user "(.+)": login (?:successful|failed))re"});
    auto found = scanSecretType(type, "user \"alice\": login successful ... alice said hi");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].text, "alice");
    EXPECT_EQ(found[0].position, 6u);
    EXPECT_EQ(found[0].secretType, &type);
}

TEST(CandidateScannerTest, RuleOrderThenLeftToRight) {
    auto type = makeSecretType("t", {"b\\d", "a\\d"});
    auto found = scanSecretType(type, "a1 b1 a2 b2");
    ASSERT_EQ(found.size(), 4u);
    EXPECT_EQ(found[0].text, "b1");
    EXPECT_EQ(found[1].text, "b2");
    EXPECT_EQ(found[2].text, "a1");
    EXPECT_EQ(found[3].text, "a2");
    EXPECT_EQ(found[0].rule, &type.patterns[0]);
    EXPECT_EQ(found[2].rule, &type.patterns[1]);
}

TEST(CandidateScannerTest, DuplicatesAreKept) {
    auto type = makeSecretType("ip", {R"(\d+\.\d+\.\d+\.\d+)", R"(called (\S+))"});
    auto found = scanSecretType(type, "10.10.0.3 called 10.10.0.3");
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].text, "10.10.0.3");
    EXPECT_EQ(found[1].text, "10.10.0.3");
    EXPECT_EQ(found[2].text, "10.10.0.3");
}

TEST(CandidateScannerTest, EmptyCandidatesAreDropped) {
    auto type = makeSecretType("t", {"x*"});
    auto found = scanSecretType(type, "ab xx c");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].text, "xx");
}

TEST(CandidateScannerTest, DollarAnchorsAtEndOfEachLine) {
    auto type = makeSecretType("secret", {R"re(using password "(.+)"$)re"});
    auto found = scanSecretType(type,
        "using password \"one\"\nusing password \"two\" later\nusing password \"three\"\n");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].text, "one");
    EXPECT_EQ(found[1].text, "three");
}

TEST(CandidateScannerTest, OverlongLineIsSkipped) {
    auto type = makeSecretType("username", {R"re(user "(.+)": login (?:successful|failed))re"});
    std::string document = "user \"" + std::string(50000, 'x') + "\": login failed\n"
                           "user \"bob\": login successful\n";
    size_t warnings = redactor::util::logger::messageCount(redactor::util::logger::LogLevel::WARN);
    auto found = scanSecretType(type, document);
    EXPECT_EQ(redactor::util::logger::messageCount(redactor::util::logger::LogLevel::WARN), warnings + 1);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].text, "bob");
    EXPECT_EQ(found[0].position, document.find("bob"));
}

TEST(CandidateScannerTest, LineLimitIsConfigurable) {
    auto type = makeSecretType("token", {R"(tok_\w+)"});
    std::string document = "padding padding tok_abc\ntok_def\n";
    auto limited = scanSecretType(type, document, 10);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].text, "tok_def");
    EXPECT_EQ(limited[0].position, 24u);
    EXPECT_EQ(scanSecretType(type, document, 0).size(), 2u);
}

TEST(CandidateScannerTest, ManyLinesWithPositionsInDocument) {
    auto type = makeSecretType("ip", {R"(\d+\.\d+\.\d+\.\d+)"});
    std::string document;
    for (int i = 0; i < 5000; ++i) {
        document += "client 10.0.0." + std::to_string(i % 250) + " connected\n";
    }
    auto found = scanSecretType(type, document);
    ASSERT_EQ(found.size(), 5000u);
    EXPECT_EQ(document.compare(found[4999].position, found[4999].text.size(), found[4999].text), 0);
}

TEST(CandidateScannerTest, MatchesNeverSpanLines) {
    auto type = makeSecretType("pair", {R"(key\s+(\w+))"});
    auto found = scanSecretType(type, "key\nvalue\nkey  other\n");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].text, "other");
}

TEST(CandidateScannerTest, CatalogOrderAcrossTypes) {
    redactor::catalog::Catalog catalog;
    catalog.push_back(makeSecretType("host", {R"(\w+\.example)"}));
    catalog.push_back(makeSecretType("user", {R"(by (\w+))"}));
    auto found = scanDocument(catalog, "by bob on db.example");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].secretType->name, "host");
    EXPECT_EQ(found[0].text, "db.example");
    EXPECT_EQ(found[1].secretType->name, "user");
    EXPECT_EQ(found[1].text, "bob");
}

} // anonymous namespace

#endif // REDACTOR_TEST_UNIT_TEST_CANDIDATE_SCANNER_HPP
