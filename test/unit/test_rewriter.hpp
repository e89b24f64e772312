#ifndef REDACTOR_TEST_UNIT_TEST_REWRITER_HPP
#define REDACTOR_TEST_UNIT_TEST_REWRITER_HPP

#include <gtest/gtest.h>
#include "engine/rewriter.hpp"

namespace {

using redactor::engine::Rewriter;
using redactor::engine::Secret;
using redactor::engine::SecretOrigin;

Secret secret(const std::string &text, const std::string &placeholder) {
    return Secret{text, "t", placeholder, SecretOrigin::Predefined};
}

TEST(RewriterTest, ReplacesEveryOccurrence) {
    Rewriter rewriter({secret("secretA", "x"), secret("secretB", "y")});
    EXPECT_EQ(rewriter.rewrite("secretA"), "x");
    EXPECT_EQ(rewriter.rewrite(" secretA"), " x");
    EXPECT_EQ(rewriter.rewrite("secretA "), "x ");
    EXPECT_EQ(rewriter.rewrite("secretAsecretA"), "xx");
    EXPECT_EQ(rewriter.rewrite("secretA secretA"), "x x");
    EXPECT_EQ(rewriter.rewrite("secretAsecretB"), "xy");
}

TEST(RewriterTest, LongestSecretWins) {
    Rewriter rewriter({secret("10.0.0.1", "ip0"), secret("10.0.0.10", "ip1")});
    EXPECT_EQ(rewriter.rewrite("10.0.0.10 and 10.0.0.1"), "ip1 and ip0");
}

TEST(RewriterTest, ConsumedSpansAreNotRevisited) {
    // "b" occurs inside "abc"; once "abc" is consumed it must not be split
    Rewriter rewriter({secret("b", "B"), secret("abc", "X")});
    EXPECT_EQ(rewriter.rewrite("abc b ab"), "X B aB");
}

TEST(RewriterTest, LongerSecretWinsAPartialOverlap) {
    // "abc" starts first but "bcdef" is longer and claims the shared bytes
    Rewriter rewriter({secret("abc", "SHORT"), secret("bcdef", "LONG")});
    EXPECT_EQ(rewriter.rewrite("abcdef"), "aLONG");
    EXPECT_EQ(rewriter.rewrite("abcdef abc"), "aLONG SHORT");
}

TEST(RewriterTest, ShorterSecretOverlappingTheTailIsSkipped) {
    Rewriter rewriter({secret("abcd", "L"), secret("cdx", "S")});
    EXPECT_EQ(rewriter.rewrite("abcdx"), "Lx");
    EXPECT_EQ(rewriter.rewrite("abcdx cdx"), "Lx S");
}

TEST(RewriterTest, SelfOverlappingOccurrencesAreConsumedLeftToRight) {
    Rewriter rewriter({secret("aa", "X")});
    EXPECT_EQ(rewriter.rewrite("aaa"), "Xa");
    EXPECT_EQ(rewriter.rewrite("aaaa"), "XX");
}

TEST(RewriterTest, LargeDocument) {
    Rewriter rewriter({secret("tok_secret", "token1"), secret("tok_secret_long", "token2")});
    std::string line = "prefix tok_secret_long middle tok_secret suffix\n";
    std::string expectedLine = "prefix token2 middle token1 suffix\n";
    std::string document;
    std::string expected;
    for (int i = 0; i < 20000; ++i) {
        document += line;
        expected += expectedLine;
    }
    EXPECT_EQ(rewriter.rewrite(document), expected);
}

TEST(RewriterTest, PlaceholdersAreNeverReMatched) {
    // the placeholder of "a" contains the secret "b"
    Rewriter rewriter({secret("a", "ab"), secret("b", "c")});
    EXPECT_EQ(rewriter.rewrite("a b"), "ab c");
}

TEST(RewriterTest, UnmatchedTextPassesThrough) {
    Rewriter rewriter({secret("needle", "N")});
    EXPECT_EQ(rewriter.rewrite(""), "");
    EXPECT_EQ(rewriter.rewrite("haystack\nneedl\n"), "haystack\nneedl\n");
    EXPECT_EQ(rewriter.rewrite("needle\n"), "N\n");
}

TEST(RewriterTest, EmptyRegistryIsIdentity) {
    Rewriter rewriter(std::vector<Secret>{});
    EXPECT_EQ(rewriter.rewrite("nothing to hide"), "nothing to hide");
}

} // anonymous namespace

#endif // REDACTOR_TEST_UNIT_TEST_REWRITER_HPP
