#include <gtest/gtest.h>

#include <sstream>

#include "batch.hpp"

using namespace regexcc;

namespace {
    const std::vector<std::pair<std::string, bool>> ABB_CASES{
            {"abb", true}, {"abba", true}, {"abbb", true}, {"aabb", true}, {"babb", true},
            {"ababa", false}, {"abab", false}, {"aa", false}, {"bb", false}, {"", false},
            {"abbabb", true}, {"babbaaaa", true}, {"aabbbaaa", true}, {"aabaa", false},
    };
}

TEST(BatchTest, CompileExpressionWithWord) {
    CompilationReport report = compileExpression("(a|b)*abb(a|b)*", std::string("babbaaaa"));

    ASSERT_TRUE(report.compiled);
    EXPECT_FALSE(report.errorKind.has_value());
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(report.minimalStates, 4u);
    EXPECT_GE(report.dfaStates, report.minimalStates);
    EXPECT_GT(report.nfaStates, 0u);
    ASSERT_TRUE(report.verdict.has_value());
    EXPECT_TRUE(report.verdict->consistent());
    EXPECT_TRUE(report.verdict->accepted());

    std::stringstream ss;
    report.reportTo(ss, false);
    EXPECT_NE(ss.str().find("all automata agree"), std::string::npos);
    EXPECT_NE(ss.str().find("result: 'babbaaaa' belongs to the language of '(a|b)*abb(a|b)*'"), std::string::npos);
}

TEST(BatchTest, CompileExpressionRejectedWord) {
    CompilationReport report = compileExpression("ab+c", std::string("ac"));
    ASSERT_TRUE(report.verdict.has_value());
    EXPECT_FALSE(report.verdict->accepted());

    std::stringstream ss;
    report.reportTo(ss, false);
    EXPECT_NE(ss.str().find("'ac' does not belong to"), std::string::npos);
}

TEST(BatchTest, CompileExpressionWithoutWord) {
    CompilationReport report = compileExpression("a*");
    EXPECT_TRUE(report.compiled);
    EXPECT_FALSE(report.verdict.has_value());
    EXPECT_EQ(report.minimalStates, 1u);

    std::stringstream ss;
    report.reportTo(ss, false);
    EXPECT_EQ(ss.str().find("result:"), std::string::npos);
}

TEST(BatchTest, FailedExpressionBecomesReport) {
    std::stringstream trace;
    RegexOptions options;
    options.trace = &trace;

    CompilationReport report = compileExpression("a|", std::nullopt, options);
    EXPECT_FALSE(report.compiled);
    ASSERT_TRUE(report.errorKind.has_value());
    EXPECT_EQ(*report.errorKind, RegexError::Kind::STACK_UNDERFLOW);
    EXPECT_NE(report.errorMessage.find("'a|'"), std::string::npos);
    EXPECT_NE(trace.str().find("[regex] error:"), std::string::npos);

    std::stringstream ss;
    report.reportTo(ss, false);
    EXPECT_NE(ss.str().find("regexcc: Error: "), std::string::npos);
    EXPECT_NE(ss.str().find("[StackUnderflow]"), std::string::npos);
}

TEST(BatchTest, BatchContinuesAfterFailure) {
    BatchSummary summary = compileBatch({
            {"a", std::string("a")},
            {"(a", std::nullopt},
            {"(a|b)*abb", std::string("aabb")},
    });

    ASSERT_EQ(summary.total(), 3u);
    EXPECT_EQ(summary.succeeded(), 2u);
    EXPECT_TRUE(summary.reports[0].verdict->accepted());
    EXPECT_EQ(*summary.reports[1].errorKind, RegexError::Kind::MALFORMED_EXPRESSION);
    EXPECT_TRUE(summary.reports[2].verdict->accepted());

    std::stringstream ss;
    summary.reportTo(ss, false);
    EXPECT_NE(ss.str().find("=== Expr #2 ==="), std::string::npos);
    EXPECT_NE(ss.str().find("Summary: 2/3 expressions processed successfully"), std::string::npos);
}

TEST(BatchTest, ColorfulReportUsesEscapes) {
    std::stringstream ss;
    compileExpression("*").reportTo(ss, true);
    EXPECT_NE(ss.str().find("\033[31mError\033[0m"), std::string::npos);
}

TEST(BatchTest, CrossTable) {
    CrossTable table = crossTest({"a*", "b", "(a"}, {"aa", "b"});

    ASSERT_EQ(table.cells.size(), 3u);
    EXPECT_EQ(table.cells[0], (std::vector<std::optional<bool>>{true, false}));
    EXPECT_EQ(table.cells[1], (std::vector<std::optional<bool>>{false, true}));
    EXPECT_EQ(table.cells[2], (std::vector<std::optional<bool>>{std::nullopt, std::nullopt}));
    ASSERT_EQ(table.errors.size(), 1u);
    EXPECT_NE(table.errors[0].find("'(a'"), std::string::npos);
    EXPECT_EQ(table.acceptedCount(), 2u);

    std::stringstream ss;
    table.reportTo(ss);
    EXPECT_NE(ss.str().find("error"), std::string::npos);
    EXPECT_NE(ss.str().find("accepted 2/6 combinations"), std::string::npos);
}

TEST(BatchTest, VerifyCasesFindsNoMismatch) {
    Regex regex("(a|b)*abb(a|b)*");
    EXPECT_TRUE(verifyCases(regex, ABB_CASES).empty());
}

TEST(BatchTest, VerifyCasesReportsWrongExpectation) {
    Regex regex("(a|b)*abb(a|b)*");
    std::vector<CaseMismatch> mismatches = verifyCases(regex, {{"abb", false}, {"ab", false}});

    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].word, "abb");
    EXPECT_FALSE(mismatches[0].expected);
    EXPECT_TRUE(mismatches[0].verdict.nfa);
    EXPECT_TRUE(mismatches[0].verdict.consistent());
}
