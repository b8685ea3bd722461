#include <gtest/gtest.h>

#include "thompson.hpp"

using namespace regexcc;

using Transitions = std::vector<NondeterministicAutomaton::Transition>;

namespace {
    NondeterministicAutomaton compileRaw(std::string_view expression) {
        return thompsonConstruct(*buildSyntaxTree(toPostfix(regexTokenize(expression))));
    }
}

TEST(ThompsonTest, LiteralIsOneEdge) {
    NondeterministicAutomaton nfa = compileRaw("a");
    EXPECT_EQ(nfa.startSingleState(), 1u);
    EXPECT_EQ(nfa.stopSingleState(), 2u);
    EXPECT_EQ(nfa.transitionsFrom(1), (Transitions{{'a', 2}}));
    EXPECT_TRUE(nfa.transitionsFrom(2).empty());
}

TEST(ThompsonTest, ConcatenationLinksAcceptToStart) {
    NondeterministicAutomaton nfa = compileRaw("ab");
    EXPECT_EQ(nfa.startSingleState(), 1u);
    EXPECT_EQ(nfa.stopSingleState(), 4u);
    EXPECT_EQ(nfa.transitionsFrom(2), (Transitions{{EPS, 3}}));
    EXPECT_EQ(nfa.transitionsFrom(3), (Transitions{{'b', 4}}));
}

TEST(ThompsonTest, AlternationAddsForkAndJoin) {
    NondeterministicAutomaton nfa = compileRaw("a|b");
    EXPECT_EQ(nfa.startSingleState(), 5u);
    EXPECT_EQ(nfa.stopSingleState(), 6u);
    EXPECT_EQ(nfa.transitionsFrom(5), (Transitions{{EPS, 1}, {EPS, 3}}));
    EXPECT_EQ(nfa.transitionsFrom(2), (Transitions{{EPS, 6}}));
    EXPECT_EQ(nfa.transitionsFrom(4), (Transitions{{EPS, 6}}));
}

TEST(ThompsonTest, StarLoopsBackAndSkips) {
    NondeterministicAutomaton nfa = compileRaw("a*");
    EXPECT_EQ(nfa.startSingleState(), 3u);
    EXPECT_EQ(nfa.stopSingleState(), 4u);
    EXPECT_EQ(nfa.transitionsFrom(3), (Transitions{{EPS, 1}, {EPS, 4}}));
    EXPECT_EQ(nfa.transitionsFrom(2), (Transitions{{EPS, 1}, {EPS, 4}}));
}

TEST(ThompsonTest, OptionalSkipsWithoutLoop) {
    ThompsonCompiler compiler;
    SyntaxTree::Ptr tree = SyntaxTree::unary('?', SyntaxTree::leaf(RegexToken("a")));
    NondeterministicAutomaton nfa = compiler.compile(*tree);
    EXPECT_EQ(nfa.startSingleState(), 3u);
    EXPECT_EQ(nfa.stopSingleState(), 4u);
    EXPECT_EQ(nfa.transitionsFrom(3), (Transitions{{EPS, 1}, {EPS, 4}}));
    EXPECT_EQ(nfa.transitionsFrom(2), (Transitions{{EPS, 4}}));
}

TEST(ThompsonTest, PlusIsConcatenationWithStar) {
    ThompsonCompiler compiler;
    SyntaxTree::Ptr tree = SyntaxTree::unary('+', SyntaxTree::leaf(RegexToken("a")));
    NondeterministicAutomaton nfa = compiler.compile(*tree);

    EXPECT_EQ(compiler.allocatedStates(), 6u);
    EXPECT_EQ(nfa.startSingleState(), 1u);
    EXPECT_EQ(nfa.stopSingleState(), 6u);
    EXPECT_EQ(nfa.transitionsFrom(2), (Transitions{{EPS, 5}}));
    EXPECT_EQ(nfa.transitionsFrom(5), (Transitions{{EPS, 3}, {EPS, 6}}));
    EXPECT_TRUE(nfa.accepts("aaa"));
    EXPECT_FALSE(nfa.accepts(""));
}

TEST(ThompsonTest, EscapedAndEmptyLeaves) {
    NondeterministicAutomaton escaped = compileRaw("\\*");
    EXPECT_EQ(escaped.transitionsFrom(1), (Transitions{{'*', 2}}));

    NondeterministicAutomaton empty = compileRaw(EMPTY_WORD);
    EXPECT_EQ(empty.transitionsFrom(1), (Transitions{{EPS, 2}}));
    EXPECT_TRUE(empty.alphabet().empty());
}

TEST(ThompsonTest, EveryCompilationCountsFromOne) {
    ThompsonCompiler compiler;
    SyntaxTree::Ptr tree = buildSyntaxTree(toPostfix(regexTokenize("a|b")));

    NondeterministicAutomaton first = compiler.compile(*tree);
    NondeterministicAutomaton second = compiler.compile(*tree);
    EXPECT_EQ(first.startSingleState(), second.startSingleState());
    EXPECT_EQ(first.transitions(), second.transitions());

    ThompsonCompiler other;
    EXPECT_EQ(other.compile(*SyntaxTree::leaf(RegexToken("x"))).startSingleState(), 1u);
}

TEST(ThompsonTest, UnknownOperatorIsRejected) {
    SyntaxTree::Ptr a = SyntaxTree::leaf(RegexToken("a"));
    EXPECT_THROW(thompsonConstruct(*SyntaxTree::unary('!', a)), UnsupportedOperator);
    EXPECT_THROW(thompsonConstruct(*SyntaxTree::binary('&', a, a)), UnsupportedOperator);
}
