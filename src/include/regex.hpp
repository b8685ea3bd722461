#ifndef REGEXCC_REGEX_HPP
#define REGEXCC_REGEX_HPP

#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "deterministic_automaton.hpp"
#include "nondeterministic_automaton.hpp"
#include "regex_parse.hpp"
#include "syntax_tree.hpp"

namespace regexcc {
    struct RegexOptions {
        // Unmatched ')' and unrecognized tokens become MalformedExpression instead of being skipped
        bool strict = false;
        bool acceptLast = true;
        bool traceSteps = false;
        std::ostream* trace = nullptr;
    };

    struct Verdict {
        bool nfa = false;
        bool dfa = false;
        bool minimalDfa = false;

        [[nodiscard]] bool consistent() const { return nfa == dfa && dfa == minimalDfa; }
        [[nodiscard]] bool accepted() const { return nfa; }
    };

    class Regex {
    public:
        explicit Regex(std::string_view sv, RegexOptions options = {});

        [[nodiscard]] const std::string& pattern() const { return _pattern; }
        [[nodiscard]] const std::string& expanded() const { return _expanded; }
        [[nodiscard]] const std::vector<RegexToken>& tokens() const { return _tokens; }
        [[nodiscard]] const std::vector<RegexToken>& postfix() const { return _postfix; }
        [[nodiscard]] const std::vector<ConversionStep>& conversionSteps() const { return _steps; }
        [[nodiscard]] const SyntaxTree& syntaxTree() const { return *_tree; }
        [[nodiscard]] const std::vector<NondeterministicAutomaton::Issue>& issues() const { return _issues; }

        const NondeterministicAutomaton& automaton() const;
        const DeterministicAutomaton& deterministicAutomaton() const;
        const DeterministicAutomaton& minimalAutomaton() const;
        const DeterministicAutomaton::MinimizationStats& minimizationStats() const;
        std::chrono::nanoseconds subsetConstructionTime() const;

        bool match(std::string_view sv) const;
        Verdict evaluate(std::string_view sv) const;
    private:
        RegexOptions _options;
        std::string _pattern;
        std::string _expanded;
        std::vector<RegexToken> _tokens;
        std::vector<ConversionStep> _steps;
        std::vector<RegexToken> _postfix;
        SyntaxTree::Ptr _tree;
        std::vector<NondeterministicAutomaton::Issue> _issues;
        NondeterministicAutomaton _atm;
        mutable std::unique_ptr<DeterministicAutomaton> _dfaPtr;
        mutable std::unique_ptr<DeterministicAutomaton> _minDfaPtr;
        mutable DeterministicAutomaton::MinimizationStats _minStats;
        mutable std::chrono::nanoseconds _subsetTime{0};

        void makeDfa() const;
        void makeMinimalDfa() const;
    };

    namespace literal {
        Regex operator"" _regex(const char* str, size_t len);
    }

    using namespace literal;

    NondeterministicAutomaton automatonFromRegexString(std::string_view str, bool strict = false);
} // regexcc

#endif // REGEXCC_REGEX_HPP
