#include "regex.hpp"
#include "thompson.hpp"
#include <memory>
#include <string>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace regexcc {
    Regex::Regex(std::string_view sv, RegexOptions options) try :
            _options(options),
            _pattern(sv),
            _expanded(desugar(sv)),
            _tokens(regexTokenize(_expanded)),
            _steps(),
            _postfix(toPostfix(_tokens, _options.strict, &_steps)),
            _tree(buildSyntaxTree(_postfix)),
            _atm(thompsonConstruct(*_tree)),
            _dfaPtr(nullptr),
            _minDfaPtr(nullptr)
    {
        _issues = _atm.validate();
        _atm = _atm.renumbered(_options.acceptLast);

        if (_options.trace != nullptr) {
            std::ostream& log = *_options.trace;
            fmt::print(log, "[regex] pattern  : {}\n", _pattern);
            fmt::print(log, "[regex] expanded : {}\n", _expanded);
            if (_options.traceSteps) {
                for (const ConversionStep& step : _steps) {
                    fmt::print(log, "[postfix] {:<20} output = {}  stack = {}\n",
                               step.action, joinTokens(step.output, " "), joinTokens(step.stack, " "));
                }
            }
            fmt::print(log, "[regex] postfix  : {}\n", joinTokens(_postfix));
            for (const auto& issue : _issues) {
                fmt::print(log, "[regex] warning: {}\n", issue.message);
            }
            fmt::print(log, "[regex] NFA: {} states, start {}, accept {}\n",
                       _atm.stateCount(), _atm.startSingleState(), _atm.stopSingleState());
        }
    } catch (RegexError& e) {
        e.attachExpression(sv);
        throw;
    }

    const NondeterministicAutomaton& Regex::automaton() const {
        return _atm;
    }

    const DeterministicAutomaton& Regex::deterministicAutomaton() const {
        makeDfa();
        return *_dfaPtr;
    }

    const DeterministicAutomaton& Regex::minimalAutomaton() const {
        makeMinimalDfa();
        return *_minDfaPtr;
    }

    const DeterministicAutomaton::MinimizationStats& Regex::minimizationStats() const {
        makeMinimalDfa();
        return _minStats;
    }

    std::chrono::nanoseconds Regex::subsetConstructionTime() const {
        makeDfa();
        return _subsetTime;
    }

    bool Regex::match(std::string_view sv) const {
        return minimalAutomaton().accepts(sv);
    }

    Verdict Regex::evaluate(std::string_view sv) const {
        Verdict verdict;
        verdict.nfa = _atm.accepts(sv);
        verdict.dfa = deterministicAutomaton().accepts(sv);
        verdict.minimalDfa = minimalAutomaton().accepts(sv);

        if (_options.trace != nullptr) {
            std::ostream& log = *_options.trace;
            fmt::print(log, "[regex] '{}': NFA {}, DFA {}, minimal DFA {}\n", sv,
                       verdict.nfa ? "accept" : "reject",
                       verdict.dfa ? "accept" : "reject",
                       verdict.minimalDfa ? "accept" : "reject");
            if (!verdict.consistent()) {
                fmt::print(log, "[regex] warning: automata disagree on '{}'\n", sv);
            }
        }

        return verdict;
    }

    void Regex::makeDfa() const {
        if (_dfaPtr != nullptr) return;

        std::ostream* stepTrace = _options.traceSteps ? _options.trace : nullptr;
        auto begin = std::chrono::steady_clock::now();
        _dfaPtr = std::make_unique<DeterministicAutomaton>(_atm.toDeterministic(stepTrace));
        _subsetTime = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - begin);

        if (_options.trace != nullptr) {
            fmt::print(*_options.trace, "[regex] DFA: {} states, subset construction took {:.6f} s\n",
                       _dfaPtr->stateCount(), std::chrono::duration<double>(_subsetTime).count());
        }
    }

    void Regex::makeMinimalDfa() const {
        if (_minDfaPtr != nullptr) return;

        _minDfaPtr = std::make_unique<DeterministicAutomaton>(deterministicAutomaton().minimized(&_minStats));

        if (_options.trace != nullptr) {
            fmt::print(*_options.trace, "[regex] minimal DFA: {} states after {} refinement passes\n",
                       _minDfaPtr->stateCount(), _minStats.refinementPasses);
        }
    }

    Regex literal::operator"" _regex(const char* str, size_t len) {
        return Regex(std::string_view(str, len));
    }

    NondeterministicAutomaton automatonFromRegexString(std::string_view str, bool strict) {
        SyntaxTree::Ptr tree = buildSyntaxTree(toPostfix(regexTokenize(desugar(str)), strict));
        return thompsonConstruct(*tree).renumbered();
    }
}
