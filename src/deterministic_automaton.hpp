#ifndef REGEXCC_DETERMINISTIC_AUTOMATON_HPP
#define REGEXCC_DETERMINISTIC_AUTOMATON_HPP

#include <string>
#include <string_view>
#include <limits>
#include <optional>
#include <set>
#include <utility>
#include <variant>
#include <vector>
#include <map>

namespace regexcc {
    // Transition symbol: a byte value, or EPS for an epsilon edge
    using Symbol = unsigned int;
    constexpr const Symbol EPS = std::numeric_limits<unsigned int>::max();

    // Reserved empty-string symbol, in UTF-8
    constexpr const std::string_view EMPTY_WORD = "\xCE\xB5";

    std::string symbolToString(Symbol s);

    // A word equal to EMPTY_WORD stands for the empty string
    std::string_view normalizeWord(std::string_view word);

    // Integer id (minimal automaton) or canonical NFA-set label (subset construction)
    using StateLabel = std::variant<size_t, std::string>;

    std::string labelToString(const StateLabel& label);

    class DeterministicAutomaton {
    public:
        using State = size_t;
        constexpr static const State REJECT = std::numeric_limits<size_t>::max();

        struct MinimizationStats {
            size_t reachableStates = 0;
            size_t refinementPasses = 0;
        };

        DeterministicAutomaton() = default;

        [[nodiscard]] inline size_t stateCount() const { return stateMap.size(); }

        State addState(StateLabel label);
        void setStartState(State s);
        [[nodiscard]] State startState() const;
        void setJump(State from, Symbol ch, State to);
        [[nodiscard]] State nextState(State from, Symbol ch) const;
        void setStopState(State s, bool stop = true);
        [[nodiscard]] bool isStopState(State s) const;
        [[nodiscard]] const std::set<State>& stopStates() const { return _endStates; }

        [[nodiscard]] const StateLabel& label(State s) const;
        [[nodiscard]] std::optional<State> findState(const StateLabel& label) const;
        [[nodiscard]] const std::map<Symbol, State>& jumps(State s) const;
        [[nodiscard]] const std::set<Symbol>& alphabet() const { return _alphabet; }
        void addSymbol(Symbol ch);

        [[nodiscard]] bool accepts(std::string_view word) const;

        [[nodiscard]] std::vector<std::pair<State, Symbol>> missingTransitions() const;
        [[nodiscard]] bool isComplete() const { return missingTransitions().empty(); }

        [[nodiscard]] DeterministicAutomaton reachablePart() const;
        [[nodiscard]] DeterministicAutomaton minimized(MinimizationStats* stats = nullptr) const;
        [[nodiscard]] std::pair<DeterministicAutomaton, std::map<std::string, std::string>> withSimpleNames() const;

        [[nodiscard]] std::string serialize() const;
    private:
        std::vector<std::map<Symbol, State>> stateMap;
        std::vector<StateLabel> stateLabels;
        std::set<Symbol> _alphabet;
        State _startState = REJECT;
        std::set<State> _endStates;
    };
}

#endif
