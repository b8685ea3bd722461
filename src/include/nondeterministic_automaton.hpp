#ifndef REGEXCC_NONDETERMINISTIC_AUTOMATON_HPP
#define REGEXCC_NONDETERMINISTIC_AUTOMATON_HPP

#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <map>
#include <set>

#include "deterministic_automaton.hpp"


namespace regexcc {
    class NondeterministicAutomaton {
    public:
        using SingleState = size_t;
        using State = std::set<SingleState>;

        struct Transition {
            Symbol symbol;
            SingleState to;

            bool operator==(const Transition& t2) const { return symbol == t2.symbol && to == t2.to; }
            bool operator<(const Transition& t2) const {
                return symbol != t2.symbol ? symbol < t2.symbol : to < t2.to;
            }
        };

        using TransitionMap = std::map<SingleState, std::vector<Transition>>;

        struct Issue {
            enum class Kind {
                MISSING_START, MISSING_ACCEPT, START_HAS_INCOMING, ACCEPT_HAS_OUTGOING,
                UNREACHABLE_STATES, ACCEPT_UNREACHABLE
            };

            Kind kind;
            std::string message;
        };

        NondeterministicAutomaton(SingleState start, SingleState accept, TransitionMap transitions = {});

        [[nodiscard]] SingleState startSingleState() const { return startSstate; }
        [[nodiscard]] SingleState stopSingleState() const { return stopSstate; }
        [[nodiscard]] const TransitionMap& transitions() const { return jumps; }
        [[nodiscard]] const std::vector<Transition>& transitionsFrom(SingleState s) const;

        // States referenced by the transition relation
        [[nodiscard]] std::set<SingleState> singleStates() const;
        [[nodiscard]] size_t stateCount() const { return singleStates().size(); }
        [[nodiscard]] std::set<Symbol> alphabet() const;

        [[nodiscard]] State epsilonClosure(State states) const;
        [[nodiscard]] State move(const State& states, Symbol ch) const;
        [[nodiscard]] State startState() const;
        [[nodiscard]] bool isStopState(const State& s) const;

        [[nodiscard]] bool accepts(std::string_view word) const;

        [[nodiscard]] std::vector<Issue> validate() const;
        [[nodiscard]] NondeterministicAutomaton renumbered(bool acceptLast = true) const;

        [[nodiscard]] DeterministicAutomaton toDeterministic(std::ostream* trace = nullptr) const;

        [[nodiscard]] std::string serialize() const;
    private:
        SingleState startSstate;
        SingleState stopSstate;
        TransitionMap jumps;
    };

    // Canonical label of an NFA state set: "5", "{1,2,3}", or the no-match marker
    std::string stateSetLabel(const NondeterministicAutomaton::State& states);
}


#endif
