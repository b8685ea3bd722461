#ifndef REGEXCC_THOMPSON_HPP
#define REGEXCC_THOMPSON_HPP

#include "nondeterministic_automaton.hpp"
#include "syntax_tree.hpp"

namespace regexcc {
    // Lowers a syntax tree into an NFA. State ids come from a counter owned by one compile() call,
    // so the first state of every compilation is 1.
    class ThompsonCompiler {
    public:
        using SingleState = NondeterministicAutomaton::SingleState;

        NondeterministicAutomaton compile(const SyntaxTree& tree);

        [[nodiscard]] SingleState allocatedStates() const { return counter; }
    private:
        struct Fragment {
            SingleState start, accept;
            NondeterministicAutomaton::TransitionMap jumps;
        };

        SingleState counter = 0;

        SingleState newState();
        Fragment build(const SyntaxTree& node);
    };

    NondeterministicAutomaton thompsonConstruct(const SyntaxTree& tree);
}

#endif // REGEXCC_THOMPSON_HPP
