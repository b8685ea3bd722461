#include "thompson.hpp"
#include <fmt/format.h>

using namespace regexcc;

using TransitionMap = NondeterministicAutomaton::TransitionMap;

namespace {
    void mergeTransitions(TransitionMap& into, TransitionMap&& from) {
        for (auto& [s, list] : from) {
            auto& target = into[s];
            target.insert(target.end(), list.begin(), list.end());
        }
    }

    void addEpsilonJump(TransitionMap& jumps, NondeterministicAutomaton::SingleState from, NondeterministicAutomaton::SingleState to) {
        jumps[from].push_back({EPS, to});
    }
}

NondeterministicAutomaton ThompsonCompiler::compile(const SyntaxTree& tree) {
    counter = 0;
    Fragment fragment = build(tree);
    return NondeterministicAutomaton(fragment.start, fragment.accept, std::move(fragment.jumps));
}

ThompsonCompiler::SingleState ThompsonCompiler::newState() {
    return ++counter;
}

ThompsonCompiler::Fragment ThompsonCompiler::build(const SyntaxTree& node) {
    if (node.isLeaf()) {
        SingleState s = newState();
        SingleState t = newState();
        Fragment f{s, t, {}};
        f.jumps[s].push_back({node.token().symbol(), t});
        return f;
    }

    switch (node.op()) {
    case '.':
        {
            Fragment a = build(*node.left());
            Fragment b = build(*node.right());
            mergeTransitions(a.jumps, std::move(b.jumps));
            addEpsilonJump(a.jumps, a.accept, b.start);
            return {a.start, b.accept, std::move(a.jumps)};
        }
    case '|':
        {
            Fragment a = build(*node.left());
            Fragment b = build(*node.right());
            SingleState s = newState();
            SingleState t = newState();
            Fragment f{s, t, std::move(a.jumps)};
            mergeTransitions(f.jumps, std::move(b.jumps));
            addEpsilonJump(f.jumps, s, a.start);
            addEpsilonJump(f.jumps, s, b.start);
            addEpsilonJump(f.jumps, a.accept, t);
            addEpsilonJump(f.jumps, b.accept, t);
            return f;
        }
    case '*':
        {
            Fragment a = build(*node.left());
            SingleState s = newState();
            SingleState t = newState();
            Fragment f{s, t, std::move(a.jumps)};
            addEpsilonJump(f.jumps, s, a.start);
            addEpsilonJump(f.jumps, s, t);
            addEpsilonJump(f.jumps, a.accept, a.start);
            addEpsilonJump(f.jumps, a.accept, t);
            return f;
        }
    case '+':
        {
            // A+ is A.(A*) over the same shared subtree
            SyntaxTree::Ptr repeated = SyntaxTree::binary('.', node.left(), SyntaxTree::unary('*', node.left()));
            return build(*repeated);
        }
    case '?':
        {
            Fragment a = build(*node.left());
            SingleState s = newState();
            SingleState t = newState();
            Fragment f{s, t, std::move(a.jumps)};
            addEpsilonJump(f.jumps, s, a.start);
            addEpsilonJump(f.jumps, s, t);
            addEpsilonJump(f.jumps, a.accept, t);
            return f;
        }
    default:
        throw UnsupportedOperator(fmt::format("unsupported operator '{}'", node.token().content()));
    }
}

NondeterministicAutomaton regexcc::thompsonConstruct(const SyntaxTree& tree) {
    ThompsonCompiler compiler;
    return compiler.compile(tree);
}
