#include <sstream>
#include <stack>
#include <deque>
#include <algorithm>
#include <iterator>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include "nondeterministic_automaton.hpp"

using namespace regexcc;

using SingleState = NondeterministicAutomaton::SingleState;

namespace {
    const std::vector<NondeterministicAutomaton::Transition> NO_TRANSITIONS;

    template <typename T>
    std::string serializeSet(const std::set<T>& val) {
        return fmt::format("{{{}}}", fmt::join(val, ","));
    }
}

std::string regexcc::stateSetLabel(const NondeterministicAutomaton::State& states) {
    if (states.empty()) {
        return "\xE2\x88\x85";
    }
    if (states.size() == 1) {
        return std::to_string(*states.begin());
    }
    return serializeSet(states);
}

NondeterministicAutomaton::NondeterministicAutomaton(SingleState start, SingleState accept, TransitionMap transitions) :
        startSstate(start), stopSstate(accept), jumps(std::move(transitions)) {}

const std::vector<NondeterministicAutomaton::Transition>& NondeterministicAutomaton::transitionsFrom(SingleState s) const {
    auto it = jumps.find(s);
    if (it == jumps.end()) return NO_TRANSITIONS;
    return it->second;
}

std::set<SingleState> NondeterministicAutomaton::singleStates() const {
    std::set<SingleState> states;
    for (auto& [from, list] : jumps) {
        if (!list.empty()) states.insert(from);
        for (auto& t : list) {
            states.insert(t.to);
        }
    }
    return states;
}

std::set<Symbol> NondeterministicAutomaton::alphabet() const {
    std::set<Symbol> symbols;
    for (auto& [from, list] : jumps) {
        for (auto& t : list) {
            if (t.symbol != EPS) symbols.insert(t.symbol);
        }
    }
    return symbols;
}

NondeterministicAutomaton::State NondeterministicAutomaton::epsilonClosure(State states) const {
    std::stack<SingleState> searchStack;
    for (SingleState s : states) {
        searchStack.push(s);
    }

    while (!searchStack.empty()) {
        SingleState st = searchStack.top();
        searchStack.pop();

        for (auto& t : transitionsFrom(st)) {
            if (t.symbol == EPS && !states.count(t.to)) {
                states.insert(t.to);
                searchStack.push(t.to);
            }
        }
    }

    return states;
}

NondeterministicAutomaton::State NondeterministicAutomaton::move(const State& states, Symbol ch) const {
    State s;
    for (SingleState ss : states) {
        for (auto& t : transitionsFrom(ss)) {
            if (t.symbol == ch) s.insert(t.to);
        }
    }
    return s;
}

NondeterministicAutomaton::State NondeterministicAutomaton::startState() const {
    return epsilonClosure({startSstate});
}

bool NondeterministicAutomaton::isStopState(const State& s) const {
    return s.count(stopSstate) > 0;
}

bool NondeterministicAutomaton::accepts(std::string_view word) const {
    State current = startState();
    for (unsigned char c : normalizeWord(word)) {
        current = epsilonClosure(move(current, c));
        if (current.empty()) break;
    }
    return isStopState(epsilonClosure(current));
}

std::vector<NondeterministicAutomaton::Issue> NondeterministicAutomaton::validate() const {
    std::vector<Issue> issues;
    std::set<SingleState> states = singleStates();

    if (!states.count(startSstate)) {
        issues.push_back({Issue::Kind::MISSING_START,
                          fmt::format("start state {} does not appear in any transition", startSstate)});
    }
    if (!states.count(stopSstate)) {
        issues.push_back({Issue::Kind::MISSING_ACCEPT,
                          fmt::format("accept state {} does not appear in any transition", stopSstate)});
    }

    std::map<SingleState, size_t> inDegree, outDegree;
    for (auto& [from, list] : jumps) {
        outDegree[from] += list.size();
        for (auto& t : list) {
            inDegree[t.to]++;
        }
    }
    if (inDegree[startSstate] != 0) {
        issues.push_back({Issue::Kind::START_HAS_INCOMING,
                          fmt::format("start state {} has in-degree {} (expected 0)", startSstate, inDegree[startSstate])});
    }
    if (outDegree[stopSstate] != 0) {
        issues.push_back({Issue::Kind::ACCEPT_HAS_OUTGOING,
                          fmt::format("accept state {} has out-degree {} (expected 0)", stopSstate, outDegree[stopSstate])});
    }

    std::set<SingleState> seen{startSstate};
    std::deque<SingleState> queue{startSstate};
    while (!queue.empty()) {
        SingleState s = queue.front();
        queue.pop_front();
        for (auto& t : transitionsFrom(s)) {
            if (seen.insert(t.to).second) queue.push_back(t.to);
        }
    }

    std::set<SingleState> unreachable;
    std::set_difference(states.begin(), states.end(), seen.begin(), seen.end(),
                        std::inserter(unreachable, unreachable.end()));
    if (!unreachable.empty()) {
        issues.push_back({Issue::Kind::UNREACHABLE_STATES,
                          fmt::format("states unreachable from {}: {}", startSstate, serializeSet(unreachable))});
    }
    if (!seen.count(stopSstate)) {
        issues.push_back({Issue::Kind::ACCEPT_UNREACHABLE,
                          fmt::format("accept state {} is not reachable from {}", stopSstate, startSstate)});
    }

    return issues;
}

NondeterministicAutomaton NondeterministicAutomaton::renumbered(bool acceptLast) const {
    std::set<SingleState> states = singleStates();

    std::vector<SingleState> order;
    std::set<SingleState> seen{startSstate};
    std::deque<SingleState> queue{startSstate};
    while (!queue.empty()) {
        SingleState s = queue.front();
        queue.pop_front();
        order.push_back(s);

        std::vector<Transition> sorted = transitionsFrom(s);
        std::sort(sorted.begin(), sorted.end());
        for (auto& t : sorted) {
            if (seen.insert(t.to).second) queue.push_back(t.to);
        }
    }

    for (SingleState s : states) {
        if (!seen.count(s)) order.push_back(s);
    }
    if (std::find(order.begin(), order.end(), stopSstate) == order.end()) {
        order.push_back(stopSstate);
    }

    if (acceptLast) {
        order.erase(std::remove(order.begin(), order.end(), stopSstate), order.end());
        order.push_back(stopSstate);
    }

    std::map<SingleState, SingleState> mapping;
    for (size_t i = 0; i < order.size(); i++) {
        mapping[order[i]] = i + 1;
    }

    TransitionMap renamed;
    for (auto& [from, list] : jumps) {
        if (list.empty()) continue;
        auto& target = renamed[mapping[from]];
        for (auto& t : list) {
            target.push_back({t.symbol, mapping[t.to]});
        }
    }

    return NondeterministicAutomaton(mapping[startSstate], mapping[stopSstate], std::move(renamed));
}

DeterministicAutomaton NondeterministicAutomaton::toDeterministic(std::ostream* trace) const {
    const std::set<Symbol> symbols = alphabet();

    DeterministicAutomaton atm;
    for (Symbol ch : symbols) {
        atm.addSymbol(ch);
    }

    State nfaState = startState();
    std::map<State, DeterministicAutomaton::State> stateTranslate;
    stateTranslate[nfaState] = atm.addState(stateSetLabel(nfaState));
    atm.setStopState(stateTranslate[nfaState], isStopState(nfaState));

    if (trace != nullptr) {
        fmt::print(*trace, "[subset] start closure = {} => {}\n", serializeSet(nfaState), stateSetLabel(nfaState));
    }

    std::deque<State> stateQueue;
    stateQueue.push_back(nfaState);

    while (!stateQueue.empty()) {
        State st = std::move(stateQueue.front());
        stateQueue.pop_front();
        DeterministicAutomaton::State fst = stateTranslate[st];

        if (trace != nullptr) {
            fmt::print(*trace, "[subset] visiting {} ~ NFA {}\n", labelToString(atm.label(fst)), serializeSet(st));
        }

        for (Symbol ch : symbols) {
            State moved = move(st, ch);
            if (moved.empty()) {
                if (trace != nullptr) {
                    fmt::print(*trace, "[subset]   {}: move = {} (no transition)\n", symbolToString(ch), stateSetLabel(moved));
                }
                continue;
            }

            State nextState = epsilonClosure(moved);
            DeterministicAutomaton::State nextDetState;
            auto it = stateTranslate.find(nextState);
            bool discovered = it == stateTranslate.end();
            if (discovered) {
                nextDetState = atm.addState(stateSetLabel(nextState));
                stateTranslate.emplace(nextState, nextDetState);
                atm.setStopState(nextDetState, isStopState(nextState));
                stateQueue.push_back(nextState);
            } else {
                nextDetState = it->second;
            }

            if (trace != nullptr) {
                fmt::print(*trace, "[subset]   {}: move = {}, closure = {} => {} {}\n",
                           symbolToString(ch), serializeSet(moved), serializeSet(nextState),
                           discovered ? "new" : "existing", labelToString(atm.label(nextDetState)));
            }

            atm.setJump(fst, ch, nextDetState);
        }
    }

    return atm;
}

std::string NondeterministicAutomaton::serialize() const {
    std::stringstream serializeStream;
    for (auto& [from, list] : jumps) {
        if (list.empty()) continue;
        serializeStream << "STATE" << from << ": {";

        bool mark = false;
        for (auto& t : list) {
            if (mark) serializeStream << ", ";
            serializeStream << symbolToString(t.symbol) << " -> " << t.to;
            mark = true;
        }

        serializeStream << "}\n";
    }

    serializeStream << "START_STATE = " << startSstate << "\n";
    serializeStream << "FINISH_STATE = " << stopSstate << "\n";
    return serializeStream.str();
}
