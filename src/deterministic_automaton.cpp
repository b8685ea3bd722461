#include "deterministic_automaton.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <sstream>
#include <utility>
#include <vector>
#include <iomanip>

using namespace regexcc;
using State = DeterministicAutomaton::State;

std::string regexcc::symbolToString(Symbol s) {
    if (s == EPS) return std::string(EMPTY_WORD);
    return std::string(1, char(s));
}

std::string_view regexcc::normalizeWord(std::string_view word) {
    if (word == EMPTY_WORD) return {};
    return word;
}

std::string regexcc::labelToString(const StateLabel& label) {
    if (std::holds_alternative<size_t>(label)) {
        return std::to_string(std::get<size_t>(label));
    }
    return std::get<std::string>(label);
}

State DeterministicAutomaton::addState(StateLabel label) {
    stateMap.emplace_back();
    stateLabels.push_back(std::move(label));
    if (_startState == REJECT) _startState = stateMap.size() - 1;
    return stateMap.size() - 1;
}

void DeterministicAutomaton::setStartState(State s) {
    _startState = s;
}

State DeterministicAutomaton::startState() const {
    return _startState;
}

void DeterministicAutomaton::setJump(State from, Symbol ch, State to) {
    stateMap[from][ch] = to;
    _alphabet.insert(ch);
}

State DeterministicAutomaton::nextState(State from, Symbol ch) const {
    if (from == REJECT) return REJECT;
    auto it = stateMap[from].find(ch);
    if (it != stateMap[from].end()) return it->second;
    return REJECT;
}

void DeterministicAutomaton::setStopState(State s, bool stop) {
    if (stop) {
        _endStates.insert(s);
    } else {
        _endStates.erase(s);
    }
}

bool DeterministicAutomaton::isStopState(State s) const {
    return _endStates.count(s) > 0;
}

const StateLabel& DeterministicAutomaton::label(State s) const {
    return stateLabels[s];
}

std::optional<State> DeterministicAutomaton::findState(const StateLabel& label) const {
    auto it = std::find(stateLabels.begin(), stateLabels.end(), label);
    if (it == stateLabels.end()) return std::nullopt;
    return State(it - stateLabels.begin());
}

const std::map<Symbol, State>& DeterministicAutomaton::jumps(State s) const {
    return stateMap[s];
}

void DeterministicAutomaton::addSymbol(Symbol ch) {
    _alphabet.insert(ch);
}

bool DeterministicAutomaton::accepts(std::string_view word) const {
    if (stateCount() == 0) return false;

    State s = _startState;
    for (unsigned char c : normalizeWord(word)) {
        s = nextState(s, c);
        if (s == REJECT) return false;
    }

    return isStopState(s);
}

std::vector<std::pair<State, Symbol>> DeterministicAutomaton::missingTransitions() const {
    std::vector<std::pair<State, Symbol>> missing;
    for (State s = 0; s < stateCount(); s++) {
        for (Symbol ch : _alphabet) {
            if (!stateMap[s].count(ch)) {
                missing.emplace_back(s, ch);
            }
        }
    }
    return missing;
}

DeterministicAutomaton DeterministicAutomaton::reachablePart() const {
    if (stateCount() == 0) return *this;

    std::vector<bool> reachable(stateCount(), false);
    std::deque<State> queue{_startState};
    reachable[_startState] = true;
    while (!queue.empty()) {
        State s = queue.front();
        queue.pop_front();
        for (auto [ch, next] : stateMap[s]) {
            if (!reachable[next]) {
                reachable[next] = true;
                queue.push_back(next);
            }
        }
    }

    DeterministicAutomaton atm;
    atm._alphabet = _alphabet;

    std::vector<State> stateMappings(stateCount(), REJECT);
    for (State s = 0; s < stateCount(); s++) {
        if (reachable[s]) {
            stateMappings[s] = atm.addState(stateLabels[s]);
            atm.setStopState(stateMappings[s], isStopState(s));
        }
    }
    for (State s = 0; s < stateCount(); s++) {
        if (!reachable[s]) continue;
        for (auto [ch, next] : stateMap[s]) {
            atm.setJump(stateMappings[s], ch, stateMappings[next]);
        }
    }
    atm._startState = stateMappings[_startState];

    return atm;
}

DeterministicAutomaton DeterministicAutomaton::minimized(MinimizationStats* stats) const {
    constexpr const size_t NO_BLOCK = std::numeric_limits<size_t>::max();

    DeterministicAutomaton dfa = reachablePart();
    if (stats != nullptr) {
        stats->reachableStates = dfa.stateCount();
        stats->refinementPasses = 0;
    }
    if (dfa.stateCount() <= 1) return dfa;

    std::vector<std::vector<State>> blocks;
    {
        std::vector<State> rejecting, accepting;
        for (State s = 0; s < dfa.stateCount(); s++) {
            (dfa.isStopState(s) ? accepting : rejecting).push_back(s);
        }
        if (!rejecting.empty()) blocks.push_back(std::move(rejecting));
        if (!accepting.empty()) blocks.push_back(std::move(accepting));
    }

    std::vector<size_t> blockOf(dfa.stateCount(), NO_BLOCK);
    auto assignBlocks = [&]() {
        for (size_t b = 0; b < blocks.size(); b++) {
            for (State s : blocks[b]) blockOf[s] = b;
        }
    };

    // Refine until a whole pass splits nothing
    bool hasChanges;
    do {
        assignBlocks();
        hasChanges = false;
        if (stats != nullptr) stats->refinementPasses++;

        std::vector<std::vector<State>> refined;
        for (const auto& block : blocks) {
            size_t firstGroup = refined.size();
            std::map<std::vector<size_t>, size_t> groups;
            for (State s : block) {
                std::vector<size_t> signature;
                signature.reserve(dfa._alphabet.size());
                for (Symbol ch : dfa._alphabet) {
                    State next = dfa.nextState(s, ch);
                    signature.push_back(next == REJECT ? NO_BLOCK : blockOf[next]);
                }
                auto [it, inserted] = groups.emplace(std::move(signature), refined.size());
                if (inserted) refined.emplace_back();
                refined[it->second].push_back(s);
            }
            if (refined.size() - firstGroup > 1) hasChanges = true;
        }
        blocks = std::move(refined);
    } while (hasChanges);

    assignBlocks();

    DeterministicAutomaton atm;
    atm._alphabet = dfa._alphabet;

    std::vector<State> blockMappings(blocks.size(), REJECT);
    size_t startBlock = blockOf[dfa._startState];
    blockMappings[startBlock] = atm.addState(size_t(0));

    std::deque<size_t> queue{startBlock};
    while (!queue.empty()) {
        size_t b = queue.front();
        queue.pop_front();

        // Members of a stable block share their signature
        State representative = blocks[b].front();
        for (auto [ch, next] : dfa.stateMap[representative]) {
            size_t nb = blockOf[next];
            if (blockMappings[nb] == REJECT) {
                blockMappings[nb] = atm.addState(atm.stateCount());
                queue.push_back(nb);
            }
            atm.setJump(blockMappings[b], ch, blockMappings[nb]);
        }
    }

    for (size_t b = 0; b < blocks.size(); b++) {
        bool accepting = std::any_of(blocks[b].begin(), blocks[b].end(),
                                     [&](State s) { return dfa.isStopState(s); });
        if (accepting) atm.setStopState(blockMappings[b]);
    }
    atm._startState = blockMappings[startBlock];

    return atm;
}

std::pair<DeterministicAutomaton, std::map<std::string, std::string>> DeterministicAutomaton::withSimpleNames() const {
    std::map<std::string, std::string> names;
    if (stateCount() == 0) return std::make_pair(*this, names);

    std::vector<State> order{_startState};
    std::vector<State> rest;
    for (State s = 0; s < stateCount(); s++) {
        if (s != _startState) rest.push_back(s);
    }
    std::sort(rest.begin(), rest.end(), [this](State a, State b) {
        return labelToString(stateLabels[a]) < labelToString(stateLabels[b]);
    });
    order.insert(order.end(), rest.begin(), rest.end());

    DeterministicAutomaton atm;
    atm._alphabet = _alphabet;

    std::vector<State> stateMappings(stateCount(), REJECT);
    for (State s : order) {
        std::string simple = "q" + std::to_string(atm.stateCount());
        names[labelToString(stateLabels[s])] = simple;
        stateMappings[s] = atm.addState(simple);
        atm.setStopState(stateMappings[s], isStopState(s));
    }
    for (State s = 0; s < stateCount(); s++) {
        for (auto [ch, next] : stateMap[s]) {
            atm.setJump(stateMappings[s], ch, stateMappings[next]);
        }
    }
    atm._startState = stateMappings[_startState];

    return std::make_pair(std::move(atm), std::move(names));
}

std::string DeterministicAutomaton::serialize() const {
    auto characterize = [](Symbol c) -> std::string {
        if (c >= 0x20 && c <= 0x7E) {
            return std::string("'") + char(c) + "'";
        }
        std::stringstream ss;
        ss << "'\\x" << std::fixed << std::setfill('0') << std::hex << std::setw(2) << c << "'";
        return ss.str();
    };

    std::stringstream serializeStream;
    for (State s = 0; s < stateCount(); s++) {
        serializeStream << "STATE" << s << " " << labelToString(stateLabels[s]) << ": {";
        bool mark = false;
        for (auto [ch, st] : stateMap[s]) {
            if (mark) serializeStream << ", ";
            serializeStream << characterize(ch) << " -> " << st;
            mark = true;
        }
        serializeStream << "}\n";
    }
    serializeStream << "START_STATE = ";
    if (_startState != REJECT) serializeStream << _startState;
    serializeStream << '\n';
    serializeStream << "STOP_STATES =";
    for (State s : _endStates) {
        serializeStream << ' ' << s;
    }
    serializeStream << '\n';

    return serializeStream.str();
}
