#include "automata/machine.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace pattern_fsm {

namespace {

template <typename T>
void require_unique(const std::vector<T>& items, const char* what) {
    std::unordered_set<T> seen;
    for (const auto& item : items) {
        if (!seen.insert(item).second) {
            std::ostringstream oss;
            oss << "duplicate " << what << " '" << item << "' in machine declaration";
            throw DefinitionError(oss.str());
        }
    }
}

}  // namespace

std::string quote_symbol(Symbol c) {
    return std::string("'") + c + "'";
}

Machine::Machine(std::vector<State> states, std::vector<Symbol> alphabet, State start)
    : states_(std::move(states)), alphabet_(std::move(alphabet)), start_(start) {
    if (states_.empty()) throw DefinitionError("machine declares no states");
    if (alphabet_.empty()) throw DefinitionError("machine declares an empty alphabet");
    require_unique(states_, "state");
    require_unique(alphabet_, "symbol");
    if (!has_state(start_)) {
        throw DefinitionError(std::string("start state '") + start_ + "' is not declared");
    }
}

bool Machine::has_state(State s) const {
    return std::find(states_.begin(), states_.end(), s) != states_.end();
}

bool Machine::has_symbol(Symbol c) const {
    return std::find(alphabet_.begin(), alphabet_.end(), c) != alphabet_.end();
}

std::size_t Machine::state_index(State s) const {
    auto it = std::find(states_.begin(), states_.end(), s);
    if (it == states_.end()) {
        throw LookupError(kind() + " machine has no state '" + s + "'");
    }
    return static_cast<std::size_t>(it - states_.begin());
}

std::size_t Machine::symbol_index(Symbol c) const {
    auto it = std::find(alphabet_.begin(), alphabet_.end(), c);
    if (it == alphabet_.end()) {
        throw LookupError(kind() + " machine has no input symbol " + quote_symbol(c));
    }
    return static_cast<std::size_t>(it - alphabet_.begin());
}

std::string Machine::describe_missing(const std::vector<bool>& filled) const {
    std::ostringstream oss;
    oss << "transition table is not total, missing:";
    for (std::size_t i = 0; i < filled.size(); ++i) {
        if (filled[i]) continue;
        oss << " (" << states_[i / alphabet_.size()] << ", "
            << quote_symbol(alphabet_[i % alphabet_.size()]) << ")";
    }
    return oss.str();
}

}  // namespace pattern_fsm
