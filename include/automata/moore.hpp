#pragma once

#include <string>
#include <utility>
#include <vector>

#include "automata/machine.hpp"

namespace pattern_fsm {

// Output is emitted per state, including the start state before any input.
class MooreMachine final : public Machine {
public:
    struct Rule {
        State from;
        Symbol on;
        State to;
    };

    using StateOutput = std::pair<State, Output>;

    // Throws DefinitionError unless `rules` covers every (state, symbol)
    // pair exactly once and `outputs` covers every state exactly once.
    MooreMachine(std::vector<State> states,
                 std::vector<Symbol> alphabet,
                 State start,
                 const std::vector<Rule>& rules,
                 const std::vector<StateOutput>& outputs);

    std::string kind() const override { return "Moore"; }

    // Throws LookupError for an undeclared state or symbol.
    State step(State state, Symbol symbol) const;

    // Throws LookupError for an undeclared state.
    Output output_of(State state) const;

private:
    std::vector<State> table_;
    std::vector<Output> outputs_;
};

// Detects "01": state C (reached right after "01") outputs 'a', others 'b'.
MooreMachine make_pattern01_moore();

}  // namespace pattern_fsm
