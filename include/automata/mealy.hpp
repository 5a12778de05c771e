#pragma once

#include <string>
#include <vector>

#include "automata/machine.hpp"

namespace pattern_fsm {

// Output is emitted per transition and depends on (state, symbol).
class MealyMachine final : public Machine {
public:
    struct Transition {
        State next;
        Output output;
    };

    struct Rule {
        State from;
        Symbol on;
        State to;
        Output output;
    };

    // Throws DefinitionError unless `rules` covers every (state, symbol)
    // pair exactly once.
    MealyMachine(std::vector<State> states,
                 std::vector<Symbol> alphabet,
                 State start,
                 const std::vector<Rule>& rules);

    std::string kind() const override { return "Mealy"; }

    // Throws LookupError for an undeclared state or symbol.
    Transition step(State state, Symbol symbol) const;

private:
    std::vector<Transition> table_;
};

// Detects "01": emits 'a' on the '1' that completes the pattern, else 'b'.
MealyMachine make_pattern01_mealy();

}  // namespace pattern_fsm
