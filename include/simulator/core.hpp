#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "automata/mealy.hpp"
#include "automata/moore.hpp"

namespace pattern_fsm {

// One consumed input symbol. `step` counts from 1.
struct TraceEntry {
    std::size_t step{0};
    State state{};
    Symbol input{};
    State next{};
    Output output{};
};

struct Trace {
    std::string machine;             // "Mealy" or "Moore"
    std::string input;
    std::vector<TraceEntry> entries;
    // Mealy: one char per entry. Moore: output of the start state, then one
    // char per entry.
    std::string output;
};

// Both throw LookupError when `input` holds a symbol outside the alphabet.
Trace simulate(const MealyMachine& machine, const std::string& input);
Trace simulate(const MooreMachine& machine, const std::string& input);

}  // namespace pattern_fsm
