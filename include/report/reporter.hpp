#pragma once

#include <iosfwd>
#include <string>

#include "automata/mealy.hpp"
#include "automata/moore.hpp"
#include "simulator/core.hpp"

namespace pattern_fsm {

// ASCII-art transition diagrams of the built-in "01" detectors.
const std::string& mealy_diagram();
const std::string& moore_diagram();

// "1:b 2:a 3:b"
std::string numbered_output(const std::string& output);

// Header, transposed step/state/input/next/output table, final output and
// numbered output, laid out for the console.
std::string format_trace(const Trace& trace);

// Formal definition of the machine as a tuple (Q, Σ, Γ, δ, [λ,] q0).
std::string to_definition(const MealyMachine& machine);
std::string to_definition(const MooreMachine& machine);

// Graphviz rendering. Mealy edges carry "in/out", Moore nodes "state/out".
std::string to_dot(const MealyMachine& machine);
std::string to_dot(const MooreMachine& machine);

void print_diagrams(std::ostream& out);
void print_trace(std::ostream& out, const Trace& trace);

}  // namespace pattern_fsm
