#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace pattern_fsm {

using State = char;
using Symbol = char;
using Output = char;

// Unknown state or symbol passed to a machine.
struct LookupError : public std::out_of_range {
    using std::out_of_range::out_of_range;
};

// Malformed or incomplete machine declaration.
struct DefinitionError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// State set, alphabet and start state shared by Mealy and Moore machines.
// Tables in the derived classes are dense arrays indexed by
// state_index(s) * alphabet().size() + symbol_index(c).
class Machine {
public:
    virtual ~Machine() = default;

    virtual std::string kind() const = 0;

    State start() const { return start_; }
    const std::vector<State>& states() const { return states_; }
    const std::vector<Symbol>& alphabet() const { return alphabet_; }

    bool has_state(State s) const;
    bool has_symbol(Symbol c) const;

    // Throw LookupError for keys outside the declaration.
    std::size_t state_index(State s) const;
    std::size_t symbol_index(Symbol c) const;

protected:
    Machine(std::vector<State> states, std::vector<Symbol> alphabet, State start);

    std::size_t cell(State s, Symbol c) const {
        return state_index(s) * alphabet_.size() + symbol_index(c);
    }
    std::size_t cell_count() const { return states_.size() * alphabet_.size(); }

    // Builds the DefinitionError message for cells that no rule filled.
    std::string describe_missing(const std::vector<bool>& filled) const;

private:
    std::vector<State> states_;
    std::vector<Symbol> alphabet_;
    State start_;
};

std::string quote_symbol(Symbol c);

}  // namespace pattern_fsm
