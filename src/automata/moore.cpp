#include "automata/moore.hpp"

#include <sstream>

namespace pattern_fsm {

MooreMachine::MooreMachine(std::vector<State> states,
                           std::vector<Symbol> alphabet,
                           State start,
                           const std::vector<Rule>& rules,
                           const std::vector<StateOutput>& outputs)
    : Machine(std::move(states), std::move(alphabet), start) {
    table_.resize(cell_count());
    std::vector<bool> filled(cell_count(), false);

    for (const auto& rule : rules) {
        if (!has_state(rule.from) || !has_state(rule.to) || !has_symbol(rule.on)) {
            std::ostringstream oss;
            oss << "rule (" << rule.from << ", " << quote_symbol(rule.on) << ") -> "
                << rule.to << " uses an undeclared state or symbol";
            throw DefinitionError(oss.str());
        }
        const std::size_t c = cell(rule.from, rule.on);
        if (filled[c]) {
            std::ostringstream oss;
            oss << "duplicate rule for (" << rule.from << ", " << quote_symbol(rule.on) << ")";
            throw DefinitionError(oss.str());
        }
        table_[c] = rule.to;
        filled[c] = true;
    }
    for (bool f : filled) {
        if (!f) throw DefinitionError("Moore " + describe_missing(filled));
    }

    outputs_.resize(this->states().size());
    std::vector<bool> has_output(this->states().size(), false);
    for (const auto& [state, output] : outputs) {
        if (!has_state(state)) {
            throw DefinitionError(std::string("output declared for undeclared state '") + state + "'");
        }
        const std::size_t i = state_index(state);
        if (has_output[i]) {
            throw DefinitionError(std::string("duplicate output for state '") + state + "'");
        }
        outputs_[i] = output;
        has_output[i] = true;
    }
    for (std::size_t i = 0; i < has_output.size(); ++i) {
        if (!has_output[i]) {
            throw DefinitionError(std::string("Moore output table is not total, missing state '") +
                                  this->states()[i] + "'");
        }
    }
}

State MooreMachine::step(State state, Symbol symbol) const {
    return table_[cell(state, symbol)];
}

Output MooreMachine::output_of(State state) const {
    return outputs_[state_index(state)];
}

MooreMachine make_pattern01_moore() {
    return MooreMachine({'A', 'B', 'C'}, {'0', '1'}, 'A',
                        {
                            {'A', '0', 'B'},
                            {'A', '1', 'A'},
                            {'B', '0', 'B'},
                            {'B', '1', 'C'},
                            {'C', '0', 'A'},
                            {'C', '1', 'C'},
                        },
                        {{'A', 'b'}, {'B', 'b'}, {'C', 'a'}});
}

}  // namespace pattern_fsm
