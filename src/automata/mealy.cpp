#include "automata/mealy.hpp"

#include <sstream>
#include <utility>

namespace pattern_fsm {

MealyMachine::MealyMachine(std::vector<State> states,
                           std::vector<Symbol> alphabet,
                           State start,
                           const std::vector<Rule>& rules)
    : Machine(std::move(states), std::move(alphabet), start) {
    table_.resize(cell_count());
    std::vector<bool> filled(cell_count(), false);

    for (const auto& rule : rules) {
        if (!has_state(rule.from) || !has_state(rule.to) || !has_symbol(rule.on)) {
            std::ostringstream oss;
            oss << "rule (" << rule.from << ", " << quote_symbol(rule.on) << ") -> ("
                << rule.to << ", " << quote_symbol(rule.output)
                << ") uses an undeclared state or symbol";
            throw DefinitionError(oss.str());
        }
        const std::size_t c = cell(rule.from, rule.on);
        if (filled[c]) {
            std::ostringstream oss;
            oss << "duplicate rule for (" << rule.from << ", " << quote_symbol(rule.on) << ")";
            throw DefinitionError(oss.str());
        }
        table_[c] = Transition{rule.to, rule.output};
        filled[c] = true;
    }

    for (bool f : filled) {
        if (!f) throw DefinitionError("Mealy " + describe_missing(filled));
    }
}

MealyMachine::Transition MealyMachine::step(State state, Symbol symbol) const {
    return table_[cell(state, symbol)];
}

MealyMachine make_pattern01_mealy() {
    return MealyMachine({'A', 'B', 'C'}, {'0', '1'}, 'A',
                        {
                            {'A', '0', 'B', 'b'},
                            {'A', '1', 'A', 'b'},
                            {'B', '0', 'B', 'b'},
                            {'B', '1', 'C', 'a'},
                            {'C', '0', 'A', 'b'},
                            {'C', '1', 'C', 'b'},
                        });
}

}  // namespace pattern_fsm
