#include <iostream>
#include <string>
#include <vector>

#include "automata/mealy.hpp"

using namespace pattern_fsm;

namespace {

bool rejects(const std::vector<State>& states, const std::vector<Symbol>& alphabet, State start,
             const std::vector<MealyMachine::Rule>& rules, std::string& message) {
    try {
        MealyMachine m(states, alphabet, start, rules);
    } catch (const DefinitionError& e) {
        message = e.what();
        return true;
    }
    return false;
}

}  // namespace

int main() {
    std::string msg;

    // (B, '1') has no rule.
    if (!rejects({'A', 'B'}, {'0', '1'}, 'A',
                 {{'A', '0', 'B', 'b'}, {'A', '1', 'A', 'b'}, {'B', '0', 'B', 'b'}}, msg)) {
        std::cerr << "Incomplete table was accepted\n";
        return 1;
    }
    if (msg.find("(B, '1')") == std::string::npos) {
        std::cerr << "Missing pair not named in message: " << msg << "\n";
        return 1;
    }

    if (!rejects({'A'}, {'0'}, 'A', {{'A', '0', 'A', 'b'}, {'A', '0', 'A', 'a'}}, msg)) {
        std::cerr << "Duplicate rule was accepted\n";
        return 1;
    }

    if (!rejects({'A'}, {'0'}, 'A', {{'A', '0', 'Z', 'b'}}, msg)) {
        std::cerr << "Rule to undeclared state was accepted\n";
        return 1;
    }

    if (!rejects({'A'}, {'0'}, 'Q', {{'A', '0', 'A', 'b'}}, msg)) {
        std::cerr << "Undeclared start state was accepted\n";
        return 1;
    }

    if (!rejects({'A', 'A'}, {'0'}, 'A', {{'A', '0', 'A', 'b'}}, msg)) {
        std::cerr << "Duplicate state was accepted\n";
        return 1;
    }

    if (!rejects({'A'}, {}, 'A', {}, msg)) {
        std::cerr << "Empty alphabet was accepted\n";
        return 1;
    }

    std::cout << "test_mealy_definition: PASS\n";
    return 0;
}
