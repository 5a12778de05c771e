#include <iostream>
#include <string>

#include "automata/moore.hpp"

using namespace pattern_fsm;

int main() {
    // Transitions are total but state B has no output.
    try {
        MooreMachine m({'A', 'B'}, {'0'}, 'A', {{'A', '0', 'B'}, {'B', '0', 'A'}}, {{'A', 'b'}});
        std::cerr << "Missing output was accepted\n";
        return 1;
    } catch (const DefinitionError& e) {
        if (std::string(e.what()).find("'B'") == std::string::npos) {
            std::cerr << "Missing state not named in message: " << e.what() << "\n";
            return 1;
        }
    }

    try {
        MooreMachine m({'A'}, {'0', '1'}, 'A', {{'A', '0', 'A'}}, {{'A', 'b'}});
        std::cerr << "Incomplete transition table was accepted\n";
        return 1;
    } catch (const DefinitionError&) {
    }

    try {
        MooreMachine m({'A'}, {'0'}, 'A', {{'A', '0', 'A'}}, {{'A', 'b'}, {'A', 'a'}});
        std::cerr << "Duplicate output was accepted\n";
        return 1;
    } catch (const DefinitionError&) {
    }

    try {
        MooreMachine m({'A'}, {'0'}, 'A', {{'A', '0', 'A'}}, {{'A', 'b'}, {'Z', 'a'}});
        std::cerr << "Output for undeclared state was accepted\n";
        return 1;
    } catch (const DefinitionError&) {
    }

    std::cout << "test_moore_definition: PASS\n";
    return 0;
}
