#include <iostream>
#include <string>

#include "report/reporter.hpp"

using namespace pattern_fsm;

int main() {
    const MealyMachine mealy = make_pattern01_mealy();
    const MooreMachine moore = make_pattern01_moore();

    const std::string mealy_dot = to_dot(mealy);
    if (mealy_dot.find("B -> C [label=\"1/a\"];") == std::string::npos ||
        mealy_dot.find("__start -> A;") == std::string::npos) {
        std::cerr << "Unexpected Mealy DOT:\n" << mealy_dot << "\n";
        return 1;
    }

    const std::string moore_dot = to_dot(moore);
    if (moore_dot.find("C [label=\"C/a\"];") == std::string::npos ||
        moore_dot.find("C -> A [label=\"0\"];") == std::string::npos) {
        std::cerr << "Unexpected Moore DOT:\n" << moore_dot << "\n";
        return 1;
    }

    const std::string def = to_definition(moore);
    if (def.find("States (Q): {A, B, C}") == std::string::npos ||
        def.find("λ(C) = a") == std::string::npos) {
        std::cerr << "Unexpected Moore definition:\n" << def << "\n";
        return 1;
    }

    if (to_definition(mealy).find("Output alphabet (Γ): {a, b}") == std::string::npos) {
        std::cerr << "Unexpected Mealy definition:\n" << to_definition(mealy) << "\n";
        return 1;
    }

    if (mealy_diagram().find("MEALY MACHINE") == std::string::npos ||
        moore_diagram().find("MOORE MACHINE") == std::string::npos) {
        std::cerr << "Diagram titles missing\n";
        return 1;
    }

    std::cout << "test_definition_dot: PASS\n";
    return 0;
}
