#include <iostream>

#include "simulator/core.hpp"

using namespace pattern_fsm;

int main() {
    const Trace mealy = simulate(make_pattern01_mealy(), "");
    if (!mealy.entries.empty() || !mealy.output.empty()) {
        std::cerr << "Mealy on empty input: expected empty trace and output got '"
                  << mealy.output << "'\n";
        return 1;
    }

    const Trace moore = simulate(make_pattern01_moore(), "");
    if (!moore.entries.empty() || moore.output != "b") {
        std::cerr << "Moore on empty input: expected output 'b' got '" << moore.output << "'\n";
        return 1;
    }

    std::cout << "test_empty_input: PASS\n";
    return 0;
}
