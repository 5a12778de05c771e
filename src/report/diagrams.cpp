#include "report/reporter.hpp"

namespace pattern_fsm {

const std::string& mealy_diagram() {
    static const std::string text =
        "\n======================\n"
        "   MEALY MACHINE\n"
        "======================\n"
        "\n(Outputs 'a' when '01' occurs, else 'b')\n\n"
        "                          ┌───────────────┐\n"
        "                 1/b  ↺   │       A       │─────0/b────▶│       B       │\n"
        "                    ◀─────┘   (start)     │             │               │\n"
        "                           └──────────────┘             └─────┬─────────┘\n"
        "                                                               │\n"
        "                                                               │\n"
        "                                                               │1/a\n"
        "                                                               ▼\n"
        "                                                         ┌───────────────┐\n"
        "                                                         │       C       │\n"
        "                                                         └─────┬─────────┘\n"
        "                                                               │\n"
        "                                                               │0/b\n"
        "                                                               ▼\n"
        "                                                         ┌───────────────┐\n"
        "                                                         │       A       │\n"
        "                                                         └───────────────┘\n"
        "\n(Transitions are labeled as input/output)\n"
        ;
    return text;
}

const std::string& moore_diagram() {
    static const std::string text =
        "\n======================\n"
        "   MOORE MACHINE\n"
        "======================\n"
        "\n(Outputs 'a' in state C, which indicates '01' was seen)\n\n"
        "                          ┌───────────────┐\n"
        "                 1        │       A       │─────0────▶│       B       │\n"
        "                    ◀─────┘   (start,b)   │           │   (b)         │\n"
        "                           └──────────────┘           └─────┬─────────┘\n"
        "                                                             │\n"
        "                                                             │1\n"
        "                                                             ▼\n"
        "                                                       ┌───────────────┐\n"
        "                                                       │       C       │\n"
        "                                                       │     (a)       │\n"
        "                                                       └─────┬─────────┘\n"
        "                                                             │\n"
        "                                                             │0\n"
        "                                                             ▼\n"
        "                                                       ┌───────────────┐\n"
        "                                                       │       A       │\n"
        "                                                       │     (b)       │\n"
        "                                                       └───────────────┘\n"
        ;
    return text;
}

}  // namespace pattern_fsm
