#include "report/reporter.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <sstream>

#include "project_config.hpp"

namespace pattern_fsm {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string cell(const std::string& text) {
    std::string padded = text;
    if (padded.size() < kCellWidth) padded.append(kCellWidth - padded.size(), ' ');
    return padded;
}

template <typename Field>
std::string row(const std::string& label, const Trace& trace, Field field) {
    std::string line = label;
    for (std::size_t i = 0; i < trace.entries.size(); ++i) {
        if (i != 0) line += "  ";
        line += cell(field(trace.entries[i]));
    }
    return line;
}

std::string set_of(const std::vector<char>& items) {
    std::string out = "{";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) out += ", ";
        out += items[i];
    }
    return out + "}";
}

}  // namespace

std::string numbered_output(const std::string& output) {
    std::ostringstream out;
    for (std::size_t i = 0; i < output.size(); ++i) {
        if (i != 0) out << ' ';
        out << (i + 1) << ':' << output[i];
    }
    return out.str();
}

std::string format_trace(const Trace& trace) {
    std::ostringstream out;
    out << "\n--- " << upper(trace.machine) << " SIMULATION for input: " << trace.input << " ---\n";
    out << row("Step:  ", trace, [](const TraceEntry& e) { return std::to_string(e.step); }) << "\n";
    out << row("State: ", trace, [](const TraceEntry& e) { return std::string(1, e.state); }) << "\n";
    out << row("Input: ", trace, [](const TraceEntry& e) { return std::string(1, e.input); }) << "\n";
    out << row("Next:  ", trace, [](const TraceEntry& e) { return std::string(1, e.next); }) << "\n";
    out << row("Output:", trace, [](const TraceEntry& e) { return std::string(1, e.output); }) << "\n";
    out << "\nFinal Output: " << trace.output << "\n\n";
    out << "Numbered Output: " << numbered_output(trace.output) << "\n\n";
    return out.str();
}

std::string to_definition(const MealyMachine& machine) {
    std::ostringstream out;
    out << "Mealy Machine Definition\n";
    out << "========================\n";
    out << "States (Q): " << set_of(machine.states()) << "\n";
    out << "Alphabet (Σ): " << set_of(machine.alphabet()) << "\n";
    out << "Start state (q0): " << machine.start() << "\n";
    out << "Transitions (δ/λ):\n";
    std::vector<char> outputs;
    for (State s : machine.states()) {
        for (Symbol c : machine.alphabet()) {
            const auto t = machine.step(s, c);
            out << "  δ(" << s << ", " << c << ") = " << t.next
                << "    λ(" << s << ", " << c << ") = " << t.output << "\n";
            if (std::find(outputs.begin(), outputs.end(), t.output) == outputs.end()) {
                outputs.push_back(t.output);
            }
        }
    }
    std::sort(outputs.begin(), outputs.end());
    out << "Output alphabet (Γ): " << set_of(outputs) << "\n";
    return out.str();
}

std::string to_definition(const MooreMachine& machine) {
    std::ostringstream out;
    out << "Moore Machine Definition\n";
    out << "========================\n";
    out << "States (Q): " << set_of(machine.states()) << "\n";
    out << "Alphabet (Σ): " << set_of(machine.alphabet()) << "\n";
    out << "Start state (q0): " << machine.start() << "\n";
    out << "Transitions (δ):\n";
    for (State s : machine.states()) {
        for (Symbol c : machine.alphabet()) {
            out << "  δ(" << s << ", " << c << ") = " << machine.step(s, c) << "\n";
        }
    }
    out << "Outputs (λ):\n";
    std::vector<char> outputs;
    for (State s : machine.states()) {
        const Output o = machine.output_of(s);
        out << "  λ(" << s << ") = " << o << "\n";
        if (std::find(outputs.begin(), outputs.end(), o) == outputs.end()) outputs.push_back(o);
    }
    std::sort(outputs.begin(), outputs.end());
    out << "Output alphabet (Γ): " << set_of(outputs) << "\n";
    return out.str();
}

std::string to_dot(const MealyMachine& machine) {
    std::ostringstream out;
    out << "digraph Mealy {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=circle];\n";
    out << "  __start [shape=point];\n";
    out << "  __start -> " << machine.start() << ";\n";
    for (State s : machine.states()) {
        for (Symbol c : machine.alphabet()) {
            const auto t = machine.step(s, c);
            out << "  " << s << " -> " << t.next << " [label=\"" << c << "/" << t.output << "\"];\n";
        }
    }
    out << "}\n";
    return out.str();
}

std::string to_dot(const MooreMachine& machine) {
    std::ostringstream out;
    out << "digraph Moore {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=circle];\n";
    out << "  __start [shape=point];\n";
    out << "  __start -> " << machine.start() << ";\n";
    for (State s : machine.states()) {
        out << "  " << s << " [label=\"" << s << "/" << machine.output_of(s) << "\"];\n";
    }
    for (State s : machine.states()) {
        for (Symbol c : machine.alphabet()) {
            out << "  " << s << " -> " << machine.step(s, c) << " [label=\"" << c << "\"];\n";
        }
    }
    out << "}\n";
    return out.str();
}

void print_diagrams(std::ostream& out) {
    out << mealy_diagram() << "\n";
    out << moore_diagram() << "\n";
}

void print_trace(std::ostream& out, const Trace& trace) {
    out << format_trace(trace);
}

}  // namespace pattern_fsm
