#include "core.hpp"

namespace pattern_fsm {

namespace {

Trace begin_trace(const Machine& machine, const std::string& input) {
    Trace trace;
    trace.machine = machine.kind();
    trace.input = input;
    trace.entries.reserve(input.size());
    return trace;
}

void record(Trace& trace, State state, Symbol input, State next, Output output) {
    TraceEntry entry;
    entry.step = trace.entries.size() + 1;
    entry.state = state;
    entry.input = input;
    entry.next = next;
    entry.output = output;
    trace.entries.push_back(entry);
    trace.output.push_back(output);
}

}  // namespace

Trace simulate(const MealyMachine& machine, const std::string& input) {
    Trace trace = begin_trace(machine, input);
    State current = machine.start();
    for (Symbol symbol : input) {
        const auto t = machine.step(current, symbol);
        record(trace, current, symbol, t.next, t.output);
        current = t.next;
    }
    return trace;
}

Trace simulate(const MooreMachine& machine, const std::string& input) {
    Trace trace = begin_trace(machine, input);
    State current = machine.start();
    // Every state emits, the start state included.
    trace.output.push_back(machine.output_of(current));
    for (Symbol symbol : input) {
        const State next = machine.step(current, symbol);
        record(trace, current, symbol, next, machine.output_of(next));
        current = next;
    }
    return trace;
}

}  // namespace pattern_fsm
