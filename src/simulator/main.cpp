#include <iostream>
#include <string>
#include <vector>

#include "automata/mealy.hpp"
#include "automata/moore.hpp"
#include "project_config.hpp"
#include "report/reporter.hpp"
#include "simulator/core.hpp"
#include "utils/log.hpp"

using namespace pattern_fsm;

namespace {

struct CommandLineOptions {
    std::vector<std::string> inputs;
    bool run_mealy{true};
    bool run_moore{true};
    bool print_diagrams{true};
    bool print_definition{false};
    bool print_dot{false};
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program
              << " [--input=STR]... [--machine=mealy|moore|both] [--no-diagrams]\n";
    std::cout << "Options:\n"
              << "  --input=STR         Binary input to simulate (repeatable).\n"
              << "                      Defaults to 011001 and 110011.\n"
              << "  --machine=KIND      mealy, moore or both (default both).\n"
              << "  --no-diagrams       Skip the ASCII transition diagrams.\n"
              << "  --print-definition  Print the formal definition of each machine.\n"
              << "  --print-dot         Print each machine as a Graphviz digraph.\n"
              << "  --version           Print version information.\n"
              << "  --help              Show this message.\n";
}

// Returns false when the argument is a malformed known option.
bool parse_argument(const std::string& arg, CommandLineOptions& opts) {
    if (arg.rfind("--input=", 0) == 0) {
        opts.inputs.push_back(arg.substr(8));
    } else if (arg.rfind("--machine=", 0) == 0) {
        const std::string kind = arg.substr(10);
        if (kind == "mealy") {
            opts.run_mealy = true;
            opts.run_moore = false;
        } else if (kind == "moore") {
            opts.run_mealy = false;
            opts.run_moore = true;
        } else if (kind == "both") {
            opts.run_mealy = opts.run_moore = true;
        } else {
            log_error("unknown machine kind '" + kind + "'");
            return false;
        }
    } else if (arg == "--no-diagrams") {
        opts.print_diagrams = false;
    } else if (arg == "--print-definition") {
        opts.print_definition = true;
    } else if (arg == "--print-dot") {
        opts.print_dot = true;
    } else {
        log_warning("ignoring unknown option: " + arg);
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    CommandLineOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            std::cout << "fsm_sim " << kVersion << "\n";
            return 0;
        }
        if (!parse_argument(arg, opts)) {
            print_usage(argv[0]);
            return 2;
        }
    }
    if (opts.inputs.empty()) opts.inputs = kDefaultInputs;

    try {
        const MealyMachine mealy = make_pattern01_mealy();
        const MooreMachine moore = make_pattern01_moore();

        if (opts.print_diagrams) print_diagrams(std::cout);

        if (opts.print_definition) {
            if (opts.run_mealy) std::cout << to_definition(mealy) << "\n";
            if (opts.run_moore) std::cout << to_definition(moore) << "\n";
        }
        if (opts.print_dot) {
            if (opts.run_mealy) std::cout << to_dot(mealy) << "\n";
            if (opts.run_moore) std::cout << to_dot(moore) << "\n";
        }

        for (const auto& input : opts.inputs) {
            if (opts.run_mealy) print_trace(std::cout, simulate(mealy, input));
            if (opts.run_moore) print_trace(std::cout, simulate(moore, input));
        }
    } catch (const LookupError& e) {
        log_error(e.what());
        return 2;
    } catch (const DefinitionError& e) {
        log_error(e.what());
        return 2;
    }
    return 0;
}
