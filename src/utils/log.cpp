#include "utils/log.hpp"

#include <iostream>

namespace pattern_fsm {

void log_error(const std::string& msg) {
    std::cerr << "Error: " << msg << "\n";
}

void log_warning(const std::string& msg) {
    std::cerr << "Warning: " << msg << "\n";
}

}  // namespace pattern_fsm
