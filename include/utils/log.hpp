#pragma once

#include <string>

namespace pattern_fsm {

// Diagnostics go to stderr; reports go to stdout.
void log_error(const std::string& msg);
void log_warning(const std::string& msg);

}  // namespace pattern_fsm
