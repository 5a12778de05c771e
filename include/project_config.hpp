#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pattern_fsm {

// Inputs simulated when no --input= option is given.
inline const std::vector<std::string> kDefaultInputs = {"011001", "110011"};

// Column width of one cell in the transposed trace table.
inline constexpr std::size_t kCellWidth = 3;

inline const std::string kVersion = "1.0.0";

}  // namespace pattern_fsm
