#pragma once

// rlreward/format.hpp - Structural check of the reasoning/answer response format.
//
// A completion is well formed when it holds a <think>...</think> pair followed,
// without overlap, by an <answer>...</answer> pair. Tag names match
// case-insensitively. The check is purely textual; extracted code is never
// looked at.

#include <string_view>
#include <vector>

#include "rlreward/completion.hpp"

namespace rlreward {

bool has_valid_format(std::string_view completion);

// 1.0 for well-formed completions, 0.0 otherwise. Same length and order as input.
std::vector<double> format_rewards(const std::vector<Completion>& completions);

}  // namespace rlreward
