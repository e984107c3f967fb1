#include "rlreward/format.hpp"

#include <array>
#include <string>

#include "rlreward/text.hpp"

namespace rlreward {

bool has_valid_format(std::string_view completion) {
  static constexpr std::array<std::string_view, 4> kTags = {
      "<think>", "</think>", "<answer>", "</answer>"};

  const std::string lowered = text::ascii_lower(completion);
  std::size_t pos = 0;
  for (const auto tag : kTags) {
    const std::size_t at = lowered.find(tag, pos);
    if (at == std::string::npos) return false;
    pos = at + tag.size();
  }
  return true;
}

std::vector<double> format_rewards(const std::vector<Completion>& completions) {
  std::vector<double> out;
  out.reserve(completions.size());
  for (const auto& c : completions) {
    out.push_back(has_valid_format(completion_text(c)) ? 1.0 : 0.0);
  }
  return out;
}

}  // namespace rlreward
