#include "rlreward/extract.hpp"

#include "rlreward/text.hpp"

namespace rlreward {

namespace {

constexpr std::string_view kAnswerOpen = "<answer>";
constexpr std::string_view kAnswerClose = "</answer>";
constexpr std::string_view kFence = "```";
constexpr std::string_view kClosingFence = "\n```";
constexpr std::size_t npos = std::string_view::npos;

// Index just past the line break of an opening fence starting at `pos`, or npos.
// An opening fence line is "```", an optional language tag, then only blanks.
std::size_t opening_fence_end(std::string_view s, std::size_t pos) {
  if (s.compare(pos, kFence.size(), kFence) != 0) return npos;
  std::size_t i = pos + kFence.size();
  while (i < s.size() && !text::is_space(s[i]) && s[i] != '`') ++i;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r')) ++i;
  if (i < s.size() && s[i] == '\n') return i + 1;
  return npos;
}

bool only_blanks(std::string_view s) { return text::trim_view(s).empty(); }

std::string strip_answer_fences(std::string_view content) {
  std::string_view code = text::trim_view(content);
  const std::size_t body = opening_fence_end(code, 0);
  // Fence and code sharing one line is left as written.
  if (body == npos) return std::string(code);

  std::string_view inner = code.substr(body);
  const std::size_t close = inner.rfind(kClosingFence);
  if (close != npos && only_blanks(inner.substr(close + kClosingFence.size()))) {
    inner = inner.substr(0, close);
  } else if (text::starts_with(inner, kFence) && only_blanks(inner.substr(kFence.size()))) {
    inner = std::string_view();
  }
  return text::trim(inner);
}

}  // namespace

std::optional<std::string> first_fenced_block(std::string_view s) {
  std::size_t pos = s.find(kFence);
  while (pos != npos) {
    // Opening fences start a line; "```" closing an inline span does not open a block.
    const bool line_start = pos == 0 || s[pos - 1] == '\n';
    const std::size_t body = line_start ? opening_fence_end(s, pos) : npos;
    if (body != npos) {
      // Search from the opening line break so an empty block still closes.
      const std::size_t close = s.find(kClosingFence, body - 1);
      if (close == npos) return std::nullopt;
      if (close < body) return std::string();
      return text::trim(s.substr(body, close - body));
    }
    pos = s.find(kFence, pos + 1);
  }
  return std::nullopt;
}

std::string extract_code(std::string_view completion) {
  const std::string lowered = text::ascii_lower(completion);

  const std::size_t open = lowered.find(kAnswerOpen);
  if (open != npos) {
    const std::size_t start = open + kAnswerOpen.size();
    const std::size_t close = lowered.find(kAnswerClose, start);
    if (close == npos) return std::string(completion);
    return strip_answer_fences(completion.substr(start, close - start));
  }

  if (auto block = first_fenced_block(completion)) return *block;

  return text::trim(completion);
}

}  // namespace rlreward
