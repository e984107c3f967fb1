#pragma once

// rlreward/extract.hpp - Candidate source extraction from free-form model output.
//
// Rules, first match wins (tag names are matched case-insensitively):
//   1. <answer>...</answer> present: take the FIRST pair's content.
//      - empty content                       -> ""
//      - content is a fenced block whose opening fence line holds only the
//        fence, an optional language tag and trailing blanks -> inner code, trimmed
//      - otherwise                           -> content trimmed, fences untouched
//   2. <answer> present but never closed    -> the original text, unmodified
//   3. no answer tag, a fenced block exists -> first block's inner code, trimmed
//   4. nothing structural                   -> the text trimmed
//
// extract_code() is total: it never throws and always returns some text.

#include <optional>
#include <string>
#include <string_view>

namespace rlreward {

std::string extract_code(std::string_view completion);

// Inner code of the first well-formed fenced block in `text`, trimmed.
std::optional<std::string> first_fenced_block(std::string_view text);

}  // namespace rlreward
