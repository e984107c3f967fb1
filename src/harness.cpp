#include "rlreward/harness.hpp"

#include <vector>

#include "rlreward/text.hpp"

namespace rlreward {

namespace {

constexpr std::string_view kBodyIndent = "    ";

std::vector<std::string_view> split_lines(std::string_view s) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  for (;;) {
    const std::size_t nl = s.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.push_back(s.substr(start));
      return lines;
    }
    lines.push_back(s.substr(start, nl - start));
    start = nl + 1;
  }
}

bool is_blank(std::string_view line) { return text::trim_view(line).empty(); }

// Identifier keyword at `pos` followed by a space, tab or one of `after`.
bool keyword_at(std::string_view line, std::size_t pos, std::string_view kw,
                std::string_view after) {
  if (line.compare(pos, kw.size(), kw) != 0) return false;
  const std::size_t next = pos + kw.size();
  if (next >= line.size()) return false;
  const char c = line[next];
  return c == ' ' || c == '\t' || after.find(c) != std::string_view::npos;
}

// "assert" statement at line start (after indentation) with a non-empty operand.
bool is_assertion(std::string_view line) {
  const std::size_t at = text::leading_indent(line).size();
  if (!keyword_at(line, at, "assert", "(")) return false;
  return !is_blank(line.substr(at + 6));
}

// "def check(" at line start, any indentation, any spacing around the name.
bool is_check_def(std::string_view line) {
  std::size_t i = text::leading_indent(line).size();
  if (!keyword_at(line, i, "def", "")) return false;
  i += 3;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
  if (line.compare(i, 5, "check") != 0) return false;
  i += 5;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
  return i < line.size() && line[i] == '(';
}

bool is_deeper(std::string_view line, std::string_view indent) {
  return line.size() > indent.size() && text::starts_with(line, indent) &&
         (line[indent.size()] == ' ' || line[indent.size()] == '\t');
}

// Lexical state carried across the physical lines of one statement.
struct Continuation {
  int depth{0};
  char quote{0};
  bool triple{false};
};

// Feeds one physical line; true when the statement continues on the next one.
bool continues(std::string_view line, Continuation& st) {
  bool comment = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (st.quote) {
      if (c == '\\') {
        ++i;
      } else if (c == st.quote) {
        if (!st.triple) {
          st.quote = 0;
        } else if (i + 2 < line.size() && line[i + 1] == c && line[i + 2] == c) {
          st.quote = 0;
          st.triple = false;
          i += 2;
        }
      }
      continue;
    }
    if (c == '#') {
      comment = true;
      break;
    }
    if (c == '"' || c == '\'') {
      st.quote = c;
      if (i + 2 < line.size() && line[i + 1] == c && line[i + 2] == c) {
        st.triple = true;
        i += 2;
      }
      continue;
    }
    if (c == '(' || c == '[' || c == '{') {
      ++st.depth;
    } else if ((c == ')' || c == ']' || c == '}') && st.depth > 0) {
      --st.depth;
    }
  }
  if (st.quote && !st.triple) st.quote = 0;  // unterminated short string ends the line

  const std::string_view t = text::trim_view(line);
  const bool backslash = !comment && !st.quote && !t.empty() && t.back() == '\\';
  return st.depth > 0 || st.quote != 0 || backslash;
}

// Index of the last physical line of the statement starting at `first`.
std::size_t statement_end(const std::vector<std::string_view>& lines, std::size_t first) {
  Continuation st;
  std::size_t i = first;
  while (continues(lines[i], st) && i + 1 < lines.size()) ++i;
  return i;
}

class HarnessWriter {
 public:
  explicit HarnessWriter(std::size_t reserve) { out_.reserve(reserve); }

  void line(std::string_view l) { out_.emplace_back(l); }

  void line(std::string_view indent, std::string_view body) {
    std::string s;
    s.reserve(indent.size() + body.size());
    s.append(indent).append(body);
    out_.push_back(std::move(s));
  }

  void open_check(std::string_view def_line, std::string_view indent) {
    line(def_line);
    line(std::string(indent) + std::string(kBodyIndent), "_results = []");
  }

  void guarded(const std::vector<std::string_view>& lines, std::size_t first,
               std::size_t last) {
    const std::string indent(text::leading_indent(lines[first]));
    const std::string inner = indent + std::string(kBodyIndent);
    line(indent, "try:");
    line(inner, lines[first].substr(indent.size()));
    // Lines inside an open triple-quoted string are string content: copied as is.
    Continuation st;
    continues(lines[first], st);
    for (std::size_t i = first + 1; i <= last; ++i) {
      if (st.triple) {
        line(lines[i]);
      } else {
        line(kBodyIndent, lines[i]);
      }
      continues(lines[i], st);
    }
    line(inner, "_results.append(True)");
    line(indent, "except:");
    line(inner, "_results.append(False)");
  }

  void close_check(std::string_view indent) {
    line(std::string(indent) + std::string(kBodyIndent), "return _results");
    line("");
  }

  void driver(std::string_view entry_point) {
    line("_test_results = check(" + std::string(entry_point) + ")");
    line("");
    line("# Report test results");
    line("_passed = sum(_test_results)");
    line("_total = len(_test_results)");
    line(R"(print(f"TESTS_PASSED:{_passed}/{_total}"))");
    line("exit(0 if _passed == _total else 1)");
  }

  std::string join() const {
    std::size_t n = 0;
    for (const auto& l : out_) n += l.size() + 1;
    std::string s;
    s.reserve(n);
    for (std::size_t i = 0; i < out_.size(); ++i) {
      if (i) s += '\n';
      s += out_[i];
    }
    return s;
  }

 private:
  std::vector<std::string> out_;
};

}  // namespace

std::size_t count_guarded_assertions(std::string_view test_program) {
  const auto lines = split_lines(test_program);
  std::size_t n = 0;
  bool in_check = false;
  std::string_view indent;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::string_view l = lines[i];
    if (is_check_def(l)) {
      in_check = true;
      indent = text::leading_indent(l);
      continue;
    }
    if (!in_check || is_blank(l)) continue;
    if (!is_deeper(l, indent)) {
      in_check = false;
    } else if (is_assertion(l)) {
      ++n;
      i = statement_end(lines, i);
    }
  }
  return n;
}

std::string wrap_tests(std::string_view test_program, std::string_view entry_point) {
  const auto lines = split_lines(test_program);

  std::size_t assertions = 0;
  for (const auto l : lines) {
    if (is_assertion(l)) ++assertions;
  }
  if (assertions == 0) return std::string(test_program);

  // Each assertion grows by four lines; init, return and driver add ~10.
  HarnessWriter w(lines.size() + assertions * 4 + 10);
  bool in_check = false;
  std::string check_indent;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::string_view l = lines[i];

    if (is_check_def(l)) {
      if (in_check) w.close_check(check_indent);
      in_check = true;
      check_indent = std::string(text::leading_indent(l));
      w.open_check(l, check_indent);
      continue;
    }

    if (in_check && !is_blank(l)) {
      // Dedent to the def's level or shallower ends the body.
      if (!is_deeper(l, check_indent)) {
        w.close_check(check_indent);
        in_check = false;
        w.line(l);
        continue;
      }
      if (is_assertion(l)) {
        const std::size_t last = statement_end(lines, i);
        w.guarded(lines, i, last);
        i = last;
        continue;
      }
    }

    w.line(l);
  }

  if (in_check) w.close_check(check_indent);

  w.driver(entry_point);
  return w.join();
}

std::optional<TestSummary> parse_test_summary(std::string_view output) {
  // Digit runs longer than this cannot be a real assertion count.
  constexpr std::size_t kMaxDigits = 18;

  auto read_number = [&](std::size_t& i, std::uint64_t& value) {
    const std::size_t start = i;
    value = 0;
    while (i < output.size() && output[i] >= '0' && output[i] <= '9' &&
           i - start < kMaxDigits) {
      value = value * 10 + static_cast<std::uint64_t>(output[i] - '0');
      ++i;
    }
    // An overlong run is rejected, not cut short.
    if (i < output.size() && output[i] >= '0' && output[i] <= '9') return false;
    return i > start;
  };

  std::optional<TestSummary> last;
  std::size_t pos = output.find(kTestsPassedMarker);
  while (pos != std::string_view::npos) {
    std::size_t i = pos + kTestsPassedMarker.size();
    TestSummary s;
    if (read_number(i, s.passed) && i < output.size() && output[i] == '/') {
      ++i;
      if (read_number(i, s.total) && s.passed <= s.total) last = s;
    }
    pos = output.find(kTestsPassedMarker, pos + 1);
  }
  return last;
}

}  // namespace rlreward
