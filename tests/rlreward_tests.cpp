#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "rlreward/completion.hpp"
#include "rlreward/config.hpp"
#include "rlreward/evaluator.hpp"
#include "rlreward/extract.hpp"
#include "rlreward/format.hpp"
#include "rlreward/harness.hpp"
#include "rlreward/hash.hpp"
#include "rlreward/jsonlite.hpp"
#include "rlreward/observability.hpp"
#include "rlreward/sandbox.hpp"
#include "rlreward/worker.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

const std::string kAddTest =
    "def check(candidate):\n"
    "    assert candidate(1, 2) == 3\n"
    "    assert candidate(0, 0) == 0";

rlreward::EvaluatorConfig quick_config(std::uint64_t timeout_seconds = 10) {
  rlreward::EvaluatorConfig cfg;
  cfg.timeout_seconds = timeout_seconds;
  cfg.cpu_time_limit = timeout_seconds;
  cfg.num_threads = 4;
  return cfg;
}

rlreward::SandboxLimits quick_limits(std::uint64_t timeout_ms = 10000) {
  rlreward::SandboxLimits limits;
  limits.interpreter = rlreward::resolve_executable("python3");
  limits.timeout_ms = timeout_ms;
  return limits;
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(rlreward::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(rlreward::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_program_digest_domain() {
  const std::string program = "print('x')";
  const std::string digest = rlreward::program_digest(program);
  expect(digest.size() == 64, "program digest must be 64 hex chars");
  expect(digest == rlreward::program_digest(program), "program digest must be deterministic");
  expect(digest != rlreward::blake3_hex(program), "program digest must be domain separated");
  expect(digest == rlreward::hash_domain("prog:", program), "program digest uses prog: domain");

  const auto info = rlreward::hash_runtime_info();
  expect(info.primitive == "blake3", "hash primitive must be blake3");
  expect(!info.version.empty(), "hash version must be reported");
}

// ============================================================================
// Completion normalization
// ============================================================================

void test_completion_shapes() {
  using rlreward::Completion;
  using rlreward::Message;
  const std::vector<Completion> batch = {
      Completion{std::string("plain")},
      Completion{Message{"assistant", "record"}},
      Completion{std::vector<Message>{{"assistant", "first"}, {"user", "second"}}},
      Completion{std::vector<Message>{}},
  };
  const auto texts = rlreward::completion_texts(batch);
  expect(texts.size() == 4, "one text per completion");
  expect(texts[0] == "plain", "raw text passes through");
  expect(texts[1] == "record", "record yields its content");
  expect(texts[2] == "first", "conversation yields the first message");
  expect(texts[3].empty(), "empty conversation yields empty text");
}

// ============================================================================
// Code extraction
// ============================================================================

void test_extract_answer_with_fence() {
  const std::string c =
      "<think>reasoning</think><answer>\n```python\ndef add(a, b):\n    return a + b\n```\n"
      "</answer>";
  expect(rlreward::extract_code(c) == "def add(a, b):\n    return a + b",
         "fenced answer content must be unwrapped");
}

void test_extract_answer_case_insensitive() {
  const std::string c = "<THINK>x</THINK><Answer>  def f(): pass  </ANSWER>";
  expect(rlreward::extract_code(c) == "def f(): pass", "tag match must ignore case");
}

void test_extract_first_answer_pair() {
  const std::string c = "<answer>first</answer> and <answer>second</answer>";
  expect(rlreward::extract_code(c) == "first", "first answer pair wins");
}

void test_extract_unclosed_answer() {
  const std::string c = "  <answer>def f():\n    return 1  ";
  expect(rlreward::extract_code(c) == c, "unclosed answer returns the text unmodified");
}

void test_extract_empty_answer() {
  expect(rlreward::extract_code("<answer></answer>").empty(), "empty answer yields empty code");
  expect(rlreward::extract_code("<answer>\n```python\n```\n</answer>").empty(),
         "empty fenced answer yields empty code");
}

void test_extract_same_line_fence_untouched() {
  const std::string c = "<answer>```def f(): return 1```</answer>";
  expect(rlreward::extract_code(c) == "```def f(): return 1```",
         "fence sharing a line with code is left as written");
}

void test_extract_fallback_fenced_block() {
  const std::string c =
      "Here you go:\n```py\nx = 1\n```\nand also\n```\ny = 2\n```\n";
  expect(rlreward::extract_code(c) == "x = 1", "first fenced block is used");

  const std::string bare = "Sure:\n```\nprint(3)\n```";
  expect(rlreward::extract_code(bare) == "print(3)", "fence without language tag");
}

void test_extract_inline_span_before_block() {
  const std::string c =
      "Call it like ```add(1, 2)```\n```python\ndef add(a, b):\n    return a + b\n```";
  expect(rlreward::extract_code(c) == "def add(a, b):\n    return a + b",
         "inline triple-backtick span does not open a block");
  expect(!rlreward::first_fenced_block("see ```x```\nno block here\n```").has_value(),
         "fence closing an inline span is not an opening fence");
}

void test_extract_embedded_backticks() {
  const std::string c = "```python\ns = \"``\"\nt = '`x`'\n```";
  expect(rlreward::extract_code(c) == "s = \"``\"\nt = '`x`'",
         "backticks inside code do not close the block");
}

void test_extract_plain_text() {
  expect(rlreward::extract_code("\n  def f():\n    return 2\n\n") == "def f():\n    return 2",
         "plain text is trimmed");
  expect(rlreward::extract_code("").empty(), "empty completion yields empty code");
  expect(!rlreward::first_fenced_block("```python\nunterminated").has_value(),
         "unterminated fence is not a block");
}

// ============================================================================
// Format reward
// ============================================================================

void test_format_reward_batch() {
  using rlreward::Completion;
  const std::vector<Completion> batch = {
      Completion{std::string("<think>r</think><answer>c</answer>")},
      Completion{std::string("<answer>c</answer>")},
      Completion{std::string("<think>\nmulti\nline\n</think>\n<ANSWER>\nx\n</answer>")},
  };
  const auto rewards = rlreward::format_rewards(batch);
  expect(rewards.size() == 3, "one format reward per completion");
  expect(rewards[0] == 1.0, "well-formed completion scores 1.0");
  expect(rewards[1] == 0.0, "missing think block scores 0.0");
  expect(rewards[2] == 1.0, "multi-line mixed-case completion scores 1.0");
}

void test_format_requires_order() {
  expect(!rlreward::has_valid_format("<answer>a</answer><think>t</think>"),
         "answer before think is not valid format");
  expect(!rlreward::has_valid_format("<think>t<answer>a</answer>"), "unclosed think");
  expect(rlreward::has_valid_format("pre <think></think> mid <answer></answer> post"),
         "surrounding text is allowed");
}

// ============================================================================
// Harness transformation
// ============================================================================

void test_wrap_exact_output() {
  const std::string expected =
      "def check(candidate):\n"
      "    _results = []\n"
      "    try:\n"
      "        assert candidate(1, 2) == 3\n"
      "        _results.append(True)\n"
      "    except:\n"
      "        _results.append(False)\n"
      "    try:\n"
      "        assert candidate(0, 0) == 0\n"
      "        _results.append(True)\n"
      "    except:\n"
      "        _results.append(False)\n"
      "    return _results\n"
      "\n"
      "_test_results = check(add)\n"
      "\n"
      "# Report test results\n"
      "_passed = sum(_test_results)\n"
      "_total = len(_test_results)\n"
      "print(f\"TESTS_PASSED:{_passed}/{_total}\")\n"
      "exit(0 if _passed == _total else 1)";
  expect(rlreward::wrap_tests(kAddTest, "add") == expected, "wrapped harness layout");
}

void test_wrap_without_assertions_is_identity() {
  const std::string t = "def check(candidate):\n    candidate(1)\n    pass\n";
  expect(rlreward::wrap_tests(t, "f") == t, "no assertions: byte-for-byte pass-through");
  expect(rlreward::wrap_tests("", "f").empty(), "empty test program passes through");
}

void test_wrap_blank_lines_inside_body() {
  const std::string t =
      "def check(candidate):\n"
      "    assert candidate(1) == 1\n"
      "\n"
      "    assert candidate(2) == 2";
  expect(rlreward::count_guarded_assertions(t) == 2, "blank line does not end the body");
  const std::string w = rlreward::wrap_tests(t, "f");
  expect(w.find("        assert candidate(2) == 2") != std::string::npos,
         "assertion after blank line is guarded");
}

void test_wrap_dedent_ends_body() {
  const std::string t =
      "METADATA = {}\n"
      "\n"
      "def check(candidate):\n"
      "    assert candidate(1) == 1\n"
      "\n"
      "assert True\n"
      "x = 5";
  expect(rlreward::count_guarded_assertions(t) == 1, "top-level assertion is not guarded");
  const std::string w = rlreward::wrap_tests(t, "f");
  const auto ret = w.find("    return _results\n");
  const auto top = w.find("\nassert True\n");
  expect(ret != std::string::npos && top != std::string::npos, "body closed before dedent");
  expect(ret < top, "return precedes trailing content");
  expect(w.find("x = 5\n_test_results = check(f)") != std::string::npos,
         "driver follows trailing content");
  expect(w.rfind("METADATA = {}", 0) == 0, "leading content is preserved");
}

void test_wrap_multiline_assertion() {
  const std::string t =
      "def check(candidate):\n"
      "    assert candidate([1,\n"
      "                      2]) == 3, \\\n"
      "        \"sum\"\n"
      "    assert candidate([]) == 0";
  expect(rlreward::count_guarded_assertions(t) == 2, "continuation lines belong to one assertion");
  const std::string w = rlreward::wrap_tests(t, "f");
  expect(w.find("        assert candidate([1,\n"
                "                          2]) == 3, \\\n"
                "            \"sum\"\n"
                "        _results.append(True)") != std::string::npos,
         "whole statement moves into the try block");
}

void test_wrap_triple_quoted_assertion() {
  const std::string t =
      "def check(candidate):\n"
      "    assert candidate() == \"\"\"a\n"
      "  b\n"
      "c\"\"\", candidate([1,\n"
      "    2])";
  expect(rlreward::count_guarded_assertions(t) == 1, "triple-quoted string spans one assertion");
  const std::string w = rlreward::wrap_tests(t, "f");
  expect(w.find("    try:\n"
                "        assert candidate() == \"\"\"a\n"
                "  b\n"
                "c\"\"\", candidate([1,\n"
                "        2])\n"
                "        _results.append(True)") != std::string::npos,
         "string content copied as is, bracket continuation re-indented");
}

void test_wrap_indented_check_and_call_form() {
  const std::string t =
      "class T:\n"
      "    def check(candidate):\n"
      "        assert(candidate(1) == 1)\n"
      "        assert   candidate(2) == 2";
  expect(rlreward::count_guarded_assertions(t) == 2, "assert( and extra spacing are assertions");
  const std::string w = rlreward::wrap_tests(t, "f");
  expect(w.find("        _results = []") != std::string::npos, "init at nested body indent");
  expect(w.find("        try:\n            assert(candidate(1) == 1)") != std::string::npos,
         "guard at nested indent");
  expect(w.find("        return _results") != std::string::npos, "return at nested body indent");
}

void test_assertion_count_matches_assert_lines() {
  std::string t = "def check(candidate):\n";
  for (int i = 0; i < 25; ++i) {
    t += "    assert candidate(" + std::to_string(i) + ") == " + std::to_string(i) + "\n";
  }
  expect(rlreward::count_guarded_assertions(t) == 25, "k assertions, k guards");
  const std::string w = rlreward::wrap_tests(t, "f");
  std::size_t guards = 0;
  for (std::size_t p = w.find("_results.append(True)"); p != std::string::npos;
       p = w.find("_results.append(True)", p + 1)) {
    ++guards;
  }
  expect(guards == 25, "one recorded outcome per assertion");
}

// ============================================================================
// Result marker parsing
// ============================================================================

void test_parse_summary() {
  auto s = rlreward::parse_test_summary("noise\nTESTS_PASSED:3/4\n");
  expect(s && s->passed == 3 && s->total == 4, "marker parsed");

  s = rlreward::parse_test_summary("TESTS_PASSED:9/9\nTESTS_PASSED:1/2\n");
  expect(s && s->passed == 1 && s->total == 2, "last marker wins");

  expect(!rlreward::parse_test_summary("TESTS_PASSED: 1/2").has_value(), "space is not allowed");
  expect(!rlreward::parse_test_summary("TESTS_PASSED:5/2").has_value(),
         "passed above total is not a summary");
  expect(!rlreward::parse_test_summary("tests_passed:1/1").has_value(), "marker is case-sensitive");
  expect(!rlreward::parse_test_summary("").has_value(), "no output, no summary");
  expect(!rlreward::parse_test_summary("TESTS_PASSED:5/1234567890123456789").has_value(),
         "19-digit count is rejected, not truncated");
  s = rlreward::parse_test_summary("TESTS_PASSED:1/1\nTESTS_PASSED:1/99999999999999999999\n");
  expect(s && s->total == 1, "overlong marker falls back to the previous one");

  s = rlreward::parse_test_summary("TESTS_PASSED:0/0");
  expect(s && s->total == 0, "0/0 is parsed");
}

void test_outcome_reward_policies() {
  rlreward::ExecutionOutcome o;
  o.marker_found = true;
  o.passed = 3;
  o.total = 4;
  o.exit_code = 1;
  expect(rlreward::outcome_reward(o, rlreward::RewardPolicy::strict) == 0.0, "strict partial");
  expect(rlreward::outcome_reward(o, rlreward::RewardPolicy::fractional) == 0.75,
         "fractional partial");

  o.passed = 4;
  o.exit_code = 0;
  expect(rlreward::outcome_reward(o, rlreward::RewardPolicy::strict) == 1.0, "strict full pass");

  o.total = 0;
  o.passed = 0;
  expect(rlreward::outcome_reward(o, rlreward::RewardPolicy::strict) == 0.0, "0/0 scores 0.0");

  rlreward::ExecutionOutcome t;
  t.timed_out = true;
  t.error = rlreward::ErrorCode::timeout;
  expect(rlreward::outcome_reward(t, rlreward::RewardPolicy::fractional) == 0.0,
         "timeout scores 0.0");
}

void test_precheck() {
  using rlreward::ErrorCode;
  expect(rlreward::precheck_sample("", "def f(): pass", "f") == ErrorCode::missing_test,
         "empty test");
  expect(rlreward::precheck_sample("null", "def f(): pass", "f") == ErrorCode::missing_test,
         "null test");
  expect(rlreward::precheck_sample(kAddTest, "   \n", "add") == ErrorCode::empty_code,
         "blank code");
  expect(rlreward::precheck_sample(kAddTest, "def sub(a, b): pass", "add") ==
             ErrorCode::entry_point_missing,
         "entry point not defined");
  expect(rlreward::precheck_sample(kAddTest, "def twoSum(self): pass", "Solution().twoSum") ==
             ErrorCode::entry_point_missing,
         "Solution entry point needs class Solution");
  expect(rlreward::precheck_sample(kAddTest, "class Solution:\n    def twoSum(self): pass",
                                   "Solution().twoSum") == ErrorCode::none,
         "Solution method accepted");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_and_validation() {
  rlreward::EvaluatorConfig cfg;
  auto v = rlreward::validate_config(cfg);
  expect(v.ok && v.errors.empty(), "defaults are valid");
  expect(cfg.reward_policy == rlreward::RewardPolicy::strict, "strict by default");

  cfg.timeout_seconds = 0;
  cfg.num_threads = 0;
  v = rlreward::validate_config(cfg);
  expect(!v.ok && v.errors.size() == 2, "zero timeout and threads rejected");

  rlreward::EvaluatorConfig huge;
  huge.timeout_seconds = 20'000'000'000'000'000ull;
  huge.cpu_time_limit = 100'000;
  huge.memory_limit_mb = 20'000'000'000'000ull;
  v = rlreward::validate_config(huge);
  expect(!v.ok && v.errors.size() == 3, "limits that would overflow ms or bytes are rejected");

  ::setenv("RLREWARD_MEMORY_LIMIT_MB", "18446744073709551615", 1);
  bool env_threw = false;
  try {
    rlreward::RewardEvaluator e(rlreward::EvaluatorConfig::from_env());
  } catch (const rlreward::UsageError& e) {
    env_threw = e.code() == rlreward::ErrorCode::config_invalid;
  }
  ::unsetenv("RLREWARD_MEMORY_LIMIT_MB");
  expect(env_threw, "oversized limit from the environment is rejected");

  rlreward::EvaluatorConfig low;
  low.timeout_seconds = 2;
  v = rlreward::validate_config(low);
  expect(v.ok && !v.warnings.empty(), "timeout below cpu limit warns");

  bool threw = false;
  try {
    rlreward::EvaluatorConfig bad;
    bad.interpreter.clear();
    rlreward::RewardEvaluator e(bad);
  } catch (const rlreward::UsageError& e) {
    threw = e.code() == rlreward::ErrorCode::config_invalid;
  }
  expect(threw, "invalid config throws UsageError");

  const std::string json = rlreward::config_to_json(rlreward::EvaluatorConfig{});
  expect(json.find("\"timeout_seconds\":15") != std::string::npos, "config json timeout");
  expect(json.find("\"reward_policy\":\"strict\"") != std::string::npos, "config json policy");
}

void test_config_from_env() {
  ::setenv("RLREWARD_TIMEOUT_SECONDS", "20", 1);
  ::setenv("RLREWARD_NUM_THREADS", "not-a-number", 1);
  ::setenv("RLREWARD_REWARD_POLICY", "fractional", 1);
  const auto cfg = rlreward::EvaluatorConfig::from_env();
  ::unsetenv("RLREWARD_TIMEOUT_SECONDS");
  ::unsetenv("RLREWARD_NUM_THREADS");
  ::unsetenv("RLREWARD_REWARD_POLICY");

  expect(cfg.timeout_seconds == 20, "timeout overlaid from env");
  expect(cfg.num_threads == 32, "unparseable value keeps default");
  expect(cfg.reward_policy == rlreward::RewardPolicy::fractional, "policy overlaid from env");

  rlreward::RewardPolicy p;
  expect(!rlreward::parse_reward_policy("lenient", p), "unknown policy rejected");
}

// ============================================================================
// Worker pool
// ============================================================================

void test_map_indexed_preserves_order() {
  const auto out = rlreward::map_indexed<std::size_t>(64, 8, [](std::size_t i) {
    // Earlier indices take longer so they finish last.
    std::this_thread::sleep_for(std::chrono::microseconds((64 - i) * 50));
    return i * i;
  });
  expect(out.size() == 64, "one result per job");
  for (std::size_t i = 0; i < out.size(); ++i) expect(out[i] == i * i, "result in input order");

  expect(rlreward::map_indexed<int>(0, 4, [](std::size_t) { return 1; }).empty(),
         "empty batch");
}

void test_run_indexed_propagates_exception() {
  std::atomic<int> ran{0};
  bool threw = false;
  try {
    rlreward::run_indexed(16, 4, [&](std::size_t i) {
      ran.fetch_add(1);
      if (i == 3) throw std::runtime_error("job 3");
    });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "job 3";
  }
  expect(threw, "job exception rethrown on caller");
  expect(ran.load() == 16, "remaining jobs still run");
}

// ============================================================================
// Observability
// ============================================================================

std::atomic<int> g_hook_calls{0};
void counting_hook(const rlreward::EvaluationEvent&) { g_hook_calls.fetch_add(1); }

void test_engine_stats_record() {
  rlreward::EngineStats stats;
  rlreward::EvaluationEvent ok;
  ok.reward = 1.0;
  ok.sandboxed = true;
  ok.sandbox_ns = 2'000'000;
  rlreward::EvaluationEvent slow;
  slow.sandboxed = true;
  slow.timed_out = true;
  slow.error = rlreward::ErrorCode::timeout;
  slow.sandbox_ns = 1'000'000'000;

  stats.record(ok);
  stats.record(slow);
  expect(stats.total_evaluations.load() == 2, "total evaluations");
  expect(stats.rewarded_evaluations.load() == 1, "rewarded evaluations");
  expect(stats.timeouts.load() == 1, "timeouts");
  expect(stats.failures(rlreward::ErrorCode::timeout) == 1, "failure category");
  expect(stats.latency_histogram.count() == 2, "latency samples");

  const std::string json = stats.to_json();
  expect(json.find("\"timeout\":1") != std::string::npos, "failure category in json");

  for (std::size_t i = 0; i < rlreward::EngineStats::kMaxRecentEvents + 10; ++i) {
    rlreward::EvaluationEvent ev;
    ev.passed = i;
    stats.record(ev);
  }
  const auto recent = stats.recent_events_snapshot();
  expect(recent.size() == rlreward::EngineStats::kMaxRecentEvents, "ring is bounded");
  expect(recent.front().passed == 10, "oldest retained event first");
  expect(recent.back().passed == rlreward::EngineStats::kMaxRecentEvents + 9,
         "newest event last");
}

void test_latency_histogram() {
  rlreward::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 100; ++i) h.record(1'000'000);  // 1 ms
  const double p50 = h.percentile(0.5);
  expect(p50 >= 512.0 && p50 <= 1024.0, "p50 in the 1 ms bucket");
  expect(h.mean_us() == 1000.0, "mean in microseconds");
}

void test_event_hook_and_log() {
  const fs::path log = fs::temp_directory_path() / "rlreward_test_events.jsonl";
  fs::remove(log);
  ::setenv("RLREWARD_EVENT_LOG", log.c_str(), 1);

  rlreward::EvaluationEvent ev;
  ev.execution_id = "abc";
  ev.entry_point = "Solution().f";
  ev.reward = 1.0;
  ev.error = rlreward::ErrorCode::none;

  rlreward::set_evaluation_event_hook(&counting_hook);
  rlreward::emit_evaluation_event(ev);
  rlreward::set_evaluation_event_hook(nullptr);
  expect(g_hook_calls.load() == 1, "hook receives the event");
  expect(!fs::exists(log), "hook replaces the log sink");

  rlreward::emit_evaluation_event(ev);
  ::unsetenv("RLREWARD_EVENT_LOG");

  std::ifstream in(log);
  std::string line;
  expect(static_cast<bool>(std::getline(in, line)), "event logged");
  expect(line.find("\"execution_id\":\"abc\"") != std::string::npos, "event json id");
  expect(line.find("\"entry_point\":\"Solution().f\"") != std::string::npos, "event json entry");
  fs::remove(log);
}

void test_json_escape() {
  expect(rlreward::jsonlite::escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "json escapes");
  expect(rlreward::jsonlite::escape(std::string("\x01", 1)) == "\\u0001", "control escape");
}

// ============================================================================
// Sandbox
// ============================================================================

void test_run_process_echo() {
  rlreward::ProcessSpec spec;
  spec.command = rlreward::resolve_executable("sh");
  spec.argv = {"-c", "echo hello; echo oops 1>&2; exit 3"};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.cwd = fs::temp_directory_path().string();
  const auto r = rlreward::run_process(spec);
  expect(r.error_message.empty(), "sh spawned");
  expect(r.stdout_text == "hello\n", "stdout captured");
  expect(r.stderr_text == "oops\n", "stderr captured");
  expect(r.exit_code == 3, "exit status reported");
  expect(!r.timed_out, "no timeout");
}

void test_run_process_timeout() {
  rlreward::ProcessSpec spec;
  spec.command = rlreward::resolve_executable("sh");
  spec.argv = {"-c", "echo started; sleep 30"};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.cwd = fs::temp_directory_path().string();
  spec.timeout_ms = 300;
  const auto t0 = std::chrono::steady_clock::now();
  const auto r = rlreward::run_process(spec);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - t0)
                      .count();
  expect(r.timed_out, "deadline enforced");
  expect(ms < 5000, "killed promptly, including the sleeping grandchild");
}

void test_run_process_tail_truncation() {
  rlreward::ProcessSpec spec;
  spec.command = rlreward::resolve_executable("sh");
  spec.argv = {"-c", "i=0; while [ $i -lt 2000 ]; do echo line$i; i=$((i+1)); done; echo END"};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.cwd = fs::temp_directory_path().string();
  spec.max_output_bytes = 128;
  const auto r = rlreward::run_process(spec);
  expect(r.stdout_truncated, "overflow flagged");
  expect(r.stdout_text.size() <= 128, "capture capped");
  expect(r.stdout_text.size() >= 4 && r.stdout_text.substr(r.stdout_text.size() - 4) == "END\n",
         "tail of the stream is kept");
}

void test_run_process_spawn_failure() {
  rlreward::ProcessSpec spec;
  spec.command = "/nonexistent/rlreward-binary";
  spec.cwd = fs::temp_directory_path().string();
  const auto r = rlreward::run_process(spec);
  expect(!r.error_message.empty(), "exec failure reported");
  expect(r.exit_code == 127, "exec failure exit code");
}

void test_scratch_dir_cleanup() {
  std::string path;
  {
    rlreward::ScratchDir dir(rlreward::default_scratch_root());
    expect(dir.valid(), "scratch dir created");
    expect(dir.write_file("a.py", "x = 1\n"), "scratch file written");
    path = dir.path();
    expect(fs::exists(fs::path(path) / "a.py"), "scratch file exists");
  }
  expect(!fs::exists(path), "scratch dir removed on destruction");
}

void test_run_program_marker_and_errors() {
  const auto limits = quick_limits();
  expect(!limits.interpreter.empty(), "python3 available for sandbox tests");

  auto o = rlreward::run_program("print('TESTS_PASSED:2/2')", limits);
  expect(o.all_passed() && o.passed == 2, "marker parsed from sandbox stdout");

  o = rlreward::run_program("print('hi')", limits);
  expect(o.error == rlreward::ErrorCode::marker_missing, "missing marker");

  o = rlreward::run_program("raise SystemExit(1)\n", limits);
  expect(o.error == rlreward::ErrorCode::nonzero_exit, "crash without marker");

  o = rlreward::run_program("print('TESTS_PASSED:2/2')\nraise SystemExit(1)", limits);
  expect(o.error == rlreward::ErrorCode::nonzero_exit && !o.all_passed(),
         "full pass with failure status is not a pass");

  o = rlreward::run_program("import os\nprint('TESTS_PASSED:1/1' if os.path.samefile("
                            "os.getcwd(), os.environ['HOME']) else 'TESTS_PASSED:0/1')",
                            limits);
  expect(o.all_passed(), "cwd is the private scratch home");

  rlreward::SandboxLimits missing = limits;
  missing.interpreter.clear();
  o = rlreward::run_program("print(1)", missing);
  expect(o.error == rlreward::ErrorCode::spawn_failed, "no interpreter");
}

void test_run_program_timeout_discards_output() {
  const auto o = rlreward::run_program(
      "print('TESTS_PASSED:1/1', flush=True)\nwhile True:\n    pass\n", quick_limits(500));
  expect(o.timed_out && o.error == rlreward::ErrorCode::timeout, "timed out");
  expect(!o.marker_found && o.stdout_text.empty(), "partial output discarded");
}

// ============================================================================
// End-to-end reward evaluation
// ============================================================================

std::string answer(const std::string& code) {
  return "<think>plan</think>\n<answer>\n```python\n" + code + "\n```\n</answer>";
}

void test_execution_reward_pass_and_fail() {
  const rlreward::RewardEvaluator eval(quick_config());
  const std::vector<rlreward::Completion> batch = {
      answer("def add(a, b):\n    return a + b"),
      answer("def add(a, b):\n    return a - b"),
  };
  const auto rewards = eval.execution_reward(batch, {kAddTest, kAddTest}, {"add", "add"});
  expect(rewards.size() == 2, "one reward per sample");
  expect(rewards[0] == 1.0, "correct candidate scores 1.0");
  expect(rewards[1] == 0.0, "partially correct candidate scores 0.0");
}

void test_execution_reward_structured_equivalence() {
  const rlreward::RewardEvaluator eval(quick_config());
  const std::string text = answer("def add(a, b):\n    return a + b");
  const std::vector<rlreward::Completion> batch = {
      rlreward::Completion{text},
      rlreward::Completion{rlreward::Message{"assistant", text}},
      rlreward::Completion{std::vector<rlreward::Message>{{"assistant", text}}},
  };
  const auto rewards =
      eval.execution_reward(batch, {kAddTest, kAddTest, kAddTest}, {"add", "add", "add"});
  expect(rewards[0] == 1.0 && rewards[1] == 1.0 && rewards[2] == 1.0,
         "completion shape does not change the reward");
}

void test_execution_reward_multiline_string_expectation() {
  const rlreward::RewardEvaluator eval(quick_config());
  const std::string test =
      "def check(candidate):\n"
      "    assert candidate() == \"\"\"a\n"
      "b\"\"\"";
  const auto r = eval.evaluate_sample(answer("def f():\n    return 'a\\nb'"), test, "f");
  expect(r.outcome.marker_found && r.outcome.passed == 1 && r.outcome.total == 1,
         "triple-quoted expectation compares unchanged");
  expect(r.reward == 1.0, "correct candidate scores 1.0");
}

void test_execution_reward_timeout_isolated() {
  const rlreward::RewardEvaluator eval(quick_config(1));
  const std::vector<rlreward::Completion> batch = {
      answer("def add(a, b):\n    while True:\n        pass"),
      answer("def add(a, b):\n    return a + b"),
  };
  const auto t0 = std::chrono::steady_clock::now();
  const auto rewards = eval.execution_reward(batch, {kAddTest, kAddTest}, {"add", "add"});
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
  expect(rewards[0] == 0.0, "hanging candidate scores 0.0");
  expect(rewards[1] == 1.0, "fast candidate unaffected by the hang");
  expect(secs < 10, "batch bounded by the per-sample timeout");
}

void test_execution_reward_prechecks() {
  const rlreward::RewardEvaluator eval(quick_config());
  const auto before = rlreward::global_engine_stats().sandbox_runs.load();
  const std::vector<rlreward::Completion> batch = {
      answer("def add(a, b):\n    return a + b"),
      std::string("<answer></answer>"),
      answer("def plus(a, b):\n    return a + b"),
  };
  const auto rewards = eval.execution_reward(batch, {"null", kAddTest, kAddTest},
                                             {"add", "add", "add"});
  expect(rewards == std::vector<double>({0.0, 0.0, 0.0}), "pre-checked samples score 0.0");
  expect(rlreward::global_engine_stats().sandbox_runs.load() == before,
         "pre-checked samples never reach the sandbox");
}

void test_execution_reward_crash_and_no_assertions() {
  const rlreward::RewardEvaluator eval(quick_config());
  const std::vector<rlreward::Completion> batch = {
      answer("def add(a, b):\n    return a + b\nraise RuntimeError('boom')"),
      answer("def add(a, b):\n    return a + b"),
  };
  const std::string no_asserts = "def check(candidate):\n    candidate(1, 2)\n";
  const auto rewards = eval.execution_reward(batch, {kAddTest, no_asserts}, {"add", "add"});
  expect(rewards[0] == 0.0, "setup crash scores 0.0");
  expect(rewards[1] == 0.0, "harness without marker scores 0.0");
}

void test_execution_reward_length_mismatch() {
  const rlreward::RewardEvaluator eval(quick_config());
  const auto before = rlreward::global_engine_stats().total_evaluations.load();
  bool threw = false;
  try {
    (void)eval.execution_reward({answer("def add(a, b): return a + b")}, {kAddTest, kAddTest},
                                {"add"});
  } catch (const rlreward::UsageError& e) {
    threw = e.code() == rlreward::ErrorCode::length_mismatch;
  }
  expect(threw, "length mismatch raises UsageError");
  expect(rlreward::global_engine_stats().total_evaluations.load() == before,
         "nothing evaluated on usage error");
  expect(eval.execution_reward({}, {}, {}).empty(), "empty batch yields empty rewards");
}

void test_evaluators_side_by_side() {
  const rlreward::RewardEvaluator slow(quick_config(3));
  const rlreward::RewardEvaluator fast(quick_config(20));
  expect(slow.limits().timeout_ms == 3000 && fast.limits().timeout_ms == 20000,
         "each evaluator keeps its own timeout");

  std::vector<double> a;
  std::vector<double> b;
  std::thread t([&] {
    a = slow.execution_reward({answer("def add(a, b):\n    return a + b")}, {kAddTest}, {"add"});
  });
  b = fast.execution_reward({answer("def add(a, b):\n    return a + b")}, {kAddTest}, {"add"});
  t.join();
  expect(a == std::vector<double>{1.0} && b == std::vector<double>{1.0},
         "concurrent evaluators are independent");
}

void test_fractional_policy() {
  auto cfg = quick_config();
  cfg.reward_policy = rlreward::RewardPolicy::fractional;
  const rlreward::RewardEvaluator eval(cfg);
  const std::string test =
      "def check(candidate):\n"
      "    assert candidate(1, 2) == 3\n"
      "    assert candidate(2, 2) == 4\n"
      "    assert candidate(5, 1) == 6\n"
      "    assert candidate(0, 1) == 1";
  // Wrong only when the first argument is zero.
  const auto r = eval.evaluate_sample(answer("def add(a, b):\n    return a + b if a else 0"),
                                      test, "add");
  expect(r.sandboxed && r.outcome.passed == 3 && r.outcome.total == 4, "3 of 4 assertions pass");
  expect(r.reward == 0.75, "fractional reward");
  expect(r.error == rlreward::ErrorCode::tests_failed, "partial pass reported as tests_failed");
  expect(r.execution_id.size() == 64, "sandboxed sample carries a program digest");
}

void test_format_reward_through_evaluator() {
  const rlreward::RewardEvaluator eval(quick_config());
  const auto r = eval.format_reward({std::string("<think>a</think><answer>b</answer>"),
                                     std::string("plain")});
  expect(r == std::vector<double>({1.0, 0.0}), "evaluator format reward");
}

}  // namespace

int main() {
  std::cout << "=== rlreward Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("program digest domain", test_program_digest_domain);

  std::cout << "\n[Completions & Extraction]\n";
  run_test("completion shapes", test_completion_shapes);
  run_test("answer with fence", test_extract_answer_with_fence);
  run_test("answer tags case-insensitive", test_extract_answer_case_insensitive);
  run_test("first answer pair", test_extract_first_answer_pair);
  run_test("unclosed answer", test_extract_unclosed_answer);
  run_test("empty answer", test_extract_empty_answer);
  run_test("same-line fence untouched", test_extract_same_line_fence_untouched);
  run_test("fallback fenced block", test_extract_fallback_fenced_block);
  run_test("inline span before block", test_extract_inline_span_before_block);
  run_test("embedded backticks", test_extract_embedded_backticks);
  run_test("plain text", test_extract_plain_text);

  std::cout << "\n[Format Reward]\n";
  run_test("format reward batch", test_format_reward_batch);
  run_test("format tag order", test_format_requires_order);

  std::cout << "\n[Harness Transformation]\n";
  run_test("exact wrapped output", test_wrap_exact_output);
  run_test("no assertions pass-through", test_wrap_without_assertions_is_identity);
  run_test("blank lines inside body", test_wrap_blank_lines_inside_body);
  run_test("dedent ends body", test_wrap_dedent_ends_body);
  run_test("multi-line assertion", test_wrap_multiline_assertion);
  run_test("triple-quoted assertion", test_wrap_triple_quoted_assertion);
  run_test("indented check, assert( form", test_wrap_indented_check_and_call_form);
  run_test("k assertions, k guards", test_assertion_count_matches_assert_lines);

  std::cout << "\n[Scoring]\n";
  run_test("summary marker parsing", test_parse_summary);
  run_test("reward policies", test_outcome_reward_policies);
  run_test("sample pre-checks", test_precheck);

  std::cout << "\n[Configuration]\n";
  run_test("defaults and validation", test_config_defaults_and_validation);
  run_test("environment overlay", test_config_from_env);

  std::cout << "\n[Worker Pool]\n";
  run_test("order preservation", test_map_indexed_preserves_order);
  run_test("exception propagation", test_run_indexed_propagates_exception);

  std::cout << "\n[Observability]\n";
  run_test("engine stats", test_engine_stats_record);
  run_test("latency histogram", test_latency_histogram);
  run_test("event hook and log", test_event_hook_and_log);
  run_test("json escape", test_json_escape);

  std::cout << "\n[Sandbox]\n";
  run_test("process capture", test_run_process_echo);
  run_test("process timeout", test_run_process_timeout);
  run_test("tail truncation", test_run_process_tail_truncation);
  run_test("spawn failure", test_run_process_spawn_failure);
  run_test("scratch dir cleanup", test_scratch_dir_cleanup);
  run_test("program marker and errors", test_run_program_marker_and_errors);
  run_test("timeout discards output", test_run_program_timeout_discards_output);

  std::cout << "\n[Reward Evaluation]\n";
  run_test("pass and fail", test_execution_reward_pass_and_fail);
  run_test("structured completion equivalence", test_execution_reward_structured_equivalence);
  run_test("multi-line string expectation", test_execution_reward_multiline_string_expectation);
  run_test("timeout isolated within batch", test_execution_reward_timeout_isolated);
  run_test("pre-checks skip sandbox", test_execution_reward_prechecks);
  run_test("crash and no-assertion harness", test_execution_reward_crash_and_no_assertions);
  run_test("length mismatch", test_execution_reward_length_mismatch);
  run_test("evaluators side by side", test_evaluators_side_by_side);
  run_test("fractional policy", test_fractional_policy);
  run_test("format reward via evaluator", test_format_reward_through_evaluator);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
