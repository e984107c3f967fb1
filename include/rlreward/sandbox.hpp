#pragma once

// rlreward/sandbox.hpp - Time-bounded process isolation for candidate programs.
//
// SCOPE:
//   Best-effort isolation, not a security boundary. Every run gets:
//     - a fresh interpreter process in its own session / process group;
//     - a private scratch directory (cwd and HOME), removed after the run;
//     - a scrubbed environment;
//     - rlimits: address space, CPU seconds, file size, no core dumps;
//     - a network namespace when the kernel lets us create one (CAP_SYS_ADMIN).
//   No state crosses runs: nothing is reused, pooled or cached.
//
// TEARDOWN:
//   The process group is SIGKILLed and the child reaped on every exit path
//   (normal exit, timeout, read error), and the scratch directory is removed,
//   both by RAII guards. A timed-out run yields no output: partial stdout is
//   discarded, never parsed.
//
// PLATFORM: POSIX only (fork/exec, poll, waitid).

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "rlreward/types.hpp"

namespace rlreward {

struct ProcessSpec {
  std::string command;  // absolute path, passed to execve()
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};
  std::uint64_t max_memory_bytes{0};  // 0 = unlimited
  std::uint64_t cpu_time_seconds{0};  // 0 = unlimited
  std::uint64_t max_file_bytes{0};    // 0 = unlimited
  bool enforce_network_isolation{false};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // non-empty when the process could not be started
};

// Runs one process to completion or deadline. Never throws for process-level
// failures; they are reported through ProcessResult.
ProcessResult run_process(const ProcessSpec& spec);

// Absolute path of an executable. Names without '/' are searched in $PATH.
// Returns "" when nothing executable is found.
std::string resolve_executable(const std::string& name);

// ---------------------------------------------------------------------------
// ScratchDir - private per-run directory, removed recursively on destruction.
// ---------------------------------------------------------------------------
class ScratchDir {
 public:
  // Creates <root>/rlreward-XXXXXX with mode 0700. On failure valid() is false
  // and error() describes why.
  explicit ScratchDir(const std::string& root);
  ~ScratchDir();

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  bool valid() const { return !path_.empty(); }
  const std::string& path() const { return path_; }
  const std::string& error() const { return error_; }

  // Writes `content` to <path>/<name>. False on any I/O failure.
  bool write_file(const std::string& name, std::string_view content) const;

 private:
  std::string path_;
  std::string error_;
};

// Default parent of scratch directories: $TMPDIR, else /tmp.
std::string default_scratch_root();

struct SandboxLimits {
  std::string interpreter;  // resolved absolute path; empty = unavailable
  std::uint64_t timeout_ms{15000};
  std::uint64_t memory_limit_bytes{512ull * 1024 * 1024};
  std::uint64_t cpu_time_seconds{12};
  std::uint64_t max_file_bytes{10ull * 1000 * 1000};
  std::size_t max_output_bytes{64 * 1024};
  bool isolate_network{true};
  std::string scratch_root;  // empty = default_scratch_root()
};

// Executes `program` as one script in a fresh sandboxed interpreter and parses
// the TESTS_PASSED marker from its stdout.
ExecutionOutcome run_program(std::string_view program, const SandboxLimits& limits);

// Candidate code and instrumented harness run as one unit, candidate first, so
// the harness's entry-point reference binds to the candidate's definitions.
ExecutionOutcome run_tests(std::string_view candidate_code, std::string_view harness,
                           const SandboxLimits& limits);

}  // namespace rlreward
