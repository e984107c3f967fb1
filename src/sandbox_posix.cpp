#include "rlreward/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__linux__)
#include <sched.h>
#endif

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <thread>

#include "rlreward/harness.hpp"
#include "rlreward/hash.hpp"
#include "rlreward/text.hpp"

namespace fs = std::filesystem;

namespace rlreward {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on one poll() wait while watching output and exit.
constexpr int kPollIntervalMs = 5;

// Reads per drain() call; keeps a chatty child from starving the deadline check.
constexpr int kMaxReadsPerDrain = 64;

// Exit code reported for a killed-on-deadline process.
constexpr int kTimeoutExitCode = 124;

constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

std::string errno_message(int err) {
  return std::error_code(err, std::generic_category()).message();
}

// Keeps the LAST `limit` bytes: the summary marker and the final traceback line
// are printed at the end of a run.
void append_tail(std::string& dst, const char* src, ssize_t n, std::size_t limit,
                 bool& truncated) {
  if (n <= 0) return;
  dst.append(src, static_cast<std::size_t>(n));
  if (dst.size() > 2 * limit) {
    dst.erase(0, dst.size() - limit);
    truncated = true;
  }
}

void finish_tail(std::string& dst, std::size_t limit, bool& truncated) {
  if (dst.size() > limit) {
    dst.erase(0, dst.size() - limit);
    truncated = true;
  }
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Reads what is available without blocking; closes `fd` at EOF.
void drain(int& fd, std::string& dst, std::size_t limit, bool& truncated) {
  if (fd < 0) return;
  char buf[4096];
  for (int i = 0; i < kMaxReadsPerDrain; ++i) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_tail(dst, buf, n, limit, truncated);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n == 0) close_fd(fd);
    return;
  }
}

// Owns every descriptor and the child pid of one run. Whatever path leaves
// run_process(), destruction kills the process group, reaps the child and
// closes the pipes.
struct ChildGuard {
  int out[2]{-1, -1};
  int err[2]{-1, -1};
  int exec_status[2]{-1, -1};  // CLOEXEC handshake: EOF = exec succeeded
  pid_t pid{-1};
  bool reaped{false};

  ChildGuard() = default;
  ChildGuard(const ChildGuard&) = delete;
  ChildGuard& operator=(const ChildGuard&) = delete;

  ~ChildGuard() {
    if (pid > 0 && !reaped) reap();
    for (int* fd : {&out[0], &out[1], &err[0], &err[1], &exec_status[0], &exec_status[1]}) {
      close_fd(*fd);
    }
  }

  // Kills whatever is left of the group, then collects the child's status.
  // The child must still be unreaped so its pid pins the process group id.
  int reap() {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    reaped = true;
    return status;
  }

  // True once the child has exited; leaves it unreaped (WNOWAIT).
  bool exited() const {
    siginfo_t info{};
    return ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
           info.si_pid == pid;
  }
};

[[noreturn]] void child_fail(int status_fd) {
  const int e = errno;
  const ssize_t w = ::write(status_fd, &e, sizeof(e));
  (void)w;  // nothing left to report to if the handshake pipe is gone
  ::_exit(127);
}

void set_limit(int resource, std::uint64_t soft, std::uint64_t hard) {
  struct rlimit rl;
  rl.rlim_cur = static_cast<rlim_t>(soft);
  rl.rlim_max = static_cast<rlim_t>(hard);
  ::setrlimit(resource, &rl);
}

// Child side, between fork() and execve(): async-signal-safe calls only.
[[noreturn]] void exec_child(const ProcessSpec& spec, ChildGuard& g, char* const* argv,
                             char* const* envp) {
  ::setsid();
#if defined(__linux__)
  if (spec.enforce_network_isolation) {
    // Needs CAP_SYS_ADMIN; without it the run proceeds with the host network.
    (void)::unshare(CLONE_NEWNET);
  }
#endif
  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    if (devnull != STDIN_FILENO) ::close(devnull);
  }
  // dup2 clears FD_CLOEXEC on the targets; the originals close at exec.
  if (::dup2(g.out[1], STDOUT_FILENO) < 0 || ::dup2(g.err[1], STDERR_FILENO) < 0) {
    child_fail(g.exec_status[1]);
  }
  if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) child_fail(g.exec_status[1]);

  if (spec.max_memory_bytes > 0) {
    set_limit(RLIMIT_AS, spec.max_memory_bytes, spec.max_memory_bytes);
  }
  if (spec.cpu_time_seconds > 0) {
    // SIGXCPU at the soft limit, SIGKILL one second later.
    set_limit(RLIMIT_CPU, spec.cpu_time_seconds, spec.cpu_time_seconds + 1);
  }
  if (spec.max_file_bytes > 0) {
    set_limit(RLIMIT_FSIZE, spec.max_file_bytes, spec.max_file_bytes);
  }
  set_limit(RLIMIT_CORE, 0, 0);

  ::execve(spec.command.c_str(), argv, envp);
  child_fail(g.exec_status[1]);
}

std::map<std::string, std::string> sandbox_env(const std::string& home) {
  const char* parent_path = std::getenv("PATH");
  return {
      {"PATH", (parent_path && parent_path[0]) ? parent_path : kDefaultPath},
      {"HOME", home},
      {"TMPDIR", home},
      {"LANG", "C.UTF-8"},
      {"PYTHONHASHSEED", "0"},
      {"PYTHONDONTWRITEBYTECODE", "1"},
      {"PYTHONIOENCODING", "utf-8"},
      {"PYTHONPATH", ""},
  };
}

std::uint64_t elapsed_ns(Clock::time_point t0) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0).count());
}

// Last non-blank line of a stream, capped; the exception line of a traceback.
std::string last_line(std::string_view s) {
  constexpr std::size_t kMaxLen = 200;
  s = text::trim_view(s);
  const std::size_t nl = s.rfind('\n');
  std::string_view l = nl == std::string_view::npos ? s : s.substr(nl + 1);
  l = text::trim_view(l);
  return std::string(l.substr(0, std::min(l.size(), kMaxLen)));
}

}  // namespace

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  ChildGuard g;

  if (::pipe2(g.out, O_CLOEXEC) != 0 || ::pipe2(g.err, O_CLOEXEC) != 0 ||
      ::pipe2(g.exec_status, O_CLOEXEC) != 0) {
    result.error_message = "spawn_failed: pipe: " + errno_message(errno);
    return result;
  }

  // Everything the child needs is built before fork(); the child may not allocate.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  g.pid = ::fork();
  if (g.pid < 0) {
    result.error_message = "spawn_failed: fork: " + errno_message(errno);
    g.pid = -1;
    return result;
  }
  if (g.pid == 0) exec_child(spec, g, argv.data(), envp.data());

  close_fd(g.out[1]);
  close_fd(g.err[1]);
  close_fd(g.exec_status[1]);

  int child_errno = 0;
  ssize_t hs = 0;
  do {
    hs = ::read(g.exec_status[0], &child_errno, sizeof(child_errno));
  } while (hs < 0 && errno == EINTR);
  if (hs == static_cast<ssize_t>(sizeof(child_errno))) {
    g.reap();
    result.exit_code = 127;
    result.error_message = "spawn_failed: " + spec.command + ": " + errno_message(child_errno);
    return result;
  }

  ::fcntl(g.out[0], F_SETFL, O_NONBLOCK);
  ::fcntl(g.err[0], F_SETFL, O_NONBLOCK);

  const auto deadline = Clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  const std::size_t limit = spec.max_output_bytes;
  bool exited = false;

  while (!exited) {
    const auto now = Clock::now();
    if (now >= deadline) break;
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    const int wait_ms = static_cast<int>(std::max<long long>(
        1, std::min<long long>(kPollIntervalMs, static_cast<long long>(remaining))));

    pollfd pfds[2];
    nfds_t nfds = 0;
    if (g.out[0] >= 0) pfds[nfds++] = {g.out[0], POLLIN, 0};
    if (g.err[0] >= 0) pfds[nfds++] = {g.err[0], POLLIN, 0};
    if (nfds > 0) {
      ::poll(pfds, nfds, wait_ms);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }

    drain(g.out[0], result.stdout_text, limit, result.stdout_truncated);
    drain(g.err[0], result.stderr_text, limit, result.stderr_truncated);
    exited = g.exited();
  }

  int status = 0;
  if (!exited) {
    result.timed_out = true;
    g.reap();
  } else {
    status = g.reap();
  }

  // Whatever is still buffered. Escaped grandchildren holding a write end
  // cannot stall this: the descriptors are non-blocking.
  drain(g.out[0], result.stdout_text, limit, result.stdout_truncated);
  drain(g.err[0], result.stderr_text, limit, result.stderr_truncated);
  finish_tail(result.stdout_text, limit, result.stdout_truncated);
  finish_tail(result.stderr_text, limit, result.stderr_truncated);

  if (result.timed_out) {
    result.exit_code = kTimeoutExitCode;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::string resolve_executable(const std::string& name) {
  if (name.empty()) return "";
  std::error_code ec;
  auto usable = [&ec](const fs::path& p) {
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
  };

  if (name.find('/') != std::string::npos) {
    const fs::path p = fs::absolute(name, ec);
    return (!ec && usable(p)) ? p.string() : "";
  }

  const char* path_env = std::getenv("PATH");
  const std::string search = (path_env && path_env[0]) ? path_env : kDefaultPath;
  std::size_t start = 0;
  while (start <= search.size()) {
    std::size_t colon = search.find(':', start);
    if (colon == std::string::npos) colon = search.size();
    const std::string dir = search.substr(start, colon - start);
    const fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
    if (usable(candidate)) {
      const fs::path abs = fs::absolute(candidate, ec);
      if (!ec) return abs.string();
    }
    start = colon + 1;
  }
  return "";
}

// ---------------------------------------------------------------------------
// ScratchDir
// ---------------------------------------------------------------------------

ScratchDir::ScratchDir(const std::string& root) {
  std::string tmpl = root + "/rlreward-XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    error_ = "mkdtemp " + tmpl + ": " + errno_message(errno);
    return;
  }
  path_ = buf.data();
}

ScratchDir::~ScratchDir() {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    std::cerr << "[rlreward] scratch cleanup failed for " << path_ << ": " << ec.message()
              << "\n";
  }
}

bool ScratchDir::write_file(const std::string& name, std::string_view content) const {
  if (path_.empty()) return false;
  const std::string file = path_ + "/" + name;
  const int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) return false;
  std::size_t off = 0;
  bool ok = true;
  while (off < content.size()) {
    const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      ok = false;
      break;
    }
    off += static_cast<std::size_t>(n);
  }
  return ::close(fd) == 0 && ok;
}

std::string default_scratch_root() {
  const char* tmp = std::getenv("TMPDIR");
  return (tmp && tmp[0]) ? std::string(tmp) : std::string("/tmp");
}

// ---------------------------------------------------------------------------
// Sandbox executor
// ---------------------------------------------------------------------------

ExecutionOutcome run_program(std::string_view program, const SandboxLimits& limits) {
  const auto t0 = Clock::now();
  ExecutionOutcome out;
  auto fail = [&](ErrorCode code, std::string message) {
    out.error = code;
    out.error_message = std::move(message);
    out.duration_ns = elapsed_ns(t0);
    return out;
  };

  if (text::trim_view(program).empty()) return fail(ErrorCode::empty_code, "empty program");
  if (limits.interpreter.empty()) return fail(ErrorCode::spawn_failed, "interpreter not found");

  ScratchDir scratch(limits.scratch_root.empty() ? default_scratch_root() : limits.scratch_root);
  if (!scratch.valid()) return fail(ErrorCode::scratch_failed, scratch.error());

  const std::string script = "prog_" + program_digest(program).substr(0, 16) + ".py";
  if (!scratch.write_file(script, program)) {
    return fail(ErrorCode::scratch_failed, "cannot write " + script);
  }

  ProcessSpec spec;
  spec.command = limits.interpreter;
  spec.argv = {"-u", script};
  spec.env = sandbox_env(scratch.path());
  spec.cwd = scratch.path();
  spec.timeout_ms = limits.timeout_ms;
  spec.max_output_bytes = limits.max_output_bytes;
  spec.max_memory_bytes = limits.memory_limit_bytes;
  spec.cpu_time_seconds = limits.cpu_time_seconds;
  spec.max_file_bytes = limits.max_file_bytes;
  spec.enforce_network_isolation = limits.isolate_network;

  ProcessResult pr = run_process(spec);
  out.exit_code = pr.exit_code;
  out.timed_out = pr.timed_out;

  if (!pr.error_message.empty()) return fail(ErrorCode::spawn_failed, pr.error_message);
  if (pr.timed_out) {
    return fail(ErrorCode::timeout,
                "wall-clock timeout after " + std::to_string(limits.timeout_ms) + " ms");
  }

  out.stdout_text = std::move(pr.stdout_text);
  out.stderr_text = std::move(pr.stderr_text);
  out.stdout_truncated = pr.stdout_truncated;

  if (const auto summary = parse_test_summary(out.stdout_text)) {
    out.marker_found = true;
    out.passed = summary->passed;
    out.total = summary->total;
    // The driver exits 0 exactly when everything passed.
    if (out.exit_code != 0 && out.passed == out.total) {
      return fail(ErrorCode::nonzero_exit,
                  "exit status " + std::to_string(out.exit_code) + " after full pass");
    }
  } else if (out.exit_code != 0) {
    return fail(ErrorCode::nonzero_exit, "exit status " + std::to_string(out.exit_code) +
                                             ": " + last_line(out.stderr_text));
  } else {
    return fail(ErrorCode::marker_missing, "no TESTS_PASSED marker in output");
  }

  out.duration_ns = elapsed_ns(t0);
  return out;
}

ExecutionOutcome run_tests(std::string_view candidate_code, std::string_view harness,
                           const SandboxLimits& limits) {
  std::string program;
  program.reserve(candidate_code.size() + harness.size() + 2);
  program.append(candidate_code).append("\n\n").append(harness);
  return run_program(program, limits);
}

}  // namespace rlreward
