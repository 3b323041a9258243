#include "cadence/executor/process_sandbox.hpp"

#include "cadence/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace cadence {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr int EXEC_FAILED = 127;

class Pipe {
public:
  Pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == 0) {
      read_ = fds[0];
      write_ = fds[1];
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe&) = delete;
  auto operator=(const Pipe&) -> Pipe& = delete;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return read_ >= 0 && write_ >= 0;
  }
  [[nodiscard]] auto read_fd() const noexcept -> int {
    return read_;
  }
  [[nodiscard]] auto write_fd() const noexcept -> int {
    return write_;
  }
  auto close_read() noexcept -> void {
    if (read_ >= 0) {
      ::close(read_);
      read_ = -1;
    }
  }
  auto close_write() noexcept -> void {
    if (write_ >= 0) {
      ::close(write_);
      write_ = -1;
    }
  }

private:
  int read_{-1};
  int write_{-1};
};

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto spawn(const std::string& program, const std::string& flag,
           const std::string& code, int stdout_fd, int stderr_fd) -> pid_t {
  // argv is built before fork; the child only calls async-signal-safe code.
  std::array<char*, 4> argv{const_cast<char*>(program.c_str()),
                            const_cast<char*>(flag.c_str()),
                            const_cast<char*>(code.c_str()), nullptr};

  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
    }
    dup2(stdout_fd, STDOUT_FILENO);
    dup2(stderr_fd, STDERR_FILENO);
    execvp(argv[0], argv.data());
    _exit(EXEC_FAILED);
  }

  setpgid(pid, pid);
  return pid;
}

struct Capture {
  std::string out;
  std::string err;
  bool timed_out{false};
};

// Drains both pipes until EOF on each or the deadline passes.
auto read_streams(int out_fd, int err_fd, std::size_t max_bytes,
                  std::chrono::steady_clock::time_point deadline) -> Capture {
  Capture capture;
  std::array<pollfd, 2> fds{pollfd{out_fd, POLLIN, 0},
                            pollfd{err_fd, POLLIN, 0}};
  std::array<std::string*, 2> sinks{&capture.out, &capture.err};
  std::array<char, READ_BUFFER_SIZE> buffer;
  int open_streams = 2;

  while (open_streams > 0) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      capture.timed_out = true;
      break;
    }

    int rc = ::poll(fds.data(), fds.size(), static_cast<int>(left.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (rc == 0) {
      capture.timed_out = true;
      break;
    }

    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        fds[i].fd = -1;
        --open_streams;
        continue;
      }
      auto& sink = *sinks[i];
      if (sink.size() < max_bytes) {
        sink.append(buffer.data(),
                    std::min(static_cast<std::size_t>(n), max_bytes - sink.size()));
      }
    }
  }
  return capture;
}

auto reap(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return -1;
    }
  }
  return get_exit_code(status);
}

}  // namespace

ProcessSandbox::ProcessSandbox(SandboxConfig config)
    : config_(std::move(config)) {
}

ProcessSandbox::~ProcessSandbox() {
  kill_all();
}

auto ProcessSandbox::interpreter(CodeLanguage language) const
    -> std::pair<std::string, std::string> {
  switch (language) {
    case CodeLanguage::Python:
      return {config_.python, "-c"};
    case CodeLanguage::JavaScript:
      return {config_.node, "-e"};
  }
  return {config_.python, "-c"};
}

auto ProcessSandbox::run(CodeLanguage language, const std::string& code,
                         std::chrono::milliseconds timeout)
    -> Outcome<CodeOutput> {
  auto [program, flag] = interpreter(language);
  if (closed()) {
    return failure(Error::Cancelled, "Code sandbox is shutting down");
  }

  Pipe out;
  Pipe err;
  if (!out.valid() || !err.valid()) {
    return failure(Error::ExecutionFailed,
                   std::format("Failed to create pipe: {}", std::strerror(errno)));
  }

  auto start = std::chrono::steady_clock::now();
  auto deadline = timeout == std::chrono::milliseconds::max() ||
                          timeout > std::chrono::hours(24)
                      ? start + std::chrono::hours(24)
                      : start + timeout;

  pid_t pid = spawn(program, flag, code, out.write_fd(), err.write_fd());
  if (pid < 0) {
    return failure(Error::ExecutionFailed,
                   std::format("Failed to fork process: {}", std::strerror(errno)));
  }
  out.close_write();
  err.close_write();
  track(pid);

  auto capture =
      read_streams(out.read_fd(), err.read_fd(), config_.max_output_bytes, deadline);
  if (capture.timed_out) {
    kill(-pid, SIGKILL);
  }
  int exit_code = reap(pid);
  bool killed = untrack(pid);

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  log::debug("{} exited with {} after {}ms", program, exit_code, elapsed.count());

  if (killed) {
    return failure(Error::Cancelled,
                   std::format("Code execution cancelled after {}ms",
                               elapsed.count()));
  }
  if (capture.timed_out) {
    return failure(Error::Timeout,
                   std::format("Code execution timed out after {}ms",
                               elapsed.count()));
  }
  if (exit_code == EXEC_FAILED && capture.out.empty() && capture.err.empty()) {
    return failure(Error::MissingDependency,
                   std::format("Interpreter '{}' could not be started", program));
  }

  return CodeOutput{.stdout_text = std::move(capture.out),
                    .stderr_text = std::move(capture.err),
                    .exit_code = exit_code};
}

auto ProcessSandbox::kill_all() -> void {
  std::lock_guard lock(mu_);
  closed_ = true;
  for (pid_t pid : active_) {
    if (pid > 0) {
      kill(-pid, SIGKILL);
      log::info("Killed sandbox process group {}", pid);
    }
  }
}

auto ProcessSandbox::reopen() -> void {
  std::lock_guard lock(mu_);
  closed_ = false;
}

auto ProcessSandbox::closed() -> bool {
  std::lock_guard lock(mu_);
  return closed_;
}

auto ProcessSandbox::track(pid_t pid) -> void {
  std::lock_guard lock(mu_);
  active_.insert(pid);
  if (closed_) {
    kill(-pid, SIGKILL);
  }
}

auto ProcessSandbox::untrack(pid_t pid) -> bool {
  std::lock_guard lock(mu_);
  active_.erase(pid);
  return closed_;
}

}  // namespace cadence
