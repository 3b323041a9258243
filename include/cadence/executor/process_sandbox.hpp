#pragma once

#include "cadence/config/system_config.hpp"
#include "cadence/executor/collaborators.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

#include <sys/types.h>

namespace cadence {

// Runs snippets through a local interpreter (`python3 -c`, `node -e`) in a
// fresh process group. Output is captured separately per stream and capped;
// on timeout the whole group is killed.
class ProcessSandbox final : public ICodeSandbox {
public:
  explicit ProcessSandbox(SandboxConfig config);
  ~ProcessSandbox() override;

  ProcessSandbox(const ProcessSandbox&) = delete;
  auto operator=(const ProcessSandbox&) -> ProcessSandbox& = delete;

  [[nodiscard]] auto run(CodeLanguage language, const std::string& code,
                         std::chrono::milliseconds timeout)
      -> Outcome<CodeOutput> override;

  // Kills every process group still running and refuses new runs with
  // Error::Cancelled until reopen().
  auto kill_all() -> void;
  auto reopen() -> void;

private:
  [[nodiscard]] auto interpreter(CodeLanguage language) const
      -> std::pair<std::string, std::string>;

  // track() kills the group at once when the sandbox is closed; untrack()
  // reports whether it was closed meanwhile.
  auto track(pid_t pid) -> void;
  [[nodiscard]] auto untrack(pid_t pid) -> bool;
  [[nodiscard]] auto closed() -> bool;

  SandboxConfig config_;
  std::mutex mu_;
  std::unordered_set<pid_t> active_;
  bool closed_{false};
};

}  // namespace cadence
