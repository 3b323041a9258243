#pragma once

#include "cadence/config/config.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace cadence::cli {

// Shared by every command: an empty config_file means built-in defaults, and
// a non-empty db_file overrides storage.db_file.
struct CommonOptions {
  std::string config_file;
  std::string db_file;
};

struct ServeOptions {
  CommonOptions common;
  bool daemon{false};
};

struct AddOptions {
  CommonOptions common;
  std::string task_file;
};

struct ListOptions {
  CommonOptions common;
  std::string status;
  std::string type;
  std::string user;
  std::size_t limit{50};
};

struct StatusOptions {
  CommonOptions common;
};

struct RunOptions {
  CommonOptions common;
  std::string task_id;
};

struct HistoryOptions {
  CommonOptions common;
  std::string task_id;
  std::size_t limit{20};
};

struct CleanupOptions {
  CommonOptions common;
  std::optional<int> days;
};

struct ValidateOptions {
  std::string config_file;
};

// Loads, overrides and validates the configuration. Prints the error and
// returns nullopt on failure.
[[nodiscard]] auto load_config(const CommonOptions& opts)
    -> std::optional<Config>;

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_add(const AddOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_history(const HistoryOptions& opts) -> int;
[[nodiscard]] auto cmd_cleanup(const CleanupOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace cadence::cli
