#include "cadence/cli/commands.hpp"

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace {

using namespace cadence::cli;

void print_usage(const char* prog) {
  std::println("Cadence - Scheduled Task Execution Engine");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve                 Run the scheduler worker until SIGINT/SIGTERM");
  std::println("  add <task.json>       Create one task, or an array of tasks");
  std::println("  list                  List tasks");
  std::println("  status                Show task counts and upcoming runs");
  std::println("  run <task-id>         Execute a task immediately");
  std::println("  history <task-id>     Show recent executions of a task");
  std::println("  cleanup               Prune completed tasks and old executions");
  std::println("  validate              Check a config file");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (overrides config)");
  std::println("  -d, --daemon          serve: run as daemon");
  std::println("  --status <status>     list: active|paused|completed|failed");
  std::println("  --type <type>         list: one-time|recurring|trigger");
  std::println("  --user <id>           list: only tasks of this user");
  std::println("  -n, --limit <n>       list/history: maximum rows");
  std::println("  --days <n>            cleanup: retention in days");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("Cadence v0.1.0");
}

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  print_usage(prog);
  std::exit(1);
}

template <typename T>
auto parse_number(const char* prog, std::string_view flag, std::string_view text)
    -> T {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    usage_error(prog, std::string(flag) + " requires a non-negative number");
  }
  if constexpr (std::is_signed_v<T>) {
    if (value < 0) {
      usage_error(prog, std::string(flag) + " requires a non-negative number");
    }
  }
  return value;
}

struct Options {
  std::string command;
  std::vector<std::string> positional;
  CommonOptions common;
  bool daemon{false};
  std::string status;
  std::string type;
  std::string user;
  std::optional<std::size_t> limit;
  std::optional<int> days;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;
  const char* prog = argv[0];

  auto value = [&](int& i, std::string_view flag) -> std::string {
    if (++i >= argc) {
      usage_error(prog, std::string(flag) + " requires an argument");
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(prog);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.common.config_file = value(i, arg);
    } else if (arg == "--db") {
      opts.common.db_file = value(i, arg);
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (arg == "--status") {
      opts.status = value(i, arg);
    } else if (arg == "--type") {
      opts.type = value(i, arg);
    } else if (arg == "--user") {
      opts.user = value(i, arg);
    } else if (arg == "-n" || arg == "--limit") {
      opts.limit = parse_number<std::size_t>(prog, arg, value(i, arg));
    } else if (arg == "--days") {
      opts.days = parse_number<int>(prog, arg, value(i, arg));
    } else if (arg.starts_with("-")) {
      usage_error(prog, std::string("Unknown option: ") + std::string(arg));
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.positional.emplace_back(arg);
    }
  }

  if (opts.command.empty()) {
    usage_error(prog, "missing command");
  }
  return opts;
}

auto positional(const Options& opts, const char* prog, std::string_view what)
    -> std::string {
  if (opts.positional.size() != 1) {
    usage_error(prog, std::string(opts.command) + " requires <" +
                          std::string(what) + ">");
  }
  return opts.positional.front();
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  auto opts = parse_args(argc, argv);
  const char* prog = argv[0];
  const auto& cmd = opts.command;

  if (cmd == "serve") {
    return cmd_serve(ServeOptions{.common = opts.common, .daemon = opts.daemon});
  }
  if (cmd == "add") {
    return cmd_add(AddOptions{.common = opts.common,
                              .task_file = positional(opts, prog, "task.json")});
  }
  if (cmd == "list") {
    return cmd_list(ListOptions{.common = opts.common,
                                .status = opts.status,
                                .type = opts.type,
                                .user = opts.user,
                                .limit = opts.limit.value_or(50)});
  }
  if (cmd == "status") {
    return cmd_status(StatusOptions{.common = opts.common});
  }
  if (cmd == "run") {
    return cmd_run(RunOptions{.common = opts.common,
                              .task_id = positional(opts, prog, "task-id")});
  }
  if (cmd == "history") {
    return cmd_history(HistoryOptions{.common = opts.common,
                                      .task_id = positional(opts, prog, "task-id"),
                                      .limit = opts.limit.value_or(20)});
  }
  if (cmd == "cleanup") {
    return cmd_cleanup(CleanupOptions{.common = opts.common, .days = opts.days});
  }
  if (cmd == "validate") {
    if (opts.common.config_file.empty()) {
      usage_error(prog, "validate requires --config <file>");
    }
    return cmd_validate(ValidateOptions{.config_file = opts.common.config_file});
  }

  usage_error(prog, "Unknown command: " + cmd);
}
