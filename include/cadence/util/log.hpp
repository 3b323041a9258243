#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace cadence::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

// Async logger. Producers append preformatted lines to a bounded queue and a
// single writer thread flushes them to stderr and, optionally, a log file.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;

  struct Line {
    Level level;
    std::string prefix;
    std::string body;
  };

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> accepting_{false};
  bool running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Line> queue_;
  std::thread writer_;
  std::FILE* file_{nullptr};
  std::mutex write_mu_;

  auto write_line(const Line& line) -> void {
    std::lock_guard lock(write_mu_);
    std::fprintf(stderr, "%s[%s%s\033[0m] %s\n", line.prefix.c_str(),
                 level_color(line.level).data(), level_name(line.level).data(),
                 line.body.c_str());
    if (file_ != nullptr) {
      std::fprintf(file_, "%s[%s] %s\n", line.prefix.c_str(),
                   level_name(line.level).data(), line.body.c_str());
      std::fflush(file_);
    }
  }

  auto writer_loop() -> void {
    std::vector<Line> batch;
    batch.reserve(64);

    std::unique_lock lock(mu_);
    while (true) {
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      while (!queue_.empty() && batch.size() < 64) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
      bool done = !running_ && queue_.empty();
      lock.unlock();

      for (const auto& line : batch) {
        write_line(line);
      }
      batch.clear();

      lock.lock();
      if (done && queue_.empty()) {
        break;
      }
    }
  }

  [[nodiscard]] static auto make_prefix() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] ", time, tid);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    close_file();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    std::lock_guard lock(mu_);
    if (running_) {
      return;
    }
    running_ = true;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    {
      std::lock_guard lock(mu_);
      if (!running_) {
        return;
      }
      running_ = false;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Appends to path in addition to stderr. Returns false if it cannot be
  // opened; console output continues either way.
  auto open_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::lock_guard lock(write_mu_);
    if (file_ != nullptr) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  auto close_file() -> void {
    std::lock_guard lock(write_mu_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    Line line{level, make_prefix(),
              std::format(fmt, std::forward<Args>(args)...)};

    if (accepting_.load(std::memory_order_acquire)) {
      std::unique_lock lock(mu_);
      if (running_ && queue_.size() < QUEUE_CAPACITY) {
        queue_.push_back(std::move(line));
        lock.unlock();
        cv_.notify_one();
        return;
      }
    }
    // Not started, shutting down, or queue full: write synchronously
    write_line(line);
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}
inline auto open_file(const std::string& path) -> bool {
  return logger().open_file(path);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace cadence::log
