#pragma once

#include <cstddef>
#include <string>

namespace cadence {

struct StorageConfig {
  std::string db_file{"cadence.db"};
  int busy_timeout_ms{5000};
};

// A claim lease must outlast the action timeout by at least this much.
inline constexpr int kClaimLeaseMarginMs = 1000;

struct WorkerConfig {
  int poll_interval_ms{30000};
  int batch_size{10};
  int action_timeout_ms{300000};
  int claim_lease_ms{600000};
  int retention_days{30};
  int history_per_task{100};
  int recurring_interval_ms{60000};
};

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct LlmConfig {
  std::string api_key_env{"ANTHROPIC_API_KEY"};
  std::string base_url{"https://api.anthropic.com"};
  std::string default_model{"claude-3-5-sonnet-20241022"};
  int max_tokens{4096};
  int report_max_tokens{8192};
};

struct SandboxConfig {
  bool enabled{false};
  std::string python{"python3"};
  std::string node{"node"};
  std::size_t max_output_bytes{1024 * 1024};
};

struct ScraperConfig {
  bool enabled{true};
  std::size_t max_content_bytes{10000};
};

struct SystemConfig {
  StorageConfig storage;
  WorkerConfig worker;
  LogConfig log;
  LlmConfig llm;
  SandboxConfig sandbox;
  ScraperConfig scraper;
};

}  // namespace cadence
