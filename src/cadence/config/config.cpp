#include "cadence/config/config.hpp"

#include "cadence/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string_view>

namespace cadence::detail {

// Absent or non-scalar keys keep `fallback`; malformed scalars throw
// YAML::BadConversion.
template <typename T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T fallback) -> T {
  auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return fallback;
  }
  return field.as<T>();
}

}  // namespace cadence::detail

namespace YAML {

template <>
struct convert<cadence::StorageConfig> {
  static bool decode(const Node& node, cadence::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = cadence::detail::yaml_get_or<std::string>(node, "db_file", s.db_file);
    s.busy_timeout_ms =
        cadence::detail::yaml_get_or(node, "busy_timeout_ms", s.busy_timeout_ms);
    return true;
  }
};

template <>
struct convert<cadence::WorkerConfig> {
  static bool decode(const Node& node, cadence::WorkerConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.poll_interval_ms =
        cadence::detail::yaml_get_or(node, "poll_interval_ms", w.poll_interval_ms);
    w.batch_size = cadence::detail::yaml_get_or(node, "batch_size", w.batch_size);
    w.action_timeout_ms =
        cadence::detail::yaml_get_or(node, "action_timeout_ms", w.action_timeout_ms);
    w.claim_lease_ms =
        cadence::detail::yaml_get_or(node, "claim_lease_ms", w.claim_lease_ms);
    w.retention_days =
        cadence::detail::yaml_get_or(node, "retention_days", w.retention_days);
    w.history_per_task =
        cadence::detail::yaml_get_or(node, "history_per_task", w.history_per_task);
    w.recurring_interval_ms = cadence::detail::yaml_get_or(
        node, "recurring_interval_ms", w.recurring_interval_ms);
    return true;
  }
};

template <>
struct convert<cadence::LogConfig> {
  static bool decode(const Node& node, cadence::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = cadence::detail::yaml_get_or<std::string>(node, "level", l.level);
    l.file = cadence::detail::yaml_get_or<std::string>(node, "file", l.file);
    return true;
  }
};

template <>
struct convert<cadence::LlmConfig> {
  static bool decode(const Node& node, cadence::LlmConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.api_key_env =
        cadence::detail::yaml_get_or<std::string>(node, "api_key_env", l.api_key_env);
    l.base_url = cadence::detail::yaml_get_or<std::string>(node, "base_url", l.base_url);
    l.default_model =
        cadence::detail::yaml_get_or<std::string>(node, "default_model", l.default_model);
    l.max_tokens = cadence::detail::yaml_get_or(node, "max_tokens", l.max_tokens);
    l.report_max_tokens =
        cadence::detail::yaml_get_or(node, "report_max_tokens", l.report_max_tokens);
    return true;
  }
};

template <>
struct convert<cadence::SandboxConfig> {
  static bool decode(const Node& node, cadence::SandboxConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.enabled = cadence::detail::yaml_get_or(node, "enabled", s.enabled);
    s.python = cadence::detail::yaml_get_or<std::string>(node, "python", s.python);
    s.node = cadence::detail::yaml_get_or<std::string>(node, "node", s.node);
    s.max_output_bytes =
        cadence::detail::yaml_get_or(node, "max_output_bytes", s.max_output_bytes);
    return true;
  }
};

template <>
struct convert<cadence::ScraperConfig> {
  static bool decode(const Node& node, cadence::ScraperConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.enabled = cadence::detail::yaml_get_or(node, "enabled", s.enabled);
    s.max_content_bytes =
        cadence::detail::yaml_get_or(node, "max_content_bytes", s.max_content_bytes);
    return true;
  }
};

template <>
struct convert<cadence::SystemConfig> {
  static bool decode(const Node& node, cadence::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<cadence::StorageConfig>();
    }
    if (auto worker = node["worker"]) {
      c.worker = worker.as<cadence::WorkerConfig>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<cadence::LogConfig>();
    }
    if (auto llm = node["llm"]) {
      c.llm = llm.as<cadence::LlmConfig>();
    }
    if (auto sandbox = node["sandbox"]) {
      c.sandbox = sandbox.as<cadence::SandboxConfig>();
    }
    if (auto scraper = node["scraper"]) {
      c.scraper = scraper.as<cadence::ScraperConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace cadence {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    if (auto r = validate(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto validate(const SystemConfig& config) -> Result<void> {
  const auto& w = config.worker;
  if (w.poll_interval_ms <= 0 || w.batch_size <= 0 ||
      w.action_timeout_ms <= 0 || w.claim_lease_ms <= 0 ||
      w.retention_days < 0 || w.history_per_task <= 0 ||
      w.recurring_interval_ms <= 0) {
    log::error("Invalid worker configuration");
    return fail(Error::InvalidArgument);
  }
  if (static_cast<std::int64_t>(w.claim_lease_ms) <
      static_cast<std::int64_t>(w.action_timeout_ms) + kClaimLeaseMarginMs) {
    log::error("worker.claim_lease_ms ({}) must exceed action_timeout_ms ({}) "
               "by at least {}ms",
               w.claim_lease_ms, w.action_timeout_ms, kClaimLeaseMarginMs);
    return fail(Error::InvalidArgument);
  }
  if (config.storage.db_file.empty()) {
    log::error("storage.db_file must not be empty");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace cadence
