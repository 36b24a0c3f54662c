#include "taskwarden/config/config.hpp"

#include "taskwarden/config/yaml_utils.hpp"
#include "taskwarden/security/input_validator.hpp"
#include "taskwarden/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskwarden::StorageConfig> {
  static bool decode(const Node& node, taskwarden::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    taskwarden::StorageConfig d;
    s.db_file = taskwarden::yaml_get_or<std::string>(node, "db_file", d.db_file);
    s.busy_timeout_ms =
        taskwarden::yaml_get_or(node, "busy_timeout_ms", d.busy_timeout_ms);
    s.write_retry_delay_ms = taskwarden::yaml_get_or(
        node, "write_retry_delay_ms", d.write_retry_delay_ms);
    return true;
  }
};

template <>
struct convert<taskwarden::LoggingConfig> {
  static bool decode(const Node& node, taskwarden::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = taskwarden::yaml_get_or<std::string>(node, "level", "info");
    l.file = taskwarden::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<taskwarden::ExecutorConfig> {
  static bool decode(const Node& node, taskwarden::ExecutorConfig& e) {
    if (!node.IsMap()) {
      return false;
    }
    taskwarden::ExecutorConfig d;
    e.worker = taskwarden::yaml_get_or<std::string>(node, "worker", d.worker);
    e.worker_args = taskwarden::yaml_get_or<std::vector<std::string>>(
        node, "worker_args", d.worker_args);
    e.max_concurrency =
        taskwarden::yaml_get_or(node, "max_concurrency", d.max_concurrency);
    e.max_output_bytes = taskwarden::yaml_get_or<std::size_t>(
        node, "max_output_bytes", d.max_output_bytes);
    auto policy = taskwarden::yaml_get_or<std::string>(
        node, "env_policy",
        std::string(taskwarden::env_policy_name(d.env_policy)));
    auto parsed = taskwarden::parse_env_policy(policy);
    if (!parsed) {
      throw TypedBadConversion<taskwarden::EnvPolicy>(node["env_policy"].Mark());
    }
    e.env_policy = *parsed;
    e.env_allow_list = taskwarden::yaml_get_or<std::vector<std::string>>(
        node, "env_allow_list", d.env_allow_list);
    e.env_always = taskwarden::yaml_get_or<std::vector<std::string>>(
        node, "env_always", d.env_always);
    e.default_mode =
        taskwarden::yaml_get_or<std::string>(node, "default_mode", d.default_mode);
    e.default_model = taskwarden::yaml_get_or<std::string>(
        node, "default_model", d.default_model);
    return true;
  }
};

template <>
struct convert<taskwarden::WatchdogLimits> {
  static bool decode(const Node& node, taskwarden::WatchdogLimits& w) {
    if (!node.IsMap()) {
      return false;
    }
    taskwarden::WatchdogLimits d;
    w.idle_timeout_ms =
        taskwarden::yaml_get_or(node, "idle_timeout_ms", d.idle_timeout_ms);
    w.hard_timeout_ms =
        taskwarden::yaml_get_or(node, "hard_timeout_ms", d.hard_timeout_ms);
    w.warn_lead_ms = taskwarden::yaml_get_or(node, "warn_lead_ms", d.warn_lead_ms);
    w.kill_grace_ms =
        taskwarden::yaml_get_or(node, "kill_grace_ms", d.kill_grace_ms);
    w.progress_interval_ms = taskwarden::yaml_get_or(
        node, "progress_interval_ms", d.progress_interval_ms);
    return true;
  }
};

template <>
struct convert<taskwarden::RegistryConfig> {
  static bool decode(const Node& node, taskwarden::RegistryConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    taskwarden::RegistryConfig d;
    r.stuck_task_max_age_sec = taskwarden::yaml_get_or(
        node, "stuck_task_max_age_sec", d.stuck_task_max_age_sec);
    r.prune_max_age_ms =
        taskwarden::yaml_get_or(node, "prune_max_age_ms", d.prune_max_age_ms);
    r.progress_flush_interval_ms = taskwarden::yaml_get_or(
        node, "progress_flush_interval_ms", d.progress_flush_interval_ms);
    r.default_poll_frequency_ms = taskwarden::yaml_get_or(
        node, "default_poll_frequency_ms", d.default_poll_frequency_ms);
    r.result_keep_alive_ms = taskwarden::yaml_get_or(
        node, "result_keep_alive_ms", d.result_keep_alive_ms);
    return true;
  }
};

template <>
struct convert<taskwarden::SystemConfig> {
  static bool decode(const Node& node, taskwarden::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<taskwarden::StorageConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<taskwarden::LoggingConfig>();
    }
    if (auto executor = node["executor"]) {
      c.executor = executor.as<taskwarden::ExecutorConfig>();
    }
    if (auto watchdog = node["watchdog"]) {
      c.watchdog = watchdog.as<taskwarden::WatchdogLimits>();
    }
    if (auto registry = node["registry"]) {
      c.registry = registry.as<taskwarden::RegistryConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskwarden {

namespace {

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  StorageConfig d;
  out << YAML::BeginMap;
  if (s.db_file != d.db_file) {
    yaml_emit(out, "db_file", s.db_file);
  }
  if (s.busy_timeout_ms != d.busy_timeout_ms) {
    yaml_emit(out, "busy_timeout_ms", s.busy_timeout_ms);
  }
  if (s.write_retry_delay_ms != d.write_retry_delay_ms) {
    yaml_emit(out, "write_retry_delay_ms", s.write_retry_delay_ms);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LoggingConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  yaml_emit_if_not_empty(out, "file", l.file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ExecutorConfig& e) {
  ExecutorConfig d;
  out << YAML::BeginMap;
  if (e.worker != d.worker) {
    yaml_emit(out, "worker", e.worker);
  }
  yaml_emit_if_not_empty(out, "worker_args", e.worker_args);
  if (e.max_concurrency != d.max_concurrency) {
    yaml_emit(out, "max_concurrency", e.max_concurrency);
  }
  if (e.max_output_bytes != d.max_output_bytes) {
    yaml_emit(out, "max_output_bytes", e.max_output_bytes);
  }
  if (e.env_policy != d.env_policy) {
    yaml_emit(out, "env_policy", std::string(env_policy_name(e.env_policy)));
  }
  yaml_emit_if_not_empty(out, "env_allow_list", e.env_allow_list);
  if (e.env_always != d.env_always) {
    out << YAML::Key << "env_always" << YAML::Value << YAML::Flow
        << e.env_always;
  }
  if (e.default_mode != d.default_mode) {
    yaml_emit(out, "default_mode", e.default_mode);
  }
  yaml_emit_if_not_empty(out, "default_model", e.default_model);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const WatchdogLimits& w) {
  WatchdogLimits d;
  out << YAML::BeginMap;
  if (w.idle_timeout_ms != d.idle_timeout_ms) {
    yaml_emit(out, "idle_timeout_ms", w.idle_timeout_ms);
  }
  if (w.hard_timeout_ms != d.hard_timeout_ms) {
    yaml_emit(out, "hard_timeout_ms", w.hard_timeout_ms);
  }
  if (w.warn_lead_ms != d.warn_lead_ms) {
    yaml_emit(out, "warn_lead_ms", w.warn_lead_ms);
  }
  if (w.kill_grace_ms != d.kill_grace_ms) {
    yaml_emit(out, "kill_grace_ms", w.kill_grace_ms);
  }
  if (w.progress_interval_ms != d.progress_interval_ms) {
    yaml_emit(out, "progress_interval_ms", w.progress_interval_ms);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const RegistryConfig& r) {
  RegistryConfig d;
  out << YAML::BeginMap;
  if (r.stuck_task_max_age_sec != d.stuck_task_max_age_sec) {
    yaml_emit(out, "stuck_task_max_age_sec", r.stuck_task_max_age_sec);
  }
  if (r.prune_max_age_ms != d.prune_max_age_ms) {
    yaml_emit(out, "prune_max_age_ms", r.prune_max_age_ms);
  }
  if (r.progress_flush_interval_ms != d.progress_flush_interval_ms) {
    yaml_emit(out, "progress_flush_interval_ms", r.progress_flush_interval_ms);
  }
  if (r.default_poll_frequency_ms != d.default_poll_frequency_ms) {
    yaml_emit(out, "default_poll_frequency_ms", r.default_poll_frequency_ms);
  }
  if (r.result_keep_alive_ms != d.result_keep_alive_ms) {
    yaml_emit(out, "result_keep_alive_ms", r.result_keep_alive_ms);
  }
  out << YAML::EndMap;
}

}  // namespace

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
      return std::unexpected(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "logging" << YAML::Value;
  to_yaml(out, config.logging);
  out << YAML::Key << "executor" << YAML::Value;
  to_yaml(out, config.executor);
  out << YAML::Key << "watchdog" << YAML::Value;
  to_yaml(out, config.watchdog);
  out << YAML::Key << "registry" << YAML::Value;
  to_yaml(out, config.registry);
  out << YAML::EndMap;
  return out.c_str();
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  constexpr std::array<std::string_view, 5> levels = {"trace", "debug", "info",
                                                      "warn", "error"};
  if (std::ranges::find(levels, config.logging.level) == levels.end()) {
    log::error("Invalid logging.level: {}", config.logging.level);
    return fail(Error::InvalidArgument);
  }
  if (config.executor.worker.empty()) {
    log::error("executor.worker must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (config.executor.max_concurrency < 1) {
    log::error("executor.max_concurrency must be at least 1, got {}",
               config.executor.max_concurrency);
    return fail(Error::InvalidArgument);
  }
  if (auto r = InputValidator::validate_mode(config.executor.default_mode);
      !r) {
    log::error("executor.default_mode: {}", r.error().message);
    return fail(Error::InvalidArgument);
  }
  const auto& w = config.watchdog;
  if (w.idle_timeout_ms <= 0 || w.hard_timeout_ms <= 0 ||
      w.kill_grace_ms < 0 || w.warn_lead_ms < 0 ||
      w.progress_interval_ms <= 0) {
    log::error("watchdog limits must be positive");
    return fail(Error::InvalidArgument);
  }
  if (config.storage.busy_timeout_ms < 0 ||
      config.storage.write_retry_delay_ms < 0) {
    log::error("storage timeouts must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (config.registry.stuck_task_max_age_sec <= 0 ||
      config.registry.prune_max_age_ms <= 0 ||
      config.registry.progress_flush_interval_ms < 0) {
    log::error("registry ages must be positive");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace taskwarden
