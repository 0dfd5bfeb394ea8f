#include "nexus/config/config.hpp"

#include "nexus/common/fs.hpp"
#include "nexus/common/toml.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace nexus::config {

namespace {

constexpr const char *CONFIG_FILENAME = "nexus.toml";
constexpr const char *STATE_FOLDER = ".nexus";
constexpr const char *STATE_FILENAME = "state.json";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("NEXUS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  const auto value = doc.get_int(key, fallback);
  if (value < 0 || value > static_cast<std::int64_t>(UINT32_MAX)) {
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

bool is_known_strategy(const std::string &strategy) {
  return strategy == "auto" || strategy == "screen" || strategy == "tmux" ||
         strategy == "background";
}

bool is_valid_session_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_' || ch == '-')) {
      return false;
    }
  }
  return true;
}

} // namespace

std::filesystem::path config_path() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return *override_path;
  }
  return std::filesystem::path(CONFIG_FILENAME);
}

bool config_exists() {
  std::error_code ec;
  return std::filesystem::exists(config_path(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const char *value = std::getenv("NEXUS_RUN_DIR"); value != nullptr && *value != '\0') {
    config.run_dir = common::expand_path(value);
  }
  if (const char *value = std::getenv("NEXUS_SCRIPTS_DIR"); value != nullptr && *value != '\0') {
    config.scripts_dir = common::expand_path(value);
  }
  if (const char *value = std::getenv("NEXUS_HEARTBEAT_INTERVAL_SECS");
      value != nullptr && *value != '\0') {
    try {
      const auto parsed = std::stoul(value);
      if (parsed > 0) {
        config.heartbeat.interval_secs = static_cast<std::uint32_t>(parsed);
      }
    } catch (const std::exception &) {
      // keep the configured interval
    }
  }
  if (const char *value = std::getenv("NEXUS_MONITOR_STRATEGY");
      value != nullptr && *value != '\0') {
    config.monitor.strategy = common::to_lower(common::trim(value));
  }
  if (const char *value = std::getenv("NEXUS_OBSERVABILITY"); value != nullptr && *value != '\0') {
    config.observability.backend = value;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config, parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.workspace_dir = expand_config_value(doc.get_string("workspace_dir", config.workspace_dir));
  config.run_dir = expand_config_value(doc.get_string("run_dir", config.run_dir));
  config.scripts_dir = expand_config_value(doc.get_string("scripts_dir", config.scripts_dir));

  config.heartbeat.interval_secs =
      get_u32(doc, "heartbeat.interval_secs", config.heartbeat.interval_secs);

  config.monitor.strategy =
      common::to_lower(common::trim(doc.get_string("monitor.strategy", config.monitor.strategy)));
  config.monitor.poll_interval_secs =
      get_u32(doc, "monitor.poll_interval_secs", config.monitor.poll_interval_secs);
  config.monitor.event_session = doc.get_string("monitor.event_session", config.monitor.event_session);
  config.monitor.status_session =
      doc.get_string("monitor.status_session", config.monitor.status_session);
  config.monitor.kill_signature =
      doc.get_string("monitor.kill_signature", config.monitor.kill_signature);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (config_path_override().has_value()) {
      return common::Result<Config>::failure(common::ErrorKind::Config,
                                             "Config file not found: " + path.string());
    }
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config, content.error());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  std::ostringstream out;
  out << "workspace_dir = " << common::quote_toml_string(config.workspace_dir) << "\n";
  out << "run_dir = " << common::quote_toml_string(config.run_dir) << "\n";
  out << "scripts_dir = " << common::quote_toml_string(config.scripts_dir) << "\n";
  out << "\n[heartbeat]\n";
  out << "interval_secs = " << config.heartbeat.interval_secs << "\n";
  out << "\n[monitor]\n";
  out << "strategy = " << common::quote_toml_string(config.monitor.strategy) << "\n";
  out << "poll_interval_secs = " << config.monitor.poll_interval_secs << "\n";
  out << "event_session = " << common::quote_toml_string(config.monitor.event_session) << "\n";
  out << "status_session = " << common::quote_toml_string(config.monitor.status_session) << "\n";
  out << "kill_signature = " << common::quote_toml_string(config.monitor.kill_signature) << "\n";
  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(config_path(), out.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.heartbeat.interval_secs == 0) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "heartbeat.interval_secs must be greater than 0");
  }
  if (config.monitor.poll_interval_secs == 0) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "monitor.poll_interval_secs must be greater than 0");
  }
  if (!is_known_strategy(config.monitor.strategy)) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "Invalid monitor.strategy: " + config.monitor.strategy);
  }
  if (!is_valid_session_name(config.monitor.event_session)) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "Invalid monitor.event_session: " +
                                         config.monitor.event_session);
  }
  if (!is_valid_session_name(config.monitor.status_session)) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "Invalid monitor.status_session: " +
                                         config.monitor.status_session);
  }
  if (config.monitor.event_session == config.monitor.status_session) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "monitor.event_session and monitor.status_session must differ");
  }
  if (common::trim(config.run_dir).empty()) {
    return ValidationResult::failure(common::ErrorKind::Config, "run_dir must not be empty");
  }

  if (common::trim(config.monitor.kill_signature).empty()) {
    warnings.push_back("monitor.kill_signature is empty; stale watchers are only found via pid records");
  }
  if (config.heartbeat.interval_secs < 5) {
    warnings.push_back("heartbeat.interval_secs below 5 seconds adds load on the status registry");
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(resolve_dir(config, config.scripts_dir), ec)) {
    warnings.push_back("scripts_dir does not exist: " + config.scripts_dir);
  }

  return ValidationResult::success(std::move(warnings));
}

std::filesystem::path resolve_dir(const Config &config, const std::string &dir) {
  const std::filesystem::path path(dir);
  if (path.is_absolute()) {
    return path.lexically_normal();
  }
  const std::filesystem::path base(config.workspace_dir.empty() ? "." : config.workspace_dir);
  return (base / path).lexically_normal();
}

std::filesystem::path state_file_path(const Config &config) {
  return resolve_dir(config, config.run_dir) / STATE_FOLDER / STATE_FILENAME;
}

} // namespace nexus::config
