#include "nexus/health/health.hpp"

#include "nexus/common/fs.hpp"
#include "nexus/common/json_util.hpp"

#include <mutex>
#include <sstream>

namespace nexus::health {

namespace {

std::mutex g_mutex;
std::map<std::string, ComponentStatus> g_components;

ComponentStatus &touch(const std::string &name) {
  auto &component = g_components[name];
  component.updated_at = common::now_rfc3339();
  return component;
}

} // namespace

void mark_component_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = touch(name);
  component.status = "starting";
  component.last_error.reset();
}

void mark_component_ok(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = touch(name);
  component.status = "ok";
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

void mark_component_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = touch(name);
  component.status = "error";
  component.last_error = error;
}

void mark_component_stopped(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  touch(name).status = "stopped";
}

void bump_component_restart(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  ++touch(name).restart_count;
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot snapshot() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return HealthSnapshot{.components = g_components};
}

std::string snapshot_json() {
  const auto snap = snapshot();
  std::ostringstream json;
  json << "{\"components\":{";
  bool first = true;
  for (const auto &[name, status] : snap.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "\"" << common::json_escape(name) << "\":{";
    json << "\"status\":\"" << status.status << "\",";
    json << "\"restart_count\":" << status.restart_count;
    if (!status.updated_at.empty()) {
      json << ",\"updated_at\":\"" << status.updated_at << "\"";
    }
    if (status.last_ok.has_value()) {
      json << ",\"last_ok\":\"" << *status.last_ok << "\"";
    }
    if (status.last_error.has_value()) {
      json << ",\"last_error\":\"" << common::json_escape(*status.last_error) << "\"";
    }
    json << "}";
  }
  json << "}}";
  return json.str();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.clear();
}

} // namespace nexus::health
