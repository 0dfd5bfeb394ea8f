#pragma once

#include "nexus/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace nexus::common {

/// Flat view of a TOML file: `[section] key = value` becomes "section.key".
/// Values are kept raw and converted on access.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::int64_t get_int(const std::string &key, std::int64_t fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace nexus::common
