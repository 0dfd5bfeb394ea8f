#pragma once

#include <string>

namespace nexus::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

} // namespace nexus::common
