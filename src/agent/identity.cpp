#include "nexus/agent/identity.hpp"

#include "nexus/common/fs.hpp"

namespace nexus::agent {

namespace {

bool is_id_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '.' || ch == '_' || ch == '-';
}

} // namespace

common::Status validate_identity(const AgentIdentity &identity) {
  if (identity.id.empty()) {
    return common::Status::error(common::ErrorKind::InvalidIdentity, "agent id must not be empty");
  }
  if (identity.id.size() > MAX_AGENT_ID_LENGTH) {
    return common::Status::error(common::ErrorKind::InvalidIdentity,
                                 "agent id is longer than " +
                                     std::to_string(MAX_AGENT_ID_LENGTH) + " bytes");
  }
  if (identity.id.front() == '.') {
    return common::Status::error(common::ErrorKind::InvalidIdentity,
                                 "agent id must not start with '.'");
  }
  for (const char ch : identity.id) {
    if (!is_id_char(ch)) {
      return common::Status::error(common::ErrorKind::InvalidIdentity,
                                   "agent id contains invalid character '" + std::string(1, ch) +
                                       "' (allowed: letters, digits, '.', '_', '-')");
    }
  }
  if (identity.kind.empty()) {
    return common::Status::error(common::ErrorKind::InvalidIdentity,
                                 "agent type must not be empty");
  }
  return common::Status::success();
}

common::Result<AgentIdentity> make_identity(const std::string &id, const std::string &kind,
                                            const std::string &description) {
  AgentIdentity identity{.id = common::trim(id),
                         .kind = common::trim(kind),
                         .description = common::trim(description)};
  auto valid = validate_identity(identity);
  if (!valid.ok()) {
    return common::Result<AgentIdentity>::failure(valid);
  }
  return common::Result<AgentIdentity>::success(std::move(identity));
}

} // namespace nexus::agent
