#pragma once

#include "nexus/common/result.hpp"

#include <string>

namespace nexus::agent {

struct AgentIdentity {
  std::string id;
  std::string kind;
  std::string description;
};

inline constexpr std::size_t MAX_AGENT_ID_LENGTH = 64;

/// Ids are 1-64 bytes of `[A-Za-z0-9._-]` without a leading dot; the kind
/// must be non-empty. Failures carry ErrorKind::InvalidIdentity.
[[nodiscard]] common::Status validate_identity(const AgentIdentity &identity);

[[nodiscard]] common::Result<AgentIdentity> make_identity(const std::string &id,
                                                          const std::string &kind,
                                                          const std::string &description);

} // namespace nexus::agent
