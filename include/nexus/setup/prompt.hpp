#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace nexus::setup {

class IPrompter {
public:
  virtual ~IPrompter() = default;
  [[nodiscard]] virtual std::optional<std::string> ask(const std::string &question) = 0;
};

class StreamPrompter final : public IPrompter {
public:
  StreamPrompter(std::istream &in, std::ostream &out);
  [[nodiscard]] std::optional<std::string> ask(const std::string &question) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

} // namespace nexus::setup
