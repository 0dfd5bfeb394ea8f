#include "nexus/setup/prompt.hpp"

#include "nexus/common/fs.hpp"

#include <istream>
#include <ostream>

namespace nexus::setup {

StreamPrompter::StreamPrompter(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

std::optional<std::string> StreamPrompter::ask(const std::string &question) {
  out_ << question << std::flush;
  std::string input;
  if (!std::getline(in_, input)) {
    out_ << "\n";
    return std::nullopt;
  }
  return common::trim(input);
}

} // namespace nexus::setup
