#pragma once

#include "nexus/common/result.hpp"
#include "nexus/launch/launcher.hpp"
#include "nexus/process/tool_probe.hpp"

#include <string_view>

namespace nexus::launch {

/// Deterministic choice from platform and installed tools. On Unix the order
/// is screen, tmux, bare background; `preferred` ("screen", "tmux",
/// "background") wins when its tool is installed. Windows needs `cmd` and a
/// bash.exe or sh.exe, otherwise the result is LaunchUnavailable.
[[nodiscard]] common::Result<LaunchStrategy> select_strategy(process::Platform platform,
                                                             const process::IToolProbe &probe,
                                                             std::string_view preferred = "auto");

} // namespace nexus::launch
