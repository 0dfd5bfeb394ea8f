#pragma once

namespace nexus::cli {

int run_cli(int argc, char **argv);

} // namespace nexus::cli
