#include "nexus/cli/commands.hpp"

int main(int argc, char **argv) { return nexus::cli::run_cli(argc, argv); }
