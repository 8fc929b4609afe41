#include "safelayer/cli/commands.hpp"

int main(int argc, char **argv) { return safelayer::cli::run_cli(argc, argv); }
