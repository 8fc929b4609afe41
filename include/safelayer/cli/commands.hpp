#pragma once

namespace safelayer::cli {

/// Exit codes: 0 success, 1 error, 2 output blocked by policy.
int run_cli(int argc, char **argv);

} // namespace safelayer::cli
