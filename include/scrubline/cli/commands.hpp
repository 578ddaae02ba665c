#pragma once

namespace scrubline::cli {

/// Entry point for the `scrubline` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace scrubline::cli
