#include "scrubline/cli/commands.hpp"

int main(int argc, char **argv) { return scrubline::cli::run_cli(argc, argv); }
