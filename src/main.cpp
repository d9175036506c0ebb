#include "couponvault/cli/commands.hpp"

int main(int argc, char **argv) { return couponvault::cli::run_cli(argc, argv); }
