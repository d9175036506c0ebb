#pragma once

namespace couponvault::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace couponvault::cli
