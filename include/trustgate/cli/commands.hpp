#pragma once

namespace trustgate::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace trustgate::cli
