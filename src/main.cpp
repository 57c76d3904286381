#include "trustgate/cli/commands.hpp"

int main(int argc, char **argv) { return trustgate::cli::run_cli(argc, argv); }
