#include "captlog/cli/commands.hpp"

int main(int argc, char **argv) { return captlog::cli::run_cli(argc, argv); }
