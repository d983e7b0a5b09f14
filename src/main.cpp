#include "boxrun/cli/commands.hpp"

int main(int argc, char **argv) { return boxrun::cli::run_cli(argc, argv); }
