#include "clawboot/cli/commands.hpp"

int main(int argc, char **argv) { return clawboot::cli::run_cli(argc, argv); }
