#include "textguard/cli/commands.hpp"

int main(int argc, char **argv) { return textguard::cli::run_cli(argc, argv); }
