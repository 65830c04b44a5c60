#include "cli/command.hpp"

int main(int argc, char **argv) { return chronolog::cli::cmd_changelog(argc, argv); }
