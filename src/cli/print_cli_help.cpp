#include "parley/cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: parley_cli [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -w, --wrap <columns>       Wrap output at the given column\n"
      << "  -p, --page <lines>         Pause output every <lines> lines\n"
      << "      --no-color             Strip ANSI styles from output\n"
      << "      --config <file>        Use a specific configuration file\n"
      << std::endl;
}
