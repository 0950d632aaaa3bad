#include "commands/config_check.h"
#include "commands/evaluate.h"
#include "commands/screen.h"
#include "fitscore/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cout << "fitscore v" << fitscore::core::kBuildVersion << "\n"
            << "Usage: fitscore_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  evaluate      Detailed match of one candidate against one position\n"
            << "  screen        Rank many candidates by whole-profile similarity\n"
            << "  config-check  Validate an engine configuration\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_help();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "evaluate") {
    return cmd_evaluate(argc, argv);
  }
  if (subcommand == "screen") {
    return cmd_screen(argc, argv);
  }
  if (subcommand == "config-check") {
    return cmd_config_check(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version") {
    std::cout << fitscore::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}
