#include <inquest/cli_exit_codes.h>
#include <inquest/inquest_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: inquest <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze     Run the analysis (default if no command is given).\n"
      << "  techniques  List the registered techniques.\n"
      << "  metrics     Show the most recent metrics history entries.\n"
      << "  cache       Manage persisted state (subcommands: clean).\n\n"
      << "Run 'inquest analyze --help' for analysis options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return inquest::kExitClean;
    }

    std::string command = "analyze";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "analyze") {
      return inquest::RunAnalyze(command_arguments);
    }
    if (command == "techniques") {
      return inquest::RunTechniques(command_arguments);
    }
    if (command == "metrics") {
      return inquest::RunMetrics(command_arguments);
    }
    if (command == "cache") {
      return inquest::RunCacheCommand(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return inquest::kExitUsageError;
  }
}
