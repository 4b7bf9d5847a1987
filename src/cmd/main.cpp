#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "cmd/commands.hpp"
#include "sys/log.hpp"
#include "sys/util.hpp"

int dispatch(Settings settings, const std::vector<std::string>& args) {
  if (args.empty()) {
    Commands::help();
    return EXIT_SUCCESS;
  }
  std::string cmd = args.front();
  if (settings.print_trace && cmd != "evaluate" && cmd != "eval") {
    Log::get().error("Option -x only allowed in evaluate command", true);
  }
  if (cmd == "help") {
    Commands::help();
    return EXIT_SUCCESS;
  }
  if ((cmd == "evaluate" || cmd == "eval" || cmd == "print") &&
      args.size() != 2) {
    std::cerr << "Usage: ilvm " << cmd << " <file>" << std::endl;
    return EXIT_FAILURE;
  }

  Commands commands(settings);

  if (cmd == "evaluate" || cmd == "eval") {
    commands.evaluate(args.at(1));
  } else if (cmd == "print") {
    commands.print(args.at(1));
  }
#ifndef ILVM_VERSION
  // hidden commands (only in development versions)
  else if (cmd == "test") {
    commands.testAll();
  }
#endif
  // unknown command
  else {
    std::cerr << "Unknown command: " << cmd << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
  try {
    Settings settings;
    auto args = settings.parseArgs(argc, argv);
    return dispatch(settings, args);
  } catch (const std::exception& e) {
    Log::get().error(e.what());
    return EXIT_FAILURE;
  }
}
