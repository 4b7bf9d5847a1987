#include "cmd/commands.hpp"

#include <iostream>

#include "cmd/test.hpp"
#include "eval/machine.hpp"
#include "lang/parser.hpp"
#include "lang/program_util.hpp"
#include "sys/log.hpp"

void Commands::help() {
  Settings settings;
  std::cout << "Welcome to " << Version::INFO << "." << std::endl
            << std::endl;
  std::cout << "Usage: ilvm <command> <options>" << std::endl << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  eval      <file>     Run an IL program and print its "
               "registers (see -c,-u,-x)"
            << std::endl;
  std::cout << "  print     <file>     Parse an IL program and print it in "
               "canonical form"
            << std::endl;
  std::cout << std::endl << "Targets:" << std::endl;
  std::cout
      << "  <file>               Path to an IL file (file extension: *.il)"
      << std::endl;
  std::cout << std::endl << "Options:" << std::endl;
  std::cout << "  -c <number>          Maximum number of execution steps "
               "(no limit: -1, default: "
            << settings.max_cycles << ")" << std::endl;
  std::cout << "  -u                   Evaluate unknown operands as zero "
               "instead of failing"
            << std::endl;
  std::cout << "  -x                   Print the registers after every "
               "executed operation"
            << std::endl;
  std::cout << "  -l <string>          Log level (values: "
               "debug,info,warn,error)"
            << std::endl;
}

void Commands::evaluate(const std::string& path) {
  Machine machine(settings);
  machine.loadFile(path);
  if (settings.print_trace) {
    machine.setTracer([](const Operation& op, size_t pc, const Memory& mem) {
      std::cout << pc << ": " << ProgramUtil::operationToString(op) << " => "
                << mem << std::endl;
    });
  }
  auto cycles = machine.run();
  std::cout << machine.getMemory() << std::endl;
  Log::get().debug("Executed " + std::to_string(cycles) + " operations");
}

void Commands::print(const std::string& path) {
  Parser parser;
  auto program = parser.parseFile(path);
  ProgramUtil::print(program, std::cout);
}

void Commands::testAll() {
  Test test;
  test.all();
}
