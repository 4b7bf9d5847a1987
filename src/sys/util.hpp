#pragma once

#include <cstdint>
#include <string>
#include <vector>

class Version {
 public:
  static const std::string VERSION;
  static const std::string INFO;
  static const bool IS_RELEASE;
};

class Settings {
 public:
  static constexpr int64_t DEFAULT_MAX_CYCLES = -1;

  // maximum number of executed operations per run (no limit: -1)
  int64_t max_cycles;

  // fail on operands that are neither literals nor known registers;
  // otherwise they evaluate to zero
  bool strict_operands;

  // print the register table after every executed operation
  bool print_trace;

  Settings();

  std::vector<std::string> parseArgs(int argc, char *argv[]);
};

void trimString(std::string &str);

std::vector<std::string> splitWords(const std::string &str);
