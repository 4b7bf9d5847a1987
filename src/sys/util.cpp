#include "sys/util.hpp"

#include <cctype>
#include <sstream>

#include "sys/log.hpp"

#define cstr(a) std::string(xstr(a))
#define xstr(a) ystr(a)
#define ystr(a) #a

#ifdef ILVM_VERSION
const std::string Version::VERSION = cstr(ILVM_VERSION);
const std::string Version::INFO = "ILVM v" + cstr(ILVM_VERSION);
const bool Version::IS_RELEASE = true;
#else
const std::string Version::VERSION = "dev";
const std::string Version::INFO = "ILVM developer version";
const bool Version::IS_RELEASE = false;
#endif

Settings::Settings()
    : max_cycles(DEFAULT_MAX_CYCLES),
      strict_operands(true),
      print_trace(false) {}

enum class Option { NONE, MAX_CYCLES, LOG_LEVEL };

std::vector<std::string> Settings::parseArgs(int argc, char *argv[]) {
  Option option(Option::NONE);
  std::vector<std::string> unparsed;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (option == Option::MAX_CYCLES) {
      std::stringstream s(arg);
      int64_t val;
      if (!(s >> val) || val < -1) {
        Log::get().error("Invalid value for option: " + arg, true);
      }
      max_cycles = val;
      option = Option::NONE;
    } else if (option == Option::LOG_LEVEL) {
      Log::Level level;
      if (Log::parseLevel(arg, level)) {
        Log::get().level = level;
      } else {
        Log::get().error("Unknown log level: " + arg);
      }
      option = Option::NONE;
    } else if (arg.size() > 1 && arg.at(0) == '-') {
      std::string opt = arg.substr(1);
      if (opt == "c") {
        option = Option::MAX_CYCLES;
      } else if (opt == "l") {
        option = Option::LOG_LEVEL;
      } else if (opt == "u") {
        strict_operands = false;
      } else if (opt == "x") {
        print_trace = true;
      } else {
        Log::get().error("Unknown option: -" + opt, true);
      }
    } else {
      unparsed.push_back(arg);
    }
  }
  if (option != Option::NONE) {
    Log::get().error("Missing argument", true);
  }
  return unparsed;
}

void trimString(std::string &str) {
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
    str.pop_back();
  }
  size_t start = 0;
  while (start < str.size() &&
         std::isspace(static_cast<unsigned char>(str[start]))) {
    start++;
  }
  str.erase(0, start);
}

std::vector<std::string> splitWords(const std::string &str) {
  std::vector<std::string> words;
  std::stringstream buf(str);
  std::string word;
  while (buf >> word) {
    words.push_back(word);
  }
  return words;
}
