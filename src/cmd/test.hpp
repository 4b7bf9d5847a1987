#pragma once

#include <string>

#include "eval/machine.hpp"
#include "lang/error.hpp"
#include "sys/util.hpp"

class Test {
 public:
  Test();

  void all();

  void value();

  void memory();

  void operationMetadata();

  void semantics();

  void literals();

  void parser();

  void programUtil();

  void instructions();

  void scenarios();

  void knownPrograms();

  void errors();

  void lenientOperands();

  void maxCycles();

  void tracer();

 private:
  Memory runProgram(const std::string &text);

  void checkProgram(const std::string &text, const std::string &expected);

  void checkError(const std::string &text, VMError::Type type,
                  const std::string &expected_mem = "");

  Settings settings;
};
