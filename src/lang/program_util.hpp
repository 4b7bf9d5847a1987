#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "lang/program.hpp"

class ProgramUtil {
 public:
  static bool hasOp(const Program &p, Operation::Type type);

  static size_t numOps(const Program &p, Operation::Type type);

  static bool isArithmetic(Operation::Type t);

  static bool isJump(Operation::Type t);

  static std::vector<std::string> getLabelsAt(const Program &p, size_t index);

  static std::string operandToString(const Operand &op);

  static std::string operationToString(const Operation &op);

  static void print(const Operation &op, std::ostream &out, int indent = 0);

  static void print(const Program &p, std::ostream &out,
                    const std::string &newline = std::string("\n"));
};
