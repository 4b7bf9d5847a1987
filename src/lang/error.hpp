#pragma once

#include <stdexcept>
#include <string>

// Error raised while loading or executing an IL program. The type identifies
// the failure, the token names the offending mnemonic, operand, label or
// register. Line numbers are 1-based; zero means unknown.
class VMError : public std::runtime_error {
 public:
  enum class Type {
    UNKNOWN_INSTRUCTION,
    INVALID_ARITY,
    INVALID_OPERAND,
    INVALID_LABEL,
    DUPLICATE_LABEL,
    UNKNOWN_EXPRESSION,
    DIVISION_BY_ZERO,
    UNDEFINED_LABEL,
    UNDEFINED_REGISTER,
    MAX_CYCLES_EXCEEDED
  };

  VMError(Type type, const std::string &token, size_t line = 0);

  static std::string getTypeName(Type type);

  const Type type;
  const std::string token;
  const size_t line;
};
