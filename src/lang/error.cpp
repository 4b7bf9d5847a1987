#include "lang/error.hpp"

std::string formatMessage(VMError::Type type, const std::string &token,
                          size_t line) {
  std::string msg = VMError::getTypeName(type);
  if (!token.empty()) {
    msg += ": " + token;
  }
  if (line > 0) {
    msg += " (line " + std::to_string(line) + ")";
  }
  return msg;
}

VMError::VMError(Type type, const std::string &token, size_t line)
    : std::runtime_error(formatMessage(type, token, line)),
      type(type),
      token(token),
      line(line) {}

std::string VMError::getTypeName(Type type) {
  switch (type) {
    case Type::UNKNOWN_INSTRUCTION:
      return "unknown instruction";
    case Type::INVALID_ARITY:
      return "invalid number of operands";
    case Type::INVALID_OPERAND:
      return "invalid operand";
    case Type::INVALID_LABEL:
      return "invalid label";
    case Type::DUPLICATE_LABEL:
      return "duplicate label";
    case Type::UNKNOWN_EXPRESSION:
      return "unknown expression";
    case Type::DIVISION_BY_ZERO:
      return "division by zero";
    case Type::UNDEFINED_LABEL:
      return "undefined label";
    case Type::UNDEFINED_REGISTER:
      return "undefined register";
    case Type::MAX_CYCLES_EXCEEDED:
      return "exceeded maximum number of cycles";
  }
  return "error";
}
