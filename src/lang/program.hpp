#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

class Operand {
 public:
  enum class Type {
    NONE,        // no operand
    EXPRESSION,  // literal or register reference
    VARIABLE,    // register to write
    LABEL        // jump target
  };

  Operand() : Operand(Type::NONE, "") {}

  Operand(Type t, const std::string &n) : type(t), name(n) {}

  inline bool operator==(const Operand &o) const {
    return (type == o.type) && (name == o.name);
  }

  inline bool operator!=(const Operand &o) const { return !((*this) == o); }

  Type type;
  std::string name;
};

class Operation {
 public:
  enum class Type {
    LD,      // load
    ST,      // store
    AND,     // bitwise and
    ANDN,    // bitwise and with inverted operand
    OR,      // bitwise or
    ORN,     // bitwise or with inverted operand
    XOR,     // bitwise xor
    XORN,    // bitwise xor with inverted operand
    ADD,     // addition
    SUB,     // subtraction
    MUL,     // multiplication
    DIV,     // division
    MOD,     // modulo
    NOT,     // bitwise complement
    S,       // conditional set
    R,       // conditional reset
    JMP,     // jump
    JMPC,    // jump if true
    JMPNC,   // jump if false
    __COUNT  // number of operation types
  };

  static const std::array<Type, 19> Types;

  class Metadata {
   public:
    static const Metadata &get(Type t);

    static const Metadata &get(const std::string &name);

    Type type;
    std::string name;
    size_t num_operands;
    Operand::Type operand_type;
    bool is_reading_acc;
    bool is_writing_acc;
  };

  explicit Operation(Type y) : Operation(y, Operand()) {}

  Operation(Type y, const Operand &o, size_t l = 0)
      : type(y), operand(o), line(l) {}

  inline bool operator==(const Operation &op) const {
    return (type == op.type) && (operand == op.operand);
  }

  inline bool operator!=(const Operation &op) const { return !((*this) == op); }

  Type type;
  Operand operand;
  size_t line;  // source line, 0 if unknown
};

class Program {
 public:
  void push_back(Operation::Type t, const std::string &operand = "");

  void addLabel(const std::string &label);

  size_t getLabel(const std::string &label) const;

  bool hasLabel(const std::string &label) const;

  bool operator==(const Program &p) const;

  bool operator!=(const Program &p) const;

  std::vector<Operation> ops;

  // label name -> index of the following operation
  std::map<std::string, size_t> labels;
};
