#include "lang/program.hpp"

#include "lang/error.hpp"

const std::array<Operation::Type, 19> Operation::Types = {
    Operation::Type::LD,   Operation::Type::ST,    Operation::Type::AND,
    Operation::Type::ANDN, Operation::Type::OR,    Operation::Type::ORN,
    Operation::Type::XOR,  Operation::Type::XORN,  Operation::Type::ADD,
    Operation::Type::SUB,  Operation::Type::MUL,   Operation::Type::DIV,
    Operation::Type::MOD,  Operation::Type::NOT,   Operation::Type::S,
    Operation::Type::R,    Operation::Type::JMP,   Operation::Type::JMPC,
    Operation::Type::JMPNC};

const Operation::Metadata& Operation::Metadata::get(Type t) {
  static const auto E = Operand::Type::EXPRESSION;
  static const auto V = Operand::Type::VARIABLE;
  static const auto L = Operand::Type::LABEL;
  static const auto N = Operand::Type::NONE;
  static Operation::Metadata ld{Operation::Type::LD, "LD", 1, E, false, true};
  static Operation::Metadata st{Operation::Type::ST, "ST", 1, V, true, false};
  static Operation::Metadata and_{Operation::Type::AND, "AND", 1, E, true, true};
  static Operation::Metadata andn{Operation::Type::ANDN, "ANDN", 1, E, true,
                                  true};
  static Operation::Metadata or_{Operation::Type::OR, "OR", 1, E, true, true};
  static Operation::Metadata orn{Operation::Type::ORN, "ORN", 1, E, true, true};
  static Operation::Metadata xor_{Operation::Type::XOR, "XOR", 1, E, true, true};
  static Operation::Metadata xorn{Operation::Type::XORN, "XORN", 1, E, true,
                                  true};
  static Operation::Metadata add{Operation::Type::ADD, "ADD", 1, E, true, true};
  static Operation::Metadata sub{Operation::Type::SUB, "SUB", 1, E, true, true};
  static Operation::Metadata mul{Operation::Type::MUL, "MUL", 1, E, true, true};
  static Operation::Metadata div{Operation::Type::DIV, "DIV", 1, E, true, true};
  static Operation::Metadata mod{Operation::Type::MOD, "MOD", 1, E, true, true};
  static Operation::Metadata not_{Operation::Type::NOT, "NOT", 0, N, true, true};
  static Operation::Metadata s{Operation::Type::S, "S", 1, V, true, false};
  static Operation::Metadata r{Operation::Type::R, "R", 1, V, true, false};
  static Operation::Metadata jmp{Operation::Type::JMP, "JMP", 1, L, false,
                                 false};
  static Operation::Metadata jmpc{Operation::Type::JMPC, "JMPC", 1, L, true,
                                  false};
  static Operation::Metadata jmpnc{Operation::Type::JMPNC, "JMPNC", 1, L, true,
                                   false};
  switch (t) {
    case Operation::Type::LD:
      return ld;
    case Operation::Type::ST:
      return st;
    case Operation::Type::AND:
      return and_;
    case Operation::Type::ANDN:
      return andn;
    case Operation::Type::OR:
      return or_;
    case Operation::Type::ORN:
      return orn;
    case Operation::Type::XOR:
      return xor_;
    case Operation::Type::XORN:
      return xorn;
    case Operation::Type::ADD:
      return add;
    case Operation::Type::SUB:
      return sub;
    case Operation::Type::MUL:
      return mul;
    case Operation::Type::DIV:
      return div;
    case Operation::Type::MOD:
      return mod;
    case Operation::Type::NOT:
      return not_;
    case Operation::Type::S:
      return s;
    case Operation::Type::R:
      return r;
    case Operation::Type::JMP:
      return jmp;
    case Operation::Type::JMPC:
      return jmpc;
    case Operation::Type::JMPNC:
      return jmpnc;
    case Operation::Type::__COUNT:
      throw std::runtime_error("not an operation type");
  }
  return ld;
}

const Operation::Metadata& Operation::Metadata::get(const std::string& name) {
  for (auto t : Operation::Types) {
    auto& m = get(t);
    if (m.name == name) {
      return m;
    }
  }
  throw VMError(VMError::Type::UNKNOWN_INSTRUCTION, name);
}

void Program::push_back(Operation::Type t, const std::string& operand) {
  auto& meta = Operation::Metadata::get(t);
  ops.push_back(Operation(t, Operand(meta.operand_type, operand)));
}

void Program::addLabel(const std::string& label) {
  if (labels.count(label)) {
    throw VMError(VMError::Type::DUPLICATE_LABEL, label);
  }
  labels[label] = ops.size();
}

size_t Program::getLabel(const std::string& label) const {
  auto it = labels.find(label);
  if (it == labels.end()) {
    throw VMError(VMError::Type::UNDEFINED_LABEL, label);
  }
  return it->second;
}

bool Program::hasLabel(const std::string& label) const {
  return labels.find(label) != labels.end();
}

bool Program::operator==(const Program& p) const {
  return (ops == p.ops) && (labels == p.labels);
}

bool Program::operator!=(const Program& p) const { return !(*this == p); }
