#include "lang/program_util.hpp"

#include <algorithm>

bool ProgramUtil::hasOp(const Program &p, Operation::Type type) {
  return std::any_of(p.ops.begin(), p.ops.end(),
                     [type](const Operation &op) { return op.type == type; });
}

size_t ProgramUtil::numOps(const Program &p, Operation::Type type) {
  return std::count_if(p.ops.begin(), p.ops.end(),
                       [type](const Operation &op) { return op.type == type; });
}

bool ProgramUtil::isArithmetic(Operation::Type t) {
  switch (t) {
    case Operation::Type::LD:
    case Operation::Type::AND:
    case Operation::Type::ANDN:
    case Operation::Type::OR:
    case Operation::Type::ORN:
    case Operation::Type::XOR:
    case Operation::Type::XORN:
    case Operation::Type::ADD:
    case Operation::Type::SUB:
    case Operation::Type::MUL:
    case Operation::Type::DIV:
    case Operation::Type::MOD:
    case Operation::Type::NOT:
      return true;
    default:
      return false;
  }
}

bool ProgramUtil::isJump(Operation::Type t) {
  return t == Operation::Type::JMP || t == Operation::Type::JMPC ||
         t == Operation::Type::JMPNC;
}

std::vector<std::string> ProgramUtil::getLabelsAt(const Program &p,
                                                  size_t index) {
  std::vector<std::string> result;
  for (const auto &it : p.labels) {
    if (it.second == index) {
      result.push_back(it.first);
    }
  }
  return result;
}

std::string getIndent(int indent) { return std::string(indent, ' '); }

std::string ProgramUtil::operandToString(const Operand &op) {
  return op.type == Operand::Type::NONE ? std::string() : op.name;
}

std::string ProgramUtil::operationToString(const Operation &op) {
  auto &metadata = Operation::Metadata::get(op.type);
  if (metadata.num_operands == 0) {
    return metadata.name;
  }
  return metadata.name + " " + operandToString(op.operand);
}

void ProgramUtil::print(const Operation &op, std::ostream &out, int indent) {
  out << getIndent(indent) << operationToString(op);
}

void ProgramUtil::print(const Program &p, std::ostream &out,
                        const std::string &newline) {
  for (size_t i = 0; i <= p.ops.size(); i++) {
    for (const auto &label : getLabelsAt(p, i)) {
      out << label << ":" << newline;
    }
    if (i < p.ops.size()) {
      print(p.ops[i], out, 2);
      out << newline;
    }
  }
}
