#include "eval/interpreter.hpp"

#include <cctype>
#include <limits>
#include <sstream>

#include "eval/semantics.hpp"
#include "lang/error.hpp"
#include "lang/program_util.hpp"
#include "sys/log.hpp"

Interpreter::Interpreter(const Settings& settings)
    : settings(settings), is_debug(Log::get().level == Log::Level::DEBUG) {}

Word Interpreter::calc(const Operation::Type type, Word acc, Word source) {
  switch (type) {
    case Operation::Type::LD: {
      return source;
    }
    case Operation::Type::AND: {
      return Semantics::bitAnd(acc, source);
    }
    case Operation::Type::ANDN: {
      return Semantics::bitAndNot(acc, source);
    }
    case Operation::Type::OR: {
      return Semantics::bitOr(acc, source);
    }
    case Operation::Type::ORN: {
      return Semantics::bitOrNot(acc, source);
    }
    case Operation::Type::XOR: {
      return Semantics::bitXor(acc, source);
    }
    case Operation::Type::XORN: {
      return Semantics::bitXorNot(acc, source);
    }
    case Operation::Type::ADD: {
      return Semantics::add(acc, source);
    }
    case Operation::Type::SUB: {
      return Semantics::sub(acc, source);
    }
    case Operation::Type::MUL: {
      return Semantics::mul(acc, source);
    }
    case Operation::Type::DIV: {
      return Semantics::div(acc, source);
    }
    case Operation::Type::MOD: {
      return Semantics::mod(acc, source);
    }
    case Operation::Type::NOT: {
      return Semantics::bitNot(acc);
    }
    case Operation::Type::ST:
    case Operation::Type::S:
    case Operation::Type::R:
    case Operation::Type::JMP:
    case Operation::Type::JMPC:
    case Operation::Type::JMPNC:
    case Operation::Type::__COUNT:
      Log::get().error(
          "non-arithmetic operation: " + Operation::Metadata::get(type).name,
          true);
      break;
  }
  return 0;
}

bool Interpreter::parseLiteral(const std::string& token, Word& value) {
  std::string digits = token;
  uint64_t base = 10;
  if (token.compare(0, 3, "16#") == 0) {
    digits = token.substr(3);
    base = 16;
  }
  if (digits.empty()) {
    return false;
  }
  uint64_t v = 0;
  for (char ch : digits) {
    auto c = static_cast<unsigned char>(ch);
    uint64_t d;
    if (std::isdigit(c)) {
      d = c - '0';
    } else if (base == 16 && std::isxdigit(c)) {
      d = std::tolower(c) - 'a' + 10;
    } else {
      return false;
    }
    v = maskWord(v * base + d);
  }
  value = static_cast<Word>(v);
  return true;
}

Word Interpreter::evaluate(const Operand& a, const Memory& mem) const {
  Word value;
  if (parseLiteral(a.name, value)) {
    return value;
  }
  auto reg = mem.find(a.name);
  if (reg) {
    return reg->asWord();
  }
  if (settings.strict_operands) {
    throw VMError(VMError::Type::UNKNOWN_EXPRESSION, a.name);
  }
  Log::get().warn("Unknown expression " + a.name + "; using 0");
  return 0;
}

size_t Interpreter::step(const Program& p, size_t pc, Memory& mem) const {
  auto& op = p.ops[pc];
  size_t pc_next = pc + 1;
  switch (op.type) {
    case Operation::Type::ST: {
      mem.set(op.operand.name, Value(mem.getAcc()));
      break;
    }
    case Operation::Type::S: {
      if (mem.getAcc()) {
        mem.set(op.operand.name, Value::TRUE_VALUE);
      }
      break;
    }
    case Operation::Type::R: {
      if (mem.getAcc()) {
        mem.set(op.operand.name, Value::FALSE_VALUE);
      }
      break;
    }
    case Operation::Type::JMP: {
      pc_next = p.getLabel(op.operand.name);
      break;
    }
    case Operation::Type::JMPC: {
      if (mem.getAcc()) {
        pc_next = p.getLabel(op.operand.name);
      }
      break;
    }
    case Operation::Type::JMPNC: {
      if (!mem.getAcc()) {
        pc_next = p.getLabel(op.operand.name);
      }
      break;
    }
    case Operation::Type::NOT: {
      mem.setAcc(calc(op.type, mem.getAcc(), 0));
      break;
    }
    default: {
      // evaluate before writing so that a failing operation leaves ACC intact
      auto source = evaluate(op.operand, mem);
      mem.setAcc(calc(op.type, mem.getAcc(), source));
      break;
    }
  }
  return pc_next;
}

size_t Interpreter::run(const Program& p, Memory& mem) {
  // check for empty program
  if (p.ops.empty()) {
    return 0;
  }

  size_t cycles = 0;
  const size_t max_cycles = getMaxCycles();
  const size_t num_ops = p.ops.size();
  Memory old_mem;
  size_t pc = 0;

  // start program execution
  while (pc < num_ops) {
    if (is_debug) {
      old_mem = mem;
    }
    auto& op = p.ops[pc];
    size_t pc_next;
    try {
      pc_next = step(p, pc, mem);
    } catch (const VMError& e) {
      if (e.line == 0 && op.line > 0) {
        throw VMError(e.type, e.token, op.line);
      }
      throw;
    }

    // count execution steps
    ++cycles;

    // print debug information
    if (is_debug) {
      std::stringstream buf;
      buf << "Executing ";
      ProgramUtil::print(op, buf);
      buf << ": " << old_mem << " => " << mem;
      Log::get().debug(buf.str());
    }
    if (tracer) {
      tracer(op, pc, mem);
    }
    pc = pc_next;

    // check resource constraints
    if (cycles > max_cycles) {
      throw VMError(VMError::Type::MAX_CYCLES_EXCEEDED,
                    ProgramUtil::operationToString(op), op.line);
    }
  }

  if (is_debug) {
    Log::get().debug("Finished execution after " + std::to_string(cycles) +
                     " cycles");
  }
  return cycles;
}

size_t Interpreter::getMaxCycles() const {
  return (settings.max_cycles >= 0) ? settings.max_cycles
                                    : std::numeric_limits<size_t>::max();
}
