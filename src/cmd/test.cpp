#include "cmd/test.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "eval/interpreter.hpp"
#include "eval/semantics.hpp"
#include "lang/parser.hpp"
#include "lang/program_util.hpp"
#include "sys/file.hpp"
#include "sys/log.hpp"

Test::Test() { settings.max_cycles = 100000; }

void Test::all() {
  value();
  memory();
  operationMetadata();
  semantics();
  literals();
  parser();
  programUtil();
  instructions();
  scenarios();
  knownPrograms();
  errors();
  lenientOperands();
  maxCycles();
  tracer();
  Log::get().info("All tests passed");
}

void checkValue(const Value& v, const std::string& s) {
  if (v.to_string() != s) {
    Log::get().error("Expected " + v.to_string() + " to be " + s, true);
  }
}

void Test::value() {
  Log::get().info("Testing value");
  checkValue(Value::ZERO, "0");
  checkValue(Value(42), "42");
  checkValue(Value("4294967295"), "4294967295");
  checkValue(Value("4294967296"), "0");
  checkValue(Value("TRUE"), "TRUE");
  checkValue(Value::boolean(false), "FALSE");
  if (Value::TRUE_VALUE.asWord() != 1 || Value::FALSE_VALUE.asWord() != 0) {
    Log::get().error("Unexpected boolean words", true);
  }
  if (Value(1) == Value::TRUE_VALUE || Value(0) == Value::FALSE_VALUE) {
    Log::get().error("Integers and booleans must not be equal", true);
  }
  if (!Value::FALSE_VALUE.isBoolean() || Value(1).isBoolean()) {
    Log::get().error("Unexpected value type", true);
  }
  if (!Value(7).isTrue() || Value::FALSE_VALUE.isTrue()) {
    Log::get().error("Unexpected truth value", true);
  }
  bool ok;
  try {
    Value("-1");
    ok = false;
  } catch (const std::runtime_error&) {
    ok = true;
  }
  if (!ok) {
    Log::get().error("Expected error for negative value", true);
  }
}

void checkMemory(const Memory& mem, const std::string& name,
                 const std::string& expected) {
  auto v = mem.find(name);
  if (!v) {
    Log::get().error("Missing register " + name, true);
  } else if (v->to_string() != expected) {
    Log::get().error("Unexpected value of register " + name + "; expected: " +
                         expected + "; found: " + v->to_string(),
                     true);
  }
}

void checkAbsent(const Memory& mem, const std::string& name) {
  if (mem.contains(name)) {
    Log::get().error("Unexpected register " + name + ": " +
                         mem.get(name).to_string(),
                     true);
  }
}

void checkMemoryString(const std::string& in, const std::string& out) {
  Memory mem(in);
  std::stringstream buf;
  buf << mem;
  auto buf_str = buf.str();
  if (buf_str != out) {
    Log::get().error(
        "Unexpected memory string: " + buf_str + " - expected: " + out, true);
  }
}

void Test::memory() {
  Log::get().info("Testing memory");

  // initial state
  Memory base;
  if (base.size() != 1) {
    Log::get().error("Unexpected initial memory size", true);
  }
  checkMemory(base, Memory::ACC, "0");
  checkAbsent(base, "A");
  if (base.find("A")) {
    Log::get().error("Expected empty result for unknown register", true);
  }
  bool ok;
  try {
    base.get("A");
    ok = false;
  } catch (const VMError& e) {
    ok = (e.type == VMError::Type::UNDEFINED_REGISTER && e.token == "A");
  }
  if (!ok) {
    Log::get().error("Expected undefined register error", true);
  }

  // get and set
  base.set("A", 0);
  checkMemory(base, "A", "0");
  base.set("B", Value::TRUE_VALUE);
  checkMemory(base, "B", "TRUE");
  base.setAcc(17);
  if (base.getAcc() != 17) {
    Log::get().error("Unexpected accumulator value", true);
  }
  base.set("a", 3);
  checkMemory(base, "a", "3");
  checkMemory(base, "A", "0");
  base.clear();
  if (base != Memory()) {
    Log::get().error("Expected initial memory after clear", true);
  }

  // parsing and printing
  checkMemoryString("", "ACC:0");
  checkMemoryString("ACC:5,A:5", "A:5,ACC:5");
  checkMemoryString("X:TRUE,Y:FALSE,ACC:1", "ACC:1,X:TRUE,Y:FALSE");
  checkMemoryString("Z:1,B:2,A:3", "A:3,ACC:0,B:2,Z:1");
  if (Memory("X:TRUE") == Memory("X:1")) {
    Log::get().error("Boolean and integer registers must differ", true);
  }
}

void Test::operationMetadata() {
  Log::get().info("Testing operation metadata");
  if (static_cast<size_t>(Operation::Type::__COUNT) !=
      Operation::Types.size()) {
    Log::get().error("Unexpected number of operation types", true);
  }
  std::set<std::string> names;
  for (auto type : Operation::Types) {
    auto& meta = Operation::Metadata::get(type);
    if (type != meta.type) {
      Log::get().error("Unexpected type: " + meta.name, true);
    }
    if (names.count(meta.name)) {
      Log::get().error("Duplicate name: " + meta.name, true);
    }
    names.insert(meta.name);
    if (&Operation::Metadata::get(meta.name) != &meta) {
      Log::get().error("Unexpected lookup result: " + meta.name, true);
    }
    if (meta.num_operands != (type == Operation::Type::NOT ? 0 : 1)) {
      Log::get().error("Unexpected number of operands: " + meta.name, true);
    }
    if (ProgramUtil::isJump(type) !=
        (meta.operand_type == Operand::Type::LABEL)) {
      Log::get().error("Unexpected operand type: " + meta.name, true);
    }
  }
}

Word readWord(const std::string& s) {
  Word w;
  if (!Interpreter::parseLiteral(s, w)) {
    Log::get().error("Invalid literal in test file: " + s, true);
  }
  return w;
}

void Test::semantics() {
  for (auto& type : Operation::Types) {
    if (!ProgramUtil::isArithmetic(type)) {
      continue;
    }
    auto& meta = Operation::Metadata::get(type);
    std::string name = meta.name;
    for (auto& c : name) {
      c = std::tolower(static_cast<unsigned char>(c));
    }
    std::string test_path = std::string("tests") + FILE_SEP + "semantics" +
                            FILE_SEP + name + ".csv";
    std::ifstream test_file(test_path);
    if (!test_file.good()) {
      Log::get().error("Test file not found: " + test_path, true);
      continue;
    }
    Log::get().info("Testing " + test_path);
    std::string line, s, t, r;
    Word op1, op2 = 0, expected, result;
    std::getline(test_file, line);  // skip header
    while (std::getline(test_file, line)) {
      if (line.empty() || line[0] == '#') {
        continue;
      }
      std::stringstream ss(line);
      std::getline(ss, s, ',');
      if (meta.num_operands == 1) {
        std::getline(ss, t, ',');
      }
      std::getline(ss, r);
      op1 = readWord(s);
      if (meta.num_operands == 1) {
        op2 = readWord(t);
      }
      expected = readWord(r);
      result = Interpreter::calc(type, op1, op2);
      if (result != expected) {
        Log::get().error("Unexpected value for " + meta.name + "(" +
                             std::to_string(op1) + "," + std::to_string(op2) +
                             "); expected " + std::to_string(expected) +
                             "; got " + std::to_string(result),
                         true);
      }
    }
  }

  // complement is its own inverse
  for (Word v : {0u, 1u, 42u, 0x80000000u, 0xFFFFFFFFu}) {
    if (Semantics::bitNot(Semantics::bitNot(v)) != v) {
      Log::get().error("Double complement changed " + std::to_string(v), true);
    }
  }
}

void checkLiteral(const std::string& token, bool valid, Word expected = 0) {
  Word w = 0;
  bool result = Interpreter::parseLiteral(token, w);
  if (result != valid || (valid && w != expected)) {
    Log::get().error("Unexpected literal parsing result for " + token, true);
  }
}

void Test::literals() {
  Log::get().info("Testing literals");
  checkLiteral("0", true, 0);
  checkLiteral("00042", true, 42);
  checkLiteral("4294967295", true, 4294967295u);
  checkLiteral("4294967296", true, 0);
  checkLiteral("4294967301", true, 5);
  checkLiteral("16#FF", true, 255);
  checkLiteral("16#ff", true, 255);
  checkLiteral("16#FFFFFFFF", true, 0xFFFFFFFFu);
  checkLiteral("16#1FFFFFFFF", true, 0xFFFFFFFFu);
  checkLiteral("16#", false);
  checkLiteral("16#G1", false);
  checkLiteral("", false);
  checkLiteral("-1", false);
  checkLiteral("12abc", false);
  checkLiteral("A", false);
  checkLiteral("8#17", false);
}

void checkParseError(const std::string& text, VMError::Type type,
                     size_t line) {
  Parser parser;
  try {
    parser.parseText(text);
  } catch (const VMError& e) {
    if (e.type != type || e.line != line) {
      Log::get().error("Unexpected parse error: " + std::string(e.what()),
                       true);
    }
    return;
  }
  Log::get().error("Expected parse error: " + VMError::getTypeName(type),
                   true);
}

void Test::parser() {
  Log::get().info("Testing parser");
  Parser parser;

  // whitespace, blank lines, labels and comments
  auto p = parser.parseText(
      "\n   \n  Start:\r\n LD 5 (* five *)\n\tloop:  ST   A\r\n"
      "(* only a comment *)\nJMP loop\nEnd:\n");
  Program expected;
  expected.addLabel("Start");
  expected.push_back(Operation::Type::LD, "5");
  expected.addLabel("loop");
  expected.push_back(Operation::Type::ST, "A");
  expected.push_back(Operation::Type::JMP, "loop");
  expected.addLabel("End");
  if (p != expected) {
    ProgramUtil::print(p, std::cerr);
    Log::get().error("Unexpected parse result", true);
  }
  if (p.getLabel("Start") != 0 || p.getLabel("loop") != 1 ||
      p.getLabel("End") != 3) {
    Log::get().error("Unexpected label positions", true);
  }
  if (p.ops.at(1).line != 5 || p.ops.at(2).line != 7) {
    Log::get().error("Unexpected line numbers", true);
  }
  if (p.ops.at(2).operand.type != Operand::Type::LABEL ||
      p.ops.at(0).operand.type != Operand::Type::EXPRESSION ||
      p.ops.at(1).operand.type != Operand::Type::VARIABLE) {
    Log::get().error("Unexpected operand types", true);
  }

  // references to unknown labels are resolved at execution time
  auto q = parser.parseText("JMPC Nowhere\nNOT");
  if (q.ops.size() != 2 || q.hasLabel("Nowhere")) {
    Log::get().error("Unexpected program with forward reference", true);
  }

  // comments
  if (Parser::stripComments("LD 1 (* a: b *) (* c *)") != "LD 1    ") {
    Log::get().error("Unexpected comment stripping", true);
  }
  if (Parser::stripComments("ST X (* open") != "ST X ") {
    Log::get().error("Unexpected unterminated comment stripping", true);
  }

  // errors
  checkParseError("LD 1\nFOO 2", VMError::Type::UNKNOWN_INSTRUCTION, 2);
  checkParseError("ld 1", VMError::Type::UNKNOWN_INSTRUCTION, 1);
  checkParseError("LD", VMError::Type::INVALID_ARITY, 1);
  checkParseError("LD 1 2", VMError::Type::INVALID_ARITY, 1);
  checkParseError("\nNOT 1", VMError::Type::INVALID_ARITY, 2);
  checkParseError("JMP", VMError::Type::INVALID_ARITY, 1);
  checkParseError("ST 5", VMError::Type::INVALID_OPERAND, 1);
  checkParseError("JMP 16#FF", VMError::Type::INVALID_OPERAND, 1);
  checkParseError(": LD 1", VMError::Type::INVALID_LABEL, 1);
  checkParseError("1x: LD 1", VMError::Type::INVALID_LABEL, 1);
  checkParseError("A B: LD 1", VMError::Type::INVALID_LABEL, 1);
  checkParseError("L: LD 1\nL: LD 2", VMError::Type::DUPLICATE_LABEL, 2);
}

void Test::programUtil() {
  Log::get().info("Testing program util");
  Parser parser;
  auto p = parser.parseText(
      "  Start:\n LD 16#5 (* c *)\nB:\nA: ST X\n NOT\nJMPNC A\nEnd:");
  std::stringstream buf;
  ProgramUtil::print(p, buf);
  std::string expected =
      "Start:\n  LD 16#5\nA:\nB:\n  ST X\n  NOT\n  JMPNC A\nEnd:\n";
  if (buf.str() != expected) {
    Log::get().error("Unexpected program output:\n" + buf.str(), true);
  }
  // printed programs parse to the same program
  if (parser.parseText(buf.str()) != p) {
    Log::get().error("Printed program differs after parsing", true);
  }
  if (!ProgramUtil::hasOp(p, Operation::Type::NOT) ||
      ProgramUtil::hasOp(p, Operation::Type::JMP) ||
      ProgramUtil::numOps(p, Operation::Type::ST) != 1) {
    Log::get().error("Unexpected operation count", true);
  }
}

Memory Test::runProgram(const std::string& text) {
  Machine machine(settings);
  machine.load(text);
  machine.run();
  return machine.getMemory();
}

void Test::checkProgram(const std::string& text, const std::string& expected) {
  auto mem = runProgram(text);
  if (mem != Memory(expected)) {
    std::stringstream buf;
    buf << mem;
    Log::get().error("Unexpected registers: " + buf.str() +
                         "; expected: " + expected + "; program:\n" + text,
                     true);
  }
}

void Test::instructions() {
  Log::get().info("Testing instructions");
  checkProgram("", "ACC:0");
  checkProgram("LD 7", "ACC:7");
  checkProgram("LD 7\nST A\nLD 8", "A:7,ACC:8");
  checkProgram("LD 12\nAND 10", "ACC:8");
  checkProgram("LD 12\nANDN 10", "ACC:4");
  checkProgram("LD 12\nOR 10", "ACC:14");
  checkProgram("LD 12\nORN 10", "ACC:4294967293");
  checkProgram("LD 12\nXOR 10", "ACC:6");
  checkProgram("LD 12\nXORN 10", "ACC:4294967289");
  checkProgram("LD 12\nADD 10", "ACC:22");
  checkProgram("LD 12\nSUB 10", "ACC:2");
  checkProgram("LD 10\nSUB 12", "ACC:4294967294");
  checkProgram("LD 12\nMUL 10", "ACC:120");
  checkProgram("LD 12\nDIV 10", "ACC:1");
  checkProgram("LD 12\nMOD 10", "ACC:2");
  checkProgram("LD 12\nNOT", "ACC:4294967283");
  checkProgram("LD 2\nS X", "ACC:2,X:TRUE");
  checkProgram("LD 2\nR X", "ACC:2,X:FALSE");
  checkProgram("LD 0\nS X\nR Y", "ACC:0");
  checkProgram("LD 1\nS X\nLD 0\nR X", "ACC:0,X:TRUE");
  checkProgram("LD 1\nS X\nR X\nS X", "ACC:1,X:TRUE");
  checkProgram("LD 3\nST X\nLD 1\nS X", "ACC:1,X:TRUE");
  checkProgram("LD 1\nS X\nLD X\nST Y", "ACC:1,X:TRUE,Y:1");
  checkProgram("LD 4\nST ACC", "ACC:4");
  checkProgram("LD 0\nJMP L\nLD 1\nL: ST A", "A:0,ACC:0");
  checkProgram("LD 5\nJMPC L\nLD 1\nL: ST A", "A:5,ACC:5");
  checkProgram("LD 0\nJMPC L\nLD 1\nL: ST A", "A:1,ACC:1");
  checkProgram("LD 0\nJMPNC L\nLD 1\nL: ST A", "A:0,ACC:0");
  checkProgram("LD 5\nJMPNC L\nLD 1\nL: ST A", "A:1,ACC:1");
  checkProgram("LD 1\nJMP End\nST A\nEnd:", "ACC:1");
  checkProgram("LD 1\nJMPNC Missing\nJMPC Ok\nOk: ST A", "A:1,ACC:1");
}

void Test::scenarios() {
  Log::get().info("Testing scenarios");
  checkProgram("LD 5\nST A", "ACC:5,A:5");
  checkProgram("LD 16#F0\nAND 16#0F\nST A", "ACC:0,A:0");
  checkProgram("JMP Skip\nLD 0\nST A\nSkip: LD 1\nST B", "ACC:1,B:1");
  checkProgram("LD 20\nDIV 4\nST A", "ACC:5,A:5");
  checkError("LD 20\nDIV 0\nST A", VMError::Type::DIVISION_BY_ZERO,
             "ACC:20");

  // load then store
  for (auto& x : {"0", "1", "123456", "16#DEADBEEF", "4294967295"}) {
    auto mem = runProgram(std::string("LD ") + x + "\nST A");
    auto expected = std::to_string(readWord(x));
    checkMemory(mem, "A", expected);
    checkMemory(mem, Memory::ACC, expected);
  }

  // double complement
  for (auto& v : {"0", "1", "16#80000000", "16#FFFFFFFF", "4294967296"}) {
    auto mem = runProgram(std::string("LD ") + v + "\nNOT\nNOT\nST A");
    checkMemory(mem, "A", std::to_string(readWord(v)));
  }

  // wraparound
  checkMemory(runProgram("LD 16#FFFFFFFF\nADD 1\nST A"), "A", "0");

  // conditional set on false accumulator never creates the register
  checkAbsent(runProgram("LD 0\nS X"), "X");
}

void Test::knownPrograms() {
  auto base_path = std::string("tests") + FILE_SEP + "programs" + FILE_SEP;
  std::ifstream in(base_path + "expected.csv");
  if (!in.good()) {
    Log::get().error("Test file not found: " + base_path + "expected.csv",
                     true);
  }
  std::string line, file, registers;
  std::getline(in, line);  // skip header
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::stringstream ss(line);
    std::getline(ss, file, ';');
    std::getline(ss, registers);
    auto path = base_path + file;
    Log::get().info("Testing " + path);
    Machine machine(settings);
    machine.loadFile(path);
    machine.run();
    if (machine.getMemory() != Memory(registers)) {
      std::stringstream buf;
      buf << machine.getMemory();
      Log::get().error("Unexpected registers for " + path + ": " + buf.str() +
                           "; expected: " + registers,
                       true);
    }
    // running again starts from the initial state
    auto first = machine.getMemory();
    machine.run();
    if (machine.getMemory() != first) {
      Log::get().error("Unexpected result of second run for " + path, true);
    }
  }
}

void Test::checkError(const std::string& text, VMError::Type type,
                      const std::string& expected_mem) {
  Machine machine(settings);
  try {
    machine.load(text);
    machine.run();
  } catch (const VMError& e) {
    if (e.type != type) {
      Log::get().error("Unexpected error: " + std::string(e.what()) +
                           "; expected: " + VMError::getTypeName(type),
                       true);
    }
    if (!expected_mem.empty() && machine.getMemory() != Memory(expected_mem)) {
      std::stringstream buf;
      buf << machine.getMemory();
      Log::get().error("Unexpected registers after error: " + buf.str() +
                           "; expected: " + expected_mem,
                       true);
    }
    return;
  }
  Log::get().error("Expected error: " + VMError::getTypeName(type) +
                       "; program:\n" + text,
                   true);
}

void Test::errors() {
  Log::get().info("Testing errors");
  checkError("LD 1\nPUSH 2", VMError::Type::UNKNOWN_INSTRUCTION);
  checkError("NOT 5", VMError::Type::INVALID_ARITY);
  checkError("LD FOO", VMError::Type::UNKNOWN_EXPRESSION, "ACC:0");
  checkError("LD 3\nST A\nADD B", VMError::Type::UNKNOWN_EXPRESSION,
             "A:3,ACC:3");
  checkError("LD 16#XYZ", VMError::Type::UNKNOWN_EXPRESSION);
  checkError("LD 7\nMOD 0\nST A", VMError::Type::DIVISION_BY_ZERO, "ACC:7");
  checkError("LD 0\nST Z\nLD 7\nDIV Z", VMError::Type::DIVISION_BY_ZERO,
             "ACC:7,Z:0");
  checkError("LD 1\nJMP Nowhere\nST A", VMError::Type::UNDEFINED_LABEL,
             "ACC:1");
  checkError("LD 1\nJMPC Nowhere", VMError::Type::UNDEFINED_LABEL);
  checkError("LD 0\nJMPNC Nowhere", VMError::Type::UNDEFINED_LABEL);

  // errors carry the line of the failing operation
  Machine machine(settings);
  machine.load("LD 1\n\nDIV 0");
  try {
    machine.run();
    Log::get().error("Expected division by zero", true);
  } catch (const VMError& e) {
    if (e.line != 3) {
      Log::get().error("Unexpected error line: " + std::to_string(e.line),
                       true);
    }
  }

  // failed loading keeps the previous program
  machine.load("LD 2\nST A");
  try {
    machine.load("LD 3\nBAD");
    Log::get().error("Expected unknown instruction", true);
  } catch (const VMError& e) {
    if (e.type != VMError::Type::UNKNOWN_INSTRUCTION) {
      throw;
    }
  }
  machine.run();
  checkMemory(machine.getMemory(), "A", "2");
  try {
    machine.getRegister("B");
    Log::get().error("Expected undefined register", true);
  } catch (const VMError& e) {
    if (e.type != VMError::Type::UNDEFINED_REGISTER) {
      throw;
    }
  }
  if (machine.findRegister("B") || !machine.findRegister("A")) {
    Log::get().error("Unexpected register lookup result", true);
  }
}

void Test::lenientOperands() {
  Log::get().info("Testing lenient operands");
  Settings lenient = settings;
  lenient.strict_operands = false;
  Machine machine(lenient);
  machine.load("LD FOO\nADD 2\nST A\nLD 5\nMUL 16#ZZ\nST B");
  machine.run();
  if (machine.getMemory() != Memory("A:2,ACC:0,B:0")) {
    Log::get().error("Unexpected registers with lenient operands", true);
  }
}

void Test::maxCycles() {
  Log::get().info("Testing max cycles");
  Settings limited = settings;
  limited.max_cycles = 50;
  Machine machine(limited);
  machine.load("LD 0\nLoop: ADD 1\nST N\nJMP Loop");
  try {
    machine.run();
    Log::get().error("Expected cycle limit error", true);
  } catch (const VMError& e) {
    if (e.type != VMError::Type::MAX_CYCLES_EXCEEDED) {
      throw;
    }
  }
  machine.load("LD 1\nADD 1\nST A");
  auto cycles = machine.run();
  if (cycles != 3) {
    Log::get().error("Unexpected number of cycles: " + std::to_string(cycles),
                     true);
  }
}

void Test::tracer() {
  Log::get().info("Testing tracer");
  Machine machine(settings);
  std::vector<size_t> trace;
  std::vector<std::string> states;
  machine.setTracer([&](const Operation& op, size_t pc, const Memory& mem) {
    trace.push_back(pc);
    std::stringstream buf;
    buf << ProgramUtil::operationToString(op) << "|" << mem;
    states.push_back(buf.str());
  });
  machine.load("LD 1\nJMPC L\nST A\nL: ST B");
  auto cycles = machine.run();
  std::vector<size_t> expected_trace = {0, 1, 3};
  if (cycles != 3 || trace != expected_trace) {
    Log::get().error("Unexpected trace", true);
  }
  if (states.front() != "LD 1|ACC:1" || states.back() != "ST B|ACC:1,B:1") {
    Log::get().error("Unexpected traced state: " + states.back(), true);
  }
}
