#pragma once

#include <functional>
#include <utility>

#include "eval/memory.hpp"
#include "lang/program.hpp"
#include "sys/util.hpp"

// Observer called after every executed operation with the index of that
// operation and the resulting register table.
using Tracer =
    std::function<void(const Operation &op, size_t pc, const Memory &mem)>;

class Interpreter {
 public:
  explicit Interpreter(const Settings &settings);

  static Word calc(const Operation::Type type, Word acc, Word source);

  // Parse a decimal or "16#" hexadecimal literal, masked to 32 bits.
  static bool parseLiteral(const std::string &token, Word &value);

  Word evaluate(const Operand &a, const Memory &mem) const;

  size_t run(const Program &p, Memory &mem);

  size_t getMaxCycles() const;

  void setTracer(Tracer t) { tracer = std::move(t); }

 private:
  size_t step(const Program &p, size_t pc, Memory &mem) const;

  const Settings &settings;

  const bool is_debug;
  Tracer tracer;
};
