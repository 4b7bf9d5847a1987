#pragma once

#include <optional>
#include <string>

#include "eval/interpreter.hpp"
#include "eval/memory.hpp"
#include "lang/parser.hpp"
#include "lang/program.hpp"

// Loads an IL program and runs it against a fresh register table.
class Machine {
 public:
  Machine();

  explicit Machine(const Settings &settings);

  Machine(const Machine &) = delete;

  Machine &operator=(const Machine &) = delete;

  // Replace the loaded program. The current program is kept if parsing fails.
  void load(const std::string &text);

  void loadFile(const std::string &path);

  // Run the loaded program from {ACC:0}, returning the number of executed
  // operations. On error the register table is left as it was before the
  // failing operation.
  size_t run();

  const Program &getProgram() const { return program; }

  const Memory &getMemory() const { return memory; }

  Value getRegister(const std::string &name) const;

  std::optional<Value> findRegister(const std::string &name) const;

  void setTracer(Tracer t);

 private:
  const Settings settings;
  Interpreter interpreter;
  Program program;
  Memory memory;
};
