#include "eval/machine.hpp"

#include "sys/file.hpp"
#include "sys/log.hpp"

Machine::Machine() : Machine(Settings()) {}

Machine::Machine(const Settings &settings)
    : settings(settings), interpreter(this->settings) {}

void Machine::load(const std::string &text) {
  Parser parser;
  program = parser.parseText(text);
  Log::get().debug("Loaded program with " + std::to_string(program.ops.size()) +
                   " operations and " + std::to_string(program.labels.size()) +
                   " labels");
}

void Machine::loadFile(const std::string &path) {
  if (!isFile(path)) {
    Log::get().error("Program file not found: " + path, true);
  }
  load(getFileAsString(path));
}

size_t Machine::run() {
  memory.clear();
  return interpreter.run(program, memory);
}

Value Machine::getRegister(const std::string &name) const {
  return memory.get(name);
}

std::optional<Value> Machine::findRegister(const std::string &name) const {
  return memory.find(name);
}

void Machine::setTracer(Tracer t) { interpreter.setTracer(std::move(t)); }
