#include "eval/memory.hpp"

#include <map>
#include <stdexcept>

#include "lang/error.hpp"
#include "sys/util.hpp"

const std::string Memory::ACC = "ACC";

Memory::Memory() { clear(); }

Memory::Memory(const std::string &s) {
  clear();
  size_t pos = 0;
  while (pos < s.size()) {
    size_t next = s.find(',', pos);
    if (next == std::string::npos) {
      next = s.size();
    }
    size_t colon = s.find(':', pos);
    if (colon == std::string::npos || colon >= next) {
      throw std::runtime_error("Invalid memory string: " + s);
    }
    auto name = s.substr(pos, colon - pos);
    auto value = s.substr(colon + 1, next - colon - 1);
    trimString(name);
    trimString(value);
    if (name.empty()) {
      throw std::runtime_error("Invalid memory string: " + s);
    }
    set(name, Value(value));
    pos = next + 1;
  }
}

Value Memory::get(const std::string &name) const {
  auto it = registers.find(name);
  if (it == registers.end()) {
    throw VMError(VMError::Type::UNDEFINED_REGISTER, name);
  }
  return it->second;
}

std::optional<Value> Memory::find(const std::string &name) const {
  auto it = registers.find(name);
  if (it == registers.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Memory::contains(const std::string &name) const {
  return registers.find(name) != registers.end();
}

void Memory::set(const std::string &name, const Value &value) {
  registers[name] = value;
}

void Memory::clear() {
  registers.clear();
  registers[ACC] = Value::ZERO;
}

size_t Memory::size() const { return registers.size(); }

bool Memory::operator==(const Memory &m) const {
  return registers == m.registers;
}

bool Memory::operator!=(const Memory &m) const { return !(*this == m); }

std::ostream &operator<<(std::ostream &out, const Memory &m) {
  std::map<std::string, Value> sorted(m.registers.begin(), m.registers.end());
  bool first = true;
  for (const auto &it : sorted) {
    if (!first) {
      out << ",";
    }
    out << it.first << ":" << it.second;
    first = false;
  }
  return out;
}
