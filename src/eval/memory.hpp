#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>

#include "math/value.hpp"

// Register table. Registers are created on their first write; the
// accumulator always exists and starts at zero.
class Memory {
 public:
  static const std::string ACC;

  Memory();

  // parse a register table such as "A:5,ACC:0,X:TRUE"
  explicit Memory(const std::string &s);

  Value get(const std::string &name) const;

  std::optional<Value> find(const std::string &name) const;

  bool contains(const std::string &name) const;

  void set(const std::string &name, const Value &value);

  inline Word getAcc() const { return get(ACC).asWord(); }

  inline void setAcc(Word value) { set(ACC, Value(value)); }

  void clear();

  size_t size() const;

  bool operator==(const Memory &m) const;

  bool operator!=(const Memory &m) const;

  friend std::ostream &operator<<(std::ostream &out, const Memory &m);

 private:
  std::unordered_map<std::string, Value> registers;
};
