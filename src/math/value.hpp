#pragma once

#include <cstdint>
#include <iostream>
#include <string>

// 32-bit machine word
using Word = uint32_t;

inline Word maskWord(uint64_t value) {
  return static_cast<Word>(value & 0xFFFFFFFF);
}

// Contents of a register: a machine word that was either written as an
// integer (LD, ST and all ACC operations) or as a boolean (S and R).
// Booleans take part in arithmetic as 0 and 1.
class Value {
 public:
  enum class Type { INTEGER, BOOLEAN };

  static const Value ZERO;
  static const Value TRUE_VALUE;
  static const Value FALSE_VALUE;

  Value() : Value(0) {}

  Value(Word w) : type(Type::INTEGER), word(w) {}

  explicit Value(const std::string &s);

  static Value boolean(bool b);

  inline Word asWord() const { return word; }

  inline bool isTrue() const { return word != 0; }

  inline bool isBoolean() const { return type == Type::BOOLEAN; }

  inline bool operator==(const Value &v) const {
    return (type == v.type) && (word == v.word);
  }

  inline bool operator!=(const Value &v) const { return !((*this) == v); }

  std::string to_string() const;

  friend std::ostream &operator<<(std::ostream &out, const Value &v);

  Type type;

 private:
  Word word;
};
