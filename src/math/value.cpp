#include "math/value.hpp"

#include <cctype>
#include <stdexcept>

const Value Value::ZERO(0);
const Value Value::TRUE_VALUE = Value::boolean(true);
const Value Value::FALSE_VALUE = Value::boolean(false);

Value::Value(const std::string &s) : type(Type::INTEGER), word(0) {
  if (s == "TRUE") {
    type = Type::BOOLEAN;
    word = 1;
    return;
  }
  if (s == "FALSE") {
    type = Type::BOOLEAN;
    return;
  }
  if (s.empty()) {
    throw std::runtime_error("empty value");
  }
  uint64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::runtime_error("invalid value: " + s);
    }
    v = maskWord(v * 10 + (c - '0'));
  }
  word = static_cast<Word>(v);
}

Value Value::boolean(bool b) {
  Value v(b ? 1 : 0);
  v.type = Type::BOOLEAN;
  return v;
}

std::string Value::to_string() const {
  if (type == Type::BOOLEAN) {
    return word ? "TRUE" : "FALSE";
  }
  return std::to_string(word);
}

std::ostream &operator<<(std::ostream &out, const Value &v) {
  out << v.to_string();
  return out;
}
