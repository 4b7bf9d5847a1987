#include "eval/semantics.hpp"

#include "lang/error.hpp"

Word Semantics::add(Word a, Word b) {
  return maskWord(static_cast<uint64_t>(a) + b);
}

Word Semantics::sub(Word a, Word b) {
  return maskWord(static_cast<uint64_t>(a) - b);
}

Word Semantics::mul(Word a, Word b) {
  return maskWord(static_cast<uint64_t>(a) * b);
}

Word Semantics::div(Word a, Word b) {
  if (b == 0) {
    throw VMError(VMError::Type::DIVISION_BY_ZERO, std::to_string(a) + "/0");
  }
  return a / b;
}

Word Semantics::mod(Word a, Word b) {
  if (b == 0) {
    throw VMError(VMError::Type::DIVISION_BY_ZERO, std::to_string(a) + "%0");
  }
  return a % b;
}

Word Semantics::bitAnd(Word a, Word b) { return a & b; }

Word Semantics::bitAndNot(Word a, Word b) { return a & bitNot(b); }

Word Semantics::bitOr(Word a, Word b) { return a | b; }

Word Semantics::bitOrNot(Word a, Word b) { return a | bitNot(b); }

Word Semantics::bitXor(Word a, Word b) { return a ^ b; }

Word Semantics::bitXorNot(Word a, Word b) { return a ^ bitNot(b); }

Word Semantics::bitNot(Word a) { return maskWord(~static_cast<uint64_t>(a)); }
