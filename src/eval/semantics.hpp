#pragma once

#include "math/value.hpp"

// Operations on 32-bit machine words. Results wrap modulo 2^32.
class Semantics {
 public:
  static Word add(Word a, Word b);

  static Word sub(Word a, Word b);

  static Word mul(Word a, Word b);

  static Word div(Word a, Word b);

  static Word mod(Word a, Word b);

  static Word bitAnd(Word a, Word b);

  static Word bitAndNot(Word a, Word b);

  static Word bitOr(Word a, Word b);

  static Word bitOrNot(Word a, Word b);

  static Word bitXor(Word a, Word b);

  static Word bitXorNot(Word a, Word b);

  static Word bitNot(Word a);
};
