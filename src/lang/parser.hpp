#pragma once

#include <iostream>
#include <string>

#include "lang/program.hpp"

// Reads IL source text. Every non-empty line holds an optional label
// ("name:") followed by an optional operation. Comments use the
// IEC 61131-3 notation "(* ... *)".
class Parser {
 public:
  Parser() : line_no(0) {}

  Program parse(std::istream &in);

  Program parseFile(const std::string &path);

  Program parseText(const std::string &text);

  Operation parseOperation(const std::string &line);

  static std::string stripComments(const std::string &line);

  static bool isIdentifier(const std::string &s);

 private:
  void parseLine(std::string line, Program &p);

  size_t line_no;
};
