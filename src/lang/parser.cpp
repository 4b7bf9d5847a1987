#include "lang/parser.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include "lang/error.hpp"
#include "sys/util.hpp"

Program Parser::parse(std::istream &in) {
  Program p;
  std::string l;
  line_no = 0;
  while (std::getline(in, l)) {
    line_no++;
    parseLine(l, p);
  }
  return p;
}

Program Parser::parseFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.good()) {
    throw std::runtime_error("Error opening file: " + path);
  }
  return parse(in);
}

Program Parser::parseText(const std::string &text) {
  std::stringstream in(text);
  return parse(in);
}

void Parser::parseLine(std::string line, Program &p) {
  line = stripComments(line);
  trimString(line);
  if (line.empty()) {
    return;
  }

  // read label
  auto colon = line.find(':');
  if (colon != std::string::npos) {
    auto label = line.substr(0, colon);
    trimString(label);
    if (!isIdentifier(label)) {
      throw VMError(VMError::Type::INVALID_LABEL, label, line_no);
    }
    if (p.hasLabel(label)) {
      throw VMError(VMError::Type::DUPLICATE_LABEL, label, line_no);
    }
    p.addLabel(label);
    line = line.substr(colon + 1);
    trimString(line);
    if (line.empty()) {
      return;
    }
  }

  p.ops.push_back(parseOperation(line));
}

Operation Parser::parseOperation(const std::string &line) {
  auto words = splitWords(line);
  if (words.empty()) {
    throw VMError(VMError::Type::UNKNOWN_INSTRUCTION, "", line_no);
  }
  const auto &mnemonic = words.front();
  const Operation::Metadata *meta;
  try {
    meta = &Operation::Metadata::get(mnemonic);
  } catch (const VMError &e) {
    throw VMError(e.type, e.token, line_no);
  }
  if (words.size() != meta->num_operands + 1) {
    throw VMError(VMError::Type::INVALID_ARITY, mnemonic, line_no);
  }
  Operand operand;
  if (meta->num_operands == 1) {
    operand = Operand(meta->operand_type, words.at(1));
    if (operand.type != Operand::Type::EXPRESSION &&
        !isIdentifier(operand.name)) {
      throw VMError(VMError::Type::INVALID_OPERAND, operand.name, line_no);
    }
  }
  return Operation(meta->type, operand, line_no);
}

std::string Parser::stripComments(const std::string &line) {
  std::string result;
  size_t pos = 0;
  while (pos < line.size()) {
    auto begin = line.find("(*", pos);
    if (begin == std::string::npos) {
      result += line.substr(pos);
      break;
    }
    result += line.substr(pos, begin - pos);
    auto end = line.find("*)", begin + 2);
    if (end == std::string::npos) {
      break;  // unterminated comment runs until the end of the line
    }
    result += ' ';
    pos = end + 2;
  }
  return result;
}

bool Parser::isIdentifier(const std::string &s) {
  if (s.empty()) {
    return false;
  }
  auto c = static_cast<unsigned char>(s.front());
  if (c != '_' && !std::isalpha(c)) {
    return false;
  }
  for (char ch : s) {
    c = static_cast<unsigned char>(ch);
    if (c != '_' && !std::isalnum(c)) {
      return false;
    }
  }
  return true;
}
