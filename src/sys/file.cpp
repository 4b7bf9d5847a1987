#include "sys/file.hpp"

#include <fstream>
#include <sstream>

#include "sys/log.hpp"

bool isFile(const std::string &path) {
  std::ifstream f(path.c_str());
  return f.good();
}

std::string getFileAsString(const std::string &filename, bool fail_on_error) {
  std::ifstream in(filename);
  if (!in.good()) {
    Log::get().error("Error loading " + filename, fail_on_error);
    return std::string();
  }
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}
