#pragma once

#include <string>

#include "sys/util.hpp"

class Commands {
 public:
  explicit Commands(const Settings& settings) : settings(settings) {}

  static void help();

  void evaluate(const std::string& path);

  void print(const std::string& path);

  // hidden commands

  void testAll();

 private:
  const Settings& settings;
};
