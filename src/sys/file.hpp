#pragma once

#include <string>

#ifdef _WIN64
static constexpr char FILE_SEP = '\\';
#else
static constexpr char FILE_SEP = '/';
#endif

bool isFile(const std::string &path);

std::string getFileAsString(const std::string &filename,
                            bool fail_on_error = true);
