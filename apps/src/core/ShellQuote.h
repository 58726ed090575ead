#pragma once

#include <string>
#include <vector>

namespace BjornManager {

// POSIX single-quote escaping for one argument of a remote shell command.
std::string shellEscapeArg(const std::string& arg);

// Escapes and joins argv with single spaces.
std::string buildCommandString(const std::vector<std::string>& argv);

} // namespace BjornManager
