#pragma once

#include <string>

// Parsing of --key=value switches from a full command line string.
namespace CommandLine {

// Value of --key="value" or --key=value. Empty if absent.
std::string GetArg(const char* key, const std::string& cmdLine);

// Integer value of --key=N, or `fallback` if absent or not a number.
int GetIntArg(const char* key, const std::string& cmdLine, int fallback);

// True if the bare switch --key (or --key=...) is present.
bool HasFlag(const char* key, const std::string& cmdLine);

} // namespace CommandLine
