#include "command_line.h"

#include <cstdlib>

namespace CommandLine {

// Position just past "--key" where it stands as a whole switch, or npos.
static size_t FindSwitch(const char* key, const std::string& cmdLine) {
    std::string token = std::string("--") + key;
    size_t pos = cmdLine.find(token);
    while (pos != std::string::npos) {
        bool startOk = (pos == 0 || cmdLine[pos - 1] == ' ' || cmdLine[pos - 1] == '"');
        size_t end = pos + token.size();
        bool endOk = (end == cmdLine.size() || cmdLine[end] == ' ' ||
                      cmdLine[end] == '=' || cmdLine[end] == '"');
        if (startOk && endOk) {
            return end;
        }
        pos = cmdLine.find(token, pos + 1);
    }
    return std::string::npos;
}

std::string GetArg(const char* key, const std::string& cmdLine) {
    size_t end = FindSwitch(key, cmdLine);
    if (end == std::string::npos || end >= cmdLine.size() || cmdLine[end] != '=') return "";

    size_t valStart = end + 1;
    if (valStart >= cmdLine.size()) return "";

    std::string val;
    if (cmdLine[valStart] == '"') {
        // Quoted value
        size_t endQuote = cmdLine.find('"', valStart + 1);
        if (endQuote != std::string::npos) {
            val = cmdLine.substr(valStart + 1, endQuote - valStart - 1);
        }
    } else {
        // Unquoted value, ends at space or end of string
        size_t valEnd = cmdLine.find(' ', valStart);
        val = cmdLine.substr(valStart, valEnd - valStart);
    }
    return val;
}

int GetIntArg(const char* key, const std::string& cmdLine, int fallback) {
    std::string val = GetArg(key, cmdLine);
    if (val.empty()) return fallback;

    char* end = nullptr;
    long parsed = strtol(val.c_str(), &end, 10);
    if (end == val.c_str() || *end != '\0') return fallback;
    return static_cast<int>(parsed);
}

bool HasFlag(const char* key, const std::string& cmdLine) {
    return FindSwitch(key, cmdLine) != std::string::npos;
}

} // namespace CommandLine
