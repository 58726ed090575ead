#include "core/ShellQuote.h"

namespace BjornManager {

std::string shellEscapeArg(const std::string& arg)
{
    if (arg.empty()) {
        return "''";
    }

    bool plain = true;
    for (const char ch : arg) {
        const bool safe = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')
            || (ch >= '0' && ch <= '9') || ch == '_' || ch == '-' || ch == '.' || ch == '/'
            || ch == ':' || ch == '=' || ch == '@' || ch == '%' || ch == '+' || ch == ',';
        if (!safe) {
            plain = false;
            break;
        }
    }
    if (plain) {
        return arg;
    }

    std::string escaped;
    escaped.reserve(arg.size() + 2);
    escaped.push_back('\'');
    for (const char ch : arg) {
        if (ch == '\'') {
            escaped.append("'\\''");
        }
        else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string buildCommandString(const std::vector<std::string>& argv)
{
    std::string command;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            command.push_back(' ');
        }
        command += shellEscapeArg(argv[i]);
    }
    return command;
}

} // namespace BjornManager
