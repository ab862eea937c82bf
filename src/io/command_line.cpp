#include "io/command_line.hpp"
#include <cctype>
#include <stdexcept>

namespace geocodec {
namespace io {

namespace {

// "-" and negative numbers are values, other tokens starting with '-' are options
bool isOptionValue(const std::string& token) {
    if (token.empty() || token[0] != '-') {
        return true;
    }
    if (token == "-") {
        return true;
    }
    size_t digit = (token.size() > 2 && token[1] == '.') ? 2 : 1;
    return token.size() > digit && std::isdigit(static_cast<unsigned char>(token[digit]));
}

} // namespace

CommandLineArgs parseArgs(int argc, const char* const argv[]) {
    CommandLineArgs args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "-v") {
            args[arg.substr(1)] = "true";
        } else if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            if (i + 1 < argc && isOptionValue(argv[i + 1])) {
                args[key] = argv[i + 1];
                i++;
            } else {
                args[key] = "true";
            }
        }
    }

    return args;
}

int parseIntegerArg(const CommandLineArgs& args, const std::string& key) {
    const std::string& value = args.at(key);
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("--" + key + " expects an integer but got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("--" + key + " expects an integer but got '" + value + "'");
    }
    return result;
}

} // namespace io
} // namespace geocodec
