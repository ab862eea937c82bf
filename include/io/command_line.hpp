#ifndef GEOCODEC_COMMAND_LINE_HPP
#define GEOCODEC_COMMAND_LINE_HPP

#include <string>
#include <unordered_map>

namespace geocodec {
namespace io {

// Parsed "--key value" pairs; flags without a value map to "true"
using CommandLineArgs = std::unordered_map<std::string, std::string>;

/**
 * Parse command line arguments.
 * A token following an option is taken as its value unless it is itself an
 * option; "-" (standard input) and negative numbers such as "-1" are values.
 * "-h" and "-v" are accepted as short forms of --help and --version.
 * @param argc Argument count
 * @param argv Argument vector, argv[0] is the program name
 * @return Option names (without leading dashes) mapped to their values
 */
CommandLineArgs parseArgs(int argc, const char* const argv[]);

/**
 * Read an integer option value
 * @param args Parsed arguments
 * @param key Option name without leading dashes, must be present
 * @return Integer value
 * @throws std::invalid_argument if the value is not an integer
 */
int parseIntegerArg(const CommandLineArgs& args, const std::string& key);

} // namespace io
} // namespace geocodec

#endif // GEOCODEC_COMMAND_LINE_HPP
