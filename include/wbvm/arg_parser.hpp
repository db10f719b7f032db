/**
 * @file arg_parser.hpp
 * @brief Command-line argument parser for wbvm
 * 
 * Usage: wbvm [OPTIONS] <command> [<version>]
 * 
 * Commands:
 *   list                 List available versions
 *   install <version>    Install a version ("latest" allowed)
 *   use <version>        Use a version for this session
 *   default <version>    Set the default version ("latest" allowed)
 *   current              Show the default version
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace wbvm {

    /**
     * @brief Commands understood by wbvm
     */
    enum class Command {
        NONE,       // No command given
        LIST,
        INSTALL,
        USE,
        DEFAULT,
        CURRENT,
        UNKNOWN     // Unrecognised command word
    };

    /**
     * @brief Parsed command-line arguments
     */
    struct ParsedArgs {
        Command command = Command::NONE;
        std::string command_name;                   // As typed, for error messages
        std::vector<std::string> positional_args;   // Everything after the command
        bool show_help = false;
        bool show_version = false;

        /**
         * @brief The version token, if one was given
         */
        [[nodiscard]] std::optional<std::string> version_token() const {
            if (positional_args.empty()) {
                return std::nullopt;
            }
            return positional_args.front();
        }
    };

    class ArgParser {
    public:
        /**
         * @brief Parse command-line arguments
         * 
         * Unknown options are reported on stderr and ignored.
         * 
         * @param argc Argument count
         * @param argv Argument values
         * @return ParsedArgs Parsed arguments structure
         */
        static ParsedArgs parse(int argc, char* argv[]);

        /**
         * @brief Checks that the command has the arguments it needs
         * 
         * @return std::optional<std::string> Error message, or nullopt if valid
         */
        static std::optional<std::string> validate(const ParsedArgs& args);

        static std::string get_help_message();

        static std::string get_version_string();

        static Command command_from_string(const std::string& name);

        static std::string command_to_string(Command command);
    };

} // namespace wbvm
