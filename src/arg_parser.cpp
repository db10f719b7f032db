//
// Created by opencode on 17/10/2026.
//

#include "wbvm/arg_parser.hpp"
#include <iostream>

#ifndef WBVM_VERSION
#define WBVM_VERSION "1.0.0"
#endif

namespace wbvm {

    ParsedArgs ArgParser::parse(int argc, char* argv[]) {
        ParsedArgs args;
        
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            
            if (arg == "--help" || arg == "-h") {
                args.show_help = true;
            } else if (arg == "--version" || arg == "-v") {
                args.show_version = true;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Warning: Unknown option: " << arg << std::endl;
            } else if (args.command == Command::NONE) {
                args.command_name = arg;
                args.command = command_from_string(arg);
            } else {
                args.positional_args.push_back(arg);
            }
        }
        
        return args;
    }

    std::optional<std::string> ArgParser::validate(const ParsedArgs& args) {
        switch (args.command) {
            case Command::NONE:
                return std::string("No command given");
            case Command::UNKNOWN:
                return "Unknown command: " + args.command_name;
            case Command::INSTALL:
            case Command::USE:
            case Command::DEFAULT:
                if (!args.version_token()) {
                    return "Missing argument: " + args.command_name + " requires <version>";
                }
                return std::nullopt;
            default:
                return std::nullopt;
        }
    }

    std::string ArgParser::get_help_message() {
        return R"(Manage Wörterbuch versions

Usage: wbvm [OPTIONS] <command> [<version>]

Options:
  -h, --help           Show this help message
  -v, --version        Show version information

Commands:
  list                 List available versions
  install <version>    Install specified version ("latest" for the newest)
  use <version>        Use specified version for this session
  default <version>    Set the specified version as the default version to use
  current              Show the default version

Environment:
  WBVM_ROOT            Root directory (default: ~/.wbvm)
  WBVM_RELEASES_URL    Release index URL
  WBVM_PLATFORM        Platform override (linux-x64, windows-x64, macos-x64)

Examples:
  wbvm list
  wbvm install latest
  wbvm default 1.2.3
)";
    }

    std::string ArgParser::get_version_string() {
        return std::string("wbvm version ") + WBVM_VERSION;
    }

    Command ArgParser::command_from_string(const std::string& name) {
        if (name == "list")    return Command::LIST;
        if (name == "install") return Command::INSTALL;
        if (name == "use")     return Command::USE;
        if (name == "default") return Command::DEFAULT;
        if (name == "current") return Command::CURRENT;
        return Command::UNKNOWN;
    }

    std::string ArgParser::command_to_string(Command command) {
        switch (command) {
            case Command::NONE:    return "";
            case Command::LIST:    return "list";
            case Command::INSTALL: return "install";
            case Command::USE:     return "use";
            case Command::DEFAULT: return "default";
            case Command::CURRENT: return "current";
            default:               return "unknown";
        }
    }

} // namespace wbvm
