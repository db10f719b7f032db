#include <gtest/gtest.h>
#include "wbvm/arg_parser.hpp"

#include <string>
#include <vector>

using namespace wbvm;

namespace {

ParsedArgs parse(std::vector<std::string> words) {
    std::vector<char*> argv = {const_cast<char*>("wbvm")};
    for (auto& word : words) {
        argv.push_back(word.data());
    }
    return ArgParser::parse(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ArgParserTest, ParsesCommandAndVersion) {
    auto args = parse({"install", "latest"});
    EXPECT_EQ(args.command, Command::INSTALL);
    EXPECT_EQ(args.version_token().value_or(""), "latest");
    EXPECT_FALSE(ArgParser::validate(args).has_value());

    EXPECT_EQ(parse({"list"}).command, Command::LIST);
    EXPECT_EQ(parse({"use", "1.0.0"}).command, Command::USE);
    EXPECT_EQ(parse({"default", "1.0.0"}).command, Command::DEFAULT);
    EXPECT_EQ(parse({"current"}).command, Command::CURRENT);
}

TEST(ArgParserTest, FlagsAnywhere) {
    auto args = parse({"list", "--help"});
    EXPECT_TRUE(args.show_help);
    EXPECT_EQ(args.command, Command::LIST);

    EXPECT_TRUE(parse({"-v"}).show_version);
    EXPECT_TRUE(parse({"--version"}).show_version);
}

TEST(ArgParserTest, ValidationErrors) {
    EXPECT_TRUE(ArgParser::validate(parse({})).has_value());
    EXPECT_TRUE(ArgParser::validate(parse({"frobnicate"})).has_value());
    EXPECT_TRUE(ArgParser::validate(parse({"install"})).has_value());
    EXPECT_TRUE(ArgParser::validate(parse({"default"})).has_value());
    EXPECT_TRUE(ArgParser::validate(parse({"use"})).has_value());
    EXPECT_FALSE(ArgParser::validate(parse({"list"})).has_value());
    EXPECT_FALSE(ArgParser::validate(parse({"current"})).has_value());
}

TEST(ArgParserTest, UnknownOptionsAreIgnored) {
    auto args = parse({"--verbose", "install", "1.0.0"});
    EXPECT_EQ(args.command, Command::INSTALL);
    EXPECT_EQ(args.version_token().value_or(""), "1.0.0");
}

TEST(ArgParserTest, CommandNamesRoundTrip) {
    for (auto command : {Command::LIST, Command::INSTALL, Command::USE, Command::DEFAULT, Command::CURRENT}) {
        EXPECT_EQ(ArgParser::command_from_string(ArgParser::command_to_string(command)), command);
    }
    EXPECT_NE(ArgParser::get_version_string().find("wbvm version"), std::string::npos);
}
