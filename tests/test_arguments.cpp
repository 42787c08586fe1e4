#include <gtest/gtest.h>
#include "cli/arguments.hpp"
#include <filesystem>
#include <fstream>

using namespace xenopscli;

namespace {

Invocation parse_ok(const std::vector<std::string>& args) {
    Invocation invocation;
    std::string error;
    EXPECT_TRUE(parse_arguments(args, invocation, error)) << error;
    return invocation;
}

std::string parse_error(const std::vector<std::string>& args) {
    Invocation invocation;
    std::string error;
    EXPECT_FALSE(parse_arguments(args, invocation, error));
    return error;
}

} // namespace

TEST(ArgumentsTest, NoArgumentsSelectsHelp) {
    auto invocation = parse_ok({});
    EXPECT_EQ(invocation.args.command, Command::Help);
    EXPECT_FALSE(invocation.args.show_help);
}

TEST(ArgumentsTest, DefaultsApplyWithoutOptions) {
    auto invocation = parse_ok({"list"});
    EXPECT_EQ(invocation.args.command, Command::List);
    EXPECT_FALSE(invocation.config.debug);
    EXPECT_FALSE(invocation.config.verbose);
    EXPECT_EQ(invocation.config.socket_path, kDefaultSocketPath);
}

TEST(ArgumentsTest, GlobalOptionsAnywhereAfterCommand) {
    auto invocation = parse_ok({"start", "--socket", "/tmp/xenopsd", "web01", "--debug", "-v"});
    EXPECT_EQ(invocation.args.command, Command::Start);
    EXPECT_EQ(invocation.config.socket_path, "/tmp/xenopsd");
    EXPECT_TRUE(invocation.config.debug);
    EXPECT_TRUE(invocation.config.verbose);
    ASSERT_TRUE(invocation.args.positional.has_value());
    EXPECT_EQ(*invocation.args.positional, "web01");
}

TEST(ArgumentsTest, VerboseMayRepeat) {
    auto invocation = parse_ok({"list", "-v", "--verbose", "-v"});
    EXPECT_TRUE(invocation.config.verbose);
}

TEST(ArgumentsTest, MissingPositionalIsPassedThrough) {
    for (const char* command : {"add", "remove", "start", "shutdown", "reboot", "suspend"}) {
        auto invocation = parse_ok({command});
        EXPECT_FALSE(invocation.args.positional.has_value()) << command;
    }
}

TEST(ArgumentsTest, StartPausedFlag) {
    EXPECT_FALSE(parse_ok({"start", "web01"}).args.paused);
    EXPECT_TRUE(parse_ok({"start", "web01", "--paused"}).args.paused);
    EXPECT_TRUE(parse_ok({"start", "--paused", "web01"}).args.paused);
}

TEST(ArgumentsTest, TimeoutForms) {
    auto separate = parse_ok({"shutdown", "web01", "--timeout", "30"});
    ASSERT_TRUE(separate.args.timeout.has_value());
    EXPECT_DOUBLE_EQ(*separate.args.timeout, 30.0);

    auto inline_value = parse_ok({"reboot", "--timeout=2.5", "web01"});
    ASSERT_TRUE(inline_value.args.timeout.has_value());
    EXPECT_DOUBLE_EQ(*inline_value.args.timeout, 2.5);

    EXPECT_FALSE(parse_ok({"shutdown", "web01"}).args.timeout.has_value());
}

TEST(ArgumentsTest, ParseTimeoutRejectsBadValues) {
    EXPECT_FALSE(parse_timeout("").has_value());
    EXPECT_FALSE(parse_timeout("ten").has_value());
    EXPECT_FALSE(parse_timeout("10s").has_value());
    EXPECT_FALSE(parse_timeout("-1").has_value());
    EXPECT_FALSE(parse_timeout("nan").has_value());
    EXPECT_FALSE(parse_timeout("inf").has_value());
    EXPECT_FALSE(parse_timeout("1e999").has_value());
    ASSERT_TRUE(parse_timeout("0").has_value());
    EXPECT_DOUBLE_EQ(*parse_timeout("0"), 0.0);
}

TEST(ArgumentsTest, ParseTimeoutEdgeForms) {
    EXPECT_FALSE(parse_timeout(" 30").has_value());
    EXPECT_FALSE(parse_timeout("\t30").has_value());
    EXPECT_FALSE(parse_timeout("30 ").has_value());

    auto tiny = parse_timeout("1e-400");
    ASSERT_TRUE(tiny.has_value());
    EXPECT_EQ(*tiny, 0.0);

    ASSERT_TRUE(parse_timeout("2.5").has_value());
    EXPECT_DOUBLE_EQ(*parse_timeout("2.5"), 2.5);
}

TEST(ArgumentsTest, InvalidTimeoutIsUsageError) {
    EXPECT_NE(parse_error({"shutdown", "web01", "--timeout", "-5"}).find("--timeout"),
              std::string::npos);
    EXPECT_NE(parse_error({"shutdown", "web01", "--timeout"}).find("needs a value"),
              std::string::npos);
}

TEST(ArgumentsTest, OptionsAreScopedToTheirCommand) {
    EXPECT_NE(parse_error({"shutdown", "web01", "--paused"}).find("Unknown option"),
              std::string::npos);
    EXPECT_NE(parse_error({"start", "web01", "--timeout", "3"}).find("Unknown option"),
              std::string::npos);
    EXPECT_NE(parse_error({"list", "--block-device", "/dev/null"}).find("Unknown option"),
              std::string::npos);
}

TEST(ArgumentsTest, FlagsRejectValues) {
    EXPECT_NE(parse_error({"start", "web01", "--paused=yes"}).find("does not take a value"),
              std::string::npos);
}

TEST(ArgumentsTest, UnknownCommand) {
    EXPECT_NE(parse_error({"destroy", "web01"}).find("Unknown command"), std::string::npos);
    EXPECT_NE(parse_error({"--socket", "/tmp/x", "list"}).find("command must come first"),
              std::string::npos);
}

TEST(ArgumentsTest, GlobalOptionsWithoutCommandSelectHelp) {
    auto debug = parse_ok({"--debug"});
    EXPECT_EQ(debug.args.command, Command::Help);
    EXPECT_FALSE(debug.args.show_help);
    EXPECT_TRUE(debug.config.debug);

    EXPECT_TRUE(parse_ok({"-v"}).config.verbose);

    auto socket = parse_ok({"--socket", "/tmp/xenopsd", "--verbose"});
    EXPECT_EQ(socket.args.command, Command::Help);
    EXPECT_EQ(socket.config.socket_path, "/tmp/xenopsd");
    EXPECT_TRUE(socket.config.verbose);

    EXPECT_EQ(parse_ok({"--socket=/tmp/other"}).config.socket_path, "/tmp/other");
}

TEST(ArgumentsTest, LeadingOptionsStillValidated) {
    EXPECT_NE(parse_error({"--paused"}).find("Unknown option '--paused'"), std::string::npos);
    EXPECT_NE(parse_error({"--socket"}).find("needs a value"), std::string::npos);
    EXPECT_NE(parse_error({"--socket="}).find("non-empty"), std::string::npos);
    EXPECT_NE(parse_error({"--debug", "list"}).find("command must come first"),
              std::string::npos);
}

TEST(ArgumentsTest, TooManyPositionals) {
    EXPECT_NE(parse_error({"start", "web01", "web02"}).find("Unexpected argument"),
              std::string::npos);
    EXPECT_NE(parse_error({"list", "web01"}).find("Unexpected argument"), std::string::npos);
}

TEST(ArgumentsTest, DoubleDashEndsOptions) {
    auto invocation = parse_ok({"remove", "--", "--odd-name"});
    ASSERT_TRUE(invocation.args.positional.has_value());
    EXPECT_EQ(*invocation.args.positional, "--odd-name");
}

TEST(ArgumentsTest, FilesMustExist) {
    EXPECT_NE(parse_error({"add", "/nonexistent/xenops-cli/vm"}).find("No such file"),
              std::string::npos);
    EXPECT_NE(parse_error({"suspend", "web01", "--block-device", "/nonexistent/xenops-cli/dev"})
                  .find("No such file"),
              std::string::npos);

    auto path = std::filesystem::temp_directory_path() / "xenops-cli-test-args-metadata";
    {
        std::ofstream file(path);
        file << "(vm)";
    }
    auto invocation = parse_ok({"add", path.string()});
    ASSERT_TRUE(invocation.args.positional.has_value());
    EXPECT_EQ(*invocation.args.positional, path.string());

    auto suspend = parse_ok({"suspend", "web01", "--block-device=" + path.string()});
    ASSERT_TRUE(suspend.args.block_device.has_value());
    EXPECT_EQ(*suspend.args.block_device, path.string());

    std::filesystem::remove(path);
}

TEST(ArgumentsTest, HelpForms) {
    auto general = parse_ok({"--help"});
    EXPECT_EQ(general.args.command, Command::Help);

    auto command_help = parse_ok({"shutdown", "--help"});
    EXPECT_EQ(command_help.args.command, Command::Shutdown);
    EXPECT_TRUE(command_help.args.show_help);

    auto help_topic = parse_ok({"help", "reboot"});
    EXPECT_EQ(help_topic.args.command, Command::Reboot);
    EXPECT_TRUE(help_topic.args.show_help);

    EXPECT_NE(parse_error({"help", "nonsense"}).find("Unknown help topic"), std::string::npos);
}

TEST(ArgumentsTest, Version) {
    EXPECT_EQ(parse_ok({"--version"}).args.command, Command::Version);
}

TEST(ArgumentsTest, EmptySocketRejected) {
    EXPECT_NE(parse_error({"list", "--socket="}).find("non-empty"), std::string::npos);
}
