#pragma once

#include "cli/config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xenopscli {

/**
 * Command - Subcommand selected by the first argument
 */
enum class Command {
    Help,
    Version,
    List,
    Add,
    Remove,
    Start,
    Shutdown,
    Reboot,
    Suspend
};

std::optional<Command> command_from_string(const std::string& s);
std::string command_to_string(Command command);

/**
 * CommandArgs - Syntactically valid arguments of one subcommand
 *
 * A missing positional is left empty here; deciding whether that is an
 * error is up to the command.
 */
struct CommandArgs {
    Command command = Command::Help;
    bool show_help = false;                   // "<command> --help"
    std::optional<std::string> positional;    // FILE for add, VM otherwise
    bool paused = false;                      // start --paused
    std::optional<double> timeout;            // shutdown/reboot --timeout
    std::optional<std::string> block_device;  // suspend --block-device
};

/**
 * Invocation - Global options plus the selected command
 */
struct Invocation {
    Config config;
    CommandArgs args;
};

/**
 * Parse command line arguments
 * @param args Arguments without the program name
 * @param out Receives the parsed invocation
 * @param error Receives a one-line description on failure
 * @return true if the arguments are syntactically valid
 */
bool parse_arguments(const std::vector<std::string>& args,
                     Invocation& out,
                     std::string& error);

/**
 * Parse a --timeout value: finite, non-negative seconds
 */
std::optional<double> parse_timeout(const std::string& value);

} // namespace xenopscli
