#include "cli/arguments.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace xenopscli {

namespace {

bool takes_positional(Command command) {
    return command != Command::List;
}

bool takes_value(const std::string& option) {
    return option == "--socket" || option == "--timeout" || option == "--block-device";
}

bool option_allowed(Command command, const std::string& option) {
    if (option == "--help" || option == "-h" ||
        option == "--debug" || option == "-v" || option == "--verbose" ||
        option == "--socket") {
        return true;
    }
    if (option == "--paused") {
        return command == Command::Start;
    }
    if (option == "--timeout") {
        return command == Command::Shutdown || command == Command::Reboot;
    }
    if (option == "--block-device") {
        return command == Command::Suspend;
    }
    return false;
}

bool check_exists(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        error = "No such file or directory: '" + path + "'";
        return false;
    }
    return true;
}

// Options given before any command: only the global ones are accepted
bool apply_leading_option(const std::vector<std::string>& args, size_t& i,
                          Config& config, std::string& error) {
    const std::string& arg = args[i];
    if (arg == "--debug") {
        config.debug = true;
        return true;
    }
    if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
        return true;
    }
    if (arg == "-h" || arg == "--help") {
        return true;
    }

    std::string path;
    if (arg == "--socket") {
        if (i + 1 >= args.size()) {
            error = "Option '--socket' needs a value";
            return false;
        }
        path = args[++i];
    } else if (arg.compare(0, 9, "--socket=") == 0) {
        path = arg.substr(9);
    } else if (!arg.empty() && arg[0] == '-') {
        error = "Unknown option '" + arg + "'; the command must come first";
        return false;
    } else {
        error = "Unexpected argument '" + arg + "'; the command must come first";
        return false;
    }

    if (path.empty()) {
        error = "Option '--socket' needs a non-empty path";
        return false;
    }
    config.socket_path = path;
    return true;
}

}  // anonymous namespace

std::optional<Command> command_from_string(const std::string& s) {
    if (s == "help") return Command::Help;
    if (s == "list") return Command::List;
    if (s == "add") return Command::Add;
    if (s == "remove") return Command::Remove;
    if (s == "start") return Command::Start;
    if (s == "shutdown") return Command::Shutdown;
    if (s == "reboot") return Command::Reboot;
    if (s == "suspend") return Command::Suspend;
    return std::nullopt;
}

std::string command_to_string(Command command) {
    switch (command) {
        case Command::Help: return "help";
        case Command::Version: return "--version";
        case Command::List: return "list";
        case Command::Add: return "add";
        case Command::Remove: return "remove";
        case Command::Start: return "start";
        case Command::Shutdown: return "shutdown";
        case Command::Reboot: return "reboot";
        case Command::Suspend: return "suspend";
    }
    return "help";
}

std::optional<double> parse_timeout(const std::string& value) {
    if (value.empty() || std::isspace(static_cast<unsigned char>(value[0]))) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    double seconds = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size()) {
        return std::nullopt;
    }
    if (errno == ERANGE) {
        if (std::isinf(seconds)) {
            return std::nullopt;
        }
        // Underflow: too small to represent, so no wait at all
        seconds = 0.0;
    }

    if (!std::isfinite(seconds) || seconds < 0.0) {
        return std::nullopt;
    }
    return seconds;
}

bool parse_arguments(const std::vector<std::string>& args,
                     Invocation& out,
                     std::string& error) {
    out = Invocation{};
    if (args.empty()) {
        return true;
    }

    const std::string& first = args[0];
    if (first == "--help" || first == "-h") {
        return true;
    }
    if (first == "--version") {
        out.args.command = Command::Version;
        return true;
    }

    auto command = command_from_string(first);
    if (!command) {
        if (first[0] != '-') {
            error = "Unknown command '" + first + "'";
            return false;
        }
        // Global options without a command still show the general help
        for (size_t i = 0; i < args.size(); i++) {
            if (!apply_leading_option(args, i, out.config, error)) {
                return false;
            }
        }
        return true;
    }

    // "help <command>" is the same as "<command> --help"
    if (*command == Command::Help) {
        if (args.size() == 1) {
            return true;
        }
        auto topic = command_from_string(args[1]);
        if (!topic || *topic == Command::Help || args.size() > 2) {
            error = "Unknown help topic '" + args[1] + "'";
            return false;
        }
        out.args.command = *topic;
        out.args.show_help = true;
        return true;
    }

    out.args.command = *command;

    bool options_done = false;
    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            if (!takes_positional(*command) || out.args.positional) {
                error = "Unexpected argument '" + arg + "' for command '" + first + "'";
                return false;
            }
            out.args.positional = arg;
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string option = arg;
        std::optional<std::string> value;
        auto eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            option = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        if (!option_allowed(*command, option)) {
            error = "Unknown option '" + option + "' for command '" + first + "'";
            return false;
        }

        if (takes_value(option)) {
            if (!value) {
                if (i + 1 >= args.size()) {
                    error = "Option '" + option + "' needs a value";
                    return false;
                }
                value = args[++i];
            }
        } else if (value) {
            error = "Option '" + option + "' does not take a value";
            return false;
        }

        if (option == "--help" || option == "-h") {
            out.args.show_help = true;
            return true;
        } else if (option == "--debug") {
            out.config.debug = true;
        } else if (option == "-v" || option == "--verbose") {
            out.config.verbose = true;
        } else if (option == "--socket") {
            if (value->empty()) {
                error = "Option '--socket' needs a non-empty path";
                return false;
            }
            out.config.socket_path = *value;
        } else if (option == "--paused") {
            out.args.paused = true;
        } else if (option == "--timeout") {
            auto timeout = parse_timeout(*value);
            if (!timeout) {
                error = "Invalid --timeout value '" + *value +
                        "': expected a non-negative number of seconds";
                return false;
            }
            out.args.timeout = timeout;
        } else if (option == "--block-device") {
            if (!check_exists(*value, error)) {
                return false;
            }
            out.args.block_device = *value;
        }
    }

    if (*command == Command::Add && out.args.positional && !out.args.positional->empty()) {
        if (!check_exists(*out.args.positional, error)) {
            return false;
        }
    }

    return true;
}

} // namespace xenopscli
