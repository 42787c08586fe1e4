#pragma once

#include "cli/arguments.hpp"
#include "cli/config.hpp"
#include "providers/vm_provider.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xenopscli {

/**
 * Whether output to a stream should carry ANSI colors: only for the
 * standard streams, and only when their own descriptor is a TTY
 */
bool colors_enabled(const std::ostream& stream);

/**
 * CLI - Command line interface for xenops-cli
 *
 * Validates each command's arguments, turns them into a single request to
 * xenopsd and maps the outcome to output and an exit code.
 */
class CLI {
public:
    /// Builds the provider once the global options are known
    using ProviderFactory = std::function<std::unique_ptr<VMProvider>(const Config&)>;

    /**
     * Constructor
     * @param provider_factory Creates the VM provider; called at most once
     *        per run and only for commands that talk to the daemon
     * @param out Stream for regular output
     * @param err Stream for diagnostics
     */
    explicit CLI(ProviderFactory provider_factory,
                 std::ostream& out = std::cout,
                 std::ostream& err = std::cerr);

    ~CLI() = default;

    /**
     * Run the CLI with command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return Exit code (0 for success)
     */
    int run(int argc, char* argv[]);

    /**
     * Run the CLI with arguments that exclude the program name
     */
    int run(const std::vector<std::string>& args);

private:
    // Command implementations
    int cmd_list();
    int cmd_add(const CommandArgs& args);
    int cmd_remove(const CommandArgs& args);
    int cmd_start(const CommandArgs& args);
    int cmd_shutdown(const CommandArgs& args);
    int cmd_reboot(const CommandArgs& args);
    int cmd_suspend(const CommandArgs& args);
    int cmd_help();
    int cmd_command_help(Command command);
    int cmd_version();

    // Resolve the target VM and send one transition request for it
    int transition(const CommandArgs& args, TransitionRequest request);

    // The VM argument, or MissingArgument
    std::optional<VMReference> vm_reference(const CommandArgs& args, Error& error) const;

    VMProvider& provider();

    // Report a failure and return its exit code
    int fail(const Error& error) const;

    // Output helpers
    void info(const std::string& msg) const;
    void success(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void error(const std::string& msg) const;
    void debug(const std::string& msg) const;

    ProviderFactory provider_factory_;
    std::unique_ptr<VMProvider> vm_provider_;
    Config config_;  // Set once per run from the parsed global options
    std::ostream& out_;
    std::ostream& err_;
    bool use_colors_ = true;      // out_
    bool use_err_colors_ = true;  // err_
};

} // namespace xenopscli
