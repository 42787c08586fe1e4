#include "cli/cli.hpp"
#include "cli/outcome.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace xenopscli {

// ANSI color codes
namespace colors {
    const char* RED = "\033[0;31m";
    const char* GREEN = "\033[0;32m";
    const char* YELLOW = "\033[1;33m";
    const char* BLUE = "\033[0;34m";
    const char* GREY = "\033[0;90m";
    const char* RESET = "\033[0m";
}

namespace {

const char* VERSION = "1.0.0";

struct CommandHelp {
    Command command;
    const char* usage;
    const char* description;
};

const CommandHelp COMMAND_HELP[] = {
    {Command::List, "list",
     "Lists the VMs registered with the xenopsd service, one per line, in the\n"
     "order xenopsd reports them.\n"
     "\n"
     "VMs are registered with the \"add\" command and are monitored until the\n"
     "matching \"remove\" command. xenopsd will not touch any VM (or domain)\n"
     "that has not been explicitly registered.\n"},
    {Command::Add, "add [FILE]",
     "Registers a new VM with the xenopsd service.\n"
     "\n"
     "FILE is the path to the VM metadata to be registered. The id of the new\n"
     "VM is printed on success.\n"},
    {Command::Remove, "remove [VM]",
     "Unregisters a VM. VM is the name or UUID of the VM to be unregistered.\n"
     "\n"
     "xenopsd only manipulates VMs which are explicitly registered with it.\n"
     "Unregister a VM if either:\n"
     "  1. the VM is not needed any more; or\n"
     "  2. you intend to manage the VM on another host or with another toolstack.\n"
     "\n"
     "Only Halted VMs may be unregistered; xenopsd reports a power state\n"
     "conflict otherwise.\n"},
    {Command::Start, "start [VM] [--paused]",
     "Starts a VM. VM is the name or UUID of the VM to be started.\n"
     "\n"
     "Without additional arguments the command returns once the VM is in the\n"
     "\"Running\" state. With --paused the VM is left in the \"Paused\" state.\n"
     "\n"
     "OPTIONS:\n"
     "  --paused              Leave the VM in a Paused state\n"
     "\n"
     "ERRORS:\n"
     "  Starting fails if the host lacks the memory or disk resources the VM\n"
     "  needs, or if the VM is not in a power state it can be started from.\n"},
    {Command::Shutdown, "shutdown [VM] [--timeout SECONDS]",
     "Shuts down a VM. VM is the name or UUID of the VM to be shut down and\n"
     "powered off.\n"
     "\n"
     "If the VM is running it is asked to shut down. If a timeout is given,\n"
     "xenopsd waits that long for a clean shutdown. If no timeout is given,\n"
     "or the timeout expires, the VM is powered off.\n"
     "\n"
     "OPTIONS:\n"
     "  --timeout SECONDS     Time to wait for the VM to cleanly shut itself\n"
     "                        down before it is powered off\n"},
    {Command::Reboot, "reboot [VM] [--timeout SECONDS]",
     "Reboots a VM. VM is the name or UUID of the VM to be rebooted.\n"
     "\n"
     "If the VM is running it is asked to reboot. If a timeout is given,\n"
     "xenopsd waits that long for a clean shutdown. If no timeout is given,\n"
     "or the timeout expires, the VM is powered off. It is then powered back\n"
     "on again.\n"
     "\n"
     "OPTIONS:\n"
     "  --timeout SECONDS     Time to wait for the VM to cleanly shut itself\n"
     "                        down before it is powered off and then on\n"},
    {Command::Suspend, "suspend [VM] [--block-device PATH]",
     "Suspends a VM. VM is the name or UUID of the VM to be suspended.\n"
     "\n"
     "If the VM is running it is asked to suspend and its memory image is\n"
     "saved to the given block device, or to xenopsd's default suspend\n"
     "target when no device is given.\n"
     "\n"
     "OPTIONS:\n"
     "  --block-device PATH   Block device to write the suspend image to\n"},
};

const char* COMMON_OPTIONS =
    "COMMON OPTIONS:\n"
    "  --debug               Give only debug output\n"
    "  -v, --verbose         Give verbose output\n"
    "  --socket PATH         Path to the xenopsd Unix domain socket\n"
    "                        (default: /var/lib/xcp/xenopsd)\n"
    "  -h, --help            Show help for the command\n";

std::string format_seconds(double seconds) {
    std::ostringstream ss;
    ss << seconds << "s";
    return ss.str();
}

// What the daemon is being asked to do, for --verbose output
std::string describe_request(const TransitionRequest& request) {
    switch (request.action) {
        case PowerAction::Start:
            return request.start_paused ? "start, leaving it Paused" : "start";
        case PowerAction::Shutdown:
            return request.timeout
                ? "clean shutdown, powering off after " + format_seconds(*request.timeout)
                : "power off";
        case PowerAction::Reboot:
            return request.timeout
                ? "clean reboot, powering off after " + format_seconds(*request.timeout)
                : "hard reboot";
        case PowerAction::Suspend:
            return request.block_device
                ? "suspend to " + *request.block_device
                : "suspend to the default device";
    }
    return power_action_to_string(request.action);
}

}  // anonymous namespace

bool colors_enabled(const std::ostream& stream) {
    if (&stream == &std::cout) {
        return isatty(STDOUT_FILENO) != 0;
    }
    if (&stream == &std::cerr || &stream == &std::clog) {
        return isatty(STDERR_FILENO) != 0;
    }
    return false;
}

CLI::CLI(ProviderFactory provider_factory, std::ostream& out, std::ostream& err)
    : provider_factory_(std::move(provider_factory)),
      out_(out),
      err_(err) {
    // Disable colors unless writing to a TTY
    use_colors_ = colors_enabled(out_);
    use_err_colors_ = colors_enabled(err_);
}

void CLI::info(const std::string& msg) const {
    if (!config_.verbose && !config_.debug) {
        return;
    }
    if (use_colors_) {
        out_ << colors::BLUE << "[INFO]" << colors::RESET << " " << msg << std::endl;
    } else {
        out_ << "[INFO] " << msg << std::endl;
    }
}

void CLI::success(const std::string& msg) const {
    if (use_colors_) {
        out_ << colors::GREEN << "[OK]" << colors::RESET << " " << msg << std::endl;
    } else {
        out_ << "[OK] " << msg << std::endl;
    }
}

void CLI::warn(const std::string& msg) const {
    if (use_err_colors_) {
        err_ << colors::YELLOW << "[WARN]" << colors::RESET << " " << msg << std::endl;
    } else {
        err_ << "[WARN] " << msg << std::endl;
    }
}

void CLI::error(const std::string& msg) const {
    if (use_err_colors_) {
        err_ << colors::RED << "[ERROR]" << colors::RESET << " " << msg << std::endl;
    } else {
        err_ << "[ERROR] " << msg << std::endl;
    }
}

void CLI::debug(const std::string& msg) const {
    if (!config_.debug) {
        return;
    }
    if (use_err_colors_) {
        err_ << colors::GREY << "[DEBUG]" << colors::RESET << " " << msg << std::endl;
    } else {
        err_ << "[DEBUG] " << msg << std::endl;
    }
}

int CLI::fail(const Error& failure) const {
    error(format_error(failure));
    return exit_code_for(failure.kind);
}

VMProvider& CLI::provider() {
    if (!vm_provider_) {
        debug("Connecting to xenopsd at " + config_.socket_path);
        vm_provider_ = provider_factory_(config_);
        if (!vm_provider_) {
            throw std::runtime_error("No VM provider available");
        }
    }
    return *vm_provider_;
}

int CLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.push_back(argv[i]);
    }
    return run(args);
}

int CLI::run(const std::vector<std::string>& args) {
    // Each run connects with its own global options
    vm_provider_.reset();

    Invocation invocation;
    std::string parse_error;
    if (!parse_arguments(args, invocation, parse_error)) {
        return fail(Error{ErrorKind::UsageError,
                          parse_error + ". Use 'xenops-cli --help' for usage."});
    }

    config_ = invocation.config;
    const CommandArgs& cmd = invocation.args;

    if (cmd.show_help) {
        return cmd_command_help(cmd.command);
    }

    switch (cmd.command) {
        case Command::Help: return cmd_help();
        case Command::Version: return cmd_version();
        case Command::List: return cmd_list();
        case Command::Add: return cmd_add(cmd);
        case Command::Remove: return cmd_remove(cmd);
        case Command::Start: return cmd_start(cmd);
        case Command::Shutdown: return cmd_shutdown(cmd);
        case Command::Reboot: return cmd_reboot(cmd);
        case Command::Suspend: return cmd_suspend(cmd);
    }
    return cmd_help();
}

std::optional<VMReference> CLI::vm_reference(const CommandArgs& args, Error& missing) const {
    if (!args.positional || args.positional->empty()) {
        missing = Error{ErrorKind::MissingArgument,
                        "A VM name or UUID is required. Use 'xenops-cli " +
                        command_to_string(args.command) + " --help' for usage."};
        return std::nullopt;
    }
    return parse_vm_reference(*args.positional);
}

int CLI::cmd_list() {
    auto& vms = provider();
    auto list = vms.list_vms();
    if (!list) {
        return fail(vms.get_last_error());
    }

    if (config_.verbose) {
        out_ << std::left
             << std::setw(36) << "UUID" << "  "
             << std::setw(20) << "NAME" << "  "
             << "POWER STATE" << std::endl;
    }

    for (const auto& vm : *list) {
        out_ << std::left
             << std::setw(36) << vm.id << "  "
             << std::setw(20) << vm.name << "  "
             << power_state_to_string(vm.power_state) << std::endl;
    }

    if (list->empty()) {
        info("No VMs are registered with xenopsd");
    }
    return exit_codes::SUCCESS;
}

int CLI::cmd_add(const CommandArgs& args) {
    if (!args.positional || args.positional->empty()) {
        return fail(Error{ErrorKind::MissingArgument,
                          "A VM metadata file is required. Use 'xenops-cli add --help' for usage."});
    }

    const std::string& path = *args.positional;
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return fail(Error{ErrorKind::InvalidMetadata, "'" + path + "' is a directory"});
    }

    std::ifstream file(path);
    if (!file) {
        return fail(Error{ErrorKind::InvalidMetadata,
                          "Cannot read VM metadata from '" + path + "'"});
    }
    std::ostringstream metadata;
    metadata << file.rdbuf();

    info("Registering VM from " + path + "...");

    auto& vms = provider();
    auto id = vms.register_vm(metadata.str());
    if (!id) {
        return fail(vms.get_last_error());
    }

    success("Registered VM " + *id);
    return exit_codes::SUCCESS;
}

int CLI::cmd_remove(const CommandArgs& args) {
    Error missing;
    auto reference = vm_reference(args, missing);
    if (!reference) {
        return fail(missing);
    }

    auto& vms = provider();
    auto vm_id = vms.resolve(*reference);
    if (!vm_id) {
        return fail(vms.get_last_error());
    }

    // Halted-only is enforced by xenopsd, not here
    info("Unregistering " + describe(*reference) + "...");
    if (!vms.unregister_vm(*vm_id)) {
        return fail(vms.get_last_error());
    }

    success(describe(*reference) + " unregistered");
    return exit_codes::SUCCESS;
}

int CLI::cmd_start(const CommandArgs& args) {
    TransitionRequest request;
    request.action = PowerAction::Start;
    request.start_paused = args.paused;
    return transition(args, request);
}

int CLI::cmd_shutdown(const CommandArgs& args) {
    TransitionRequest request;
    request.action = PowerAction::Shutdown;
    request.timeout = args.timeout;
    return transition(args, request);
}

int CLI::cmd_reboot(const CommandArgs& args) {
    TransitionRequest request;
    request.action = PowerAction::Reboot;
    request.timeout = args.timeout;
    return transition(args, request);
}

int CLI::cmd_suspend(const CommandArgs& args) {
    TransitionRequest request;
    request.action = PowerAction::Suspend;
    request.block_device = args.block_device;
    return transition(args, request);
}

int CLI::transition(const CommandArgs& args, TransitionRequest request) {
    Error missing;
    auto reference = vm_reference(args, missing);
    if (!reference) {
        return fail(missing);
    }

    auto& vms = provider();
    auto vm_id = vms.resolve(*reference);
    if (!vm_id) {
        return fail(vms.get_last_error());
    }
    if (std::holds_alternative<VMName>(*reference)) {
        debug("Resolved " + describe(*reference) + " to " + *vm_id);
    }
    request.vm_id = *vm_id;

    if (request.timeout && *request.timeout == 0.0) {
        warn("A timeout of 0s leaves no time for a clean shutdown; the VM will be powered off");
    }

    // One request only: any forced fallback after the timeout is xenopsd's job
    info(describe(*reference) + ": requesting " + describe_request(request) + "...");
    auto state = vms.request_transition(request);
    if (!state) {
        return fail(vms.get_last_error());
    }

    success(describe(*reference) + " is now " + power_state_to_string(*state));
    return exit_codes::SUCCESS;
}

int CLI::cmd_version() {
    out_ << "xenops-cli " << VERSION << std::endl;
    return exit_codes::SUCCESS;
}

int CLI::cmd_command_help(Command command) {
    for (const auto& help : COMMAND_HELP) {
        if (help.command == command) {
            out_ << "USAGE:\n  xenops-cli " << help.usage << " [COMMON OPTIONS]\n\n"
                 << "DESCRIPTION:\n" << help.description << "\n"
                 << COMMON_OPTIONS;
            out_.flush();
            return exit_codes::SUCCESS;
        }
    }
    return cmd_help();
}

int CLI::cmd_help() {
    out_ << R"(xenops-cli - interact with the XCP xenopsd VM management service

USAGE:
  xenops-cli <command> [arguments] [COMMON OPTIONS]

COMMANDS:
  list                                 List the VMs registered with xenopsd
  add [FILE]                           Register a new VM with xenopsd
  remove [VM]                          Unregister a VM
  start [VM] [--paused]                Start a VM
  shutdown [VM] [--timeout SECONDS]    Shut down a VM
  reboot [VM] [--timeout SECONDS]      Reboot a VM
  suspend [VM] [--block-device PATH]   Suspend a VM
  help [COMMAND]                       Show this help, or help for COMMAND

VM is the name or UUID of a registered VM.

)" << COMMON_OPTIONS << R"(  --version             Show the version and exit

EXAMPLES:
  # Register a VM and start it, leaving it paused
  xenops-cli add /path/to/vm-metadata
  xenops-cli start web01 --paused

  # Ask for a clean shutdown, powering off after 30 seconds
  xenops-cli shutdown web01 --timeout 30

  # Suspend to a specific block device
  xenops-cli suspend web01 --block-device /dev/xvdb

MORE HELP:
  Use 'xenops-cli COMMAND --help' for help on a single command.
)";
    out_.flush();
    return exit_codes::SUCCESS;
}

} // namespace xenopscli
