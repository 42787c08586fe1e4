#pragma once

#include "utils/error.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <variant>

namespace xenopscli {

struct Config;

/**
 * PowerState - Power state of a VM as reported by xenopsd
 *
 * Only ever parsed from daemon replies; the client never decides
 * transitions on its own.
 */
enum class PowerState {
    Halted,
    Running,
    Paused,
    Suspended
};

std::string power_state_to_string(PowerState state);
std::optional<PowerState> power_state_from_string(const std::string& s);

/**
 * PowerAction - Transition requested from the daemon
 */
enum class PowerAction {
    Start,
    Shutdown,
    Reboot,
    Suspend
};

std::string power_action_to_string(PowerAction action);

/**
 * VMSummary - One entry of the daemon's VM list
 */
struct VMSummary {
    std::string id;
    std::string name;
    PowerState power_state;
};

/// A VM selected by its (case-sensitive) name
struct VMName {
    std::string value;
};

/// A VM selected by its UUID
struct VMId {
    std::string value;
};

using VMReference = std::variant<VMName, VMId>;

/// True for the 8-4-4-4-12 hex digit UUID layout
bool is_uuid(const std::string& s);

/// UUID-shaped strings select by id, everything else by name
VMReference parse_vm_reference(const std::string& s);

/// Human readable form, e.g. "VM 'web01'"
std::string describe(const VMReference& reference);

/**
 * TransitionRequest - A single power transition for one resolved VM
 */
struct TransitionRequest {
    std::string vm_id;
    PowerAction action = PowerAction::Start;
    std::optional<double> timeout;            // Seconds to wait for a clean shutdown
    bool start_paused = false;                // Start only: leave the VM Paused
    std::optional<std::string> block_device;  // Suspend only: where to write the image
};

/**
 * VMProvider - Abstract interface to the xenopsd VM lifecycle service
 *
 * Every call blocks until the daemon replies or the channel fails. On
 * failure the call returns false / an empty optional and get_last_error()
 * describes what went wrong. Nothing is retried.
 */
class VMProvider {
public:
    virtual ~VMProvider() = default;

    /**
     * Register a new VM
     * @param metadata VM metadata document
     * @return Id of the registered VM
     */
    virtual std::optional<std::string> register_vm(const std::string& metadata) = 0;

    /**
     * List registered VMs
     * @return VM summaries in the order the daemon reports them
     */
    virtual std::optional<std::vector<VMSummary>> list_vms() = 0;

    /**
     * Unregister a VM. The daemon only accepts Halted VMs.
     * @param vm_id Resolved VM id
     * @return true if successful
     */
    virtual bool unregister_vm(const std::string& vm_id) = 0;

    /**
     * Ask the daemon to perform a power transition
     * @param request Transition for a resolved VM
     * @return Power state the VM ended up in
     */
    virtual std::optional<PowerState> request_transition(
        const TransitionRequest& request) = 0;

    /**
     * Resolve a name or UUID to exactly one VM id
     *
     * Ids are passed through untouched. Names are looked up in list_vms();
     * no match is NotFound and several matches are AmbiguousReference.
     */
    std::optional<std::string> resolve(const VMReference& reference);

    /**
     * Get the last error
     */
    const Error& get_last_error() const { return last_error_; }

    /**
     * Factory method to create the default VM provider
     */
    static std::unique_ptr<VMProvider> create_default(const Config& config);

protected:
    void set_error(ErrorKind kind, const std::string& message) const;

private:
    mutable Error last_error_;
};

} // namespace xenopscli
