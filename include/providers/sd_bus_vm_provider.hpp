#pragma once

#include "vm_provider.hpp"
#include "cli/config.hpp"
#include <systemd/sd-bus.h>
#include <cstdint>

namespace xenopscli {

/// D-Bus names exported by xenopsd on its control socket
namespace xenopsd_bus {
    inline constexpr const char* OBJECT_PATH = "/org/xen/xcp/xenops";
    inline constexpr const char* INTERFACE = "org.xen.xcp.xenops.VM";
    inline constexpr const char* ERROR_PREFIX = "org.xen.xcp.xenops.Error.";
}

/**
 * Map a D-Bus error name to an ErrorKind
 *
 * An empty name means the call failed locally (connect/send/receive).
 */
ErrorKind classify_bus_error(const std::string& error_name);

/**
 * Escape a value for use in a D-Bus address ("unix:path=...")
 */
std::string escape_bus_address_value(const std::string& value);

/**
 * SdBusVMProvider - xenopsd client over a peer-to-peer sd-bus connection
 *
 * Connects directly to the daemon's Unix socket (no bus broker). The
 * connection is opened and pinged in the constructor; if that fails every
 * call reports DaemonUnreachable.
 */
class SdBusVMProvider : public VMProvider {
public:
    /**
     * Constructor
     * @param socket_path Path of the xenopsd control socket
     * @param connect_timeout_usec Bound on establishing the connection
     */
    explicit SdBusVMProvider(
        const std::string& socket_path = kDefaultSocketPath,
        uint64_t connect_timeout_usec = kDefaultConnectTimeoutUsec
    );

    /**
     * Constructor over an already connected socket
     * @param fd Connected stream socket (e.g. one end of a socketpair); the
     *        provider owns it from here on, also on failure
     * @param connect_timeout_usec Bound on the handshake
     */
    SdBusVMProvider(int fd, uint64_t connect_timeout_usec);

    ~SdBusVMProvider() override;

    SdBusVMProvider(const SdBusVMProvider&) = delete;
    SdBusVMProvider& operator=(const SdBusVMProvider&) = delete;

    // VMProvider interface
    std::optional<std::string> register_vm(const std::string& metadata) override;
    std::optional<std::vector<VMSummary>> list_vms() override;
    bool unregister_vm(const std::string& vm_id) override;
    std::optional<PowerState> request_transition(
        const TransitionRequest& request) override;

private:
    /**
     * Connect to the daemon and check that it answers
     * @param fd Connected socket to use, or -1 to connect to socket_path_
     */
    bool init_bus(int fd = -1);

    /**
     * Cleanup the D-Bus connection
     */
    void cleanup_bus();

    /**
     * Create a method call on the xenopsd VM interface
     * @param member Method name (e.g., "Start")
     * @param m Receives the new message
     * @return true if successful
     */
    bool new_method_call(const char* member, sd_bus_message** m);

    /**
     * Send a method call and wait for the reply. Consumes m.
     * @param member Method name, for error messages
     * @param m Message built by new_method_call
     * @param reply Receives the reply on success
     * @return true if successful
     */
    bool call(const char* member, sd_bus_message* m, sd_bus_message** reply);

    /**
     * Read a single power state string from a reply
     */
    std::optional<PowerState> read_power_state(sd_bus_message* reply);

    sd_bus* bus_ = nullptr;
    std::string socket_path_;
    uint64_t connect_timeout_usec_;
    std::string connect_error_;
};

} // namespace xenopscli
