#include "providers/sd_bus_vm_provider.hpp"
#include <cstring>
#include <cstdio>
#include <map>
#include <unistd.h>

namespace xenopscli {

namespace {

// Method calls may legitimately block for as long as the daemon needs
// (e.g. waiting out a clean shutdown), so only the connection is bounded.
constexpr uint64_t NO_CALL_TIMEOUT = UINT64_MAX;

const char* member_for(PowerAction action) {
    switch (action) {
        case PowerAction::Start: return "Start";
        case PowerAction::Shutdown: return "Shutdown";
        case PowerAction::Reboot: return "Reboot";
        case PowerAction::Suspend: return "Suspend";
    }
    return "Start";
}

bool is_transport_error(const std::string& name) {
    static const char* const transport_errors[] = {
        SD_BUS_ERROR_DISCONNECTED,
        SD_BUS_ERROR_NO_REPLY,
        SD_BUS_ERROR_TIMEOUT,
        SD_BUS_ERROR_TIMED_OUT,
        SD_BUS_ERROR_SERVICE_UNKNOWN,
        SD_BUS_ERROR_NO_SERVER,
        SD_BUS_ERROR_NO_NETWORK,
        SD_BUS_ERROR_IO_ERROR,
    };
    for (const char* e : transport_errors) {
        if (name == e) return true;
    }
    // Errors sd-bus synthesizes from a local errno
    return name.rfind("System.Error.", 0) == 0;
}

}  // anonymous namespace

ErrorKind classify_bus_error(const std::string& error_name) {
    if (error_name.empty()) {
        return ErrorKind::DaemonUnreachable;
    }

    static const std::map<std::string, ErrorKind> daemon_errors = {
        {"DoesNotExist", ErrorKind::NotFound},
        {"BadPowerState", ErrorKind::PowerStateConflict},
        {"NotEnoughMemory", ErrorKind::ResourceConstraint},
        {"NotEnoughDiskSpace", ErrorKind::ResourceConstraint},
        {"ResourceExhausted", ErrorKind::ResourceConstraint},
        {"InvalidMetadata", ErrorKind::InvalidMetadata},
        {"AmbiguousReference", ErrorKind::AmbiguousReference},
    };

    const std::string prefix = xenopsd_bus::ERROR_PREFIX;
    if (error_name.compare(0, prefix.size(), prefix) == 0) {
        auto it = daemon_errors.find(error_name.substr(prefix.size()));
        if (it != daemon_errors.end()) {
            return it->second;
        }
        return ErrorKind::DaemonError;
    }

    if (is_transport_error(error_name)) {
        return ErrorKind::DaemonUnreachable;
    }
    return ErrorKind::DaemonError;
}

std::string escape_bus_address_value(const std::string& value) {
    std::string result;
    for (char c : value) {
        unsigned char u = static_cast<unsigned char>(c);
        if ((u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') ||
            (u >= '0' && u <= '9') || (c != '\0' && std::strchr("-_/.\\*", c) != nullptr)) {
            result += c;
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02x", u);
            result += buf;
        }
    }
    return result;
}

SdBusVMProvider::SdBusVMProvider(
    const std::string& socket_path,
    uint64_t connect_timeout_usec)
    : socket_path_(socket_path),
      connect_timeout_usec_(connect_timeout_usec) {
    init_bus();
}

SdBusVMProvider::SdBusVMProvider(int fd, uint64_t connect_timeout_usec)
    : socket_path_("fd " + std::to_string(fd)),
      connect_timeout_usec_(connect_timeout_usec) {
    init_bus(fd);
}

SdBusVMProvider::~SdBusVMProvider() {
    cleanup_bus();
}

bool SdBusVMProvider::init_bus(int fd) {
    int r = sd_bus_new(&bus_);
    if (r < 0) {
        if (fd >= 0) {
            close(fd);
        }
        connect_error_ = "Failed to allocate bus: " + std::string(strerror(-r));
        bus_ = nullptr;
        set_error(ErrorKind::DaemonUnreachable, connect_error_);
        return false;
    }

    if (fd >= 0) {
        // The bus closes the socket once it has taken it
        r = sd_bus_set_fd(bus_, fd, fd);
        if (r < 0) {
            close(fd);
        }
    } else {
        std::string address = "unix:path=" + escape_bus_address_value(socket_path_);
        r = sd_bus_set_address(bus_, address.c_str());
    }
    if (r >= 0) {
        r = sd_bus_set_method_call_timeout(bus_, connect_timeout_usec_);
    }
    if (r >= 0) {
        r = sd_bus_start(bus_);
    }
    if (r < 0) {
        connect_error_ = "Failed to connect to xenopsd at " + socket_path_ + ": " +
                         strerror(-r);
        cleanup_bus();
        set_error(ErrorKind::DaemonUnreachable, connect_error_);
        return false;
    }

    // The handshake happens lazily; a ping forces it within the timeout
    sd_bus_error error = SD_BUS_ERROR_NULL;
    sd_bus_message* m = nullptr;

    r = sd_bus_call_method(
        bus_,
        nullptr,
        xenopsd_bus::OBJECT_PATH,
        "org.freedesktop.DBus.Peer",
        "Ping",
        &error,
        &m,
        nullptr
    );

    if (r < 0) {
        connect_error_ = "xenopsd at " + socket_path_ + " is not responding: " +
                         (error.message ? error.message : strerror(-r));
        sd_bus_error_free(&error);
        sd_bus_message_unref(m);
        cleanup_bus();
        set_error(ErrorKind::DaemonUnreachable, connect_error_);
        return false;
    }

    sd_bus_error_free(&error);
    sd_bus_message_unref(m);
    return true;
}

void SdBusVMProvider::cleanup_bus() {
    if (bus_) {
        sd_bus_flush_close_unref(bus_);
        bus_ = nullptr;
    }
}

bool SdBusVMProvider::new_method_call(const char* member, sd_bus_message** m) {
    if (!bus_) {
        set_error(ErrorKind::DaemonUnreachable, connect_error_);
        return false;
    }

    int r = sd_bus_message_new_method_call(
        bus_,
        m,
        nullptr,
        xenopsd_bus::OBJECT_PATH,
        xenopsd_bus::INTERFACE,
        member
    );

    if (r < 0) {
        set_error(ErrorKind::DaemonError,
                  std::string("Failed to create ") + member + " call: " + strerror(-r));
        return false;
    }
    return true;
}

bool SdBusVMProvider::call(const char* member, sd_bus_message* m,
                           sd_bus_message** reply) {
    sd_bus_error error = SD_BUS_ERROR_NULL;

    int r = sd_bus_call(bus_, m, NO_CALL_TIMEOUT, &error, reply);
    sd_bus_message_unref(m);

    if (r < 0) {
        ErrorKind kind = classify_bus_error(error.name ? error.name : "");
        std::string detail = error.message ? error.message : strerror(-r);
        if (kind == ErrorKind::DaemonUnreachable) {
            set_error(kind, std::string("Lost connection to xenopsd at ") + socket_path_ +
                            " during " + member + ": " + detail);
        } else {
            // Daemon-reported failures are shown as-is
            set_error(kind, detail);
        }
        sd_bus_error_free(&error);
        return false;
    }

    sd_bus_error_free(&error);
    return true;
}

std::optional<PowerState> SdBusVMProvider::read_power_state(sd_bus_message* reply) {
    const char* value = nullptr;
    int r = sd_bus_message_read(reply, "s", &value);
    if (r < 0) {
        set_error(ErrorKind::DaemonError, "Failed to parse power state from xenopsd reply");
        return std::nullopt;
    }

    auto state = power_state_from_string(value);
    if (!state) {
        set_error(ErrorKind::DaemonError,
                  "xenopsd reported unknown power state '" + std::string(value) + "'");
    }
    return state;
}

std::optional<std::string> SdBusVMProvider::register_vm(const std::string& metadata) {
    sd_bus_message* m = nullptr;
    if (!new_method_call("Add", &m)) {
        return std::nullopt;
    }

    int r = sd_bus_message_append(m, "s", metadata.c_str());
    if (r < 0) {
        sd_bus_message_unref(m);
        set_error(ErrorKind::InvalidMetadata,
                  "Failed to encode VM metadata: " + std::string(strerror(-r)));
        return std::nullopt;
    }

    sd_bus_message* reply = nullptr;
    if (!call("Add", m, &reply)) {
        return std::nullopt;
    }

    const char* id = nullptr;
    r = sd_bus_message_read(reply, "s", &id);
    if (r < 0) {
        set_error(ErrorKind::DaemonError, "Failed to parse VM id from xenopsd reply");
        sd_bus_message_unref(reply);
        return std::nullopt;
    }

    std::string result(id);
    sd_bus_message_unref(reply);
    return result;
}

std::optional<std::vector<VMSummary>> SdBusVMProvider::list_vms() {
    sd_bus_message* m = nullptr;
    if (!new_method_call("List", &m)) {
        return std::nullopt;
    }

    sd_bus_message* reply = nullptr;
    if (!call("List", m, &reply)) {
        return std::nullopt;
    }

    int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "(sss)");
    if (r < 0) {
        set_error(ErrorKind::DaemonError, "Failed to parse VM list from xenopsd reply");
        sd_bus_message_unref(reply);
        return std::nullopt;
    }

    std::vector<VMSummary> vms;
    const char* id = nullptr;
    const char* name = nullptr;
    const char* state = nullptr;

    while ((r = sd_bus_message_read(reply, "(sss)", &id, &name, &state)) > 0) {
        auto power_state = power_state_from_string(state);
        if (!power_state) {
            set_error(ErrorKind::DaemonError,
                      "xenopsd reported unknown power state '" + std::string(state) +
                      "' for VM " + id);
            sd_bus_message_unref(reply);
            return std::nullopt;
        }
        vms.push_back(VMSummary{id, name, *power_state});
    }

    if (r < 0) {
        set_error(ErrorKind::DaemonError, "Failed to parse VM list entry from xenopsd reply");
        sd_bus_message_unref(reply);
        return std::nullopt;
    }

    sd_bus_message_exit_container(reply);
    sd_bus_message_unref(reply);
    return vms;
}

bool SdBusVMProvider::unregister_vm(const std::string& vm_id) {
    sd_bus_message* m = nullptr;
    if (!new_method_call("Remove", &m)) {
        return false;
    }

    int r = sd_bus_message_append(m, "s", vm_id.c_str());
    if (r < 0) {
        sd_bus_message_unref(m);
        set_error(ErrorKind::DaemonError, "Failed to encode Remove call: " +
                                          std::string(strerror(-r)));
        return false;
    }

    sd_bus_message* reply = nullptr;
    if (!call("Remove", m, &reply)) {
        return false;
    }

    sd_bus_message_unref(reply);
    return true;
}

std::optional<PowerState> SdBusVMProvider::request_transition(
    const TransitionRequest& request) {
    const char* member = member_for(request.action);

    sd_bus_message* m = nullptr;
    if (!new_method_call(member, &m)) {
        return std::nullopt;
    }

    int r = 0;
    switch (request.action) {
        case PowerAction::Start:
            r = sd_bus_message_append(m, "sb", request.vm_id.c_str(),
                                      request.start_paused ? 1 : 0);
            break;
        case PowerAction::Shutdown:
        case PowerAction::Reboot:
            r = sd_bus_message_append(m, "sbd", request.vm_id.c_str(),
                                      request.timeout ? 1 : 0,
                                      request.timeout.value_or(0.0));
            break;
        case PowerAction::Suspend:
            r = sd_bus_message_append(m, "sbs", request.vm_id.c_str(),
                                      request.block_device ? 1 : 0,
                                      request.block_device ? request.block_device->c_str() : "");
            break;
    }

    if (r < 0) {
        sd_bus_message_unref(m);
        set_error(ErrorKind::DaemonError, std::string("Failed to encode ") + member +
                                          " call: " + strerror(-r));
        return std::nullopt;
    }

    sd_bus_message* reply = nullptr;
    if (!call(member, m, &reply)) {
        return std::nullopt;
    }

    auto state = read_power_state(reply);
    sd_bus_message_unref(reply);
    return state;
}

} // namespace xenopscli
