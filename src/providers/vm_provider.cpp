#include "providers/vm_provider.hpp"
#include "providers/sd_bus_vm_provider.hpp"
#include "cli/config.hpp"
#include <cctype>

namespace xenopscli {

std::string power_state_to_string(PowerState state) {
    switch (state) {
        case PowerState::Halted: return "Halted";
        case PowerState::Running: return "Running";
        case PowerState::Paused: return "Paused";
        case PowerState::Suspended: return "Suspended";
    }
    return "Unknown";
}

std::optional<PowerState> power_state_from_string(const std::string& s) {
    if (s == "Halted") return PowerState::Halted;
    if (s == "Running") return PowerState::Running;
    if (s == "Paused") return PowerState::Paused;
    if (s == "Suspended") return PowerState::Suspended;
    return std::nullopt;
}

std::string power_action_to_string(PowerAction action) {
    switch (action) {
        case PowerAction::Start: return "start";
        case PowerAction::Shutdown: return "shutdown";
        case PowerAction::Reboot: return "reboot";
        case PowerAction::Suspend: return "suspend";
    }
    return "unknown";
}

bool is_uuid(const std::string& s) {
    if (s.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < s.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

VMReference parse_vm_reference(const std::string& s) {
    if (is_uuid(s)) {
        return VMId{s};
    }
    return VMName{s};
}

std::string describe(const VMReference& reference) {
    if (const auto* id = std::get_if<VMId>(&reference)) {
        return "VM " + id->value;
    }
    return "VM '" + std::get<VMName>(reference).value + "'";
}

std::optional<std::string> VMProvider::resolve(const VMReference& reference) {
    if (const auto* id = std::get_if<VMId>(&reference)) {
        return id->value;
    }

    const std::string& name = std::get<VMName>(reference).value;
    auto vms = list_vms();
    if (!vms) {
        return std::nullopt;
    }

    std::vector<std::string> matches;
    for (const auto& vm : *vms) {
        if (vm.name == name) {
            matches.push_back(vm.id);
        }
    }

    if (matches.empty()) {
        set_error(ErrorKind::NotFound, "No VM named '" + name + "' is registered");
        return std::nullopt;
    }
    if (matches.size() > 1) {
        std::string ids;
        for (const auto& id : matches) {
            if (!ids.empty()) ids += ", ";
            ids += id;
        }
        set_error(ErrorKind::AmbiguousReference,
                  "Name '" + name + "' matches " + std::to_string(matches.size()) +
                  " VMs (" + ids + "); use the UUID instead");
        return std::nullopt;
    }
    return matches.front();
}

void VMProvider::set_error(ErrorKind kind, const std::string& message) const {
    last_error_.kind = kind;
    last_error_.message = message;
}

std::unique_ptr<VMProvider> VMProvider::create_default(const Config& config) {
    return std::make_unique<SdBusVMProvider>(config.socket_path,
                                             config.connect_timeout_usec);
}

} // namespace xenopscli
