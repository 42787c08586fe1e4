#include "cli/outcome.hpp"

namespace xenopscli {

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return exit_codes::SUCCESS;
        case ErrorKind::UsageError:
        case ErrorKind::MissingArgument:
            return exit_codes::USAGE;
        default:
            return exit_codes::FAILURE;
    }
}

std::string error_label(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "Success";
        case ErrorKind::UsageError: return "Usage error";
        case ErrorKind::MissingArgument: return "Missing argument";
        case ErrorKind::AmbiguousReference: return "Ambiguous VM reference";
        case ErrorKind::NotFound: return "VM not found";
        case ErrorKind::PowerStateConflict: return "Power state conflict";
        case ErrorKind::ResourceConstraint: return "Insufficient resources";
        case ErrorKind::DaemonUnreachable: return "xenopsd unreachable";
        case ErrorKind::InvalidMetadata: return "Invalid VM metadata";
        case ErrorKind::DaemonError: return "xenopsd error";
    }
    return "Error";
}

std::string format_error(const Error& error) {
    // Diagnostics are one line; fold line breaks in daemon text
    std::string message = error.message;
    for (char& c : message) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    if (message.empty()) {
        return error_label(error.kind);
    }
    return error_label(error.kind) + ": " + message;
}

} // namespace xenopscli
