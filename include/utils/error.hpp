#pragma once

#include <string>

namespace xenopscli {

/**
 * ErrorKind - Category of a failed command
 *
 * UsageError and MissingArgument are detected locally; every other kind
 * comes from the daemon or from the control channel.
 */
enum class ErrorKind {
    None,
    UsageError,
    MissingArgument,
    AmbiguousReference,
    NotFound,
    PowerStateConflict,
    ResourceConstraint,
    DaemonUnreachable,
    InvalidMetadata,
    DaemonError
};

/**
 * Error - Failure kind plus the message shown to the user
 */
struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

} // namespace xenopscli
