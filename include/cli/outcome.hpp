#pragma once

#include "utils/error.hpp"
#include <string>

namespace xenopscli {

/// Process exit codes
namespace exit_codes {
    inline constexpr int SUCCESS = 0;
    inline constexpr int FAILURE = 1;  // Daemon or control channel failure
    inline constexpr int USAGE = 2;    // Bad or missing arguments
}

/**
 * Exit code for a failure kind
 */
int exit_code_for(ErrorKind kind);

/**
 * Short label for a failure kind, e.g. "Power state conflict"
 */
std::string error_label(ErrorKind kind);

/**
 * Single-line diagnostic: "<label>: <message>"
 */
std::string format_error(const Error& error);

} // namespace xenopscli
