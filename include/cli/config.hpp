#pragma once

#include <cstdint>
#include <string>

namespace xenopscli {

/// Path of the xenopsd control socket when --socket is not given
inline constexpr const char* kDefaultSocketPath = "/var/lib/xcp/xenopsd";

/// Upper bound on connecting to the daemon (microseconds)
inline constexpr uint64_t kDefaultConnectTimeoutUsec = 10ULL * 1000 * 1000;

/// Options common to all commands. Built once by the argument parser.
struct Config {
    bool debug = false;
    bool verbose = false;
    std::string socket_path = kDefaultSocketPath;
    uint64_t connect_timeout_usec = kDefaultConnectTimeoutUsec;
};

} // namespace xenopscli
