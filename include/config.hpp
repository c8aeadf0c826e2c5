#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace config {

struct Config {
    // Pause between the last chunk and FILE_COMPLETE
    std::chrono::milliseconds complete_grace{500};
    // Finalize anyway if FILE_COMPLETE has not arrived this long after the last chunk
    std::chrono::milliseconds finalize_watchdog{1000};
    unsigned short discovery_port = 45454;
    std::chrono::milliseconds dial_timeout{10000};
    std::string save_dir = ".";
    // When set, dialing skips discovery and connects here directly
    std::string direct_host;
    unsigned short direct_port = 0;
};

// Consumes --grace-ms, --watchdog-ms, --port, --timeout-ms and --save-dir from args
// and returns the remaining positional arguments. Throws errors::ValidationError,
// also when the grace delay is not shorter than the watchdog.
std::vector<std::string> parse_args(const std::vector<std::string>& args, Config& cfg);

} // namespace config
