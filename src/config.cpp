#include "config.hpp"
#include "errors.hpp"
#include <limits>
#include <stdexcept>

namespace config {

namespace {

long parse_number(const std::string& flag, const std::string& value, long max) {
    try {
        std::size_t used = 0;
        long n = std::stol(value, &used);
        if (used != value.size() || n < 0 || n > max) {
            throw std::out_of_range(value);
        }
        return n;
    } catch (std::logic_error&) {
        throw errors::ValidationError("Invalid value for " + flag + ": " + value);
    }
}

} // namespace

std::vector<std::string> parse_args(const std::vector<std::string>& args, Config& cfg) {
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= args.size()) {
            throw errors::ValidationError("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--grace-ms") {
            cfg.complete_grace = std::chrono::milliseconds(parse_number(arg, value, 60000));
        } else if (arg == "--watchdog-ms") {
            cfg.finalize_watchdog = std::chrono::milliseconds(parse_number(arg, value, 60000));
        } else if (arg == "--timeout-ms") {
            cfg.dial_timeout = std::chrono::milliseconds(parse_number(arg, value, 600000));
        } else if (arg == "--port") {
            long port = parse_number(arg, value, std::numeric_limits<unsigned short>::max());
            if (port == 0) {
                throw errors::ValidationError("Invalid value for --port: 0");
            }
            cfg.discovery_port = static_cast<unsigned short>(port);
        } else if (arg == "--save-dir") {
            if (value.empty()) {
                throw errors::ValidationError("Empty --save-dir");
            }
            cfg.save_dir = value;
        } else {
            throw errors::ValidationError("Unknown option: " + arg);
        }
    }

    // FILE_COMPLETE has to beat the receiver's watchdog
    if (cfg.complete_grace >= cfg.finalize_watchdog) {
        throw errors::ValidationError("--grace-ms must be shorter than --watchdog-ms");
    }
    return positional;
}

} // namespace config
