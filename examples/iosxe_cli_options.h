/**
 * @file iosxe_cli_options.h
 * @brief Command line parsing for the IOS-XE file transfer example
 */

#ifndef KCENON_DEVICE_TRANSFER_EXAMPLES_IOSXE_CLI_OPTIONS_H
#define KCENON_DEVICE_TRANSFER_EXAMPLES_IOSXE_CLI_OPTIONS_H

#include <kcenon/device_transfer/device_transfer.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace kcenon::device_transfer::examples {

struct cli_options {
    ssh_credentials credentials;
    transfer_options options;
    cisco_iosxe::platform_options platform;
    std::string operation;
    std::string source;
    std::string destination;
    bool debug = false;
    bool help = false;
};

/**
 * @brief Parse a non-negative decimal argument no larger than `max`
 */
inline auto parse_number(const std::string& text, const std::string& arg, uint64_t max)
    -> result<uint64_t> {
    auto invalid = [&]() {
        return unexpected(error{error_code::invalid_configuration,
                                arg + " expects a number up to " + std::to_string(max) +
                                    ", got '" + text + "'"});
    };
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return invalid();
    }
    try {
        std::size_t consumed = 0;
        auto value = std::stoull(text, &consumed);
        if (consumed != text.size() || value > max) {
            return invalid();
        }
        return static_cast<uint64_t>(value);
    } catch (const std::invalid_argument&) {
        return invalid();
    } catch (const std::out_of_range&) {
        return invalid();
    }
}

/**
 * @brief Parse argv into credentials, transfer options and the operation
 * @return Parsed options, or invalid_configuration describing the bad argument
 */
inline auto parse_cli_options(int argc, const char* const argv[]) -> result<cli_options> {
    cli_options parsed;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> result<std::string> {
            if (i + 1 >= argc) {
                return unexpected(error{error_code::invalid_configuration,
                                        arg + " requires an argument"});
            }
            return std::string(argv[++i]);
        };
        auto number = [&](uint64_t max) -> result<uint64_t> {
            auto text = value();
            if (!text) {
                return unexpected(text.error());
            }
            return parse_number(text.value(), arg, max);
        };
        auto assign = [&](std::string& target) -> result<void> {
            auto text = value();
            if (!text) {
                return unexpected(text.error());
            }
            target = text.value();
            return {};
        };

        result<void> step;
        if (arg == "--help") {
            parsed.help = true;
            return parsed;
        } else if (arg == "-h" || arg == "--host") {
            step = assign(parsed.credentials.host);
        } else if (arg == "-p" || arg == "--port") {
            auto port = number(std::numeric_limits<uint16_t>::max());
            if (!port) {
                return unexpected(port.error());
            }
            parsed.credentials.port = static_cast<uint16_t>(port.value());
        } else if (arg == "-u" || arg == "--user") {
            step = assign(parsed.credentials.username);
        } else if (arg == "--password") {
            step = assign(parsed.credentials.password);
        } else if (arg == "--enable") {
            std::string secret;
            step = assign(secret);
            parsed.credentials.enable_secret = secret;
        } else if (arg == "--fs") {
            step = assign(parsed.options.storage_root);
        } else if (arg == "--verify") {
            parsed.options.verify_hash = true;
        } else if (arg == "--no-verify") {
            parsed.options.verify_hash = false;
        } else if (arg == "--overwrite") {
            parsed.options.overwrite = true;
        } else if (arg == "--force-config") {
            parsed.options.force = force_policy::check_and_apply;
        } else if (arg == "--skip-capability-check") {
            parsed.options.force = force_policy::skip_check;
        } else if (arg == "--no-cleanup") {
            parsed.options.cleanup = false;
        } else if (arg == "--keepalive") {
            auto seconds = number(24 * 3600);
            if (!seconds) {
                return unexpected(seconds.error());
            }
            parsed.options.keep_alive_interval = std::chrono::seconds{seconds.value()};
        } else if (arg == "--bulk-mode") {
            auto window = number(std::numeric_limits<uint32_t>::max());
            if (!window) {
                return unexpected(window.error());
            }
            parsed.platform.bulk_mode_window = static_cast<uint32_t>(window.value());
        } else if (arg == "--known-hosts") {
            parsed.credentials.strict_host_key = true;
            step = assign(parsed.credentials.known_hosts_file);
        } else if (arg == "--debug") {
            parsed.debug = true;
        } else if (arg[0] == '-') {
            return unexpected(error{error_code::invalid_configuration, "unknown option " + arg});
        } else if (parsed.operation.empty()) {
            parsed.operation = arg;
        } else if (parsed.source.empty()) {
            parsed.source = arg;
        } else if (parsed.destination.empty()) {
            parsed.destination = arg;
        } else {
            return unexpected(error{error_code::invalid_configuration, "too many arguments"});
        }

        if (!step) {
            return unexpected(step.error());
        }
    }

    if (parsed.credentials.host.empty() || parsed.credentials.username.empty() ||
        parsed.source.empty() || (parsed.operation != "put" && parsed.operation != "get")) {
        return unexpected(error{error_code::invalid_configuration,
                                "host, user, operation (put|get) and source are required"});
    }
    return parsed;
}

}  // namespace kcenon::device_transfer::examples

#endif  // KCENON_DEVICE_TRANSFER_EXAMPLES_IOSXE_CLI_OPTIONS_H
