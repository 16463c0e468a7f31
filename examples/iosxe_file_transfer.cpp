/**
 * @file iosxe_file_transfer.cpp
 * @brief Idempotent file transfer to or from a Cisco IOS-XE device
 *
 * This example demonstrates:
 * - Opening the administrative session with the IOS-XE platform preset
 * - Wiring an orchestrator with make_orchestrator()
 * - Choosing verification, overwrite and capability policies per run
 * - Progress reporting from the bulk-copy loop
 *
 * The process exits with 0 only when the destination was verified.
 */

#include <kcenon/device_transfer/device_transfer.h>

#include "iosxe_cli_options.h"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace kcenon::device_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto yes_no(bool value) -> const char* { return value ? "yes" : "no"; }

}  // namespace

void print_usage(const char* program) {
    std::cout << "IOS-XE File Transfer - Device Transfer System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <put|get> <source> [destination]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --host <host>         Device hostname or address (required)" << std::endl;
    std::cout << "  -p, --port <port>         SSH port (default: 22)" << std::endl;
    std::cout << "  -u, --user <name>         Username (required)" << std::endl;
    std::cout << "  --password <secret>       Password (default: $DEVICE_PASSWORD)" << std::endl;
    std::cout << "  --enable <secret>         Enable secret (default: password)" << std::endl;
    std::cout << "  --fs <filesystem>         Device filesystem, e.g. flash: (default: detect)" << std::endl;
    std::cout << "  --verify / --no-verify    Compare MD5 before and after (default: verify)" << std::endl;
    std::cout << "  --overwrite               Replace a differing destination" << std::endl;
    std::cout << "  --force-config            Enable SCP on the device if needed" << std::endl;
    std::cout << "  --skip-capability-check   Do not inspect the device configuration" << std::endl;
    std::cout << "  --no-cleanup              Keep configuration changes after the copy" << std::endl;
    std::cout << "  --keepalive <seconds>     Keep-alive interval, 0 disables (default: timeout)" << std::endl;
    std::cout << "  --bulk-mode <window>      Also require 'ip ssh bulk-mode <window>'" << std::endl;
    std::cout << "  --known-hosts <file>      Verify the host key against this file" << std::endl;
    std::cout << "  --debug                   Verbose logging" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " -h 10.0.0.1 -u admin put image.bin" << std::endl;
    std::cout << "  " << program << " -h r1 -u admin --force-config --fs bootflash: put image.bin" << std::endl;
    std::cout << "  " << program << " -h r1 -u admin get running-config.txt backup.txt" << std::endl;
}

int main(int argc, char* argv[]) {
    auto parsed = examples::parse_cli_options(argc, argv);
    if (!parsed.has_value()) {
        std::cerr << "Error: " << parsed.error().message << std::endl;
        print_usage(argv[0]);
        return 2;
    }
    if (parsed.value().help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& cli = parsed.value();
    auto& credentials = cli.credentials;
    auto& options = cli.options;
    if (credentials.password.empty()) {
        if (const char* env = std::getenv("DEVICE_PASSWORD")) {
            credentials.password = env;
        }
    }

    get_logger().initialize();
    get_logger().set_level(cli.debug ? log_level::debug : log_level::info);

    auto direction = cli.operation == "put" ? transfer_direction::upload : transfer_direction::download;

    options.progress = [](const std::string& src, const std::string& dst, uint64_t copied,
                          uint64_t total) {
        copy_progress p{copied, total};
        std::cout << "\r" << src << " -> " << dst << ": " << format_bytes(copied) << " / "
                  << format_bytes(total) << " (" << std::fixed << std::setprecision(1)
                  << p.percentage() << "%)" << std::flush;
        if (copied == total) {
            std::cout << std::endl;
        }
    };

    std::cout << "Connecting to " << credentials.host << ":" << credentials.port << "..."
              << std::endl;
    auto admin = libssh2_admin_channel::open(cisco_iosxe::platform_config(credentials));
    if (!admin.has_value()) {
        std::cerr << "Error: " << admin.error().message << std::endl;
        return 1;
    }

    auto orchestrator = cisco_iosxe::make_orchestrator(
        admin.value(), std::make_shared<libssh2_bulk_copy_channel>(), credentials, cli.platform);
    if (!orchestrator.has_value()) {
        std::cerr << "Error: " << orchestrator.error().message << std::endl;
        return 1;
    }

    auto outcome = orchestrator.value().transfer(direction, cli.source, cli.destination, options);
    if (!outcome.has_value()) {
        std::cerr << "Error: " << to_string(outcome.error().code) << ": "
                  << outcome.error().message << std::endl;
        get_logger().shutdown();
        return 1;
    }

    std::cout << "Destination exists: " << yes_no(outcome.value().destination_existed) << std::endl;
    std::cout << "Transferred:        " << yes_no(outcome.value().transferred) << std::endl;
    std::cout << "Verified:           " << yes_no(outcome.value().verified) << std::endl;

    get_logger().shutdown();
    return outcome.value().verified ? 0 : 1;
}
