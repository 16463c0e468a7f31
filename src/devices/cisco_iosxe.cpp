/**
 * @file cisco_iosxe.cpp
 * @brief Cisco IOS-XE dialect, resolver, capability profile and preset
 */

#include "kcenon/device_transfer/devices/cisco_iosxe.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

#include <kcenon/device_transfer/capability/capability_negotiator.h>
#include <kcenon/device_transfer/core/logging.h>
#include <kcenon/device_transfer/probe/local_file_probe.h>
#include <kcenon/device_transfer/transfer/transfer_engine.h>

namespace kcenon::device_transfer::cisco_iosxe {

namespace {

// Device output is matched one line at a time; IOS-XE terminates lines
// with CR LF.
auto split_lines(const std::string& output) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

auto trim(const std::string& text) -> std::string {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

auto regex_escape(const std::string& text) -> std::string {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

// "flash:/dir/image.bin" -> "image.bin"
auto base_name(const std::string& path) -> std::string {
    auto pos = path.find_last_of("/:");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

auto to_uint64(const std::string& digits) -> std::optional<uint64_t> {
    try {
        return static_cast<uint64_t>(std::stoull(digits));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

// ============================================================================
// file_dialect
// ============================================================================

auto file_dialect::hash_command(const std::string& path) const -> std::string {
    return "verify /md5 " + path;
}

auto file_dialect::listing_command(const std::string& path) const -> std::string {
    return "dir " + path;
}

auto file_dialect::free_space_command(const std::string& root) const
    -> std::optional<std::string> {
    if (root.empty()) {
        return std::string{"dir | include bytes total"};
    }
    return "dir " + root + " | include bytes total";
}

auto file_dialect::parse_hash(const std::string& output) const -> std::optional<std::string> {
    static const std::regex pattern(R"(^verify.*=\s*(\w{32}))");
    for (const auto& line : split_lines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            auto digest = match[1].str();
            std::transform(digest.begin(), digest.end(), digest.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return digest;
        }
    }
    return std::nullopt;
}

auto file_dialect::parse_size(const std::string& output, const std::string& name) const
    -> std::optional<uint64_t> {
    auto file = base_name(name);
    if (file.empty()) {
        return std::nullopt;
    }
    const std::regex pattern(R"(^\s*\d+\s+[rwxd-]+\s+(\d+)\s.*\s)" + regex_escape(file) +
                             R"(\s*$)");
    for (const auto& line : split_lines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return to_uint64(match[1].str());
        }
    }
    return std::nullopt;
}

auto file_dialect::parse_free_space(const std::string& output) const
    -> std::optional<uint64_t> {
    static const std::regex pattern(R"((\d+) bytes total \((\d+) bytes free\))");
    for (const auto& line : split_lines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return to_uint64(match[2].str());
        }
    }
    return std::nullopt;
}

// ============================================================================
// storage_resolver
// ============================================================================

storage_resolver::storage_resolver(std::shared_ptr<admin_channel> channel, std::string privilege)
    : channel_(std::move(channel)), privilege_(std::move(privilege)) {}

auto storage_resolver::parse_root(const std::string& output) -> std::optional<std::string> {
    static const std::regex pattern(R"(Directory of (\S+))");
    for (const auto& line : split_lines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

auto storage_resolver::resolve_active_root() -> result<std::optional<std::string>> {
    if (!channel_) {
        return unexpected(error{error_code::not_initialized, "resolver has no channel"});
    }

    auto raised = channel_->acquire_privilege(privilege_);
    if (!raised) {
        return unexpected(raised.error());
    }

    auto output = channel_->send_command("dir | i Directory of", channel_->timeout_ops());
    if (!output) {
        return unexpected(output.error());
    }
    return parse_root(output.value());
}

// ============================================================================
// scp_capability_profile
// ============================================================================

scp_capability_profile::scp_capability_profile(std::optional<uint32_t> bulk_mode_window)
    : bulk_mode_window_(bulk_mode_window) {}

auto scp_capability_profile::inspect_command() const -> std::string {
    return "show running-config | include ^ip scp server enable|^ip ssh bulk-mode";
}

auto scp_capability_profile::parse_settings(const std::string& output) const
    -> std::vector<capability_setting> {
    static const std::regex bulk_mode(R"(^ip ssh bulk-mode(?:\s+(\d+))?$)");

    std::vector<capability_setting> settings;
    for (const auto& raw : split_lines(output)) {
        auto line = trim(raw);
        if (line == scp_server_key) {
            settings.push_back({scp_server_key, std::nullopt});
            continue;
        }
        std::smatch match;
        if (std::regex_match(line, match, bulk_mode)) {
            capability_setting setting{bulk_mode_key, std::nullopt};
            if (match[1].matched) {
                setting.value = match[1].str();
            }
            settings.push_back(std::move(setting));
        }
    }
    return settings;
}

auto scp_capability_profile::required_settings() const -> std::vector<capability_setting> {
    std::vector<capability_setting> required{{scp_server_key, std::nullopt}};
    if (bulk_mode_window_) {
        required.push_back({bulk_mode_key, std::to_string(*bulk_mode_window_)});
    }
    return required;
}

// ============================================================================
// platform preset
// ============================================================================

auto platform_config(const ssh_credentials& credentials) -> admin_channel_config {
    privilege_level exec;
    exec.name = "exec";
    exec.pattern = R"(^[\w.\-@/:]{1,63}>\s?$)";

    privilege_level privileged;
    privileged.name = "privilege_exec";
    privileged.pattern = R"(^[\w.\-@/:]{1,63}#\s?$)";
    privileged.previous = "exec";
    privileged.escalate = "enable";
    privileged.escalate_auth = true;
    privileged.escalate_prompt = R"(^(?:enable\s)?[Pp]assword:\s?$)";
    privileged.deescalate = "disable";

    privilege_level configuration;
    configuration.name = "configuration";
    configuration.pattern = R"(^[\w.\-@/:]{1,63}\(conf[\w.\-@/:+]{0,32}\)#\s?$)";
    configuration.previous = "privilege_exec";
    configuration.escalate = "configure terminal";
    configuration.deescalate = "end";

    return admin_channel_config_builder(credentials)
        .with_privilege_level(std::move(exec))
        .with_privilege_level(std::move(privileged))
        .with_privilege_level(std::move(configuration))
        .with_default_privilege("privilege_exec")
        .with_configuration_privilege("configuration")
        .with_failed_when_contains("% Ambiguous command")
        .with_failed_when_contains("% Incomplete command")
        .with_failed_when_contains("% Invalid input detected")
        .with_failed_when_contains("% Unknown command")
        .with_on_open_command("terminal length 0")
        .with_on_open_command("terminal width 512")
        .build();
}

auto make_orchestrator(std::shared_ptr<admin_channel> admin,
                       std::shared_ptr<bulk_copy_channel> bulk,
                       const ssh_credentials& credentials,
                       const platform_options& options) -> result<transfer_orchestrator> {
    if (!admin || !bulk) {
        return unexpected{error{error_code::invalid_configuration,
                               "IOS-XE orchestrator needs both channels"}};
    }

    auto dialect = std::make_shared<const file_dialect>();
    auto profile = std::make_shared<const scp_capability_profile>(options.bulk_mode_window);

    return transfer_orchestrator::builder()
        .with_local_probe(std::make_shared<local_file_probe>())
        .with_remote_probe(
            std::make_shared<remote_file_probe>(admin, dialect, options.hash_timeout))
        .with_negotiator(std::make_shared<capability_negotiator>(admin, profile))
        .with_engine(std::make_shared<transfer_engine>(bulk, admin, credentials, options.pool))
        .with_storage_root_resolver(std::make_shared<storage_resolver>(admin))
        .with_default_keep_alive(admin->timeout_ops())
        .build();
}

}  // namespace kcenon::device_transfer::cisco_iosxe
