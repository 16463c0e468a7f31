/**
 * @file ssh_config.h
 * @brief Connection and session configuration types
 *
 * This file defines the credentials shared by the administrative and the
 * bulk-copy sessions, and the prompt / privilege description an
 * interactive administrative session needs.
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_SSH_CONFIG_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_SSH_CONFIG_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::device_transfer {

/**
 * @brief Credentials and endpoint of a device
 *
 * Both the administrative session and every bulk-copy session are opened
 * from the same credentials.
 */
struct ssh_credentials {
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::string password;

    /// Secret sent when escalating privilege (defaults to password if unset)
    std::optional<std::string> enable_secret;

    /// Verify the host key against known_hosts_file
    bool strict_host_key = false;
    std::string known_hosts_file;

    /// TCP connect + SSH handshake timeout
    std::chrono::milliseconds connect_timeout{15000};
};

/**
 * @brief One privilege level of an interactive CLI
 */
struct privilege_level {
    /// Level name, e.g. "exec", "privilege_exec", "configuration"
    std::string name;

    /// Regex matching the prompt line of this level
    std::string pattern;

    /// Level this one is entered from (empty for the base level)
    std::string previous;

    /// Command entering this level from `previous`
    std::string escalate;

    /// Whether escalation asks for a secret
    bool escalate_auth = false;

    /// Regex matching the secret prompt during escalation
    std::string escalate_prompt;

    /// Command returning from this level to `previous`
    std::string deescalate;
};

/**
 * @brief Administrative session configuration
 */
struct admin_channel_config {
    ssh_credentials credentials;

    /// Timeout for ordinary commands
    std::chrono::milliseconds timeout_ops{30000};

    /// PTY geometry requested for the shell
    std::string terminal_type = "vt100";
    int terminal_width = 511;
    int terminal_height = 24;

    /// Ordered privilege levels, base level first
    std::vector<privilege_level> privilege_levels;

    /// Level commands are sent from unless told otherwise
    std::string default_privilege = "privilege_exec";

    /// Level configuration directives are applied in
    std::string configuration_privilege = "configuration";

    /// Output fragments that mark a command or directive as rejected
    std::vector<std::string> failed_when_contains;

    /// Commands run once after the shell is opened
    std::vector<std::string> on_open_commands;

    /// Commands run before the session is closed
    std::vector<std::string> on_close_commands;

    /**
     * @brief Combined regex matching any configured prompt
     */
    [[nodiscard]] auto combined_prompt_pattern() const -> std::string {
        std::string combined;
        for (const auto& level : privilege_levels) {
            if (!combined.empty()) combined += "|";
            combined += "(?:" + level.pattern + ")";
        }
        return combined;
    }

    [[nodiscard]] auto find_level(const std::string& name) const -> const privilege_level* {
        for (const auto& level : privilege_levels) {
            if (level.name == name) return &level;
        }
        return nullptr;
    }
};

/**
 * @brief Builder for admin_channel_config
 *
 * @code
 * auto config = admin_channel_config_builder(credentials)
 *     .with_timeout_ops(std::chrono::seconds{60})
 *     .with_privilege_level({"exec", R"(^\S+>\s?$)"})
 *     .with_failed_when_contains("% Invalid input detected")
 *     .build();
 * @endcode
 */
class admin_channel_config_builder {
public:
    explicit admin_channel_config_builder(ssh_credentials credentials) {
        config_.credentials = std::move(credentials);
    }

    explicit admin_channel_config_builder(admin_channel_config base)
        : config_(std::move(base)) {}

    auto with_timeout_ops(std::chrono::milliseconds timeout) -> admin_channel_config_builder& {
        config_.timeout_ops = timeout;
        return *this;
    }

    auto with_terminal(std::string type, int width, int height) -> admin_channel_config_builder& {
        config_.terminal_type = std::move(type);
        config_.terminal_width = width;
        config_.terminal_height = height;
        return *this;
    }

    auto with_privilege_level(privilege_level level) -> admin_channel_config_builder& {
        config_.privilege_levels.push_back(std::move(level));
        return *this;
    }

    auto with_default_privilege(std::string name) -> admin_channel_config_builder& {
        config_.default_privilege = std::move(name);
        return *this;
    }

    auto with_configuration_privilege(std::string name) -> admin_channel_config_builder& {
        config_.configuration_privilege = std::move(name);
        return *this;
    }

    auto with_failed_when_contains(std::string marker) -> admin_channel_config_builder& {
        config_.failed_when_contains.push_back(std::move(marker));
        return *this;
    }

    auto with_on_open_command(std::string command) -> admin_channel_config_builder& {
        config_.on_open_commands.push_back(std::move(command));
        return *this;
    }

    auto with_on_close_command(std::string command) -> admin_channel_config_builder& {
        config_.on_close_commands.push_back(std::move(command));
        return *this;
    }

    [[nodiscard]] auto build() const -> admin_channel_config { return config_; }

private:
    admin_channel_config config_;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_SSH_CONFIG_H
