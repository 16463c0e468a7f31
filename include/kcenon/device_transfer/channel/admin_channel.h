/**
 * @file admin_channel.h
 * @brief Command/response channel to the managed device
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_ADMIN_CHANNEL_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_ADMIN_CHANNEL_H

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "kcenon/device_transfer/core/types.h"

namespace kcenon::device_transfer {

/**
 * @brief Outcome of a single configuration directive
 */
struct directive_response {
    std::string directive;
    std::string output;
    bool failed = false;
};

/**
 * @brief Outcome of a configuration write
 *
 * Directives are applied in order and the write stops at the first
 * rejected directive, so `responses` holds the accepted prefix followed
 * by at most one failed entry.
 */
struct config_response {
    std::vector<directive_response> responses;

    [[nodiscard]] auto failed() const -> bool {
        for (const auto& r : responses) {
            if (r.failed) return true;
        }
        return false;
    }

    /**
     * @brief Directives the device accepted, in application order
     */
    [[nodiscard]] auto accepted() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& r : responses) {
            if (!r.failed) out.push_back(r.directive);
        }
        return out;
    }
};

/**
 * @brief Administrative (CLI) session to a device
 *
 * Connection setup, authentication, prompt handling and privilege
 * escalation are owned by the implementation. One instance belongs to one
 * transfer run at a time; only write_raw() may be called from a thread
 * other than the owner, for keep-alive signalling.
 */
class admin_channel {
public:
    virtual ~admin_channel() = default;

    /**
     * @brief Send one command and return its output without echo and prompt
     * @param command Command text
     * @param timeout Maximum time to wait for the prompt to return
     */
    [[nodiscard]] virtual auto send_command(const std::string& command,
                                            std::chrono::milliseconds timeout)
        -> result<std::string> = 0;

    /**
     * @brief Send several commands, one output per command
     */
    [[nodiscard]] virtual auto send_commands(const std::vector<std::string>& commands,
                                             std::chrono::milliseconds timeout)
        -> result<std::vector<std::string>> = 0;

    /**
     * @brief Apply configuration directives in configuration mode
     *
     * A directive rejected by the device is reported in the response, not
     * as an error; the error path is reserved for channel failures.
     */
    [[nodiscard]] virtual auto send_config(const std::vector<std::string>& directives)
        -> result<config_response> = 0;

    /**
     * @brief Move the session to the named privilege level
     */
    [[nodiscard]] virtual auto acquire_privilege(const std::string& level) -> result<void> = 0;

    /**
     * @brief Write raw bytes to the session, bypassing prompt handling
     */
    [[nodiscard]] virtual auto write_raw(std::span<const std::byte> bytes) -> result<void> = 0;

    /**
     * @brief Default timeout for ordinary commands
     */
    [[nodiscard]] virtual auto timeout_ops() const -> std::chrono::milliseconds = 0;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_ADMIN_CHANNEL_H
