/**
 * @file capability_negotiator.h
 * @brief Detects, enables and rolls back bulk-copy capability on a device
 */

#ifndef KCENON_DEVICE_TRANSFER_CAPABILITY_CAPABILITY_NEGOTIATOR_H
#define KCENON_DEVICE_TRANSFER_CAPABILITY_CAPABILITY_NEGOTIATOR_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/device_transfer/capability/capability_profile.h"
#include "kcenon/device_transfer/channel/admin_channel.h"
#include "kcenon/device_transfer/core/types.h"

namespace kcenon::device_transfer {

/**
 * @brief How far the negotiator may go to make the device capable
 */
enum class force_policy {
    skip_check,       ///< do not inspect; caller knows the device state
    check_only,       ///< inspect, never change configuration
    check_and_apply   ///< inspect and apply missing settings
};

[[nodiscard]] constexpr auto to_string(force_policy policy) -> const char* {
    switch (policy) {
        case force_policy::skip_check: return "skip_check";
        case force_policy::check_only: return "check_only";
        case force_policy::check_and_apply: return "check_and_apply";
        default: return "unknown";
    }
}

/**
 * @brief Result of a negotiation
 */
enum class capability_decision {
    not_checked,      ///< skip_check: state unknown, transfer proceeds
    already_capable,  ///< nothing missing, nothing changed
    declined,         ///< settings missing and policy forbids changes
    apply_failed,     ///< device rejected a directive; accepted ones reverted
    enabled           ///< settings applied, rollback pending
};

[[nodiscard]] constexpr auto to_string(capability_decision decision) -> const char* {
    switch (decision) {
        case capability_decision::not_checked: return "not checked";
        case capability_decision::already_capable: return "already capable";
        case capability_decision::declined: return "declined";
        case capability_decision::apply_failed: return "apply failed";
        case capability_decision::enabled: return "enabled";
        default: return "unknown";
    }
}

/**
 * @brief Whether a transfer may proceed after this decision
 */
[[nodiscard]] constexpr auto is_capable(capability_decision decision) -> bool {
    return decision != capability_decision::declined &&
           decision != capability_decision::apply_failed;
}

/**
 * @brief Negotiator state machine
 */
enum class negotiator_state {
    unchecked,
    checked,
    applied,
    declined
};

[[nodiscard]] constexpr auto to_string(negotiator_state state) -> const char* {
    switch (state) {
        case negotiator_state::unchecked: return "unchecked";
        case negotiator_state::checked: return "checked";
        case negotiator_state::applied: return "applied";
        case negotiator_state::declined: return "declined";
        default: return "unknown";
    }
}

/**
 * @brief A missing setting with the directives to apply and undo it
 */
struct capability_change {
    std::string directive;
    std::string rollback;
};

/**
 * @brief Changes applied during one negotiation
 *
 * `rollback_directives` is already in replay order (reverse of
 * application order).
 */
struct capability_state {
    std::vector<std::string> applied_changes;
    std::vector<std::string> rollback_directives;

    [[nodiscard]] auto empty() const -> bool { return applied_changes.empty(); }
};

/**
 * @brief Makes a device accept bulk copies for the duration of one run
 *
 * unchecked -> checked -> (applied | declined). Configuration is only ever
 * written under force_policy::check_and_apply, and every applied setting
 * gets an inverse computed from the value that was inspected before it,
 * so cleanup() restores a previous numeric value rather than merely
 * removing the setting.
 *
 * @code
 * capability_negotiator negotiator(channel, std::make_shared<cisco_iosxe::scp_capability_profile>());
 * auto decision = negotiator.ensure_capability(force_policy::check_and_apply);
 * if (decision && is_capable(decision.value())) {
 *     // ... copy ...
 *     (void)negotiator.cleanup();
 * }
 * @endcode
 */
class capability_negotiator {
public:
    capability_negotiator(std::shared_ptr<admin_channel> channel,
                          std::shared_ptr<const capability_profile> profile);

    /**
     * @brief Inspect and, when allowed, enable bulk-copy capability
     *
     * Starts a new negotiation: changes recorded by an earlier call are
     * forgotten, never rolled back by this one.
     * @return Decision, or an error when the channel fails
     */
    [[nodiscard]] auto ensure_capability(force_policy policy) -> result<capability_decision>;

    /**
     * @brief Replay the recorded rollback directives once
     *
     * No-op when nothing was applied or cleanup already ran.
     */
    [[nodiscard]] auto cleanup() -> result<void>;

    [[nodiscard]] auto state() const -> negotiator_state { return state_; }

    [[nodiscard]] auto has_pending_rollback() const -> bool {
        return pending_.has_value() && !pending_->empty();
    }

    /**
     * @brief Changes recorded by the last successful apply, if any
     */
    [[nodiscard]] auto pending() const -> const std::optional<capability_state>& {
        return pending_;
    }

    /**
     * @brief Missing settings and their computed inverses
     * @param profile Device syntax
     * @param required Settings the transfer needs
     * @param present Settings currently configured
     */
    [[nodiscard]] static auto compute_delta(const capability_profile& profile,
                                            const std::vector<capability_setting>& required,
                                            const std::vector<capability_setting>& present)
        -> std::vector<capability_change>;

private:
    auto revert_partial(const std::vector<capability_change>& delta,
                        const config_response& response) -> void;

    std::shared_ptr<admin_channel> channel_;
    std::shared_ptr<const capability_profile> profile_;
    negotiator_state state_ = negotiator_state::unchecked;
    std::optional<capability_state> pending_;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CAPABILITY_CAPABILITY_NEGOTIATOR_H
