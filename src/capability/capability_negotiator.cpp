/**
 * @file capability_negotiator.cpp
 * @brief Implementation of the bulk-copy capability negotiator
 */

#include "kcenon/device_transfer/capability/capability_negotiator.h"

#include <algorithm>

#include <kcenon/device_transfer/core/logging.h>

namespace kcenon::device_transfer {

namespace {

auto find_setting(const std::vector<capability_setting>& settings, const std::string& key)
    -> const capability_setting* {
    auto it = std::find_if(settings.begin(), settings.end(),
                           [&key](const capability_setting& s) { return s.key == key; });
    return it == settings.end() ? nullptr : &*it;
}

}  // namespace

capability_negotiator::capability_negotiator(std::shared_ptr<admin_channel> channel,
                                             std::shared_ptr<const capability_profile> profile)
    : channel_(std::move(channel)), profile_(std::move(profile)) {}

auto capability_negotiator::compute_delta(const capability_profile& profile,
                                          const std::vector<capability_setting>& required,
                                          const std::vector<capability_setting>& present)
    -> std::vector<capability_change> {
    std::vector<capability_change> delta;
    for (const auto& want : required) {
        const auto* have = find_setting(present, want.key);
        if (have && have->value == want.value) {
            continue;
        }
        capability_change change;
        change.directive = profile.render(want);
        change.rollback = have ? profile.render(*have) : profile.render_removal(want);
        delta.push_back(std::move(change));
    }
    return delta;
}

auto capability_negotiator::ensure_capability(force_policy policy)
    -> result<capability_decision> {
    if (!channel_ || !profile_) {
        return unexpected(error{error_code::not_initialized, "negotiator has no channel"});
    }

    if (has_pending_rollback()) {
        DT_LOG_DEBUG(log_category::capability,
                     "keeping " + std::to_string(pending_->rollback_directives.size()) +
                         " change(s) left by a previous run");
    }
    pending_.reset();
    state_ = negotiator_state::unchecked;

    if (policy == force_policy::skip_check) {
        DT_LOG_DEBUG(log_category::capability, "capability check skipped");
        return capability_decision::not_checked;
    }

    auto output = channel_->send_command(profile_->inspect_command(), channel_->timeout_ops());
    if (!output) {
        return unexpected(output.error());
    }
    state_ = negotiator_state::checked;

    auto delta = compute_delta(*profile_, profile_->required_settings(),
                               profile_->parse_settings(output.value()));
    if (delta.empty()) {
        DT_LOG_DEBUG(log_category::capability, "device already accepts bulk copies");
        return capability_decision::already_capable;
    }

    if (policy == force_policy::check_only) {
        state_ = negotiator_state::declined;
        DT_LOG_WARN(log_category::capability,
                    std::to_string(delta.size()) +
                        " setting(s) missing for bulk copy and changes are not allowed");
        return capability_decision::declined;
    }

    std::vector<std::string> directives;
    directives.reserve(delta.size());
    for (const auto& change : delta) {
        directives.push_back(change.directive);
    }

    auto response = channel_->send_config(directives);
    if (!response) {
        return unexpected(response.error());
    }

    if (response.value().failed()) {
        revert_partial(delta, response.value());
        state_ = negotiator_state::declined;
        return capability_decision::apply_failed;
    }

    capability_state applied;
    applied.applied_changes = directives;
    for (auto it = delta.rbegin(); it != delta.rend(); ++it) {
        applied.rollback_directives.push_back(it->rollback);
    }
    pending_ = std::move(applied);
    state_ = negotiator_state::applied;

    DT_LOG_INFO(log_category::capability,
                "enabled bulk copy with " + std::to_string(directives.size()) + " directive(s)");
    return capability_decision::enabled;
}

auto capability_negotiator::revert_partial(const std::vector<capability_change>& delta,
                                           const config_response& response) -> void {
    std::vector<std::string> rollback;
    for (const auto& r : response.responses) {
        if (r.failed) {
            DT_LOG_ERROR(log_category::capability,
                         "device rejected '" + r.directive + "': " + r.output);
            break;
        }
    }

    auto accepted = response.accepted();
    for (auto it = accepted.rbegin(); it != accepted.rend(); ++it) {
        auto change = std::find_if(delta.begin(), delta.end(),
                                   [&](const capability_change& c) { return c.directive == *it; });
        if (change != delta.end()) {
            rollback.push_back(change->rollback);
        }
    }
    if (rollback.empty()) {
        return;
    }

    auto reverted = channel_->send_config(rollback);
    if (!reverted) {
        DT_LOG_ERROR(log_category::capability,
                     "revert after failed apply lost the channel: " + reverted.error().message);
    } else if (reverted.value().failed()) {
        DT_LOG_ERROR(log_category::capability, "revert after failed apply was rejected");
    }
}

auto capability_negotiator::cleanup() -> result<void> {
    if (!has_pending_rollback()) {
        return {};
    }

    auto rollback = std::move(pending_->rollback_directives);
    pending_.reset();

    auto response = channel_->send_config(rollback);
    if (!response) {
        return unexpected(response.error());
    }
    if (response.value().failed()) {
        for (const auto& r : response.value().responses) {
            if (r.failed) {
                return unexpected(error{error_code::capability_rollback_failed,
                                        "device rejected '" + r.directive + "'"});
            }
        }
    }

    DT_LOG_INFO(log_category::capability,
                "restored configuration with " + std::to_string(rollback.size()) +
                    " directive(s)");
    return {};
}

}  // namespace kcenon::device_transfer
