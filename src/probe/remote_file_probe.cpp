/**
 * @file remote_file_probe.cpp
 * @brief Implementation of the device file probe
 */

#include "kcenon/device_transfer/probe/remote_file_probe.h"

#include <kcenon/device_transfer/core/logging.h>

namespace kcenon::device_transfer {

remote_file_probe::remote_file_probe(std::shared_ptr<admin_channel> channel,
                                     std::shared_ptr<const remote_file_dialect> dialect,
                                     std::chrono::milliseconds hash_timeout)
    : channel_(std::move(channel)),
      dialect_(std::move(dialect)),
      hash_timeout_(hash_timeout) {}

auto remote_file_probe::locate(const std::string& location,
                               const std::optional<std::string>& storage_context) const
    -> std::string {
    if (!dialect_) {
        return storage_context.value_or("") + location;
    }
    return dialect_->join(storage_context.value_or(""), location);
}

auto remote_file_probe::probe(const std::string& location,
                              const std::optional<std::string>& storage_context)
    -> result<file_state> {
    if (!channel_ || !dialect_) {
        return unexpected(error{error_code::not_initialized, "remote probe has no channel"});
    }

    auto path = locate(location, storage_context);

    auto hash_output = channel_->send_command(dialect_->hash_command(path), hash_timeout_);
    if (!hash_output) {
        return unexpected(hash_output.error());
    }

    auto listing_output =
        channel_->send_command(dialect_->listing_command(path), channel_->timeout_ops());
    if (!listing_output) {
        return unexpected(listing_output.error());
    }

    auto free_space = dialect_->parse_free_space(listing_output.value());
    if (!free_space) {
        if (auto command = dialect_->free_space_command(storage_context.value_or(""))) {
            auto space_output = channel_->send_command(*command, channel_->timeout_ops());
            if (!space_output) {
                return unexpected(space_output.error());
            }
            free_space = dialect_->parse_free_space(space_output.value());
        }
    }

    auto hash = dialect_->parse_hash(hash_output.value());
    if (!hash || hash->empty()) {
        DT_LOG_DEBUG(log_category::probe, path + " has no hash on the device");
        return file_state::not_found(free_space.value_or(0));
    }

    auto size = dialect_->parse_size(listing_output.value(), location);
    if (!size) {
        DT_LOG_WARN(log_category::probe,
                    "no size for " + path + " in listing, free-space check treats it as 0 bytes");
    }

    return file_state{*hash, size.value_or(0), free_space.value_or(0)};
}

}  // namespace kcenon::device_transfer
