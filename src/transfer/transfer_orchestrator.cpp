/**
 * @file transfer_orchestrator.cpp
 * @brief Implementation of transfer_orchestrator
 */

#include "kcenon/device_transfer/transfer/transfer_orchestrator.h"

#include <optional>

#include <kcenon/device_transfer/core/logging.h>

namespace kcenon::device_transfer {

struct transfer_orchestrator::impl {
    std::shared_ptr<file_probe> local_probe;
    std::shared_ptr<file_probe> remote_probe;
    std::shared_ptr<capability_negotiator> negotiator;
    std::shared_ptr<transfer_engine> engine;
    std::shared_ptr<storage_root_resolver> resolver;
    std::chrono::milliseconds default_keep_alive{30000};
    transfer_stage stage = transfer_stage::init;

    auto resolve_root(const transfer_options& options) -> result<std::string>;
    auto finish(transfer_outcome outcome) -> result<transfer_outcome> {
        stage = transfer_stage::done;
        return outcome;
    }
};

auto transfer_orchestrator::impl::resolve_root(const transfer_options& options)
    -> result<std::string> {
    if (!options.storage_root.empty()) {
        return options.storage_root;
    }
    if (!resolver) {
        return std::string{};
    }

    auto root = resolver->resolve_active_root();
    if (!root) {
        return unexpected(root.error());
    }
    if (!root.value()) {
        DT_LOG_WARN(log_category::orchestrator,
                    "device reported no active filesystem, using bare paths");
        return std::string{};
    }
    DT_LOG_DEBUG(log_category::orchestrator, "active device filesystem: " + *root.value());
    return *root.value();
}

// builder

transfer_orchestrator::builder::builder() = default;

auto transfer_orchestrator::builder::with_local_probe(std::shared_ptr<file_probe> probe)
    -> builder& {
    local_probe_ = std::move(probe);
    return *this;
}

auto transfer_orchestrator::builder::with_remote_probe(std::shared_ptr<file_probe> probe)
    -> builder& {
    remote_probe_ = std::move(probe);
    return *this;
}

auto transfer_orchestrator::builder::with_negotiator(
    std::shared_ptr<capability_negotiator> negotiator) -> builder& {
    negotiator_ = std::move(negotiator);
    return *this;
}

auto transfer_orchestrator::builder::with_engine(std::shared_ptr<transfer_engine> engine)
    -> builder& {
    engine_ = std::move(engine);
    return *this;
}

auto transfer_orchestrator::builder::with_storage_root_resolver(
    std::shared_ptr<storage_root_resolver> resolver) -> builder& {
    resolver_ = std::move(resolver);
    return *this;
}

auto transfer_orchestrator::builder::with_default_keep_alive(std::chrono::milliseconds interval)
    -> builder& {
    default_keep_alive_ = interval;
    return *this;
}

auto transfer_orchestrator::builder::build() -> result<transfer_orchestrator> {
    if (!local_probe_ || !remote_probe_) {
        return unexpected{error{error_code::invalid_configuration,
                               "Both local and remote probes are required"}};
    }
    if (!negotiator_) {
        return unexpected{error{error_code::invalid_configuration,
                               "A capability negotiator is required"}};
    }
    if (!engine_) {
        return unexpected{error{error_code::invalid_configuration,
                               "A transfer engine is required"}};
    }
    if (default_keep_alive_.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Keep-alive interval must not be negative"}};
    }

    auto pimpl = std::make_unique<impl>();
    pimpl->local_probe = std::move(local_probe_);
    pimpl->remote_probe = std::move(remote_probe_);
    pimpl->negotiator = std::move(negotiator_);
    pimpl->engine = std::move(engine_);
    pimpl->resolver = std::move(resolver_);
    pimpl->default_keep_alive = default_keep_alive_;
    return transfer_orchestrator{std::move(pimpl)};
}

// transfer_orchestrator

transfer_orchestrator::transfer_orchestrator(std::unique_ptr<impl> pimpl)
    : impl_(std::move(pimpl)) {
    get_logger().initialize();
}

transfer_orchestrator::transfer_orchestrator(transfer_orchestrator&&) noexcept = default;
auto transfer_orchestrator::operator=(transfer_orchestrator&&) noexcept
    -> transfer_orchestrator& = default;
transfer_orchestrator::~transfer_orchestrator() = default;

auto transfer_orchestrator::last_stage() const -> transfer_stage { return impl_->stage; }

auto transfer_orchestrator::transfer(transfer_direction direction,
                                     const std::string& source,
                                     const std::string& destination,
                                     const transfer_options& options)
    -> result<transfer_outcome> {
    impl_->stage = transfer_stage::init;
    transfer_outcome outcome;

    const auto target = (destination.empty() || destination == ".") ? source : destination;

    auto root = impl_->resolve_root(options);
    if (!root) {
        return unexpected(root.error());
    }
    const std::optional<std::string> device_context = root.value();

    const bool upload = direction == transfer_direction::upload;
    auto& src_probe = upload ? *impl_->local_probe : *impl_->remote_probe;
    auto& dst_probe = upload ? *impl_->remote_probe : *impl_->local_probe;
    const auto src_context = upload ? std::optional<std::string>{} : device_context;
    const auto dst_context = upload ? device_context : std::optional<std::string>{};

    transfer_log_context ctx;
    ctx.operation = to_string(direction);
    ctx.source = src_probe.locate(source, src_context);
    ctx.destination = dst_probe.locate(target, dst_context);

    impl_->stage = transfer_stage::pre_check;
    auto source_state = file_state::not_found();
    auto target_state = file_state::not_found();
    if (options.verify_hash) {
        auto probed_source = src_probe.probe(source, src_context);
        if (!probed_source) {
            return unexpected(probed_source.error());
        }
        source_state = probed_source.value();
        if (!source_state.exists()) {
            DT_LOG_WARN_CTX(log_category::orchestrator, "source file does not exist", ctx);
            return impl_->finish(outcome);
        }
        ctx.file_size = source_state.size();

        auto probed_target = dst_probe.probe(target, dst_context);
        if (!probed_target) {
            return unexpected(probed_target.error());
        }
        target_state = probed_target.value();
        if (target_state.exists()) {
            outcome.destination_existed = true;
        }
        if (target_state.same_content(source_state)) {
            outcome.verified = true;
            DT_LOG_INFO_CTX(log_category::orchestrator,
                            "destination already up to date, nothing to copy", ctx);
            return impl_->finish(outcome);
        }
    }

    if (target_state.exists() && !options.overwrite) {
        DT_LOG_WARN_CTX(log_category::orchestrator,
                        "destination differs and overwrite is disabled", ctx);
        return impl_->finish(outcome);
    }

    if (target_state.free_space() < source_state.size()) {
        DT_LOG_WARN_CTX(log_category::orchestrator,
                        "not enough free space at destination (" +
                            std::to_string(target_state.free_space()) + " bytes free)",
                        ctx);
        return impl_->finish(outcome);
    }

    impl_->stage = transfer_stage::capability_gate;
    auto decision = impl_->negotiator->ensure_capability(options.force);
    if (!decision) {
        return unexpected(decision.error());
    }
    if (!is_capable(decision.value())) {
        DT_LOG_ERROR_CTX(log_category::orchestrator,
                         std::string("bulk copy is not enabled on the device: ") +
                             to_string(decision.value()),
                         ctx);
        return impl_->finish(outcome);
    }

    impl_->stage = transfer_stage::copying;
    auto copied = impl_->engine->copy(direction, ctx.source, ctx.destination, options.progress,
                                      options.keep_alive_interval.value_or(
                                          impl_->default_keep_alive));
    if (copied) {
        outcome.transferred = true;
    }

    impl_->stage = transfer_stage::cleanup;
    if (options.cleanup && decision.value() == capability_decision::enabled &&
        impl_->negotiator->has_pending_rollback()) {
        auto restored = impl_->negotiator->cleanup();
        if (!restored) {
            DT_LOG_ERROR(log_category::orchestrator,
                         "configuration rollback failed: " + restored.error().message);
        }
    }

    if (!copied) {
        ctx.error_message = copied.error().message;
        DT_LOG_ERROR_CTX(log_category::orchestrator, "transfer failed", ctx);
        return unexpected(copied.error());
    }

    impl_->stage = transfer_stage::post_check;
    if (options.verify_hash) {
        auto probed_target = dst_probe.probe(target, dst_context);
        if (!probed_target) {
            return unexpected(probed_target.error());
        }
        if (probed_target.value().same_content(source_state)) {
            outcome.verified = true;
            DT_LOG_INFO_CTX(log_category::orchestrator, "transfer verified", ctx);
        } else {
            DT_LOG_WARN_CTX(log_category::orchestrator,
                            "destination failed hash verification", ctx);
        }
    }

    return impl_->finish(outcome);
}

}  // namespace kcenon::device_transfer
