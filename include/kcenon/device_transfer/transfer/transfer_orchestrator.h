/**
 * @file transfer_orchestrator.h
 * @brief Idempotent, verifiable single-file transfer
 */

#ifndef KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H
#define KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H

#include <chrono>
#include <memory>
#include <string>

#include "kcenon/device_transfer/capability/capability_negotiator.h"
#include "kcenon/device_transfer/channel/storage_root_resolver.h"
#include "kcenon/device_transfer/core/transfer_types.h"
#include "kcenon/device_transfer/core/types.h"
#include "kcenon/device_transfer/probe/file_probe.h"
#include "kcenon/device_transfer/transfer/transfer_engine.h"
#include "kcenon/device_transfer/transfer/transfer_options.h"

namespace kcenon::device_transfer {

/**
 * @brief Stages of one orchestrated run
 */
enum class transfer_stage {
    init,
    pre_check,
    capability_gate,
    copying,
    cleanup,
    post_check,
    done
};

[[nodiscard]] constexpr auto to_string(transfer_stage stage) -> const char* {
    switch (stage) {
        case transfer_stage::init: return "init";
        case transfer_stage::pre_check: return "pre_check";
        case transfer_stage::capability_gate: return "capability_gate";
        case transfer_stage::copying: return "copying";
        case transfer_stage::cleanup: return "cleanup";
        case transfer_stage::post_check: return "post_check";
        case transfer_stage::done: return "done";
        default: return "unknown";
    }
}

/**
 * @brief Composes probes, capability negotiation and the copy engine
 *
 * The orchestrator is the only component that decides whether a run
 * succeeded; callers look at transfer_outcome::verified. A missing
 * source, an up-to-date destination, a protected destination, too little
 * free space and a declined capability change are all regular outcomes.
 * The error result is reserved for channel failures and copy errors.
 *
 * @code
 * auto orchestrator = transfer_orchestrator::builder()
 *     .with_local_probe(std::make_shared<local_file_probe>())
 *     .with_remote_probe(remote_probe)
 *     .with_negotiator(negotiator)
 *     .with_engine(engine)
 *     .with_storage_root_resolver(resolver)
 *     .build();
 *
 * if (orchestrator.has_value()) {
 *     auto outcome = orchestrator.value().transfer(
 *         transfer_direction::upload, "image.bin", "", transfer_options{});
 * }
 * @endcode
 */
class transfer_orchestrator {
public:
    /**
     * @brief Builder for transfer_orchestrator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Probe for the operator's filesystem
         * @return Reference to builder for chaining
         */
        auto with_local_probe(std::shared_ptr<file_probe> probe) -> builder&;

        /**
         * @brief Probe for the device filesystem
         * @return Reference to builder for chaining
         */
        auto with_remote_probe(std::shared_ptr<file_probe> probe) -> builder&;

        auto with_negotiator(std::shared_ptr<capability_negotiator> negotiator) -> builder&;

        auto with_engine(std::shared_ptr<transfer_engine> engine) -> builder&;

        /**
         * @brief Resolver used when a run names no storage root (optional)
         * @return Reference to builder for chaining
         */
        auto with_storage_root_resolver(std::shared_ptr<storage_root_resolver> resolver)
            -> builder&;

        /**
         * @brief Keep-alive interval for runs that do not set one
         * @param interval Usually the admin channel's operation timeout
         * @return Reference to builder for chaining
         */
        auto with_default_keep_alive(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Build the orchestrator
         * @return Result containing the orchestrator or an error
         */
        [[nodiscard]] auto build() -> result<transfer_orchestrator>;

    private:
        std::shared_ptr<file_probe> local_probe_;
        std::shared_ptr<file_probe> remote_probe_;
        std::shared_ptr<capability_negotiator> negotiator_;
        std::shared_ptr<transfer_engine> engine_;
        std::shared_ptr<storage_root_resolver> resolver_;
        std::chrono::milliseconds default_keep_alive_{30000};
    };

    transfer_orchestrator(const transfer_orchestrator&) = delete;
    auto operator=(const transfer_orchestrator&) -> transfer_orchestrator& = delete;
    transfer_orchestrator(transfer_orchestrator&&) noexcept;
    auto operator=(transfer_orchestrator&&) noexcept -> transfer_orchestrator&;
    ~transfer_orchestrator();

    /**
     * @brief Transfer one file
     * @param direction upload (local -> device) or download (device -> local)
     * @param source Source file
     * @param destination Destination file; empty or "." reuses the source name
     * @param options Run options
     * @return Outcome of the run, or an error on channel or copy failure
     *
     * Capability changes made by this run are rolled back before a copy
     * error is returned.
     */
    [[nodiscard]] auto transfer(transfer_direction direction,
                                const std::string& source,
                                const std::string& destination,
                                const transfer_options& options) -> result<transfer_outcome>;

    /**
     * @brief Stage the last run stopped in
     */
    [[nodiscard]] auto last_stage() const -> transfer_stage;

private:
    struct impl;

    explicit transfer_orchestrator(std::unique_ptr<impl> pimpl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H
