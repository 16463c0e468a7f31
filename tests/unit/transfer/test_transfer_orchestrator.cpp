/**
 * @file test_transfer_orchestrator.cpp
 * @brief Unit tests for transfer_orchestrator
 */

#include <gtest/gtest.h>

#include <kcenon/device_transfer/transfer/transfer_orchestrator.h>

#include "../fakes.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::device_transfer::test {

using namespace std::chrono_literals;

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        admin_ = std::make_shared<fake_admin_channel>();
        bulk_ = std::make_shared<fake_bulk_copy_channel>();
        local_ = std::make_shared<fake_file_probe>("local");
        remote_ = std::make_shared<fake_file_probe>("device");
        resolver_ = std::make_shared<fake_storage_root_resolver>();
        profile_ = std::make_shared<fake_capability_profile>();
        profile_->required = {{"enable-bulk-copy", std::nullopt}};
        admin_->responses["show capability"] = "enable-bulk-copy\n";

        ssh_credentials credentials;
        credentials.host = "192.0.2.10";
        engine_ = std::make_shared<transfer_engine>(
            bulk_, admin_, credentials, std::make_shared<adapters::async_task_pool>());

        auto built = transfer_orchestrator::builder()
                         .with_local_probe(local_)
                         .with_remote_probe(remote_)
                         .with_negotiator(std::make_shared<capability_negotiator>(admin_, profile_))
                         .with_engine(engine_)
                         .with_storage_root_resolver(resolver_)
                         .with_default_keep_alive(0ms)
                         .build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        orchestrator_ = std::make_unique<transfer_orchestrator>(std::move(built.value()));

        options_.storage_root = "flash:";
    }

    // Copying makes the destination look like the source to the next probe
    void mirror_on_copy(fake_file_probe& destination, const std::string& name,
                        const file_state& state) {
        bulk_->plan.on_complete = [&destination, name, state](const std::string&,
                                                              const std::string&) {
            destination.states.insert_or_assign(name, state);
        };
    }

    auto upload(const std::string& source, const std::string& destination)
        -> result<transfer_outcome> {
        return orchestrator_->transfer(transfer_direction::upload, source, destination,
                                       options_);
    }

    auto engine_calls() const -> std::size_t { return bulk_->copies.size(); }

    const file_state image_{hex_digest('a'), 4096, 1ULL << 30};
    const file_state other_image_{hex_digest('b'), 2048, 1ULL << 30};

    std::shared_ptr<fake_admin_channel> admin_;
    std::shared_ptr<fake_bulk_copy_channel> bulk_;
    std::shared_ptr<fake_file_probe> local_;
    std::shared_ptr<fake_file_probe> remote_;
    std::shared_ptr<fake_storage_root_resolver> resolver_;
    std::shared_ptr<fake_capability_profile> profile_;
    std::shared_ptr<transfer_engine> engine_;
    std::unique_ptr<transfer_orchestrator> orchestrator_;
    transfer_options options_;
};

// =============================================================================
// Outcome scenarios
// =============================================================================

TEST_F(TransferOrchestratorTest, FreshUploadIsCopiedAndVerified) {
    local_->states.insert_or_assign("/tmp/image.bin", image_);
    mirror_on_copy(*remote_, "/tmp/image.bin", image_);

    auto outcome = upload("/tmp/image.bin", "");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, true, true}));
    EXPECT_EQ(engine_calls(), 1u);
    EXPECT_EQ(orchestrator_->last_stage(), transfer_stage::done);
}

TEST_F(TransferOrchestratorTest, IdenticalDestinationNeedsNoCopy) {
    local_->states.insert_or_assign("image.bin", image_);
    remote_->states.insert_or_assign("image.bin", image_);

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{true, false, true}));
    EXPECT_EQ(engine_calls(), 0u);
    EXPECT_EQ(bulk_->open_count, 0);
    EXPECT_TRUE(admin_->commands.empty());
}

TEST_F(TransferOrchestratorTest, RepeatedTransferIsIdempotent) {
    local_->states.insert_or_assign("image.bin", image_);
    mirror_on_copy(*remote_, "image.bin", image_);

    auto first = upload("image.bin", "image.bin");
    auto second = upload("image.bin", "image.bin");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), (transfer_outcome{false, true, true}));
    EXPECT_EQ(second.value(), (transfer_outcome{true, false, true}));
    EXPECT_EQ(engine_calls(), 1u);
}

TEST_F(TransferOrchestratorTest, DifferentDestinationWithoutOverwriteIsLeftAlone) {
    local_->states.insert_or_assign("image.bin", image_);
    remote_->states.insert_or_assign("image.bin", other_image_);

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{true, false, false}));
    EXPECT_EQ(engine_calls(), 0u);
    EXPECT_TRUE(admin_->commands.empty());
}

TEST_F(TransferOrchestratorTest, DifferentDestinationWithOverwriteIsReplaced) {
    local_->states.insert_or_assign("image.bin", image_);
    remote_->states.insert_or_assign("image.bin", other_image_);
    mirror_on_copy(*remote_, "image.bin", image_);
    options_.overwrite = true;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{true, true, true}));
}

TEST_F(TransferOrchestratorTest, DeclinedCapabilityAbortsWithoutWrites) {
    local_->states.insert_or_assign("image.bin", image_);
    admin_->responses["show capability"] = "";
    options_.force = force_policy::check_only;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, false, false}));
    EXPECT_TRUE(admin_->config_batches.empty());
    EXPECT_EQ(engine_calls(), 0u);
}

TEST_F(TransferOrchestratorTest, CopyFailureStillRollsBackOnce) {
    local_->states.insert_or_assign("image.bin", image_);
    admin_->responses["show capability"] = "";
    options_.force = force_policy::check_and_apply;
    bulk_->plan.fail_after_blocks = 1;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::copy_send_failed);
    ASSERT_EQ(admin_->config_batches.size(), 2u);
    EXPECT_EQ(admin_->config_batches[0], (std::vector<std::string>{"enable-bulk-copy"}));
    EXPECT_EQ(admin_->config_batches[1], (std::vector<std::string>{"no enable-bulk-copy"}));
    EXPECT_EQ(orchestrator_->last_stage(), transfer_stage::cleanup);
}

// =============================================================================
// Pre-check gates
// =============================================================================

TEST_F(TransferOrchestratorTest, MissingSourceShortCircuits) {
    auto outcome = upload("missing.bin", "missing.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, false, false}));
    EXPECT_EQ(remote_->probe_count, 0);
    EXPECT_TRUE(admin_->commands.empty());
    EXPECT_EQ(engine_calls(), 0u);
}

TEST_F(TransferOrchestratorTest, InsufficientSpaceAbortsBeforeNegotiation) {
    local_->states.insert_or_assign("image.bin", image_);
    remote_->states.insert_or_assign("image.bin", file_state::not_found(1024));

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, false, false}));
    EXPECT_TRUE(admin_->commands.empty());
    EXPECT_EQ(engine_calls(), 0u);
}

TEST_F(TransferOrchestratorTest, ProbeFailurePropagates) {
    local_->failure = error{error_code::file_access_denied, "permission denied"};

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::file_access_denied);
    EXPECT_EQ(orchestrator_->last_stage(), transfer_stage::pre_check);
}

TEST_F(TransferOrchestratorTest, WithoutHashVerificationCopiesBlindly) {
    remote_->states.insert_or_assign("image.bin", other_image_);
    options_.verify_hash = false;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, true, false}));
    EXPECT_EQ(local_->probe_count, 0);
    EXPECT_EQ(remote_->probe_count, 0);
    EXPECT_EQ(engine_calls(), 1u);
}

TEST_F(TransferOrchestratorTest, PostCheckMismatchIsNotVerified) {
    local_->states.insert_or_assign("image.bin", image_);

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, true, false}));
    EXPECT_EQ(remote_->probe_count, 2);
}

// =============================================================================
// Paths and storage root
// =============================================================================

TEST_F(TransferOrchestratorTest, DotDestinationMeansSourceName) {
    local_->states.insert_or_assign("image.bin", image_);

    auto outcome = upload("image.bin", ".");

    ASSERT_TRUE(outcome.has_value());
    ASSERT_EQ(bulk_->copies.size(), 1u);
    EXPECT_EQ(bulk_->copies[0], "send:image.bin->flash:image.bin");
}

TEST_F(TransferOrchestratorTest, ExplicitStorageRootSkipsResolver) {
    local_->states.insert_or_assign("image.bin", image_);

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(resolver_->calls, 0);
    ASSERT_FALSE(remote_->contexts.empty());
    EXPECT_EQ(remote_->contexts[0].value_or(""), "flash:");
    EXPECT_FALSE(local_->contexts[0].has_value());
}

TEST_F(TransferOrchestratorTest, EmptyStorageRootIsResolvedFromDevice) {
    local_->states.insert_or_assign("image.bin", image_);
    resolver_->root = "bootflash:";
    options_.storage_root.clear();

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(resolver_->calls, 1);
    ASSERT_EQ(bulk_->copies.size(), 1u);
    EXPECT_EQ(bulk_->copies[0], "send:image.bin->bootflash:image.bin");
}

TEST_F(TransferOrchestratorTest, ResolverFailurePropagates) {
    resolver_->failure = error{error_code::privilege_escalation_failed, "bad enable secret"};
    options_.storage_root.clear();

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::privilege_escalation_failed);
}

TEST_F(TransferOrchestratorTest, DownloadProbesDeviceAsSource) {
    remote_->states.insert_or_assign("image.bin", image_);
    mirror_on_copy(*local_, "copy.bin", image_);

    auto outcome = orchestrator_->transfer(transfer_direction::download, "image.bin",
                                           "copy.bin", options_);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, true, true}));
    ASSERT_EQ(bulk_->copies.size(), 1u);
    EXPECT_EQ(bulk_->copies[0], "fetch:flash:image.bin->copy.bin");
    EXPECT_EQ(remote_->contexts[0].value_or(""), "flash:");
    EXPECT_FALSE(local_->contexts[0].has_value());
}

// =============================================================================
// Cleanup
// =============================================================================

TEST_F(TransferOrchestratorTest, AppliedChangesAreRolledBack) {
    local_->states.insert_or_assign("image.bin", image_);
    mirror_on_copy(*remote_, "image.bin", image_);
    admin_->responses["show capability"] = "";
    options_.force = force_policy::check_and_apply;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, true, true}));
    EXPECT_EQ(admin_->all_directives(),
              (std::vector<std::string>{"enable-bulk-copy", "no enable-bulk-copy"}));
}

TEST_F(TransferOrchestratorTest, CleanupDisabledLeavesChangesApplied) {
    local_->states.insert_or_assign("image.bin", image_);
    admin_->responses["show capability"] = "";
    options_.force = force_policy::check_and_apply;
    options_.cleanup = false;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(admin_->config_batches.size(), 1u);
}

TEST_F(TransferOrchestratorTest, KeptChangesSurviveLaterRun) {
    local_->states.insert_or_assign("image.bin", image_);
    admin_->responses["show capability"] = "";
    options_.force = force_policy::check_and_apply;
    options_.cleanup = false;
    ASSERT_TRUE(upload("image.bin", "image.bin").has_value());

    admin_->responses["show capability"] = "enable-bulk-copy\n";
    options_ = transfer_options{};
    options_.storage_root = "flash:";
    local_->states.insert_or_assign("other.bin", other_image_);
    mirror_on_copy(*remote_, "other.bin", other_image_);

    auto outcome = upload("other.bin", "other.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, true, true}));
    EXPECT_EQ(admin_->config_batches.size(), 1u);
    EXPECT_EQ(admin_->all_directives(), (std::vector<std::string>{"enable-bulk-copy"}));
}

TEST_F(TransferOrchestratorTest, RollbackFailureDoesNotChangeOutcome) {
    local_->states.insert_or_assign("image.bin", image_);
    mirror_on_copy(*remote_, "image.bin", image_);
    admin_->responses["show capability"] = "";
    admin_->rejected_directives.insert("no enable-bulk-copy");
    options_.force = force_policy::check_and_apply;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), (transfer_outcome{false, true, true}));
}

TEST_F(TransferOrchestratorTest, KeepAliveOptionOverridesDefault) {
    local_->states.insert_or_assign("image.bin", image_);
    bulk_->plan.total_bytes = 6 * transfer_engine::block_size;
    bulk_->plan.block_delay = 30ms;
    options_.keep_alive_interval = 50ms;

    auto outcome = upload("image.bin", "image.bin");

    ASSERT_TRUE(outcome.has_value());
    EXPECT_GE(admin_->raw_writes.load(), 1);
}

// =============================================================================
// Builder
// =============================================================================

TEST(TransferOrchestratorBuilderTest, RequiresProbes) {
    auto built = transfer_orchestrator::builder().build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST(TransferOrchestratorBuilderTest, RequiresEngine) {
    auto admin = std::make_shared<fake_admin_channel>();
    auto built = transfer_orchestrator::builder()
                     .with_local_probe(std::make_shared<fake_file_probe>())
                     .with_remote_probe(std::make_shared<fake_file_probe>())
                     .with_negotiator(std::make_shared<capability_negotiator>(
                         admin, std::make_shared<fake_capability_profile>()))
                     .build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST(TransferOrchestratorBuilderTest, RejectsNegativeKeepAlive) {
    auto admin = std::make_shared<fake_admin_channel>();
    auto built = transfer_orchestrator::builder()
                     .with_local_probe(std::make_shared<fake_file_probe>())
                     .with_remote_probe(std::make_shared<fake_file_probe>())
                     .with_negotiator(std::make_shared<capability_negotiator>(
                         admin, std::make_shared<fake_capability_profile>()))
                     .with_engine(std::make_shared<transfer_engine>(
                         std::make_shared<fake_bulk_copy_channel>(), admin, ssh_credentials{}))
                     .with_default_keep_alive(-1ms)
                     .build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

}  // namespace kcenon::device_transfer::test
