/**
 * @file test_prompt_matcher.cpp
 * @brief Unit tests for prompt detection, output cleanup and privilege paths
 */

#include <gtest/gtest.h>

#include <kcenon/device_transfer/channel/prompt_matcher.h>
#include <kcenon/device_transfer/devices/cisco_iosxe.h>

#include <memory>
#include <string>

namespace kcenon::device_transfer::test {

class PromptMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ssh_credentials credentials;
        credentials.host = "192.0.2.10";
        config_ = cisco_iosxe::platform_config(credentials);
        matcher_ = std::make_unique<prompt_matcher>(config_);
    }

    admin_channel_config config_;
    std::unique_ptr<prompt_matcher> matcher_;
};

// =============================================================================
// Prompt detection
// =============================================================================

TEST_F(PromptMatcherTest, DetectsEachLevel) {
    EXPECT_EQ(matcher_->prompt_level("\r\nedge-rtr01>"), "exec");
    EXPECT_EQ(matcher_->prompt_level("\r\nedge-rtr01#"), "privilege_exec");
    EXPECT_EQ(matcher_->prompt_level("\r\nedge-rtr01(config)#"), "configuration");
    EXPECT_EQ(matcher_->prompt_level("\r\nedge-rtr01(config-line)#"), "configuration");
}

TEST_F(PromptMatcherTest, OnlyLastLineCounts) {
    EXPECT_FALSE(matcher_->prompt_level("edge-rtr01#\r\nBuilding configuration...").has_value());
    EXPECT_EQ(matcher_->prompt_level("output\r\nedge-rtr01#\r\n"), "privilege_exec");
}

TEST_F(PromptMatcherTest, NoPromptInEmptyBuffer) {
    EXPECT_FALSE(matcher_->prompt_level("").has_value());
    EXPECT_FALSE(matcher_->prompt_level("\r\n\r\n").has_value());
}

TEST_F(PromptMatcherTest, LastLineMatchesPasswordPrompt) {
    const std::regex password(config_.find_level("privilege_exec")->escalate_prompt);

    EXPECT_TRUE(prompt_matcher::last_line_matches("enable\r\nPassword: ", password));
    EXPECT_FALSE(prompt_matcher::last_line_matches("Password: wrong\r\nedge-rtr01>", password));
}

// =============================================================================
// Command completion
// =============================================================================

TEST_F(PromptMatcherTest, CommandCompletesAfterEchoAndPrompt) {
    EXPECT_TRUE(matcher_->command_completed(
        "verify /md5 flash:/image.bin\r\nverify /md5 (flash:/image.bin) = "
        "0123456789abcdef0123456789abcdef\r\nedge-rtr01#",
        "verify /md5 flash:/image.bin"));
}

TEST_F(PromptMatcherTest, StalePromptBeforeEchoDoesNotComplete) {
    const std::string command = "verify /md5 flash:/image.bin";

    EXPECT_FALSE(matcher_->command_completed("\r\nedge-rtr01#", command));
    EXPECT_FALSE(matcher_->command_completed("\r\nedge-rtr01#" + command, command));
    EXPECT_FALSE(matcher_->command_completed("\r\nedge-rtr01#" + command + "\r\n", command));
    EXPECT_TRUE(matcher_->command_completed(
        "\r\nedge-rtr01#" + command + "\r\nverify /md5 (flash:/image.bin) = "
        "0123456789abcdef0123456789abcdef\r\nedge-rtr01#",
        command));
}

TEST_F(PromptMatcherTest, SilentCommandCompletesOnPromptAfterEcho) {
    EXPECT_TRUE(
        matcher_->command_completed("terminal length 0\r\nedge-rtr01#", "terminal length 0"));
}

// =============================================================================
// Output cleanup
// =============================================================================

TEST_F(PromptMatcherTest, CleanOutputDropsEchoAndPrompt) {
    auto cleaned = prompt_matcher::clean_output(
        "dir flash:\r\nDirectory of flash:/\r\n\r\n1000 bytes total (800 bytes free)\r\n"
        "edge-rtr01#",
        "dir flash:");

    EXPECT_EQ(cleaned, "Directory of flash:/\n\n1000 bytes total (800 bytes free)");
}

TEST_F(PromptMatcherTest, CleanOutputOfSilentCommandIsEmpty) {
    EXPECT_EQ(prompt_matcher::clean_output("terminal length 0\r\nedge-rtr01#",
                                           "terminal length 0"),
              "");
}

TEST_F(PromptMatcherTest, CleanOutputDropsStalePromptBeforeEcho) {
    auto cleaned = prompt_matcher::clean_output(
        "\r\nedge-rtr01#\r\nedge-rtr01#verify /md5 flash:/image.bin\r\n"
        "verify /md5 (flash:/image.bin) = 0123456789abcdef0123456789abcdef\r\nedge-rtr01#",
        "verify /md5 flash:/image.bin");

    EXPECT_EQ(cleaned, "verify /md5 (flash:/image.bin) = 0123456789abcdef0123456789abcdef");
}

TEST_F(PromptMatcherTest, CleanOutputKeepsFirstLineWithoutEcho) {
    EXPECT_EQ(prompt_matcher::clean_output("result\r\nedge-rtr01#", "show clock"), "result");
}

// =============================================================================
// Rejection markers
// =============================================================================

TEST_F(PromptMatcherTest, RejectionMarkers) {
    EXPECT_TRUE(matcher_->is_rejected("              ^\r\n% Invalid input detected at '^' marker."));
    EXPECT_TRUE(matcher_->is_rejected("% Incomplete command."));
    EXPECT_FALSE(matcher_->is_rejected("ip scp server enable"));
}

// =============================================================================
// Privilege paths
// =============================================================================

TEST_F(PromptMatcherTest, EscalatePathFromExecToConfiguration) {
    auto steps = matcher_->path("exec", "configuration");

    ASSERT_TRUE(steps.has_value());
    ASSERT_EQ(steps->size(), 2u);
    EXPECT_EQ((*steps)[0].level->name, "privilege_exec");
    EXPECT_TRUE((*steps)[0].escalate);
    EXPECT_EQ((*steps)[1].level->name, "configuration");
    EXPECT_TRUE((*steps)[1].escalate);
}

TEST_F(PromptMatcherTest, DeescalatePathFromConfiguration) {
    auto steps = matcher_->path("configuration", "privilege_exec");

    ASSERT_TRUE(steps.has_value());
    ASSERT_EQ(steps->size(), 1u);
    EXPECT_EQ((*steps)[0].level->name, "configuration");
    EXPECT_FALSE((*steps)[0].escalate);
    EXPECT_EQ((*steps)[0].level->deescalate, "end");
}

TEST_F(PromptMatcherTest, SameLevelNeedsNoSteps) {
    auto steps = matcher_->path("privilege_exec", "privilege_exec");

    ASSERT_TRUE(steps.has_value());
    EXPECT_TRUE(steps->empty());
}

TEST_F(PromptMatcherTest, UnknownLevelHasNoPath) {
    EXPECT_FALSE(matcher_->path("exec", "shell").has_value());
    EXPECT_FALSE(matcher_->path("rommon", "exec").has_value());
}

}  // namespace kcenon::device_transfer::test
