/**
 * @file fakes.h
 * @brief Hand-written fakes of the channel, probe and resolver interfaces
 */

#ifndef KCENON_DEVICE_TRANSFER_TESTS_UNIT_FAKES_H
#define KCENON_DEVICE_TRANSFER_TESTS_UNIT_FAKES_H

#include <kcenon/device_transfer/capability/capability_profile.h>
#include <kcenon/device_transfer/channel/admin_channel.h>
#include <kcenon/device_transfer/channel/bulk_copy_channel.h>
#include <kcenon/device_transfer/channel/storage_root_resolver.h>
#include <kcenon/device_transfer/probe/file_probe.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::device_transfer::test {

/**
 * @brief Admin channel answering from a script and recording every call
 *
 * `journal` holds one entry per operation in call order:
 * "cmd:<text>", "config:<directive>", "priv:<level>" or "raw".
 */
class fake_admin_channel : public admin_channel {
public:
    std::map<std::string, std::string> responses;
    std::set<std::string> rejected_directives;
    std::optional<error> command_failure;
    std::optional<error> config_failure;
    std::chrono::milliseconds ops_timeout{30000};

    std::vector<std::string> commands;
    std::vector<std::chrono::milliseconds> command_timeouts;
    std::vector<std::vector<std::string>> config_batches;
    std::vector<std::string> journal;
    std::atomic<int> raw_writes{0};
    std::vector<std::byte> raw_bytes;

    auto send_command(const std::string& command, std::chrono::milliseconds timeout)
        -> result<std::string> override {
        std::lock_guard<std::mutex> lock(mutex_);
        commands.push_back(command);
        command_timeouts.push_back(timeout);
        journal.push_back("cmd:" + command);
        if (command_failure) {
            return unexpected(*command_failure);
        }
        auto it = responses.find(command);
        return it == responses.end() ? std::string{} : it->second;
    }

    auto send_commands(const std::vector<std::string>& batch, std::chrono::milliseconds timeout)
        -> result<std::vector<std::string>> override {
        std::vector<std::string> outputs;
        for (const auto& command : batch) {
            auto output = send_command(command, timeout);
            if (!output) {
                return unexpected(output.error());
            }
            outputs.push_back(output.value());
        }
        return outputs;
    }

    auto send_config(const std::vector<std::string>& directives)
        -> result<config_response> override {
        std::lock_guard<std::mutex> lock(mutex_);
        config_batches.push_back(directives);
        if (config_failure) {
            return unexpected(*config_failure);
        }
        config_response response;
        for (const auto& directive : directives) {
            journal.push_back("config:" + directive);
            bool rejected = rejected_directives.count(directive) > 0;
            response.responses.push_back(
                {directive, rejected ? "% Invalid input detected at '^' marker." : "", rejected});
            if (rejected) {
                break;
            }
        }
        return response;
    }

    auto acquire_privilege(const std::string& level) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        journal.push_back("priv:" + level);
        return {};
    }

    auto write_raw(std::span<const std::byte> bytes) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        journal.push_back("raw");
        raw_bytes.insert(raw_bytes.end(), bytes.begin(), bytes.end());
        ++raw_writes;
        return {};
    }

    auto timeout_ops() const -> std::chrono::milliseconds override { return ops_timeout; }

    /// Every directive written, across all configuration batches
    auto all_directives() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& batch : config_batches) {
            out.insert(out.end(), batch.begin(), batch.end());
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
};

/**
 * @brief Copy session that pretends to move `total_bytes` in blocks
 */
struct fake_copy_plan {
    uint64_t total_bytes = 3 * 65536;
    std::chrono::milliseconds block_delay{0};
    std::optional<std::size_t> fail_after_blocks;
    std::function<void(const std::string&, const std::string&)> on_complete;
};

class fake_copy_session : public bulk_copy_session {
public:
    fake_copy_session(const fake_copy_plan& plan, std::vector<std::string>& log,
                      std::vector<std::size_t>& block_sizes)
        : plan_(plan), log_(log), block_sizes_(block_sizes) {}

    auto send_file(const std::filesystem::path& local_path, const std::string& remote_spec,
                   std::size_t block_size, const block_progress_callback& on_progress)
        -> result<void> override {
        log_.push_back("send:" + local_path.string() + "->" + remote_spec);
        return stream(local_path.string(), remote_spec, block_size, on_progress,
                      error_code::copy_send_failed);
    }

    auto fetch_file(const std::string& remote_spec, const std::filesystem::path& local_path,
                    std::size_t block_size, const block_progress_callback& on_progress)
        -> result<void> override {
        log_.push_back("fetch:" + remote_spec + "->" + local_path.string());
        return stream(remote_spec, local_path.string(), block_size, on_progress,
                      error_code::copy_receive_failed);
    }

private:
    auto stream(const std::string& from, const std::string& to, std::size_t block_size,
                const block_progress_callback& on_progress, error_code failure)
        -> result<void> {
        block_sizes_.push_back(block_size);
        uint64_t copied = 0;
        std::size_t blocks = 0;
        while (copied < plan_.total_bytes) {
            if (plan_.fail_after_blocks && blocks == *plan_.fail_after_blocks) {
                return unexpected(error{failure, "connection reset by peer"});
            }
            if (plan_.block_delay.count() > 0) {
                std::this_thread::sleep_for(plan_.block_delay);
            }
            copied = std::min<uint64_t>(copied + block_size, plan_.total_bytes);
            ++blocks;
            if (on_progress) {
                on_progress(copy_progress{copied, plan_.total_bytes});
            }
        }
        if (plan_.on_complete) {
            plan_.on_complete(from, to);
        }
        return {};
    }

    const fake_copy_plan& plan_;
    std::vector<std::string>& log_;
    std::vector<std::size_t>& block_sizes_;
};

class fake_bulk_copy_channel : public bulk_copy_channel {
public:
    fake_copy_plan plan;
    std::optional<error> open_failure;

    int open_count = 0;
    std::vector<ssh_credentials> opened_with;
    std::vector<std::string> copies;
    std::vector<std::size_t> block_sizes;

    auto open(const ssh_credentials& credentials)
        -> result<std::unique_ptr<bulk_copy_session>> override {
        ++open_count;
        opened_with.push_back(credentials);
        if (open_failure) {
            return unexpected(*open_failure);
        }
        return std::unique_ptr<bulk_copy_session>(
            std::make_unique<fake_copy_session>(plan, copies, block_sizes));
    }
};

/**
 * @brief Probe returning preset states per location
 */
class fake_file_probe : public file_probe {
public:
    explicit fake_file_probe(std::string side_name = "fake", uint64_t default_free = 1ULL << 30)
        : side_name_(std::move(side_name)), default_free_(default_free) {}

    std::map<std::string, file_state> states;
    std::optional<error> failure;
    std::string prefix_on_locate;

    int probe_count = 0;
    std::vector<std::optional<std::string>> contexts;

    auto probe(const std::string& location, const std::optional<std::string>& storage_context)
        -> result<file_state> override {
        ++probe_count;
        contexts.push_back(storage_context);
        if (failure) {
            return unexpected(*failure);
        }
        auto it = states.find(location);
        return it == states.end() ? file_state::not_found(default_free_) : it->second;
    }

    auto locate(const std::string& location,
                const std::optional<std::string>& storage_context) const
        -> std::string override {
        return storage_context.value_or("") + location;
    }

    auto side() const -> std::string_view override { return side_name_; }

private:
    std::string side_name_;
    uint64_t default_free_;
};

class fake_storage_root_resolver : public storage_root_resolver {
public:
    std::optional<std::string> root = "flash:";
    std::optional<error> failure;
    int calls = 0;

    auto resolve_active_root() -> result<std::optional<std::string>> override {
        ++calls;
        if (failure) {
            return unexpected(*failure);
        }
        return root;
    }
};

/**
 * @brief Profile reading "key[ value]" lines from the inspect command
 */
class fake_capability_profile : public capability_profile {
public:
    std::vector<capability_setting> required;

    auto inspect_command() const -> std::string override { return "show capability"; }

    auto parse_settings(const std::string& output) const
        -> std::vector<capability_setting> override {
        std::vector<capability_setting> settings;
        std::size_t start = 0;
        while (start < output.size()) {
            auto end = output.find('\n', start);
            auto line = output.substr(start, end == std::string::npos ? std::string::npos
                                                                      : end - start);
            if (!line.empty()) {
                auto space = line.find(' ');
                if (space == std::string::npos) {
                    settings.push_back({line, std::nullopt});
                } else {
                    settings.push_back({line.substr(0, space), line.substr(space + 1)});
                }
            }
            if (end == std::string::npos) break;
            start = end + 1;
        }
        return settings;
    }

    auto required_settings() const -> std::vector<capability_setting> override {
        return required;
    }
};

inline auto hex_digest(char c) -> std::string { return std::string(32, c); }

}  // namespace kcenon::device_transfer::test

#endif  // KCENON_DEVICE_TRANSFER_TESTS_UNIT_FAKES_H
