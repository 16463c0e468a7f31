/**
 * @file test_fixtures.h
 * @brief Simulated IOS-XE device and fixtures for integration tests
 */

#ifndef KCENON_DEVICE_TRANSFER_TEST_FIXTURES_H
#define KCENON_DEVICE_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/device_transfer/device_transfer.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace kcenon::device_transfer::test {

/**
 * @brief In-memory IOS-XE device: a flash: filesystem and the two settings
 * the SCP capability profile looks at
 */
class simulated_device {
public:
    uint64_t flash_capacity = 64 * 1024 * 1024;

    std::map<std::string, std::vector<char>> flash;
    bool scp_enabled = false;
    std::optional<std::string> bulk_mode;
    std::vector<std::string> config_log;
    int raw_writes = 0;

    auto used() const -> uint64_t {
        uint64_t total = 0;
        for (const auto& [name, data] : flash) {
            total += data.size();
        }
        return total;
    }

    auto free_line() const -> std::string {
        return std::to_string(flash_capacity) + " bytes total (" +
               std::to_string(flash_capacity - used()) + " bytes free)\r\n";
    }

    static auto strip_fs(const std::string& path) -> std::string {
        auto pos = path.find(':');
        auto name = pos == std::string::npos ? path : path.substr(pos + 1);
        while (!name.empty() && name.front() == '/') {
            name.erase(name.begin());
        }
        return name;
    }

    auto md5_of(const std::vector<char>& data) const -> std::string {
        return checksum::md5(std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size()));
    }

    auto execute(const std::string& command) -> std::string {
        const std::string verify = "verify /md5 ";
        const std::string dir = "dir ";
        if (command.rfind(verify, 0) == 0) {
            auto path = command.substr(verify.size());
            auto it = flash.find(strip_fs(path));
            if (it == flash.end()) {
                return "%Error verifying " + path + " (No such file or directory)\r\n";
            }
            return "verify /md5 (" + path + ") = " + md5_of(it->second) + "\r\n";
        }
        if (command == "dir | i Directory of") {
            return "Directory of flash:/\r\n";
        }
        const std::string space_filter = " | include bytes total";
        if (command.size() > space_filter.size() &&
            command.compare(command.size() - space_filter.size(), space_filter.size(),
                            space_filter) == 0) {
            return free_line();
        }
        if (command.rfind(dir, 0) == 0) {
            auto path = command.substr(dir.size());
            auto name = strip_fs(path);
            auto it = flash.find(name);
            if (it == flash.end()) {
                return "%Error opening " + path + " (No such file or directory)\r\n";
            }
            return "Directory of flash:/" + name + "\r\n\r\n   12  -rw-    " +
                   std::to_string(it->second.size()) + "  Jan 1 2025 00:00:00 +00:00  " +
                   name + "\r\n\r\n" + free_line();
        }
        if (command.rfind("show running-config", 0) == 0) {
            std::string out;
            if (scp_enabled) out += "ip scp server enable\r\n";
            if (bulk_mode) out += "ip ssh bulk-mode " + *bulk_mode + "\r\n";
            return out;
        }
        return "% Invalid input detected at '^' marker.\r\n";
    }

    auto configure(const std::string& directive) -> std::string {
        config_log.push_back(directive);
        const std::string bulk = "ip ssh bulk-mode ";
        if (directive == "ip scp server enable") {
            scp_enabled = true;
        } else if (directive == "no ip scp server enable") {
            scp_enabled = false;
        } else if (directive.rfind(bulk, 0) == 0) {
            bulk_mode = directive.substr(bulk.size());
        } else if (directive == "no ip ssh bulk-mode") {
            bulk_mode.reset();
        } else {
            return "% Invalid input detected at '^' marker.";
        }
        return {};
    }
};

/**
 * @brief Admin channel talking to a simulated_device
 */
class simulated_admin_channel : public admin_channel {
public:
    explicit simulated_admin_channel(simulated_device& device) : device_(device) {}

    auto send_command(const std::string& command, std::chrono::milliseconds)
        -> result<std::string> override {
        std::lock_guard<std::mutex> lock(mutex_);
        return device_.execute(command);
    }

    auto send_commands(const std::vector<std::string>& commands, std::chrono::milliseconds t)
        -> result<std::vector<std::string>> override {
        std::vector<std::string> outputs;
        for (const auto& c : commands) {
            outputs.push_back(send_command(c, t).value());
        }
        return outputs;
    }

    auto send_config(const std::vector<std::string>& directives)
        -> result<config_response> override {
        std::lock_guard<std::mutex> lock(mutex_);
        config_response response;
        for (const auto& d : directives) {
            auto output = device_.configure(d);
            bool rejected = !output.empty();
            response.responses.push_back({d, output, rejected});
            if (rejected) break;
        }
        return response;
    }

    auto acquire_privilege(const std::string&) -> result<void> override { return {}; }

    auto write_raw(std::span<const std::byte>) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++device_.raw_writes;
        return {};
    }

    auto timeout_ops() const -> std::chrono::milliseconds override { return timeout_; }

    std::chrono::milliseconds timeout_{0};

private:
    simulated_device& device_;
    std::mutex mutex_;
};

class simulated_copy_session : public bulk_copy_session {
public:
    explicit simulated_copy_session(simulated_device& device) : device_(device) {}

    auto send_file(const std::filesystem::path& local_path, const std::string& remote_spec,
                   std::size_t block_size, const block_progress_callback& on_progress)
        -> result<void> override {
        if (!device_.scp_enabled) {
            return unexpected(error{error_code::copy_session_failed, "scp refused"});
        }
        std::ifstream file(local_path, std::ios::binary);
        std::vector<char> data((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
        report(data.size(), block_size, on_progress);
        device_.flash[simulated_device::strip_fs(remote_spec)] = std::move(data);
        return {};
    }

    auto fetch_file(const std::string& remote_spec, const std::filesystem::path& local_path,
                    std::size_t block_size, const block_progress_callback& on_progress)
        -> result<void> override {
        if (!device_.scp_enabled) {
            return unexpected(error{error_code::copy_session_failed, "scp refused"});
        }
        auto it = device_.flash.find(simulated_device::strip_fs(remote_spec));
        if (it == device_.flash.end()) {
            return unexpected(error{error_code::copy_receive_failed, "no such file"});
        }
        std::ofstream file(local_path, std::ios::binary | std::ios::trunc);
        file.write(it->second.data(), static_cast<std::streamsize>(it->second.size()));
        report(it->second.size(), block_size, on_progress);
        return {};
    }

private:
    static void report(uint64_t total, std::size_t block_size,
                       const block_progress_callback& on_progress) {
        for (uint64_t done = 0; done < total;) {
            done = std::min<uint64_t>(done + block_size, total);
            if (on_progress) on_progress(copy_progress{done, total});
        }
    }

    simulated_device& device_;
};

class simulated_bulk_copy_channel : public bulk_copy_channel {
public:
    explicit simulated_bulk_copy_channel(simulated_device& device) : device_(device) {}

    auto open(const ssh_credentials&) -> result<std::unique_ptr<bulk_copy_session>> override {
        return std::unique_ptr<bulk_copy_session>(
            std::make_unique<simulated_copy_session>(device_));
    }

private:
    simulated_device& device_;
};

/**
 * @brief Temporary directory plus an IOS-XE orchestrator wired to the
 * simulated device
 */
class DeviceFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("device_transfer_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);

        admin_ = std::make_shared<simulated_admin_channel>(device_);
        bulk_ = std::make_shared<simulated_bulk_copy_channel>(device_);

        ssh_credentials credentials;
        credentials.host = "192.0.2.1";
        credentials.username = "netops";
        auto built = cisco_iosxe::make_orchestrator(admin_, bulk_, credentials);
        ASSERT_TRUE(built.has_value()) << built.error().message;
        orchestrator_ = std::make_unique<transfer_orchestrator>(std::move(built.value()));
    }

    void TearDown() override {
        orchestrator_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size, unsigned seed = 42)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);
        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }
        return path;
    }

    auto read_file(const std::filesystem::path& path) -> std::vector<char> {
        std::ifstream file(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    }

    simulated_device device_;
    std::shared_ptr<simulated_admin_channel> admin_;
    std::shared_ptr<simulated_bulk_copy_channel> bulk_;
    std::unique_ptr<transfer_orchestrator> orchestrator_;
    std::filesystem::path test_dir_;
};

}  // namespace kcenon::device_transfer::test

#endif  // KCENON_DEVICE_TRANSFER_TEST_FIXTURES_H
