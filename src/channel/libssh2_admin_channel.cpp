/**
 * @file libssh2_admin_channel.cpp
 * @brief Interactive shell implementation of admin_channel
 */

#include "kcenon/device_transfer/channel/libssh2_admin_channel.h"

#include <functional>
#include <mutex>
#include <regex>

#include <libssh2.h>

#include <kcenon/device_transfer/channel/prompt_matcher.h>
#include <kcenon/device_transfer/channel/ssh_session.h>
#include <kcenon/device_transfer/core/logging.h>

namespace kcenon::device_transfer {

namespace {

constexpr std::size_t read_chunk = 4096;
constexpr std::chrono::milliseconds poll_slice{200};

}  // namespace

struct libssh2_admin_channel::impl {
    admin_channel_config config;
    std::unique_ptr<ssh_session> session;
    LIBSSH2_CHANNEL* channel = nullptr;
    std::unique_ptr<prompt_matcher> matcher;
    std::string current_level;

    // Serializes every libssh2 call; write_raw comes from pool threads
    mutable std::mutex io_mutex;

    explicit impl(admin_channel_config cfg) : config(std::move(cfg)) {
        matcher = std::make_unique<prompt_matcher>(config);
    }

    ~impl() {
        if (channel) {
            std::lock_guard<std::mutex> lock(io_mutex);
            session->set_blocking(true);
            libssh2_channel_close(channel);
            libssh2_channel_free(channel);
            channel = nullptr;
        }
    }

    auto write_all(const char* data, std::size_t size, std::chrono::milliseconds timeout)
        -> result<void>;
    auto read_available(std::string& buffer) -> result<bool>;
    auto read_until(const std::function<bool(const std::string&)>& done,
                    std::chrono::milliseconds timeout) -> result<std::string>;
    auto read_until_prompt(std::chrono::milliseconds timeout) -> result<std::string>;
    auto discard_pending() -> void;
    auto run(const std::string& command, std::chrono::milliseconds timeout)
        -> result<std::string>;
    auto step(const privilege_step& s) -> result<void>;
    auto acquire(const std::string& target) -> result<void>;
};

auto libssh2_admin_channel::impl::write_all(const char* data, std::size_t size,
                                            std::chrono::milliseconds timeout) -> result<void> {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t written = 0;
    while (written < size) {
        ssize_t rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            rc = libssh2_channel_write(channel, data + written, size - written);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return unexpected(error{error_code::command_timeout, "write timed out"});
            }
            (void)session->wait_socket(poll_slice);
            continue;
        }
        if (rc < 0) {
            return unexpected(error{error_code::channel_closed,
                                    "write to shell failed: " + session->last_error()});
        }
        written += static_cast<std::size_t>(rc);
    }
    return {};
}

auto libssh2_admin_channel::impl::read_available(std::string& buffer) -> result<bool> {
    char chunk[read_chunk];
    bool got = false;
    for (;;) {
        ssize_t rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            rc = libssh2_channel_read(channel, chunk, sizeof(chunk));
        }
        if (rc > 0) {
            buffer.append(chunk, static_cast<std::size_t>(rc));
            got = true;
            continue;
        }
        if (rc == 0 || rc == LIBSSH2_ERROR_EAGAIN) {
            std::lock_guard<std::mutex> lock(io_mutex);
            if (libssh2_channel_eof(channel)) {
                return unexpected(error{error_code::channel_closed, "device closed the shell"});
            }
            return got;
        }
        return unexpected(error{error_code::channel_closed,
                                "read from shell failed: " + session->last_error()});
    }
}

auto libssh2_admin_channel::impl::read_until(const std::function<bool(const std::string&)>& done,
                                             std::chrono::milliseconds timeout)
    -> result<std::string> {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string buffer;
    for (;;) {
        auto got = read_available(buffer);
        if (!got) {
            return unexpected(got.error());
        }
        if (done(buffer)) {
            return buffer;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return unexpected(error{error_code::command_timeout,
                                    "timed out waiting for the device prompt"});
        }
        if (!got.value()) {
            (void)session->wait_socket(poll_slice);
        }
    }
}

auto libssh2_admin_channel::impl::read_until_prompt(std::chrono::milliseconds timeout)
    -> result<std::string> {
    auto output = read_until(
        [this](const std::string& buffer) { return matcher->prompt_level(buffer).has_value(); },
        timeout);
    if (output) {
        current_level = *matcher->prompt_level(output.value());
    }
    return output;
}

auto libssh2_admin_channel::impl::discard_pending() -> void {
    // Prompt redraws triggered by keep-alive form-feeds
    std::string stale;
    if (auto r = read_available(stale); r && !stale.empty()) {
        DT_LOG_TRACE(log_category::channel,
                     "discarded " + std::to_string(stale.size()) + " pending bytes");
    }
}

auto libssh2_admin_channel::impl::run(const std::string& command,
                                      std::chrono::milliseconds timeout)
    -> result<std::string> {
    discard_pending();
    auto line = command + "\n";
    if (auto w = write_all(line.data(), line.size(), timeout); !w) {
        return unexpected(w.error());
    }
    auto raw = read_until(
        [this, &command](const std::string& buffer) {
            return matcher->command_completed(buffer, command);
        },
        timeout);
    if (!raw) {
        return unexpected(raw.error());
    }
    current_level = *matcher->prompt_level(raw.value());
    return prompt_matcher::clean_output(raw.value(), command);
}

auto libssh2_admin_channel::impl::step(const privilege_step& s) -> result<void> {
    const auto& command = s.escalate ? s.level->escalate : s.level->deescalate;
    if (command.empty()) {
        return unexpected(error{error_code::privilege_escalation_failed,
                                "no command to " + std::string(s.escalate ? "enter " : "leave ") +
                                    s.level->name});
    }

    if (!s.escalate || !s.level->escalate_auth) {
        auto r = run(command, config.timeout_ops);
        return r ? result<void>{} : result<void>{unexpected(r.error())};
    }

    discard_pending();
    auto line = command + "\n";
    if (auto w = write_all(line.data(), line.size(), config.timeout_ops); !w) {
        return unexpected(w.error());
    }

    std::regex secret_prompt(s.level->escalate_prompt);
    auto raw = read_until(
        [&](const std::string& buffer) {
            return prompt_matcher::last_line_matches(buffer, secret_prompt) ||
                   matcher->prompt_level(buffer).has_value();
        },
        config.timeout_ops);
    if (!raw) {
        return unexpected(raw.error());
    }

    if (prompt_matcher::last_line_matches(raw.value(), secret_prompt)) {
        auto secret = config.credentials.enable_secret.value_or(config.credentials.password) + "\n";
        if (auto w = write_all(secret.data(), secret.size(), config.timeout_ops); !w) {
            return unexpected(w.error());
        }
        auto after = read_until_prompt(config.timeout_ops);
        if (!after) {
            return unexpected(after.error());
        }
    } else {
        current_level = *matcher->prompt_level(raw.value());
    }
    return {};
}

auto libssh2_admin_channel::impl::acquire(const std::string& target) -> result<void> {
    if (current_level == target) {
        return {};
    }

    auto steps = matcher->path(current_level, target);
    if (!steps) {
        return unexpected(error{error_code::privilege_escalation_failed,
                                "no path from " + current_level + " to " + target});
    }
    for (const auto& s : *steps) {
        if (auto r = step(s); !r) {
            return r;
        }
        const auto& expected = s.escalate ? s.level->name : s.level->previous;
        if (current_level != expected) {
            return unexpected(error{error_code::privilege_escalation_failed,
                                    "device is at " + current_level + " instead of " + expected});
        }
    }

    DT_LOG_DEBUG(log_category::channel, "privilege level is now " + target);
    return {};
}

// ============================================================================
// libssh2_admin_channel
// ============================================================================

libssh2_admin_channel::libssh2_admin_channel(std::unique_ptr<impl> pimpl)
    : impl_(std::move(pimpl)) {}

libssh2_admin_channel::~libssh2_admin_channel() {
    if (impl_ && impl_->channel) {
        for (const auto& command : impl_->config.on_close_commands) {
            if (auto r = impl_->run(command, impl_->config.timeout_ops); !r) {
                DT_LOG_WARN(log_category::channel,
                            "close command '" + command + "' failed: " + r.error().message);
                break;
            }
        }
    }
}

auto libssh2_admin_channel::open(admin_channel_config config)
    -> result<std::shared_ptr<libssh2_admin_channel>> {
    if (config.privilege_levels.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "at least one privilege level is required"});
    }

    auto pimpl = std::make_unique<impl>(std::move(config));
    auto& cfg = pimpl->config;

    auto session = ssh_session::connect(cfg.credentials);
    if (!session) {
        return unexpected(session.error());
    }
    pimpl->session = std::move(session.value());
    auto* native = pimpl->session->native();

    pimpl->channel = libssh2_channel_open_session(native);
    if (!pimpl->channel) {
        return unexpected(error{error_code::channel_open_failed,
                                "cannot open session channel: " + pimpl->session->last_error()});
    }
    if (libssh2_channel_request_pty_ex(pimpl->channel, cfg.terminal_type.c_str(),
                                       static_cast<unsigned int>(cfg.terminal_type.size()),
                                       nullptr, 0, cfg.terminal_width, cfg.terminal_height, 0,
                                       0) != 0) {
        return unexpected(error{error_code::channel_open_failed,
                                "pty request refused: " + pimpl->session->last_error()});
    }
    if (libssh2_channel_shell(pimpl->channel) != 0) {
        return unexpected(error{error_code::channel_open_failed,
                                "shell request refused: " + pimpl->session->last_error()});
    }

    pimpl->session->set_blocking(false);

    // Banner and first prompt
    if (auto w = pimpl->write_all("\n", 1, cfg.timeout_ops); !w) {
        return unexpected(w.error());
    }
    auto first = pimpl->read_until_prompt(cfg.timeout_ops);
    if (!first) {
        return unexpected(error{error_code::prompt_not_found,
                                "no prompt after login: " + first.error().message});
    }

    for (const auto& command : cfg.on_open_commands) {
        if (auto r = pimpl->run(command, cfg.timeout_ops); !r) {
            return unexpected(r.error());
        }
    }

    if (auto r = pimpl->acquire(cfg.default_privilege); !r) {
        return unexpected(r.error());
    }

    DT_LOG_INFO(log_category::channel, "admin session open at " + pimpl->current_level);
    return std::shared_ptr<libssh2_admin_channel>(new libssh2_admin_channel(std::move(pimpl)));
}

auto libssh2_admin_channel::send_command(const std::string& command,
                                         std::chrono::milliseconds timeout)
    -> result<std::string> {
    if (auto r = impl_->acquire(impl_->config.default_privilege); !r) {
        return unexpected(r.error());
    }
    DT_LOG_DEBUG(log_category::channel, "sending: " + command);
    return impl_->run(command, timeout);
}

auto libssh2_admin_channel::send_commands(const std::vector<std::string>& commands,
                                          std::chrono::milliseconds timeout)
    -> result<std::vector<std::string>> {
    std::vector<std::string> outputs;
    outputs.reserve(commands.size());
    for (const auto& command : commands) {
        auto output = send_command(command, timeout);
        if (!output) {
            return unexpected(output.error());
        }
        outputs.push_back(std::move(output.value()));
    }
    return outputs;
}

auto libssh2_admin_channel::send_config(const std::vector<std::string>& directives)
    -> result<config_response> {
    if (auto r = impl_->acquire(impl_->config.configuration_privilege); !r) {
        return unexpected(r.error());
    }

    config_response response;
    for (const auto& directive : directives) {
        DT_LOG_DEBUG(log_category::channel, "configuring: " + directive);
        auto output = impl_->run(directive, impl_->config.timeout_ops);
        if (!output) {
            return unexpected(output.error());
        }
        bool rejected = impl_->matcher->is_rejected(output.value());
        response.responses.push_back({directive, output.value(), rejected});
        if (rejected) {
            DT_LOG_WARN(log_category::channel, "device rejected: " + directive);
            break;
        }
    }

    if (auto r = impl_->acquire(impl_->config.default_privilege); !r) {
        return unexpected(r.error());
    }
    return response;
}

auto libssh2_admin_channel::acquire_privilege(const std::string& level) -> result<void> {
    if (!impl_->config.find_level(level)) {
        return unexpected(error{error_code::invalid_operation, "unknown privilege level " + level});
    }
    return impl_->acquire(level);
}

auto libssh2_admin_channel::write_raw(std::span<const std::byte> bytes) -> result<void> {
    return impl_->write_all(reinterpret_cast<const char*>(bytes.data()), bytes.size(),
                            impl_->config.timeout_ops);
}

auto libssh2_admin_channel::timeout_ops() const -> std::chrono::milliseconds {
    return impl_->config.timeout_ops;
}

auto libssh2_admin_channel::current_privilege() const -> std::string {
    return impl_->current_level;
}

auto libssh2_admin_channel::config() const -> const admin_channel_config& {
    return impl_->config;
}

}  // namespace kcenon::device_transfer
