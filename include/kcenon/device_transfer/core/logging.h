// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/device_transfer/config/feature_flags.h"

#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::device_transfer {

/**
 * @brief Log categories for the device transfer library
 */
struct log_category {
    static constexpr std::string_view orchestrator = "device_transfer.orchestrator";
    static constexpr std::string_view probe = "device_transfer.probe";
    static constexpr std::string_view capability = "device_transfer.capability";
    static constexpr std::string_view engine = "device_transfer.engine";
    static constexpr std::string_view channel = "device_transfer.channel";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_hosts = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Masks device addresses and file paths in log messages
 *
 * Device management addresses end up in almost every message, so the
 * masker keeps only the last IPv4 octet when host masking is enabled.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths && !config_.mask_hosts) {
            return input;
        }

        std::string result = input;
        if (config_.mask_hosts) {
            result = replace_all(result, ip_pattern(), [this](const std::string& s) {
                return mask_host(s);
            });
        }
        if (config_.mask_paths) {
            result = replace_all(result, path_pattern(), [this](const std::string& s) {
                return mask_path(s);
            });
        }
        return result;
    }

    /**
     * @brief Mask the directory part of a path, keep the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char[0]) + "/" + path.substr(last_sep + 1);
    }

    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.empty()) {
            return host;
        }

        auto last_dot = host.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(host.size(), config_.mask_char[0]);
        }
        return std::string(last_dot, config_.mask_char[0]) + host.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = std::move(config); }

private:
    static auto ip_pattern() -> const std::regex& {
        static const std::regex pattern(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");
        return pattern;
    }

    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn&& fn)
        -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, static_cast<std::size_t>(it->position()) - last_pos);
            result += fn(it->str());
            last_pos = static_cast<std::size_t>(it->position() + it->length());
        }
        result += input.substr(last_pos);
        return result;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for one transfer run
 */
struct transfer_log_context {
    std::string operation;
    std::string source;
    std::string destination;
    std::optional<std::string> host;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<double> progress_percent;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        auto path = [masker](const std::string& p) {
            return masker ? masker->mask_path(p) : p;
        };

        if (!operation.empty()) add_field("operation", operation);
        if (!source.empty()) add_field("source", path(source));
        if (!destination.empty()) add_field("destination", path(destination));
        if (host) add_field("host", masker ? masker->mask_host(*host) : *host);
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (progress_percent) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2)
                << "\"progress_percent\":" << *progress_percent;
            first = false;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", masker ? masker->mask(*error_message)
                                                             : *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Library-wide logger
 *
 * Forwards to logger_system when the library is built with it and writes
 * to stderr otherwise. A callback can observe every message that passes
 * the level filter, which the unit tests use to assert on warnings.
 */
class device_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    device_transfer_logger() = default;
    ~device_transfer_logger() = default;

    device_transfer_logger(const device_transfer_logger&) = delete;
    device_transfer_logger& operator=(const device_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string formatted;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_timestamp(true);
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            formatted = entry.to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            formatted = oss.str();
        }

#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0) {
                logger_->log(to_logger_level(level), formatted, file, line, "");
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            std::string prefix = get_timestamp(false) + " [" +
                                 std::string(log_level_to_string(level)) + "] ";
            output_to_stderr(prefix + formatted);
        } else {
            output_to_stderr(formatted);
        }
    }

    void flush() {
#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp(bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        if (utc) {
            gmtime_r(&time_t_val, &tm_buf);
        } else {
            localtime_r(&time_t_val, &tm_buf);
        }

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        if (utc) oss << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline device_transfer_logger& get_logger() {
    static device_transfer_logger instance;
    return instance;
}

#define DT_LOG(level, category, message) \
    kcenon::device_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define DT_LOG_CTX(level, category, message, context) \
    kcenon::device_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define DT_LOG_TRACE(category, message) \
    DT_LOG(kcenon::device_transfer::log_level::trace, category, message)

#define DT_LOG_DEBUG(category, message) \
    DT_LOG(kcenon::device_transfer::log_level::debug, category, message)

#define DT_LOG_INFO(category, message) \
    DT_LOG(kcenon::device_transfer::log_level::info, category, message)

#define DT_LOG_WARN(category, message) \
    DT_LOG(kcenon::device_transfer::log_level::warn, category, message)

#define DT_LOG_ERROR(category, message) \
    DT_LOG(kcenon::device_transfer::log_level::error, category, message)

#define DT_LOG_DEBUG_CTX(category, message, ctx) \
    DT_LOG_CTX(kcenon::device_transfer::log_level::debug, category, message, ctx)

#define DT_LOG_INFO_CTX(category, message, ctx) \
    DT_LOG_CTX(kcenon::device_transfer::log_level::info, category, message, ctx)

#define DT_LOG_WARN_CTX(category, message, ctx) \
    DT_LOG_CTX(kcenon::device_transfer::log_level::warn, category, message, ctx)

#define DT_LOG_ERROR_CTX(category, message, ctx) \
    DT_LOG_CTX(kcenon::device_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::device_transfer
