/**
 * @file types.h
 * @brief Core type definitions for device_transfer
 */

#ifndef KCENON_DEVICE_TRANSFER_CORE_TYPES_H
#define KCENON_DEVICE_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::device_transfer {

/**
 * @brief Error codes for device transfer operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -102,
    file_write_error = -103,
    invalid_file_path = -104,

    // Channel errors (-120 to -149)
    connection_failed = -120,
    connection_timeout = -121,
    authentication_failed = -122,
    host_key_mismatch = -123,
    channel_open_failed = -124,
    channel_closed = -125,
    command_timeout = -126,
    privilege_escalation_failed = -127,
    prompt_not_found = -128,

    // Bulk copy errors (-150 to -169)
    copy_session_failed = -150,
    copy_send_failed = -151,
    copy_receive_failed = -152,
    copy_size_mismatch = -153,

    // Capability errors (-170 to -189)
    capability_inspection_failed = -170,
    capability_apply_failed = -171,
    capability_rollback_failed = -172,

    // Configuration errors (-190 to -199)
    invalid_configuration = -190,
    invalid_operation = -191,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::host_key_mismatch:
            return "host key mismatch";
        case error_code::channel_open_failed:
            return "channel open failed";
        case error_code::channel_closed:
            return "channel closed";
        case error_code::command_timeout:
            return "command timeout";
        case error_code::privilege_escalation_failed:
            return "privilege escalation failed";
        case error_code::prompt_not_found:
            return "prompt not found";
        case error_code::copy_session_failed:
            return "copy session failed";
        case error_code::copy_send_failed:
            return "copy send failed";
        case error_code::copy_receive_failed:
            return "copy receive failed";
        case error_code::copy_size_mismatch:
            return "copy size mismatch";
        case error_code::capability_inspection_failed:
            return "capability inspection failed";
        case error_code::capability_apply_failed:
            return "capability apply failed";
        case error_code::capability_rollback_failed:
            return "capability rollback failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_operation:
            return "invalid operation";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Direction of a transfer relative to the remote device
 */
enum class transfer_direction {
    upload,    ///< local file sent to the device ("put")
    download   ///< device file fetched to local ("get")
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) -> const char* {
    switch (direction) {
        case transfer_direction::upload: return "put";
        case transfer_direction::download: return "get";
        default: return "unknown";
    }
}

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CORE_TYPES_H
