/**
 * @file ssh_session.h
 * @brief Authenticated libssh2 session over its own TCP connection
 */

#ifndef KCENON_DEVICE_TRANSFER_CHANNEL_SSH_SESSION_H
#define KCENON_DEVICE_TRANSFER_CHANNEL_SSH_SESSION_H

#include <chrono>
#include <memory>
#include <string>

#include "kcenon/device_transfer/channel/ssh_config.h"
#include "kcenon/device_transfer/core/types.h"

struct _LIBSSH2_SESSION;

namespace kcenon::device_transfer {

/**
 * @brief Owns a socket and the libssh2 session running on it
 *
 * connect() performs the TCP connect, the SSH handshake, the optional
 * known-hosts check and authentication (password, then
 * keyboard-interactive when the server only offers that). The session is
 * disconnected and the socket closed on destruction.
 */
class ssh_session {
public:
    ~ssh_session();

    ssh_session(const ssh_session&) = delete;
    ssh_session& operator=(const ssh_session&) = delete;

    /**
     * @brief Open an authenticated session
     * @param credentials Endpoint, credentials and host key policy
     */
    [[nodiscard]] static auto connect(const ssh_credentials& credentials)
        -> result<std::unique_ptr<ssh_session>>;

    [[nodiscard]] auto native() const -> _LIBSSH2_SESSION* { return session_; }
    [[nodiscard]] auto socket() const -> int { return socket_; }

    /**
     * @brief Switch between blocking and non-blocking libssh2 calls
     */
    auto set_blocking(bool blocking) -> void;

    /**
     * @brief Timeout applied to blocking libssh2 calls (0 = none)
     */
    auto set_timeout(std::chrono::milliseconds timeout) -> void;

    /**
     * @brief Wait until the socket is ready in the direction libssh2 needs
     * @return false when the timeout expired first
     */
    [[nodiscard]] auto wait_socket(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Most recent libssh2 error message
     */
    [[nodiscard]] auto last_error() const -> std::string;

private:
    explicit ssh_session(ssh_credentials credentials);

    auto tcp_connect() -> result<void>;
    auto handshake() -> result<void>;
    auto verify_host_key() -> result<void>;
    auto authenticate() -> result<void>;

    ssh_credentials credentials_;
    int socket_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
};

}  // namespace kcenon::device_transfer

#endif  // KCENON_DEVICE_TRANSFER_CHANNEL_SSH_SESSION_H
