/**
 * @file ssh_session.cpp
 * @brief libssh2 session setup and teardown
 */

#include "kcenon/device_transfer/channel/ssh_session.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <libssh2.h>

#include <kcenon/device_transfer/core/logging.h>

namespace kcenon::device_transfer {

namespace {

auto ensure_library() -> bool {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

// Answers every keyboard-interactive prompt with the password
LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(answer_with_password) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    (void)prompts;
    const auto* password = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = strdup(password->c_str());
        responses[i].length = static_cast<unsigned int>(password->size());
    }
}

auto endpoint_of(const ssh_credentials& credentials) -> std::string {
    return credentials.host + ":" + std::to_string(credentials.port);
}

}  // namespace

ssh_session::ssh_session(ssh_credentials credentials) : credentials_(std::move(credentials)) {}

ssh_session::~ssh_session() {
    if (session_) {
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "closing");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
}

auto ssh_session::connect(const ssh_credentials& credentials)
    -> result<std::unique_ptr<ssh_session>> {
    if (credentials.host.empty() || credentials.username.empty()) {
        return unexpected(error{error_code::invalid_configuration, "host and username are required"});
    }
    if (!ensure_library()) {
        return unexpected(error{error_code::internal_error, "libssh2_init failed"});
    }

    std::unique_ptr<ssh_session> session(new ssh_session(credentials));

    if (auto r = session->tcp_connect(); !r) {
        return unexpected(r.error());
    }
    if (auto r = session->handshake(); !r) {
        return unexpected(r.error());
    }
    if (auto r = session->verify_host_key(); !r) {
        return unexpected(r.error());
    }
    if (auto r = session->authenticate(); !r) {
        return unexpected(r.error());
    }

    DT_LOG_DEBUG(log_category::channel, "ssh session established to " + endpoint_of(credentials));
    return session;
}

auto ssh_session::tcp_connect() -> result<void> {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* resolved = nullptr;
    auto port = std::to_string(credentials_.port);
    if (int rc = ::getaddrinfo(credentials_.host.c_str(), port.c_str(), &hints, &resolved);
        rc != 0) {
        return unexpected(error{error_code::connection_failed,
                                "cannot resolve " + credentials_.host + ": " + gai_strerror(rc)});
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(resolved, &::freeaddrinfo);

    bool timed_out = false;
    for (auto* ai = resolved; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }

        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            rc = ::poll(&pfd, 1, static_cast<int>(credentials_.connect_timeout.count()));
            if (rc == 0) {
                timed_out = true;
                rc = -1;
            } else if (rc > 0) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                rc = so_error == 0 ? 0 : -1;
            }
        }

        if (rc == 0) {
            ::fcntl(fd, F_SETFL, flags);
            socket_ = fd;
            return {};
        }
        ::close(fd);
    }

    if (timed_out) {
        return unexpected(error{error_code::connection_timeout,
                                "timed out connecting to " + endpoint_of(credentials_)});
    }
    return unexpected(error{error_code::connection_failed,
                            "cannot connect to " + endpoint_of(credentials_)});
}

auto ssh_session::handshake() -> result<void> {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, &credentials_.password);
    if (!session_) {
        return unexpected(error{error_code::internal_error, "libssh2_session_init failed"});
    }

    libssh2_session_set_blocking(session_, 1);
    set_timeout(credentials_.connect_timeout);

    if (libssh2_session_handshake(session_, socket_) != 0) {
        return unexpected(error{error_code::connection_failed,
                                "ssh handshake with " + endpoint_of(credentials_) +
                                    " failed: " + last_error()});
    }
    set_timeout(std::chrono::milliseconds{0});
    return {};
}

auto ssh_session::verify_host_key() -> result<void> {
    if (!credentials_.strict_host_key) {
        return {};
    }

    std::size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return unexpected(error{error_code::host_key_mismatch, "server sent no host key"});
    }

    LIBSSH2_KNOWNHOSTS* known = libssh2_knownhost_init(session_);
    if (!known) {
        return unexpected(error{error_code::internal_error, "libssh2_knownhost_init failed"});
    }
    std::unique_ptr<LIBSSH2_KNOWNHOSTS, decltype(&libssh2_knownhost_free)> guard(
        known, &libssh2_knownhost_free);

    if (libssh2_knownhost_readfile(known, credentials_.known_hosts_file.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        return unexpected(error{error_code::host_key_mismatch,
                                "cannot read known hosts file " + credentials_.known_hosts_file});
    }

    libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(
        known, credentials_.host.c_str(), credentials_.port, key, key_len,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW, &entry);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        return unexpected(error{error_code::host_key_mismatch,
                                check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND
                                    ? "host key of " + credentials_.host + " is not known"
                                    : "host key of " + credentials_.host + " does not match"});
    }
    return {};
}

auto ssh_session::authenticate() -> result<void> {
    const char* methods = libssh2_userauth_list(
        session_, credentials_.username.c_str(),
        static_cast<unsigned int>(credentials_.username.size()));
    if (!methods) {
        if (libssh2_userauth_authenticated(session_)) {
            return {};
        }
        return unexpected(error{error_code::authentication_failed,
                                "cannot list authentication methods: " + last_error()});
    }

    std::string offered = methods;
    if (offered.find("password") != std::string::npos &&
        libssh2_userauth_password(session_, credentials_.username.c_str(),
                                  credentials_.password.c_str()) == 0) {
        return {};
    }
    if (offered.find("keyboard-interactive") != std::string::npos &&
        libssh2_userauth_keyboard_interactive(session_, credentials_.username.c_str(),
                                              &answer_with_password) == 0) {
        return {};
    }

    return unexpected(error{error_code::authentication_failed,
                            "authentication as " + credentials_.username + " failed (" +
                                offered + ")"});
}

auto ssh_session::set_blocking(bool blocking) -> void {
    libssh2_session_set_blocking(session_, blocking ? 1 : 0);
}

auto ssh_session::set_timeout(std::chrono::milliseconds timeout) -> void {
    libssh2_session_set_timeout(session_, static_cast<long>(timeout.count()));
}

auto ssh_session::wait_socket(std::chrono::milliseconds timeout) const -> bool {
    pollfd pfd{socket_, 0, 0};
    int directions = libssh2_session_block_directions(session_);
    if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) {
        pfd.events |= POLLIN;
    }
    if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
        pfd.events |= POLLOUT;
    }
    if (pfd.events == 0) {
        pfd.events = POLLIN;
    }
    return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
}

auto ssh_session::last_error() const -> std::string {
    char* message = nullptr;
    int length = 0;
    libssh2_session_last_error(session_, &message, &length, 0);
    return message ? std::string(message, static_cast<std::size_t>(length)) : std::string{};
}

}  // namespace kcenon::device_transfer
