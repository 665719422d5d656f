#include "libssh2_client.hpp"
#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <mutex>

using Clock = std::chrono::steady_clock;

// libssh2_init is not thread-safe; run it once per process.
static bool init_libssh2() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Wait (at most 100ms) for the socket direction libssh2 is blocked on.
static void wait_socket(LIBSSH2_SESSION* session, socket_t sock, Clock::time_point deadline) {
    int dir = libssh2_session_block_directions(session);
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    int wait = std::min(remaining_ms(deadline), 100);
    if (events == 0) {
        platform::sleep_ms(std::min(wait, SSH_EAGAIN_SLEEP_MS));
        return;
    }
    platform::poll_socket(sock, events, wait);
}

static std::string session_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : std::string("unknown error");
}

static std::string host_fingerprint(LIBSSH2_SESSION* session) {
    const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!hash) return "unavailable";
    std::string hex;
    for (int i = 0; i < 32; ++i) {
        if (i) hex += ':';
        hex += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
    }
    return hex;
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

Libssh2Client::Libssh2Client(const ShellSettings& shell, const TransferSettings& transfer)
    : shell_(shell), transfer_(transfer) {}

TransportResult Libssh2Client::connect(const ConnectionRequest& request) {
    auto deadline = Clock::now() + request.timeout;
    const std::string target = request.target();

    if (!init_libssh2()) {
        return TransportResult::Err(ConnectErrorKind::HostUnreachable,
                                    "Failed to initialize libssh2");
    }

    tether_log(fmt::format("connect: {} (timeout {}s, auth {})", target,
                           request.timeout.count(),
                           request.auth.method == AuthMethod::PrivateKey ? "key" : "password"));

    auto tcp = platform::tcp_connect(request.host, request.port, remaining_ms(deadline));
    if (tcp.is_err()) {
        tether_log("connect: " + tcp.error);
        return TransportResult::Err(tcp.kind, tcp.error);
    }
    socket_t sock = tcp.value;

    LIBSSH2_SESSION* session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session) {
        platform::close_socket(sock);
        return TransportResult::Err(ConnectErrorKind::HostUnreachable,
                                    "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session, 0);

    auto fail = [&](ConnectErrorKind kind, const std::string& msg) {
        tether_log(fmt::format("connect: {} failed: {}", target, msg));
        libssh2_session_disconnect(session, "Connection aborted");
        libssh2_session_free(session);
        platform::close_socket(sock);
        return TransportResult::Err(kind, msg);
    };
    auto timed_out = [&](const char* phase) {
        return fail(ConnectErrorKind::Timeout,
                    fmt::format("Timed out after {}s during {}", request.timeout.count(), phase));
    };

    // SSH handshake (key exchange)
    int rc;
    while ((rc = libssh2_session_handshake(session, sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (Clock::now() >= deadline) return timed_out("SSH handshake");
        wait_socket(session, sock, deadline);
    }
    if (rc != 0) {
        return fail(ConnectErrorKind::HostUnreachable,
                    "SSH handshake failed: " + session_error(session));
    }

    // Host key is not verified (accept on every use); record what we saw.
    tether_log(fmt::format("connect: {} host key SHA256 {}", target, host_fingerprint(session)));

    platform::enable_tcp_keepalive(sock);

    // ── Authentication ──
    if (request.auth.method == AuthMethod::PrivateKey) {
        while ((rc = libssh2_userauth_publickey_fromfile(session, request.username.c_str(),
                                                         nullptr,
                                                         request.auth.secret.c_str(),
                                                         nullptr)) == LIBSSH2_ERROR_EAGAIN) {
            if (Clock::now() >= deadline) return timed_out("public key authentication");
            wait_socket(session, sock, deadline);
        }
        if (rc == LIBSSH2_ERROR_FILE) {
            return fail(ConnectErrorKind::KeyError,
                        "Unable to load private key " + request.auth.secret);
        }
        if (rc != 0) {
            return fail(ConnectErrorKind::AuthFailed,
                        "Public key authentication failed: " + session_error(session));
        }
    } else {
        // Check what auth methods the server supports
        char* auth_list = nullptr;
        while ((auth_list = libssh2_userauth_list(session, request.username.c_str(),
                                                  static_cast<unsigned int>(request.username.length()))) == nullptr) {
            if (libssh2_userauth_authenticated(session)) break;    // "none" accepted
            if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) break;
            if (Clock::now() >= deadline) return timed_out("authentication");
            wait_socket(session, sock, deadline);
        }
        std::string methods = auth_list ? auth_list : "";

        if (!libssh2_userauth_authenticated(session)) {
            rc = -1;
            if (methods.empty() || methods.find("password") != std::string::npos) {
                while ((rc = libssh2_userauth_password(session, request.username.c_str(),
                                                       request.auth.secret.c_str())) == LIBSSH2_ERROR_EAGAIN) {
                    if (Clock::now() >= deadline) return timed_out("password authentication");
                    wait_socket(session, sock, deadline);
                }
            }
            if (rc != 0 && methods.find("keyboard-interactive") != std::string::npos) {
                KbdAuthData kbd_data{request.auth.secret};
                *libssh2_session_abstract(session) = &kbd_data;
                while ((rc = libssh2_userauth_keyboard_interactive(session, request.username.c_str(),
                                                                   kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
                    if (Clock::now() >= deadline) {
                        *libssh2_session_abstract(session) = nullptr;
                        return timed_out("keyboard-interactive authentication");
                    }
                    wait_socket(session, sock, deadline);
                }
                *libssh2_session_abstract(session) = nullptr;
            }
            if (rc != 0) {
                return fail(ConnectErrorKind::AuthFailed,
                            "Authentication failed (check username/password)");
            }
        }
    }

    tether_log(fmt::format("connect: {} authenticated", target));

    auto transport = std::make_shared<Libssh2Transport>(session, sock, shell_, transfer_, target);
    return TransportResult::Ok(transport);
}
