#include "infrastructure/network/SftpSession.hpp"

#include "infrastructure/network/TcpConnector.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace ftpprobe::infra {

namespace {

std::once_flag libssh2InitFlag;

void ensureLibssh2Initialized() {
    std::call_once(libssh2InitFlag, [] {
        const int rc = libssh2_init(0);
        if (rc != 0) {
            throw std::runtime_error("libssh2_init failed with code " + std::to_string(rc));
        }
    });
}

bool offersMethod(std::string_view methods, std::string_view wanted) {
    size_t start = 0;
    while (start <= methods.size()) {
        size_t end = methods.find(',', start);
        if (end == std::string_view::npos) {
            end = methods.size();
        }
        if (methods.substr(start, end - start) == wanted) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

bool isTransportError(int rc) {
    return rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_SOCKET_DISCONNECT;
}

struct KeyboardInteractiveContext {
    const std::string* password;
    std::string unexpectedPrompts;
};

void answerKeyboardInteractive(const char* /*name*/, int /*nameLength*/,
                               const char* /*instruction*/, int /*instructionLength*/,
                               int promptCount, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                               LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract) {
    auto* context = static_cast<KeyboardInteractiveContext*>(*abstract);
    for (int i = 0; i < promptCount; ++i) {
        if (prompts[i].echo == 0) {
            // libssh2 takes ownership and frees the response text
            responses[i].text = ::strdup(context->password->c_str());
            responses[i].length = static_cast<unsigned int>(context->password->size());
        } else {
            if (!context->unexpectedPrompts.empty()) {
                context->unexpectedPrompts += '|';
            }
            context->unexpectedPrompts.append(reinterpret_cast<const char*>(prompts[i].text),
                                              prompts[i].length);
        }
    }
}

} // namespace

SftpSession::SftpSession() : socket_(io_) {}

SftpSession::~SftpSession() {
    close();
}

core::ClientStatus SftpSession::connect(const std::string& host, uint16_t port,
                                        const std::string& username, const std::string& password,
                                        std::chrono::milliseconds timeout) {
    ensureLibssh2Initialized();
    host_ = host;

    auto status = connectWithTimeout(io_, socket_, host, port, timeout);
    if (!status.ok()) {
        return status;
    }

    // libssh2 drives the socket itself in blocking mode
    asio::error_code ec;
    socket_.native_non_blocking(false, ec);
    if (ec) {
        return statusFromError(ec);
    }

    session_ = libssh2_session_init();
    if (session_ == nullptr) {
        return core::ClientStatus::failure(core::ClientErrorKind::Unexpected,
                                           "Unable to create SSH session");
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(timeout.count()));

    const int rc = libssh2_session_handshake(session_, socket_.native_handle());
    if (rc != 0) {
        return sessionError(rc, "SSH handshake failed");
    }
    spdlog::debug("SSH handshake with {}:{} complete", host, port);

    return authenticate(username, password);
}

core::ClientStatus SftpSession::authenticate(const std::string& username,
                                             const std::string& password) {
    const auto userLength = static_cast<unsigned int>(username.size());
    const char* methods = libssh2_userauth_list(session_, username.c_str(), userLength);
    if (methods == nullptr) {
        // The server accepted the "none" method
        if (libssh2_userauth_authenticated(session_) == 1) {
            return core::ClientStatus::success();
        }
        return sessionError(libssh2_session_last_errno(session_),
                            "Querying authentication methods failed");
    }

    const std::string offered(methods);
    const bool supportsPassword = offersMethod(offered, "password");
    const bool supportsInteractive = offersMethod(offered, "keyboard-interactive");
    if (!supportsPassword && !supportsInteractive) {
        return core::ClientStatus::failure(core::ClientErrorKind::AuthenticationFailed,
                                           "No password authentication offered (" + offered + ")");
    }

    int rc = 0;
    if (supportsPassword) {
        rc = libssh2_userauth_password_ex(session_, username.c_str(), userLength,
                                          password.c_str(),
                                          static_cast<unsigned int>(password.size()), nullptr);
        if (rc == 0) {
            return core::ClientStatus::success();
        }
        if (isTransportError(rc)) {
            return sessionError(rc, "Password authentication aborted");
        }
    } else {
        KeyboardInteractiveContext context{&password, {}};
        void** abstract = libssh2_session_abstract(session_);
        *abstract = &context;
        rc = libssh2_userauth_keyboard_interactive_ex(session_, username.c_str(), userLength,
                                                      &answerKeyboardInteractive);
        *abstract = nullptr;

        if (!context.unexpectedPrompts.empty()) {
            spdlog::debug("Unanswered keyboard-interactive prompts from {}: {}", host_,
                          context.unexpectedPrompts);
        }
        if (rc == 0) {
            return core::ClientStatus::success();
        }
        if (isTransportError(rc)) {
            return sessionError(rc, "Keyboard-interactive authentication aborted");
        }
    }

    return core::ClientStatus::failure(core::ClientErrorKind::AuthenticationFailed,
                                       "Authentication failed");
}

core::ClientStatus SftpSession::stat(const std::string& path,
                                     core::SftpFileAttributes& attributes) {
    if (session_ == nullptr) {
        return core::ClientStatus::failure(core::ClientErrorKind::Protocol, "Not connected");
    }
    if (sftp_ == nullptr) {
        sftp_ = libssh2_sftp_init(session_);
        if (sftp_ == nullptr) {
            return sessionError(libssh2_session_last_errno(session_),
                                "SFTP subsystem unavailable");
        }
    }

    LIBSSH2_SFTP_ATTRIBUTES raw{};
    const int rc = libssh2_sftp_stat_ex(sftp_, path.c_str(),
                                        static_cast<unsigned int>(path.size()),
                                        LIBSSH2_SFTP_STAT, &raw);
    if (rc == 0) {
        attributes.permissions.reset();
        if ((raw.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) != 0) {
            attributes.permissions = static_cast<uint32_t>(raw.permissions);
        }
        return core::ClientStatus::success();
    }

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        const unsigned long code = libssh2_sftp_last_error(sftp_);
        switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return core::ClientStatus::failure(core::ClientErrorKind::NotFound, "No such file");
        case LIBSSH2_FX_PERMISSION_DENIED:
            return core::ClientStatus::failure(core::ClientErrorKind::PermissionDenied,
                                               "Permission denied");
        default:
            return core::ClientStatus::failure(core::ClientErrorKind::Protocol,
                                               "SFTP status code " + std::to_string(code));
        }
    }
    return sessionError(rc, "stat failed");
}

void SftpSession::close() {
    if (sftp_ != nullptr) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_ != nullptr) {
        libssh2_session_disconnect(session_, "Normal shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.close(ec);
        if (ec) {
            spdlog::debug("Closing SSH socket to {} failed: {}", host_, ec.message());
        }
    }
}

core::ClientStatus SftpSession::sessionError(int rc, const std::string& context) const {
    std::string detail = context;
    char* message = nullptr;
    int length = 0;
    if (session_ != nullptr) {
        libssh2_session_last_error(session_, &message, &length, 0);
    }
    if (message != nullptr && length > 0) {
        detail += ": ";
        detail.append(message, static_cast<size_t>(length));
    }

    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return core::ClientStatus::failure(core::ClientErrorKind::Timeout, detail);
    }
    return core::ClientStatus::failure(core::ClientErrorKind::Protocol, detail);
}

} // namespace ftpprobe::infra
