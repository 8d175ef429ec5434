/**
 * @file ClientStatus.hpp
 * @brief Categorized outcome of a protocol client operation.
 *
 * Protocol clients never throw to report network or server failures. They
 * return a ClientStatus and the checkers decide per category what the
 * failure means for the probe.
 */

#pragma once

#include <string>
#include <utility>

namespace ftpprobe::core {

/**
 * @brief Failure categories shared by the FTP and SFTP clients.
 */
enum class ClientErrorKind : int {
    None = 0,             ///< Operation succeeded
    Timeout,              ///< Deadline expired before the operation finished
    HostResolution,       ///< Hostname could not be resolved
    ConnectionRefused,    ///< Transport-level refusal or unreachable network
    AuthenticationFailed, ///< Credentials rejected
    PermissionDenied,     ///< Server rejected the request (FTP 5xx, SFTP permission)
    NotSupported,         ///< Command not implemented by the server
    NotFound,             ///< Remote object does not exist
    Protocol,             ///< Unexpected reply or broken session
    Unexpected            ///< Anything else
};

/**
 * @brief Result of a client operation: a category plus a human-readable detail.
 */
struct ClientStatus {
    ClientErrorKind kind{ClientErrorKind::None};
    std::string message;

    static ClientStatus success() { return {}; }

    static ClientStatus failure(ClientErrorKind kind, std::string message) {
        return ClientStatus{kind, std::move(message)};
    }

    [[nodiscard]] bool ok() const { return kind == ClientErrorKind::None; }

    /**
     * @brief True when the server answered with a permanent rejection.
     *
     * The session is still usable after such a failure.
     */
    [[nodiscard]] bool isServerRejection() const {
        return kind == ClientErrorKind::PermissionDenied ||
               kind == ClientErrorKind::NotSupported || kind == ClientErrorKind::NotFound ||
               kind == ClientErrorKind::AuthenticationFailed;
    }
};

/**
 * @brief Returns a short name for an error kind, for logging.
 */
inline const char* clientErrorKindToString(ClientErrorKind kind) {
    switch (kind) {
    case ClientErrorKind::None:
        return "None";
    case ClientErrorKind::Timeout:
        return "Timeout";
    case ClientErrorKind::HostResolution:
        return "HostResolution";
    case ClientErrorKind::ConnectionRefused:
        return "ConnectionRefused";
    case ClientErrorKind::AuthenticationFailed:
        return "AuthenticationFailed";
    case ClientErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ClientErrorKind::NotSupported:
        return "NotSupported";
    case ClientErrorKind::NotFound:
        return "NotFound";
    case ClientErrorKind::Protocol:
        return "Protocol";
    case ClientErrorKind::Unexpected:
        return "Unexpected";
    }
    return "Unexpected";
}

} // namespace ftpprobe::core
