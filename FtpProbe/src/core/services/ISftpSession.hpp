/**
 * @file ISftpSession.hpp
 * @brief Interface for an SSH session with an SFTP channel.
 */

#pragma once

#include "core/types/ClientStatus.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ftpprobe::core {

/**
 * @brief Attributes returned by an SFTP stat call.
 */
struct SftpFileAttributes {
    std::optional<uint32_t> permissions; ///< st_mode bits, if the server reported them

    /**
     * @brief True when the mode carries the directory bit (0040000).
     */
    [[nodiscard]] bool isDirectory() const {
        return permissions && (*permissions & 0040000) != 0;
    }
};

/**
 * @brief One SSH session used for SFTP probing.
 *
 * SSH binds the transport handshake and user authentication together, so
 * connect() performs both.
 */
class ISftpSession {
public:
    virtual ~ISftpSession() = default;

    /**
     * @brief Connects, performs the SSH handshake and authenticates.
     * @param host Hostname or address.
     * @param port TCP port.
     * @param username Login name.
     * @param password Password (also answers keyboard-interactive prompts).
     * @param timeout Deadline for this and every following operation.
     * @return AuthenticationFailed when the credentials were rejected.
     */
    virtual ClientStatus connect(const std::string& host, uint16_t port,
                                 const std::string& username, const std::string& password,
                                 std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Stats a remote path over SFTP.
     * @param path Remote path.
     * @param attributes Receives the attributes on success.
     * @return NotFound when the path does not exist.
     */
    virtual ClientStatus stat(const std::string& path, SftpFileAttributes& attributes) = 0;

    /**
     * @brief Shuts down the SFTP channel and the SSH session. Idempotent.
     */
    virtual void close() = 0;
};

/**
 * @brief Creates a fresh, unconnected SFTP session.
 */
using SftpSessionFactory = std::function<std::unique_ptr<ISftpSession>()>;

} // namespace ftpprobe::core
