#pragma once

#include "core/services/ISftpSession.hpp"

#include <asio.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <string>

namespace ftpprobe::infra {

/**
 * @brief SSH session with an SFTP channel, built on libssh2.
 *
 * The TCP connection is opened with Asio under the probe deadline and then
 * handed to libssh2 in blocking mode with the same timeout. Authentication
 * uses the "password" method when the server offers it and
 * "keyboard-interactive" otherwise, answering every hidden prompt with the
 * password.
 *
 * @note This class is non-copyable.
 */
class SftpSession : public core::ISftpSession {
public:
    SftpSession();
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    core::ClientStatus connect(const std::string& host, uint16_t port,
                               const std::string& username, const std::string& password,
                               std::chrono::milliseconds timeout) override;
    core::ClientStatus stat(const std::string& path, core::SftpFileAttributes& attributes) override;
    void close() override;

private:
    core::ClientStatus authenticate(const std::string& username, const std::string& password);

    /**
     * @brief Builds a status from a libssh2 return code and the session's last error text.
     */
    core::ClientStatus sessionError(int rc, const std::string& context) const;

    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    LIBSSH2_SESSION* session_{nullptr};
    LIBSSH2_SFTP* sftp_{nullptr};
    std::string host_;
};

} // namespace ftpprobe::infra
