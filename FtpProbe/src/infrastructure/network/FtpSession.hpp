#pragma once

#include "core/services/IFtpSession.hpp"
#include "infrastructure/network/FtpReply.hpp"

#include <asio.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace ftpprobe::infra {

/**
 * @brief Blocking FTP client built on Asio sockets.
 *
 * Each session owns a private io_context that is only driven from the
 * calling thread, so sessions can run in parallel on different workers.
 * Every network operation is bounded by the timeout given to connect().
 * Data transfers use passive mode (EPSV for IPv6 peers, PASV otherwise).
 *
 * @note This class is non-copyable.
 */
class FtpSession : public core::IFtpSession {
public:
    FtpSession();

    /**
     * @brief Destructor. Sends QUIT if still connected and closes the socket.
     */
    ~FtpSession() override;

    FtpSession(const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    core::ClientStatus connect(const std::string& host, uint16_t port,
                               std::chrono::milliseconds timeout) override;
    std::string welcomeMessage() const override { return welcome_; }
    core::ClientStatus login(const std::string& username, const std::string& password) override;
    core::ClientStatus features(std::vector<std::string>& features) override;
    core::ClientStatus changeDirectory(const std::string& path) override;
    core::ClientStatus listNames(std::vector<std::string>& names) override;
    void close() override;

private:
    core::ClientStatus sendLine(const std::string& line);
    core::ClientStatus readLine(std::string& line);
    core::ClientStatus readReply(FtpReply& reply);
    core::ClientStatus command(const std::string& line, FtpReply& reply);
    core::ClientStatus openDataConnection(asio::ip::tcp::socket& data);
    core::ClientStatus readAll(asio::ip::tcp::socket& data, std::string& payload);
    void dropConnection();

    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
    std::chrono::milliseconds timeout_{10000};
    std::string host_;
    std::string welcome_;
    bool connected_{false};
};

} // namespace ftpprobe::infra
