/**
 * @file IFtpSession.hpp
 * @brief Interface for an FTP control connection.
 *
 * This is the capability surface the FTP checker is written against. The
 * production implementation lives in infrastructure/network; tests supply
 * scripted fakes.
 */

#pragma once

#include "core/types/ClientStatus.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ftpprobe::core {

/**
 * @brief One FTP session, from connect to close.
 *
 * Every operation is bounded by the timeout passed to connect(). Failures
 * are reported through ClientStatus, never thrown.
 */
class IFtpSession {
public:
    virtual ~IFtpSession() = default;

    /**
     * @brief Opens the control connection and reads the server greeting.
     * @param host Hostname or address.
     * @param port TCP port.
     * @param timeout Deadline for this and every following operation.
     */
    virtual ClientStatus connect(const std::string& host, uint16_t port,
                                 std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Returns the greeting received by connect(), empty if none.
     */
    virtual std::string welcomeMessage() const = 0;

    /**
     * @brief Logs in with USER/PASS.
     */
    virtual ClientStatus login(const std::string& username, const std::string& password) = 0;

    /**
     * @brief Sends FEAT and collects the advertised feature lines.
     * @param features Receives the features on success.
     */
    virtual ClientStatus features(std::vector<std::string>& features) = 0;

    /**
     * @brief Sends CWD.
     */
    virtual ClientStatus changeDirectory(const std::string& path) = 0;

    /**
     * @brief Lists the names in the current directory with NLST.
     * @param names Receives one entry per listed name.
     */
    virtual ClientStatus listNames(std::vector<std::string>& names) = 0;

    /**
     * @brief Closes the session. Safe to call more than once.
     */
    virtual void close() = 0;
};

/**
 * @brief Creates a fresh, unconnected FTP session.
 */
using FtpSessionFactory = std::function<std::unique_ptr<IFtpSession>()>;

} // namespace ftpprobe::core
