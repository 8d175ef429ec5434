#pragma once

#include "core/services/IFtpSession.hpp"
#include "core/services/IProtocolChecker.hpp"

#include <string>
#include <utility>

namespace ftpprobe::infra {

/**
 * @brief Probes an FTP endpoint: connect, login, FEAT and optional path check.
 *
 * Implements the core::IProtocolChecker interface on top of an
 * core::IFtpSession. Every failure ends up in the result's error list.
 */
class FtpChecker : public core::IProtocolChecker {
public:
    /**
     * @brief Constructs a checker that uses the asio-based FtpSession.
     */
    FtpChecker();

    /**
     * @brief Constructs a checker with a custom session factory.
     * @param factory Creates one session per probe.
     */
    explicit FtpChecker(core::FtpSessionFactory factory);

    core::ProbeResult check(const core::Endpoint& endpoint, const core::Credential& credential,
                            std::chrono::seconds timeout,
                            const std::optional<std::string>& checkPath) override;

private:
    bool connect(core::IFtpSession& session, const core::Endpoint& endpoint,
                 std::chrono::milliseconds timeout, core::ProbeResult& result);
    bool login(core::IFtpSession& session, const core::Credential& credential,
               core::ProbeResult& result);
    void discoverFeatures(core::IFtpSession& session, core::ProbeResult& result);
    void inspectPath(core::IFtpSession& session, const std::string& path,
                     core::ProbeResult& result);
    void lookUpPath(core::IFtpSession& session, const std::string& path,
                    core::ProbeResult& result);

    core::FtpSessionFactory factory_;
};

/**
 * @brief Splits a remote path into parent directory and file name.
 *
 * "/a/b.txt" gives {"/a", "b.txt"}; a path without a parent component
 * gives {"/", name}.
 */
std::pair<std::string, std::string> splitRemotePath(const std::string& path);

} // namespace ftpprobe::infra
