#pragma once

#include "core/services/IProtocolChecker.hpp"
#include "core/services/ISftpSession.hpp"

namespace ftpprobe::infra {

/**
 * @brief Probes an SFTP endpoint: SSH handshake with authentication and
 * an optional stat of a remote path.
 *
 * SSH connects and authenticates in one handshake, so connection and
 * authentication succeed or fail together and authTimeMs is set to the
 * same value as connectionTimeMs. These timings are not comparable with
 * the separate FTP connect and login timings.
 */
class SftpChecker : public core::IProtocolChecker {
public:
    /**
     * @brief Constructs a checker that uses the libssh2-based SftpSession.
     */
    SftpChecker();

    /**
     * @brief Constructs a checker with a custom session factory.
     * @param factory Creates one session per probe.
     */
    explicit SftpChecker(core::SftpSessionFactory factory);

    core::ProbeResult check(const core::Endpoint& endpoint, const core::Credential& credential,
                            std::chrono::seconds timeout,
                            const std::optional<std::string>& checkPath) override;

private:
    void inspectPath(core::ISftpSession& session, const std::string& path,
                     core::ProbeResult& result);

    core::SftpSessionFactory factory_;
};

} // namespace ftpprobe::infra
