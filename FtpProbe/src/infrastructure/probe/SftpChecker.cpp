#include "infrastructure/probe/SftpChecker.hpp"

#include "core/probe/ScopeGuard.hpp"
#include "infrastructure/network/SftpSession.hpp"

#include <spdlog/spdlog.h>

namespace ftpprobe::infra {

namespace {

std::string describeFailure(const core::ClientStatus& status) {
    switch (status.kind) {
    case core::ClientErrorKind::AuthenticationFailed:
        return "Authentication failed";
    case core::ClientErrorKind::Timeout:
        return "Connection timed out";
    case core::ClientErrorKind::HostResolution:
        return "Hostname resolution failed";
    case core::ClientErrorKind::Unexpected:
        return "Unexpected error: " + status.message;
    default:
        return "SSH error: " + status.message;
    }
}

} // namespace

SftpChecker::SftpChecker()
    : SftpChecker([] { return std::make_unique<SftpSession>(); }) {}

SftpChecker::SftpChecker(core::SftpSessionFactory factory) : factory_(std::move(factory)) {}

core::ProbeResult SftpChecker::check(const core::Endpoint& endpoint,
                                     const core::Credential& credential,
                                     std::chrono::seconds timeout,
                                     const std::optional<std::string>& checkPath) {
    auto result = core::ProbeResult::forDescriptor({endpoint, credential, checkPath});
    const auto start = std::chrono::steady_clock::now();

    try {
        auto session = factory_();
        auto closeSession = core::onScopeExit([&session] { session->close(); });

        const auto connectStart = std::chrono::steady_clock::now();
        auto status = session->connect(endpoint.host, endpoint.port, credential.username,
                                       credential.password, timeout);
        if (status.ok()) {
            result.connectionTimeMs =
                core::roundedMilliseconds(std::chrono::steady_clock::now() - connectStart);
            result.connection = true;
            result.authentication = true;

            if (checkPath) {
                inspectPath(*session, *checkPath, result);
            }
        } else {
            result.errors.push_back(describeFailure(status));
        }
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Unexpected error: ") + e.what());
    }

    result.totalTimeMs = core::roundedMilliseconds(std::chrono::steady_clock::now() - start);
    result.authTimeMs = result.connectionTimeMs;

    spdlog::debug("SFTP probe {}@{}:{} finished: authenticated={} errors={}",
                  credential.username, endpoint.host, endpoint.port, result.authentication,
                  result.errors.size());
    return result;
}

void SftpChecker::inspectPath(core::ISftpSession& session, const std::string& path,
                              core::ProbeResult& result) {
    core::StageTimer timer(result.pathCheckTimeMs);

    try {
        core::SftpFileAttributes attributes;
        auto status = session.stat(path, attributes);

        if (status.ok()) {
            result.pathExists = true;
            if (attributes.permissions) {
                result.pathType =
                    attributes.isDirectory() ? core::PathType::Directory : core::PathType::File;
            }
        } else if (status.kind == core::ClientErrorKind::NotFound) {
            result.pathExists = false;
            result.errors.push_back("Path '" + path + "' not found");
        } else {
            result.pathExists = false;
            result.errors.push_back("Path check error: " + status.message);
        }
    } catch (const std::exception& e) {
        result.pathExists = false;
        result.pathType = core::PathType::Unknown;
        result.errors.push_back(std::string("Path check error: ") + e.what());
    }
}

} // namespace ftpprobe::infra
