#include "infrastructure/probe/FtpChecker.hpp"

#include "core/probe/ScopeGuard.hpp"
#include "infrastructure/network/FtpSession.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ftpprobe::infra {

namespace {

std::string describeFailure(const core::ClientStatus& status) {
    switch (status.kind) {
    case core::ClientErrorKind::Timeout:
        return "Connection timed out";
    case core::ClientErrorKind::HostResolution:
        return "Hostname resolution failed";
    case core::ClientErrorKind::Unexpected:
        return "Unexpected error: " + status.message;
    default:
        return "FTP error: " + status.message;
    }
}

} // namespace

std::pair<std::string, std::string> splitRemotePath(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return {"/", path};
    }
    std::string parent = path.substr(0, slash);
    if (parent.empty()) {
        parent = "/";
    }
    return {parent, path.substr(slash + 1)};
}

FtpChecker::FtpChecker()
    : FtpChecker([] { return std::make_unique<FtpSession>(); }) {}

FtpChecker::FtpChecker(core::FtpSessionFactory factory) : factory_(std::move(factory)) {}

core::ProbeResult FtpChecker::check(const core::Endpoint& endpoint,
                                    const core::Credential& credential,
                                    std::chrono::seconds timeout,
                                    const std::optional<std::string>& checkPath) {
    auto result = core::ProbeResult::forDescriptor({endpoint, credential, checkPath});
    const auto start = std::chrono::steady_clock::now();

    try {
        auto session = factory_();
        auto closeSession = core::onScopeExit([&session] { session->close(); });

        if (connect(*session, endpoint, timeout, result) && login(*session, credential, result)) {
            discoverFeatures(*session, result);
            if (checkPath) {
                inspectPath(*session, *checkPath, result);
            }
        }
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Unexpected error: ") + e.what());
    }

    result.totalTimeMs = core::roundedMilliseconds(std::chrono::steady_clock::now() - start);

    spdlog::debug("FTP probe {}@{}:{} finished: connection={} authentication={} errors={}",
                  credential.username, endpoint.host, endpoint.port, result.connection,
                  result.authentication, result.errors.size());
    return result;
}

bool FtpChecker::connect(core::IFtpSession& session, const core::Endpoint& endpoint,
                         std::chrono::milliseconds timeout, core::ProbeResult& result) {
    const auto start = std::chrono::steady_clock::now();
    auto status = session.connect(endpoint.host, endpoint.port, timeout);
    if (!status.ok()) {
        result.errors.push_back(describeFailure(status));
        return false;
    }

    result.connectionTimeMs = core::roundedMilliseconds(std::chrono::steady_clock::now() - start);
    result.connection = true;

    auto welcome = session.welcomeMessage();
    if (!welcome.empty()) {
        result.welcomeMessage = std::move(welcome);
    }
    return true;
}

bool FtpChecker::login(core::IFtpSession& session, const core::Credential& credential,
                       core::ProbeResult& result) {
    const auto start = std::chrono::steady_clock::now();
    auto status = session.login(credential.username, credential.password);
    if (!status.ok()) {
        result.errors.push_back(describeFailure(status));
        return false;
    }

    result.authTimeMs = core::roundedMilliseconds(std::chrono::steady_clock::now() - start);
    result.authentication = true;
    return true;
}

void FtpChecker::discoverFeatures(core::IFtpSession& session, core::ProbeResult& result) {
    std::vector<std::string> features;
    auto status = session.features(features);

    if (status.ok()) {
        result.features = std::move(features);
    } else if (status.isServerRejection()) {
        // FEAT not implemented or not permitted
        spdlog::debug("FEAT rejected by {}: {}", result.host, status.message);
    } else {
        result.errors.push_back("Feature discovery failed: " + status.message);
    }
}

void FtpChecker::inspectPath(core::IFtpSession& session, const std::string& path,
                             core::ProbeResult& result) {
    core::StageTimer timer(result.pathCheckTimeMs);

    try {
        lookUpPath(session, path, result);
    } catch (const std::exception& e) {
        result.pathExists = false;
        result.pathType = core::PathType::Unknown;
        result.errors.push_back(std::string("Path check error: ") + e.what());
    }
}

void FtpChecker::lookUpPath(core::IFtpSession& session, const std::string& path,
                            core::ProbeResult& result) {

    auto status = session.changeDirectory(path);
    if (status.ok()) {
        result.pathExists = true;
        result.pathType = core::PathType::Directory;
        return;
    }
    if (!status.isServerRejection()) {
        result.pathExists = false;
        result.errors.push_back("Path check error: " + status.message);
        return;
    }

    // Not a directory we can enter; look for a file of that name in the parent
    const auto [parent, name] = splitRemotePath(path);
    std::vector<std::string> names;
    status = session.changeDirectory(parent);
    if (status.ok()) {
        status = session.listNames(names);
    }

    if (!status.ok()) {
        result.pathExists = false;
        if (status.isServerRejection()) {
            result.errors.push_back("Error accessing parent directory: " + status.message);
        } else {
            result.errors.push_back("Path check error: " + status.message);
        }
        return;
    }

    if (std::find(names.begin(), names.end(), name) != names.end()) {
        result.pathExists = true;
        result.pathType = core::PathType::File;
    } else {
        result.pathExists = false;
        result.errors.push_back("Path '" + path + "' not found");
    }
}

} // namespace ftpprobe::infra
