/**
 * @file IProtocolChecker.hpp
 * @brief Interface for a single end-to-end probe.
 */

#pragma once

#include "core/types/Endpoint.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace ftpprobe::core {

/**
 * @brief Performs connect, authenticate and optional path inspection
 * against one endpoint with one credential.
 *
 * Implementations capture every failure in the returned result. check()
 * is expected not to throw; callers still guard against it.
 */
class IProtocolChecker {
public:
    virtual ~IProtocolChecker() = default;

    /**
     * @brief Runs one probe.
     * @param endpoint Target endpoint.
     * @param credential Credential to log in with.
     * @param timeout Per-stage network timeout.
     * @param checkPath Remote path to verify, if any.
     * @return The completed result.
     */
    virtual ProbeResult check(const Endpoint& endpoint, const Credential& credential,
                              std::chrono::seconds timeout,
                              const std::optional<std::string>& checkPath) = 0;
};

} // namespace ftpprobe::core
