/**
 * @file ProbeResult.hpp
 * @brief Outcome record of a single connection attempt.
 *
 * A ProbeResult has the same shape for FTP and SFTP probes. Fields a
 * protocol cannot populate stay at their defaults.
 */

#pragma once

#include "core/types/Endpoint.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ftpprobe::core {

/**
 * @brief Kind of filesystem object found at a checked path.
 */
enum class PathType : int {
    Unknown = 0,  ///< Not checked, not found, or type not reported
    File = 1,     ///< Regular file (or anything that is not a directory)
    Directory = 2 ///< Directory
};

/**
 * @brief Normalized result of one probe.
 *
 * Timings are milliseconds rounded to two decimals. A timing is empty when
 * its stage never ran.
 */
struct ProbeResult {
    // Identity, copied from the descriptor
    std::string host;
    uint16_t port{0};
    std::string username;
    std::string password;
    Protocol protocol{Protocol::Ftp};
    std::chrono::system_clock::time_point timestamp; ///< When the probe began

    bool connection{false};                 ///< Transport (and greeting) succeeded
    std::optional<double> connectionTimeMs; ///< Duration of the connect stage
    bool authentication{false};             ///< Login succeeded
    std::optional<double> authTimeMs;       ///< Duration of the login stage

    std::optional<bool> pathExists;         ///< Empty when no path check was requested
    PathType pathType{PathType::Unknown};
    std::optional<double> pathCheckTimeMs;

    std::optional<std::string> welcomeMessage; ///< Server greeting (FTP only)
    std::vector<std::string> features;         ///< FEAT lines (FTP only)
    std::vector<std::string> errors;           ///< Accumulated error descriptions
    std::optional<double> totalTimeMs;

    /**
     * @brief Creates an empty result carrying the descriptor's identity.
     * @param descriptor Descriptor the probe runs for.
     * @return Result stamped with the current time.
     */
    static ProbeResult forDescriptor(const ProbeDescriptor& descriptor);

    /**
     * @brief Creates a failed result with a single error.
     *
     * Used when a probe could not produce a result of its own.
     * @param descriptor Descriptor the probe ran for.
     * @param error Description of the failure.
     */
    static ProbeResult failure(const ProbeDescriptor& descriptor, const std::string& error);

    /**
     * @brief True when both connection and authentication succeeded.
     */
    [[nodiscard]] bool isSuccessful() const { return connection && authentication; }

    /**
     * @brief Returns "FTP" or "SFTP".
     */
    [[nodiscard]] std::string protocolName() const { return protocolToString(protocol); }

    /**
     * @brief Converts a PathType to "file", "directory" or "unknown".
     */
    static std::string pathTypeToString(PathType type);

    bool operator==(const ProbeResult& other) const = default;
};

/**
 * @brief Converts a duration to milliseconds rounded to two decimals.
 */
double roundedMilliseconds(std::chrono::steady_clock::duration duration);

/**
 * @brief Formats a time point as local ISO-8601 with microseconds.
 * @return e.g. "2024-05-01T13:37:00.123456".
 */
std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp);

} // namespace ftpprobe::core
