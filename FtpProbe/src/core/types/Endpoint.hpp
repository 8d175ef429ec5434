/**
 * @file Endpoint.hpp
 * @brief Probe target, credential and work-unit types.
 *
 * This file defines the immutable value types that describe what a probe
 * connects to and with which credential.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ftpprobe::core {

/**
 * @brief File transfer protocol spoken by an endpoint.
 *
 * The numeric values match the protocol ids used by FileZilla exports and
 * the command line.
 */
enum class Protocol : int {
    Ftp = 0,  ///< Plain FTP (RFC 959)
    Sftp = 1  ///< SSH File Transfer Protocol
};

/**
 * @brief Converts a protocol to its display name ("FTP" or "SFTP").
 */
std::string protocolToString(Protocol protocol);

/**
 * @brief Maps a numeric protocol id to a Protocol.
 * @param id Protocol id (0 = FTP, 1 = SFTP).
 * @return The protocol, or nullopt for unsupported ids.
 */
std::optional<Protocol> protocolFromId(int id);

/**
 * @brief Returns the well-known port of a protocol (21 for FTP, 22 for SFTP).
 */
uint16_t defaultPort(Protocol protocol);

/**
 * @brief A network target, independent of credentials.
 */
struct Endpoint {
    std::string host;                 ///< Hostname or IP address
    uint16_t port{21};                ///< TCP port
    Protocol protocol{Protocol::Ftp}; ///< Protocol spoken on the port

    bool operator==(const Endpoint& other) const = default;
};

/**
 * @brief A username/password pair. The password may be empty.
 */
struct Credential {
    std::string username;
    std::string password;

    bool operator==(const Credential& other) const = default;
};

/**
 * @brief One unit of work for the scheduler.
 *
 * Each descriptor produces exactly one ProbeResult.
 */
struct ProbeDescriptor {
    Endpoint endpoint;
    Credential credential;
    std::optional<std::string> checkPath; ///< Remote path to verify, if requested

    bool operator==(const ProbeDescriptor& other) const = default;
};

} // namespace ftpprobe::core
