/**
 * @file BruteForceSpec.hpp
 * @brief Description of a brute-force combination space.
 */

#pragma once

#include "core/types/Endpoint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ftpprobe::core {

/**
 * @brief Username/password/port sets to try against a single host.
 *
 * When combos is set, its fixed pairs replace the usernames x passwords
 * cross-product. An empty port list stands for the protocol's default port.
 */
struct BruteForceSpec {
    std::string host;                           ///< Target host
    Protocol protocol{Protocol::Ftp};           ///< Protocol for every attempt
    std::vector<std::string> usernames;         ///< Candidate usernames
    std::vector<std::string> passwords;         ///< Candidate passwords
    std::vector<uint16_t> ports;                ///< Candidate ports
    std::optional<std::vector<Credential>> combos; ///< Explicit user:password pairs
    std::optional<std::string> checkPath;       ///< Path verified on every attempt
};

} // namespace ftpprobe::core
