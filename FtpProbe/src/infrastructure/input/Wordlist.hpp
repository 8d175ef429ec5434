/**
 * @file Wordlist.hpp
 * @brief Loaders for username, password, combo and port lists.
 */

#pragma once

#include "core/types/Endpoint.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ftpprobe::infra {

/**
 * @brief Reads a wordlist file.
 *
 * Lines are trimmed; blank lines and lines starting with '#' are dropped.
 * An unreadable file yields an empty list and an error log line.
 */
std::vector<std::string> readWordlist(const std::filesystem::path& path);

/**
 * @brief Splits wordlist text into entries with the same rules as readWordlist().
 */
std::vector<std::string> parseWordlist(std::string_view text);

/**
 * @brief Turns "user:password" entries into credentials.
 *
 * Each entry is split at the first ':' and both sides are trimmed, so the
 * password may itself contain ':'. Entries without ':' are skipped.
 */
std::vector<core::Credential> parseComboLines(const std::vector<std::string>& lines);

/**
 * @brief Parses a single port number.
 * @return The port, or nullopt unless @p text is an integer in 1..65535.
 */
std::optional<uint16_t> parsePort(std::string_view text);

/**
 * @brief Resolves a --port-list argument.
 *
 * If @p spec names an existing file, the file is read as a wordlist of
 * ports; otherwise it is treated as a comma-separated list.
 * @throws std::runtime_error on any entry that is not a valid port, or
 *         when the list is empty.
 */
std::vector<uint16_t> parsePortList(const std::string& spec);

} // namespace ftpprobe::infra
