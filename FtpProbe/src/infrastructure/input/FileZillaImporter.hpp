/**
 * @file FileZillaImporter.hpp
 * @brief Reads server entries from a FileZilla site manager export.
 */

#pragma once

#include "core/types/Endpoint.hpp"

#include <filesystem>
#include <string>
#include <vector>

class QByteArray;

namespace ftpprobe::infra {

/**
 * @brief One server entry from a FileZilla export.
 */
struct FileZillaServer {
    std::string name;           ///< <Name>, or "user@host:port" when absent
    core::Endpoint endpoint;    ///< Host, port (default 21) and protocol (default FTP)
    core::Credential credential;
    int logonType{1};           ///< FileZilla logon type; 0 means anonymous

    bool operator==(const FileZillaServer& other) const = default;
};

/**
 * @brief Parses FileZilla XML exports (sitemanager.xml, "Export" files).
 *
 * Every <Server> element is read regardless of how deeply it is nested in
 * <Folder> elements. Passwords with encoding="base64" are decoded; a value
 * that is not valid base64-encoded UTF-8 is kept as written. Servers with an
 * unsupported protocol or no host are skipped with a warning.
 */
class FileZillaImporter {
public:
    /**
     * @brief Parses an export file.
     * @throws std::runtime_error if the file cannot be read or is malformed.
     */
    static std::vector<FileZillaServer> parseFile(const std::filesystem::path& path);

    /**
     * @brief Parses an export held in memory.
     * @throws std::runtime_error if the document is malformed.
     */
    static std::vector<FileZillaServer> parse(const QByteArray& content);

    /**
     * @brief Decodes a base64 password, falling back to the raw text.
     */
    static std::string decodePassword(const std::string& raw);
};

} // namespace ftpprobe::infra
