/**
 * @file FtpReply.hpp
 * @brief FTP control-connection reply parsing.
 */

#pragma once

#include "core/types/ClientStatus.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ftpprobe::infra {

/**
 * @brief A complete (possibly multi-line) FTP reply.
 */
struct FtpReply {
    int code{0};                    ///< Three-digit reply code
    std::vector<std::string> lines; ///< Raw lines without CRLF

    /**
     * @brief Reply lines joined with '\n'.
     */
    [[nodiscard]] std::string text() const;

    [[nodiscard]] bool isPreliminary() const { return code >= 100 && code < 200; }
    [[nodiscard]] bool isCompletion() const { return code >= 200 && code < 300; }
    [[nodiscard]] bool isIntermediate() const { return code >= 300 && code < 400; }
    [[nodiscard]] bool isError() const { return code >= 400; }
};

/**
 * @brief Reads the reply code from the first line of a reply.
 * @return The code, or nullopt when the line does not start with three digits.
 */
std::optional<int> parseReplyCode(const std::string& line);

/**
 * @brief True when @p line ends a multi-line reply that started with @p code.
 */
bool isFinalReplyLine(const std::string& line, int code);

/**
 * @brief Maps an error reply to a client status.
 *
 * 4xx replies are transient and reported as Protocol. Among 5xx replies,
 * 530 means the login was rejected, 500/501/502/504 mean the command is
 * not supported and anything else is a permanent rejection.
 */
core::ClientStatus classifyReply(const FtpReply& reply);

/**
 * @brief Extracts the feature lines from a FEAT reply.
 *
 * The first and last lines are the framing lines of the 211 reply.
 */
std::vector<std::string> parseFeatureReply(const FtpReply& reply);

/**
 * @brief Extracts the data port from a 227 PASV reply.
 *
 * The address part is ignored; the data connection goes to the control
 * connection's peer.
 */
std::optional<uint16_t> parsePassiveReply(const std::string& text);

/**
 * @brief Extracts the data port from a 229 EPSV reply, e.g. "(|||6446|)".
 */
std::optional<uint16_t> parseExtendedPassiveReply(const std::string& text);

/**
 * @brief Splits an NLST payload into names, dropping blank lines.
 */
std::vector<std::string> parseNameList(const std::string& payload);

} // namespace ftpprobe::infra
