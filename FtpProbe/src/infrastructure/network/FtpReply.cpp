#include "infrastructure/network/FtpReply.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace ftpprobe::infra {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c) != 0; })
                   .base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

std::string FtpReply::text() const {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

std::optional<int> parseReplyCode(const std::string& line) {
    if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
        !std::isdigit(static_cast<unsigned char>(line[1])) ||
        !std::isdigit(static_cast<unsigned char>(line[2]))) {
        return std::nullopt;
    }
    if (line.size() > 3 && line[3] != ' ' && line[3] != '-') {
        return std::nullopt;
    }
    return (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
}

bool isFinalReplyLine(const std::string& line, int code) {
    auto lineCode = parseReplyCode(line);
    return lineCode && *lineCode == code && (line.size() == 3 || line[3] == ' ');
}

core::ClientStatus classifyReply(const FtpReply& reply) {
    using core::ClientErrorKind;

    if (!reply.isError()) {
        return core::ClientStatus::success();
    }
    if (reply.code < 500) {
        return core::ClientStatus::failure(ClientErrorKind::Protocol, reply.text());
    }
    switch (reply.code) {
    case 530:
        return core::ClientStatus::failure(ClientErrorKind::AuthenticationFailed, reply.text());
    case 500:
    case 501:
    case 502:
    case 504:
        return core::ClientStatus::failure(ClientErrorKind::NotSupported, reply.text());
    default:
        return core::ClientStatus::failure(ClientErrorKind::PermissionDenied, reply.text());
    }
}

std::vector<std::string> parseFeatureReply(const FtpReply& reply) {
    std::vector<std::string> features;
    if (reply.code != 211 || reply.lines.size() < 3) {
        return features;
    }
    for (size_t i = 1; i + 1 < reply.lines.size(); ++i) {
        auto feature = trim(reply.lines[i]);
        if (!feature.empty()) {
            features.push_back(std::move(feature));
        }
    }
    return features;
}

std::optional<uint16_t> parsePassiveReply(const std::string& text) {
    static const std::regex pattern(
        R"((\d{1,3}),(\d{1,3}),(\d{1,3}),(\d{1,3}),(\d{1,3}),(\d{1,3}))");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return std::nullopt;
    }
    int high = std::stoi(match[5].str());
    int low = std::stoi(match[6].str());
    if (high > 255 || low > 255) {
        return std::nullopt;
    }
    int port = high * 256 + low;
    if (port == 0) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

std::optional<uint16_t> parseExtendedPassiveReply(const std::string& text) {
    static const std::regex pattern(R"(\((.)\1\1(\d+)\1\))");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return std::nullopt;
    }
    auto digits = match[2].str();
    if (digits.size() > 5) {
        return std::nullopt;
    }
    int port = std::stoi(digits);
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

std::vector<std::string> parseNameList(const std::string& payload) {
    std::vector<std::string> names;
    std::istringstream stream(payload);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            names.push_back(line);
        }
    }
    return names;
}

} // namespace ftpprobe::infra
