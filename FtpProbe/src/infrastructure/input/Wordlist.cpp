#include "infrastructure/input/Wordlist.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ftpprobe::infra {

namespace {

std::string_view trim(std::string_view s) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && isSpace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && isSpace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<uint16_t> toPorts(const std::vector<std::string>& entries, const std::string& source) {
    std::vector<uint16_t> ports;
    ports.reserve(entries.size());
    for (const auto& entry : entries) {
        auto port = parsePort(entry);
        if (!port) {
            throw std::runtime_error("Invalid port '" + entry + "' in port list " + source);
        }
        ports.push_back(*port);
    }
    if (ports.empty()) {
        throw std::runtime_error("Port list " + source + " is empty");
    }
    return ports;
}

} // namespace

std::vector<std::string> parseWordlist(std::string_view text) {
    std::vector<std::string> words;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = trim(text.substr(start, end - start));
        if (!line.empty() && line.front() != '#') {
            words.emplace_back(line);
        }
        start = end + 1;
    }
    return words;
}

std::vector<std::string> readWordlist(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("Error reading wordlist {}: cannot open file", path.string());
        return {};
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        spdlog::error("Error reading wordlist {}: read failed", path.string());
        return {};
    }

    auto words = parseWordlist(content.str());
    spdlog::debug("Loaded {} entries from {}", words.size(), path.string());
    return words;
}

std::vector<core::Credential> parseComboLines(const std::vector<std::string>& lines) {
    std::vector<core::Credential> combos;
    for (const auto& line : lines) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            spdlog::debug("Skipping combo entry without ':'");
            continue;
        }
        const std::string_view view(line);
        combos.push_back({std::string(trim(view.substr(0, colon))),
                          std::string(trim(view.substr(colon + 1)))});
    }
    return combos;
}

std::optional<uint16_t> parsePort(std::string_view text) {
    text = trim(text);
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 1 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::vector<uint16_t> parsePortList(const std::string& spec) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(spec, ec)) {
        return toPorts(readWordlist(spec), "file " + spec);
    }

    std::vector<std::string> entries;
    std::string_view rest(spec);
    while (true) {
        const auto comma = rest.find(',');
        auto entry = trim(rest.substr(0, comma));
        if (!entry.empty()) {
            entries.emplace_back(entry);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return toPorts(entries, "'" + spec + "'");
}

} // namespace ftpprobe::infra
