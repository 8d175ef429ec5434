#include "infrastructure/input/FileZillaImporter.hpp"

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QStringDecoder>
#include <QXmlStreamReader>
#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>

namespace ftpprobe::infra {

namespace {

/**
 * @brief Text of the child elements of one <Server>, before validation.
 */
struct RawServer {
    std::optional<QString> host;
    std::optional<QString> port;
    std::optional<QString> protocol;
    std::optional<QString> user;
    std::optional<QString> pass;
    QString passEncoding;
    std::optional<QString> name;
    std::optional<QString> logonType;
};

RawServer readServerElement(QXmlStreamReader& reader) {
    RawServer raw;
    while (reader.readNextStartElement()) {
        const auto element = reader.name();
        if (element == QLatin1String("Host")) {
            raw.host = reader.readElementText().trimmed();
        } else if (element == QLatin1String("Port")) {
            raw.port = reader.readElementText().trimmed();
        } else if (element == QLatin1String("Protocol")) {
            raw.protocol = reader.readElementText().trimmed();
        } else if (element == QLatin1String("User")) {
            raw.user = reader.readElementText();
        } else if (element == QLatin1String("Pass")) {
            raw.passEncoding = reader.attributes().value(QLatin1String("encoding")).toString();
            raw.pass = reader.readElementText();
        } else if (element == QLatin1String("Name")) {
            raw.name = reader.readElementText().trimmed();
        } else if (element == QLatin1String("Logontype")) {
            raw.logonType = reader.readElementText().trimmed();
        } else {
            reader.skipCurrentElement();
        }
    }
    return raw;
}

int parseInteger(const QString& text, const char* field, qint64 line) {
    bool ok = false;
    const int value = text.toInt(&ok);
    if (!ok) {
        throw std::runtime_error("Invalid " + std::string(field) + " '" + text.toStdString() +
                                 "' in FileZilla server near line " + std::to_string(line));
    }
    return value;
}

std::optional<FileZillaServer> toServer(const RawServer& raw, qint64 line) {
    // Kept so the entry is reported as a failed probe
    const std::string host = raw.host ? raw.host->toStdString() : std::string();
    if (host.empty()) {
        spdlog::warn("FileZilla server without host near line {}", line);
    }

    const int protocolId = raw.protocol ? parseInteger(*raw.protocol, "protocol", line) : 0;
    auto protocol = core::protocolFromId(protocolId);
    if (!protocol) {
        spdlog::warn("Skipping FileZilla server {} with unsupported protocol {}",
                     host, protocolId);
        return std::nullopt;
    }

    int port = 21;
    if (raw.port) {
        port = parseInteger(*raw.port, "port", line);
        if (port < 1 || port > 65535) {
            throw std::runtime_error("Port " + std::to_string(port) +
                                     " out of range in FileZilla server near line " +
                                     std::to_string(line));
        }
    }

    FileZillaServer server;
    server.endpoint.host = host;
    server.endpoint.port = static_cast<uint16_t>(port);
    server.endpoint.protocol = *protocol;
    server.credential.username = raw.user ? raw.user->toStdString() : std::string();
    if (raw.pass) {
        const auto pass = raw.pass->toStdString();
        server.credential.password = raw.passEncoding == QLatin1String("base64")
                                         ? FileZillaImporter::decodePassword(pass)
                                         : pass;
    }
    if (raw.logonType) {
        server.logonType = parseInteger(*raw.logonType, "logon type", line);
    }
    if (server.logonType == 0 && server.credential.username.empty()) {
        server.credential.username = "anonymous";
    }
    server.name = raw.name && !raw.name->isEmpty()
                      ? raw.name->toStdString()
                      : server.credential.username + "@" + server.endpoint.host + ":" +
                            std::to_string(server.endpoint.port);
    return server;
}

} // namespace

std::vector<FileZillaServer> FileZillaImporter::parseFile(const std::filesystem::path& path) {
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("Cannot open FileZilla export " + path.string() + ": " +
                                 file.errorString().toStdString());
    }
    auto servers = parse(file.readAll());
    spdlog::info("Loaded {} servers from {}", servers.size(), path.string());
    return servers;
}

std::vector<FileZillaServer> FileZillaImporter::parse(const QByteArray& content) {
    std::vector<FileZillaServer> servers;
    QXmlStreamReader reader(content);

    while (!reader.atEnd()) {
        reader.readNext();
        if (reader.isStartElement() && reader.name() == QLatin1String("Server")) {
            const auto line = reader.lineNumber();
            auto raw = readServerElement(reader);
            if (reader.hasError()) {
                break;
            }
            if (auto server = toServer(raw, line)) {
                servers.push_back(std::move(*server));
            }
        }
    }

    if (reader.hasError()) {
        throw std::runtime_error("Malformed FileZilla export at line " +
                                 std::to_string(reader.lineNumber()) + ": " +
                                 reader.errorString().toStdString());
    }
    return servers;
}

std::string FileZillaImporter::decodePassword(const std::string& raw) {
    if (raw.empty()) {
        return raw;
    }

    auto decoded = QByteArray::fromBase64Encoding(QByteArray::fromStdString(raw),
                                                  QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        spdlog::debug("FileZilla password is not valid base64, using raw text");
        return raw;
    }

    QStringDecoder utf8(QStringDecoder::Utf8);
    const QString text = utf8(*decoded);
    if (utf8.hasError()) {
        spdlog::debug("FileZilla password is not UTF-8, using raw text");
        return raw;
    }
    return text.toStdString();
}

} // namespace ftpprobe::infra
