#include "infrastructure/report/ReportRenderer.hpp"

#include <QString>
#include <QXmlStreamWriter>
#include <spdlog/fmt/fmt.h>

#include <sstream>

namespace ftpprobe::infra {

namespace {

constexpr size_t kWelcomePreviewLength = 100;

QString qs(const std::string& value) {
    return QString::fromStdString(value);
}

QString boolText(bool value) {
    return value ? QStringLiteral("true") : QStringLiteral("false");
}

nlohmann::json optionalMs(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string csvMs(const std::optional<double>& value) {
    return value ? formatMilliseconds(*value) : std::string();
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string joined;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            joined += "; ";
        }
        joined += errors[i];
    }
    return joined;
}

} // namespace

std::string reportFormatToString(ReportFormat format) {
    switch (format) {
    case ReportFormat::Text:
        return "TXT";
    case ReportFormat::Xml:
        return "XML";
    case ReportFormat::Json:
        return "JSON";
    case ReportFormat::Csv:
        return "CSV";
    }
    return "Unknown";
}

std::string formatMilliseconds(double ms) {
    return fmt::format("{}", ms);
}

nlohmann::json resultToJson(const core::ProbeResult& result) {
    nlohmann::json j;
    j["host"] = result.host;
    j["port"] = result.port;
    j["username"] = result.username;
    j["password"] = result.password;
    j["protocol"] = result.protocolName();
    j["timestamp"] = core::formatIsoTimestamp(result.timestamp);
    j["connection"] = result.connection;
    j["connection_time"] = optionalMs(result.connectionTimeMs);
    j["authentication"] = result.authentication;
    j["auth_time"] = optionalMs(result.authTimeMs);

    if (result.pathExists) {
        j["path_exists"] = *result.pathExists;
        j["path_type"] = core::ProbeResult::pathTypeToString(result.pathType);
    } else {
        j["path_exists"] = nullptr;
        j["path_type"] = nullptr;
    }
    j["path_check_time"] = optionalMs(result.pathCheckTimeMs);

    j["welcome_message"] =
        result.welcomeMessage ? nlohmann::json(*result.welcomeMessage) : nlohmann::json(nullptr);
    j["features"] = result.features;
    j["errors"] = result.errors;
    j["total_time"] = optionalMs(result.totalTimeMs);
    return j;
}

std::string renderTextReport(const std::vector<core::ProbeResult>& results,
                             const core::ResultSummary& summary,
                             std::chrono::system_clock::time_point generatedAt) {
    std::ostringstream out;
    out << "Advanced FTP/SFTP Check Results\n";
    out << "==============================\n";
    out << "Generated: " << core::formatIsoTimestamp(generatedAt) << "\n";
    out << "Total servers: " << summary.total << "\n\n";
    out << "Successful connections: " << summary.successful << "\n";
    out << "Failed connections: " << summary.failed << "\n\n";

    size_t index = 1;
    for (const auto& r : results) {
        out << "Server " << index++ << ": " << r.username << "@" << r.host << ":" << r.port
            << " (" << r.protocolName() << ")\n";

        out << "  Connection: " << (r.connection ? "Success" : "Failed");
        if (r.connectionTimeMs) {
            out << " (" << formatMilliseconds(*r.connectionTimeMs) << "ms)";
        }
        out << "\n";

        out << "  Authentication: " << (r.authentication ? "Success" : "Failed");
        if (r.authTimeMs) {
            out << " (" << formatMilliseconds(*r.authTimeMs) << "ms)";
        }
        out << "\n";

        if (r.pathExists) {
            out << "  Path check: " << (*r.pathExists ? "Exists" : "Missing");
            if (r.pathCheckTimeMs) {
                out << " (" << formatMilliseconds(*r.pathCheckTimeMs) << "ms)";
            }
            if (r.pathType != core::PathType::Unknown) {
                out << " [Type: " << core::ProbeResult::pathTypeToString(r.pathType) << "]";
            }
            out << "\n";
        }

        if (r.welcomeMessage && !r.welcomeMessage->empty()) {
            const auto& welcome = *r.welcomeMessage;
            out << "  Welcome: " << welcome.substr(0, kWelcomePreviewLength);
            if (welcome.size() > kWelcomePreviewLength) {
                out << "...";
            }
            out << "\n";
        }

        if (!r.features.empty()) {
            out << "  Features: " << r.features.size() << " supported\n";
        }

        out << "  Total time: "
            << (r.totalTimeMs ? formatMilliseconds(*r.totalTimeMs) : std::string("N/A"))
            << "ms\n";

        if (!r.errors.empty()) {
            out << "  Errors:\n";
            for (const auto& error : r.errors) {
                out << "    - " << error << "\n";
            }
        }
        out << "\n";
    }
    return out.str();
}

std::string renderXmlReport(const std::vector<core::ProbeResult>& results,
                            const core::ResultSummary& summary,
                            std::chrono::system_clock::time_point generatedAt) {
    QString document;
    QXmlStreamWriter xml(&document);
    xml.setAutoFormatting(true);
    xml.setAutoFormattingIndent(2);

    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("ftp_check_results"));
    xml.writeTextElement(QStringLiteral("timestamp"), qs(core::formatIsoTimestamp(generatedAt)));
    xml.writeTextElement(QStringLiteral("total_servers"), QString::number(summary.total));
    xml.writeTextElement(QStringLiteral("successful_connections"),
                         QString::number(summary.successful));
    xml.writeTextElement(QStringLiteral("failed_connections"), QString::number(summary.failed));

    xml.writeStartElement(QStringLiteral("servers"));
    for (const auto& r : results) {
        xml.writeStartElement(QStringLiteral("server"));
        xml.writeTextElement(QStringLiteral("host"), qs(r.host));
        xml.writeTextElement(QStringLiteral("port"), QString::number(r.port));
        xml.writeTextElement(QStringLiteral("username"), qs(r.username));
        xml.writeTextElement(QStringLiteral("password"), qs(r.password));
        xml.writeTextElement(QStringLiteral("protocol"), qs(r.protocolName()));
        xml.writeTextElement(QStringLiteral("timestamp"), qs(core::formatIsoTimestamp(r.timestamp)));

        xml.writeStartElement(QStringLiteral("status"));
        xml.writeTextElement(QStringLiteral("connection"), boolText(r.connection));
        if (r.connectionTimeMs) {
            xml.writeTextElement(QStringLiteral("connection_time_ms"),
                                 qs(formatMilliseconds(*r.connectionTimeMs)));
        }
        xml.writeTextElement(QStringLiteral("authentication"), boolText(r.authentication));
        if (r.authTimeMs) {
            xml.writeTextElement(QStringLiteral("authentication_time_ms"),
                                 qs(formatMilliseconds(*r.authTimeMs)));
        }
        xml.writeEndElement(); // status

        if (r.pathExists) {
            xml.writeStartElement(QStringLiteral("path_check"));
            xml.writeTextElement(QStringLiteral("exists"), boolText(*r.pathExists));
            if (r.pathType != core::PathType::Unknown) {
                xml.writeTextElement(QStringLiteral("type"),
                                     qs(core::ProbeResult::pathTypeToString(r.pathType)));
            }
            if (r.pathCheckTimeMs) {
                xml.writeTextElement(QStringLiteral("check_time_ms"),
                                     qs(formatMilliseconds(*r.pathCheckTimeMs)));
            }
            xml.writeEndElement(); // path_check
        }

        if (r.welcomeMessage && !r.welcomeMessage->empty()) {
            xml.writeTextElement(QStringLiteral("welcome_message"), qs(*r.welcomeMessage));
        }

        if (!r.features.empty()) {
            xml.writeStartElement(QStringLiteral("features"));
            for (const auto& feature : r.features) {
                xml.writeTextElement(QStringLiteral("feature"), qs(feature));
            }
            xml.writeEndElement(); // features
        }

        xml.writeTextElement(QStringLiteral("total_time_ms"),
                             r.totalTimeMs ? qs(formatMilliseconds(*r.totalTimeMs))
                                           : QStringLiteral("N/A"));

        if (!r.errors.empty()) {
            xml.writeStartElement(QStringLiteral("errors"));
            for (const auto& error : r.errors) {
                xml.writeTextElement(QStringLiteral("error"), qs(error));
            }
            xml.writeEndElement(); // errors
        }

        xml.writeEndElement(); // server
    }
    xml.writeEndElement(); // servers
    xml.writeEndElement(); // ftp_check_results
    xml.writeEndDocument();

    return document.toStdString();
}

std::string renderJsonReport(const std::vector<core::ProbeResult>& results,
                             const core::ResultSummary& summary,
                             std::chrono::system_clock::time_point generatedAt) {
    nlohmann::json j;
    j["timestamp"] = core::formatIsoTimestamp(generatedAt);
    j["total_servers"] = summary.total;
    j["successful_connections"] = summary.successful;
    j["failed_connections"] = summary.failed;
    j["servers"] = nlohmann::json::array();
    for (const auto& r : results) {
        j["servers"].push_back(resultToJson(r));
    }
    // Banners and wordlist entries are not guaranteed to be valid UTF-8
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string renderCsvReport(const std::vector<core::ProbeResult>& results,
                            const core::ResultSummary& /*summary*/,
                            std::chrono::system_clock::time_point /*generatedAt*/) {
    std::ostringstream out;
    out << "Timestamp,Host,Port,Username,Password,Protocol,Connection,Connection Time (ms),"
           "Authentication,Auth Time (ms),Path Exists,Path Type,Path Check Time (ms),"
           "Welcome Message,Features,Total Time (ms),Errors\n";

    for (const auto& r : results) {
        std::string pathExists = "N/A";
        if (r.pathExists) {
            pathExists = *r.pathExists ? "Yes" : "No";
        }
        const std::string pathType = r.pathType != core::PathType::Unknown
                                         ? core::ProbeResult::pathTypeToString(r.pathType)
                                         : std::string();

        out << core::formatIsoTimestamp(r.timestamp) << "," << csvField(r.host) << "," << r.port << "," << csvField(r.username) << ","
            << csvField(r.password) << "," << r.protocolName() << ","
            << (r.connection ? "Success" : "Failed") << "," << csvMs(r.connectionTimeMs) << ","
            << (r.authentication ? "Success" : "Failed") << "," << csvMs(r.authTimeMs) << ","
            << pathExists << "," << pathType << "," << csvMs(r.pathCheckTimeMs) << ","
            << csvField(r.welcomeMessage.value_or("")) << "," << r.features.size() << ","
            << csvMs(r.totalTimeMs) << "," << csvField(joinErrors(r.errors)) << "\n";
    }
    return out.str();
}

std::string renderReport(ReportFormat format, const std::vector<core::ProbeResult>& results,
                         const core::ResultSummary& summary,
                         std::chrono::system_clock::time_point generatedAt) {
    switch (format) {
    case ReportFormat::Text:
        return renderTextReport(results, summary, generatedAt);
    case ReportFormat::Xml:
        return renderXmlReport(results, summary, generatedAt);
    case ReportFormat::Json:
        return renderJsonReport(results, summary, generatedAt);
    case ReportFormat::Csv:
        return renderCsvReport(results, summary, generatedAt);
    }
    return {};
}

} // namespace ftpprobe::infra
