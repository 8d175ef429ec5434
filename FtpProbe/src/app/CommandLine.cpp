#include "app/CommandLine.hpp"

#include "infrastructure/input/Wordlist.hpp"

#include <stdexcept>
#include <utility>

namespace ftpprobe::app {

namespace {

std::optional<std::string> valueOf(const QCommandLineParser& parser, const QString& name) {
    if (!parser.isSet(name)) {
        return std::nullopt;
    }
    return parser.value(name).toStdString();
}

int positiveInteger(const QCommandLineParser& parser, const QString& name) {
    const auto text = parser.value(name);
    bool ok = false;
    const int value = text.toInt(&ok);
    if (!ok || value < 1) {
        throw std::runtime_error("Invalid value for --" + name.toStdString() + ": '" +
                                 text.toStdString() + "' (expected a positive integer)");
    }
    return value;
}

} // namespace

CommandLine::CommandLine()
    : helpOption_(parser_.addHelpOption()), versionOption_(parser_.addVersionOption()) {
    parser_.setApplicationDescription(
        QStringLiteral("FTP/SFTP connection tester and credential brute-forcer"));

    parser_.addOptions({
        {QStringLiteral("filezilla-xml"), QStringLiteral("Path to a FileZilla XML export."),
         QStringLiteral("file")},
        {QStringLiteral("host"), QStringLiteral("Target host (IP or domain)."),
         QStringLiteral("host")},
        {QStringLiteral("brute-force"), QStringLiteral("Enable brute-force mode.")},
        {QStringLiteral("port"), QStringLiteral("Target port (default 21 FTP / 22 SFTP)."),
         QStringLiteral("port")},
        {QStringLiteral("username"), QStringLiteral("Username for authentication."),
         QStringLiteral("name")},
        {QStringLiteral("password"), QStringLiteral("Password for authentication."),
         QStringLiteral("password")},
        {QStringLiteral("protocol"), QStringLiteral("0 = FTP (default), 1 = SFTP."),
         QStringLiteral("id"), QStringLiteral("0")},
        {QStringLiteral("user-list"), QStringLiteral("File containing usernames."),
         QStringLiteral("file")},
        {QStringLiteral("pass-list"), QStringLiteral("File containing passwords."),
         QStringLiteral("file")},
        {QStringLiteral("combo-list"), QStringLiteral("File containing user:password combos."),
         QStringLiteral("file")},
        {QStringLiteral("port-list"), QStringLiteral("File or comma-separated list of ports."),
         QStringLiteral("ports")},
        {QStringLiteral("timeout"), QStringLiteral("Connection timeout in seconds."),
         QStringLiteral("seconds")},
        {QStringLiteral("max-workers"), QStringLiteral("Concurrent connections."),
         QStringLiteral("count")},
        {QStringLiteral("check-path"), QStringLiteral("Path to check on the server."),
         QStringLiteral("path")},
        {QStringLiteral("txt"), QStringLiteral("Save results as text (- for stdout)."),
         QStringLiteral("file")},
        {QStringLiteral("xml"), QStringLiteral("Save results as XML (- for stdout)."),
         QStringLiteral("file")},
        {QStringLiteral("json"), QStringLiteral("Save results as JSON (- for stdout)."),
         QStringLiteral("file")},
        {QStringLiteral("csv"), QStringLiteral("Save results as CSV (- for stdout)."),
         QStringLiteral("file")},
        {QStringLiteral("quiet"), QStringLiteral("Suppress console output.")},
        {QStringLiteral("debug"), QStringLiteral("Enable debug logging.")},
        {QStringLiteral("config-dir"), QStringLiteral("Directory holding config.json."),
         QStringLiteral("dir")},
        {QStringLiteral("log-file"), QStringLiteral("Also write the log to this file."),
         QStringLiteral("file")},
    });
}

CliOptions CommandLine::parse(const QStringList& arguments) {
    if (!parser_.parse(arguments)) {
        throw std::runtime_error(parser_.errorText().toStdString());
    }

    CliOptions options;
    options.helpRequested = parser_.isSet(helpOption_);
    options.versionRequested = parser_.isSet(versionOption_);
    if (options.helpRequested || options.versionRequested) {
        return options;
    }

    if (!parser_.positionalArguments().isEmpty()) {
        throw std::runtime_error("Unexpected argument: " +
                                 parser_.positionalArguments().constFirst().toStdString());
    }

    options.filezillaXml = valueOf(parser_, QStringLiteral("filezilla-xml"));
    options.host = valueOf(parser_, QStringLiteral("host"));
    options.username = valueOf(parser_, QStringLiteral("username"));
    options.password = valueOf(parser_, QStringLiteral("password"));
    options.userList = valueOf(parser_, QStringLiteral("user-list"));
    options.passList = valueOf(parser_, QStringLiteral("pass-list"));
    options.comboList = valueOf(parser_, QStringLiteral("combo-list"));
    options.portList = valueOf(parser_, QStringLiteral("port-list"));
    options.checkPath = valueOf(parser_, QStringLiteral("check-path"));
    options.configDir = valueOf(parser_, QStringLiteral("config-dir"));
    options.logFile = valueOf(parser_, QStringLiteral("log-file"));
    options.quiet = parser_.isSet(QStringLiteral("quiet"));
    options.debug = parser_.isSet(QStringLiteral("debug"));

    const auto protocolText = parser_.value(QStringLiteral("protocol")).toStdString();
    bool protocolOk = false;
    const int protocolId = QString::fromStdString(protocolText).toInt(&protocolOk);
    auto protocol = protocolOk ? core::protocolFromId(protocolId) : std::nullopt;
    if (!protocol) {
        throw std::runtime_error("Invalid value for --protocol: '" + protocolText +
                                 "' (expected 0 for FTP or 1 for SFTP)");
    }
    options.protocol = *protocol;

    if (auto port = valueOf(parser_, QStringLiteral("port"))) {
        options.port = infra::parsePort(*port);
        if (!options.port) {
            throw std::runtime_error("Invalid value for --port: '" + *port + "'");
        }
    }
    if (parser_.isSet(QStringLiteral("timeout"))) {
        options.timeoutSeconds = positiveInteger(parser_, QStringLiteral("timeout"));
    }
    if (parser_.isSet(QStringLiteral("max-workers"))) {
        options.maxWorkers = positiveInteger(parser_, QStringLiteral("max-workers"));
    }

    const std::pair<const char*, infra::ReportFormat> reportOptions[] = {
        {"txt", infra::ReportFormat::Text},
        {"xml", infra::ReportFormat::Xml},
        {"json", infra::ReportFormat::Json},
        {"csv", infra::ReportFormat::Csv},
    };
    for (const auto& [name, format] : reportOptions) {
        if (auto destination = valueOf(parser_, QString::fromLatin1(name))) {
            if (destination->empty()) {
                throw std::runtime_error(std::string("Empty destination for --") + name);
            }
            options.reports.push_back({format, *destination});
        }
    }

    if (parser_.isSet(QStringLiteral("brute-force"))) {
        if (!options.host || options.host->empty()) {
            throw std::runtime_error("--host is required in brute-force mode");
        }
        options.mode = RunMode::BruteForce;
    } else if (options.filezillaXml) {
        options.mode = RunMode::FileZilla;
    } else if (options.host) {
        if (options.host->empty()) {
            throw std::runtime_error("--host must not be empty");
        }
        if (!options.username || !options.password) {
            throw std::runtime_error(
                "--username and --password are required with --host (non-brute mode)");
        }
        options.mode = RunMode::Single;
    } else {
        throw std::runtime_error(
            "No mode selected: use --brute-force with --host, --filezilla-xml, or --host");
    }

    return options;
}

std::string CommandLine::helpText() const {
    return parser_.helpText().toStdString();
}

} // namespace ftpprobe::app
