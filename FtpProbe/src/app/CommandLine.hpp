#pragma once

#include "core/types/Endpoint.hpp"
#include "infrastructure/report/ReportWriter.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>
#include <optional>
#include <string>
#include <vector>

namespace ftpprobe::app {

/**
 * @brief What a run does, in order of precedence.
 */
enum class RunMode : int {
    BruteForce = 0, ///< Credential space against one host
    FileZilla = 1,  ///< Every server of a FileZilla export
    Single = 2      ///< One host with one credential
};

/**
 * @brief Validated command-line options.
 *
 * Unset optional values fall back to the configuration file.
 */
struct CliOptions {
    RunMode mode{RunMode::Single};
    bool helpRequested{false};
    bool versionRequested{false};

    std::optional<std::string> filezillaXml;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> username;
    std::optional<std::string> password;
    core::Protocol protocol{core::Protocol::Ftp};

    std::optional<std::string> userList;
    std::optional<std::string> passList;
    std::optional<std::string> comboList;
    std::optional<std::string> portList;

    std::optional<int> timeoutSeconds;
    std::optional<int> maxWorkers;
    std::optional<std::string> checkPath;
    std::vector<infra::ReportTarget> reports; ///< In the order txt, xml, json, csv

    bool quiet{false};
    bool debug{false};
    std::optional<std::string> configDir;
    std::optional<std::string> logFile;
};

/**
 * @brief Parses the ftpprobe command line with QCommandLineParser.
 */
class CommandLine {
public:
    CommandLine();

    CommandLine(const CommandLine&) = delete;
    CommandLine& operator=(const CommandLine&) = delete;

    /**
     * @brief Parses and validates the arguments (program name first).
     *
     * When --help or --version is given the remaining options are not
     * validated.
     * @throws std::runtime_error on unknown options, invalid values or when
     *         no usable mode is selected.
     */
    CliOptions parse(const QStringList& arguments);

    /**
     * @brief Usage text. Requires a QCoreApplication instance.
     */
    std::string helpText() const;

private:
    QCommandLineParser parser_;
    QCommandLineOption helpOption_;
    QCommandLineOption versionOption_;
};

} // namespace ftpprobe::app
