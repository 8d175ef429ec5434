#include "app/ConsoleReporter.hpp"

#include "infrastructure/report/ReportRenderer.hpp"

#include <spdlog/fmt/fmt.h>

namespace ftpprobe::app {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan = "\033[36m";

std::string optionalMs(const std::optional<double>& ms) {
    return ms ? infra::formatMilliseconds(*ms) : std::string("N/A");
}

} // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, RunMode mode, int progressInterval,
                                 bool quiet, bool color)
    : out_(out),
      mode_(mode),
      progressInterval_(progressInterval > 0 ? static_cast<size_t>(progressInterval) : 1),
      quiet_(quiet),
      color_(color) {}

void ConsoleReporter::printBanner(std::ostream& out, bool color) {
    const char* cyan = color ? kCyan : "";
    const char* yellow = color ? kYellow : "";
    const char* reset = color ? kReset : "";

    out << cyan << R"(
  _____ _____ ____    ____            _
 |  ___|_   _|  _ \  |  _ \ _ __ ___ | |__   ___
 | |_    | | | |_) | | |_) | '__/ _ \| '_ \ / _ \
 |  _|   | | |  __/  |  __/| | | (_) | |_) |  __/
 |_|     |_| |_|     |_|   |_|  \___/|_.__/ \___|
)" << reset << "\n"
        << yellow << "FTP/SFTP Connection Tester & Brute Forcer" << reset << "\n\n";
}

void ConsoleReporter::announce(size_t total) {
    if (quiet_) {
        return;
    }
    if (mode_ == RunMode::BruteForce) {
        out_ << paint(kYellow) << "Starting brute force with " << total << " combinations..."
             << paint(kReset) << std::endl;
    } else {
        out_ << paint(kYellow) << "Checking " << total << (total == 1 ? " server" : " servers")
             << "..." << paint(kReset) << std::endl;
    }
}

void ConsoleReporter::onProgress(const core::ProbeProgress& progress) {
    if (quiet_) {
        return;
    }
    if (mode_ == RunMode::BruteForce) {
        printBruteForce(progress);
    } else {
        printResult(progress);
    }
}

void ConsoleReporter::printBruteForce(const core::ProbeProgress& progress) {
    const auto& r = progress.result;
    if (r.isSuccessful()) {
        out_ << paint(kGreen)
             << fmt::format("✓ FOUND: {}:{}@{}:{} ({:.1f}% complete)", r.username,
                            r.password, r.host, r.port, progress.percentComplete())
             << paint(kReset) << std::endl;
    } else if (progress.completed % progressInterval_ == 0) {
        out_ << paint(kYellow)
             << fmt::format("Progress: {:.1f}% ({}/{})", progress.percentComplete(),
                            progress.completed, progress.total)
             << paint(kReset) << std::endl;
    }
}

void ConsoleReporter::printResult(const core::ProbeProgress& progress) {
    const auto& r = progress.result;
    if (r.isSuccessful()) {
        out_ << paint(kGreen)
             << fmt::format("✓ SUCCESS: {}:{}@{}:{} ({}) - Connection: {}ms, Auth: {}ms",
                            r.username, r.password, r.host, r.port, r.protocolName(),
                            optionalMs(r.connectionTimeMs), optionalMs(r.authTimeMs))
             << paint(kReset) << std::endl;
        return;
    }

    out_ << paint(kRed)
         << fmt::format("✗ FAILED: {}@{}:{} ({})", r.username, r.host, r.port,
                        r.protocolName())
         << paint(kReset) << std::endl;
    for (const auto& error : r.errors) {
        out_ << paint(kYellow) << "  Error: " << error << paint(kReset) << std::endl;
    }
}

const char* ConsoleReporter::paint(const char* code) const {
    return color_ ? code : "";
}

} // namespace ftpprobe::app
