#include "infrastructure/report/ReportWriter.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <ostream>

namespace ftpprobe::infra {

ReportWriter::ReportWriter(std::ostream& console) : console_(console) {}

bool ReportWriter::write(const ReportTarget& target, const std::vector<core::ProbeResult>& results,
                         const core::ResultSummary& summary,
                         std::chrono::system_clock::time_point generatedAt) {
    const auto formatName = reportFormatToString(target.format);

    try {
        auto content = renderReport(target.format, results, summary, generatedAt);

        if (target.destination == "-") {
            console_ << content;
            if (!content.empty() && content.back() != '\n') {
                console_ << '\n';
            }
            console_.flush();
            return true;
        }

        const std::filesystem::path path(target.destination);
        if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to open {} report file for writing: {}", formatName,
                          target.destination);
            return false;
        }
        file << content;
        if (!file) {
            spdlog::error("Failed to write {} report to {}", formatName, target.destination);
            return false;
        }

        spdlog::info("{} report saved to {}", formatName, target.destination);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write {} report: {}", formatName, e.what());
        return false;
    }
}

size_t ReportWriter::writeAll(const std::vector<ReportTarget>& targets,
                              const std::vector<core::ProbeResult>& results) {
    const auto generatedAt = std::chrono::system_clock::now();
    const auto summary = core::summarize(results);

    size_t failures = 0;
    for (const auto& target : targets) {
        if (!write(target, results, summary, generatedAt)) {
            ++failures;
        }
    }
    return failures;
}

} // namespace ftpprobe::infra
