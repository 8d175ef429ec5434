#pragma once

#include "infrastructure/report/ReportRenderer.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace ftpprobe::infra {

/**
 * @brief A requested report: format plus destination.
 */
struct ReportTarget {
    ReportFormat format{ReportFormat::Text};
    std::string destination; ///< File path, or "-" for the console stream

    bool operator==(const ReportTarget& other) const = default;
};

/**
 * @brief Renders reports and writes them to files or the console stream.
 */
class ReportWriter {
public:
    /**
     * @brief Constructs a writer.
     * @param console Stream used for the "-" destination.
     */
    explicit ReportWriter(std::ostream& console);

    /**
     * @brief Renders and writes one report.
     * @return True on success. Failures are logged.
     */
    bool write(const ReportTarget& target, const std::vector<core::ProbeResult>& results,
               const core::ResultSummary& summary,
               std::chrono::system_clock::time_point generatedAt);

    /**
     * @brief Writes every requested report with a shared generation time.
     * @return Number of reports that could not be written.
     */
    size_t writeAll(const std::vector<ReportTarget>& targets,
                    const std::vector<core::ProbeResult>& results);

private:
    std::ostream& console_;
};

} // namespace ftpprobe::infra
