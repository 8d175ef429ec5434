/**
 * @file ReportRenderer.hpp
 * @brief Renders probe results as text, XML, JSON or CSV reports.
 *
 * Every renderer is a pure function of the results, their summary and the
 * generation time, so the same inputs always produce the same document.
 */

#pragma once

#include "core/probe/ResultAggregator.hpp"
#include "core/types/ProbeResult.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ftpprobe::infra {

/**
 * @brief Report output formats.
 */
enum class ReportFormat : int {
    Text = 0, ///< Human-readable block per result
    Xml = 1,  ///< <ftp_check_results> document
    Json = 2, ///< Summary object with a "servers" array
    Csv = 3   ///< Header row and one row per result
};

/**
 * @brief Returns "TXT", "XML", "JSON" or "CSV".
 */
std::string reportFormatToString(ReportFormat format);

/**
 * @brief Converts a single result to its JSON record.
 *
 * Absent values are written as null.
 */
nlohmann::json resultToJson(const core::ProbeResult& result);

std::string renderTextReport(const std::vector<core::ProbeResult>& results,
                             const core::ResultSummary& summary,
                             std::chrono::system_clock::time_point generatedAt);

std::string renderXmlReport(const std::vector<core::ProbeResult>& results,
                            const core::ResultSummary& summary,
                            std::chrono::system_clock::time_point generatedAt);

std::string renderJsonReport(const std::vector<core::ProbeResult>& results,
                             const core::ResultSummary& summary,
                             std::chrono::system_clock::time_point generatedAt);

/**
 * @brief Renders the CSV report.
 *
 * Fields containing separators, quotes or line breaks are quoted.
 * generatedAt is unused; the parameter keeps all renderers interchangeable.
 */
std::string renderCsvReport(const std::vector<core::ProbeResult>& results,
                            const core::ResultSummary& summary,
                            std::chrono::system_clock::time_point generatedAt);

/**
 * @brief Dispatches to the renderer for @p format.
 */
std::string renderReport(ReportFormat format, const std::vector<core::ProbeResult>& results,
                         const core::ResultSummary& summary,
                         std::chrono::system_clock::time_point generatedAt);

/**
 * @brief Formats a millisecond value in its shortest round-trip form.
 */
std::string formatMilliseconds(double ms);

} // namespace ftpprobe::infra
