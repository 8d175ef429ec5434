#pragma once

#include "app/CommandLine.hpp"
#include "core/services/IProbeScheduler.hpp"
#include "core/types/BruteForceSpec.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/input/FileZillaImporter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ftpprobe::app {

/**
 * @brief Builds the brute-force combination space from options and config.
 *
 * Usernames come from --user-list, else --username, else the configured
 * defaults; passwords likewise. A --combo-list replaces both. Ports come
 * from --port-list, else --port, else the protocol default.
 * @throws std::runtime_error on a malformed port list.
 */
core::BruteForceSpec buildBruteForceSpec(const CliOptions& options, const infra::AppConfig& config);

/**
 * @brief One descriptor per imported FileZilla server.
 */
std::vector<core::ProbeDescriptor>
buildBulkDescriptors(const std::vector<infra::FileZillaServer>& servers,
                     const std::optional<std::string>& checkPath);

/**
 * @brief The descriptor of a single-host run.
 */
core::ProbeDescriptor buildSingleDescriptor(const CliOptions& options);

/**
 * @brief Concurrency and timeout, with command-line values taking precedence.
 */
core::ScheduleOptions buildScheduleOptions(const CliOptions& options,
                                           const infra::AppConfig& config);

} // namespace ftpprobe::app
