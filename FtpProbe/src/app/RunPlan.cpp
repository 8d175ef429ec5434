#include "app/RunPlan.hpp"

#include "infrastructure/input/Wordlist.hpp"

#include <spdlog/spdlog.h>

namespace ftpprobe::app {

namespace {

std::vector<std::string> pickList(const std::optional<std::string>& listFile,
                                  const std::optional<std::string>& single,
                                  const std::vector<std::string>& defaults) {
    if (listFile) {
        return infra::readWordlist(*listFile);
    }
    if (single) {
        return {*single};
    }
    return defaults;
}

} // namespace

core::BruteForceSpec buildBruteForceSpec(const CliOptions& options,
                                         const infra::AppConfig& config) {
    core::BruteForceSpec spec;
    spec.host = options.host.value_or("");
    spec.protocol = options.protocol;
    spec.checkPath = options.checkPath;

    if (options.comboList) {
        spec.combos = infra::parseComboLines(infra::readWordlist(*options.comboList));
        if (spec.combos->empty()) {
            spdlog::warn("Combo list {} contains no user:password entries", *options.comboList);
        }
    } else {
        spec.usernames = pickList(options.userList, options.username, config.defaultUsernames);
        spec.passwords = pickList(options.passList, options.password, config.defaultPasswords);
        if (spec.usernames.empty() || spec.passwords.empty()) {
            spdlog::warn("Username or password list is empty, nothing to try");
        }
    }

    if (options.portList) {
        spec.ports = infra::parsePortList(*options.portList);
    } else {
        spec.ports = {options.port.value_or(core::defaultPort(options.protocol))};
    }
    return spec;
}

std::vector<core::ProbeDescriptor>
buildBulkDescriptors(const std::vector<infra::FileZillaServer>& servers,
                     const std::optional<std::string>& checkPath) {
    std::vector<core::ProbeDescriptor> descriptors;
    descriptors.reserve(servers.size());
    for (const auto& server : servers) {
        descriptors.push_back({server.endpoint, server.credential, checkPath});
    }
    return descriptors;
}

core::ProbeDescriptor buildSingleDescriptor(const CliOptions& options) {
    core::ProbeDescriptor descriptor;
    descriptor.endpoint.host = options.host.value_or("");
    descriptor.endpoint.protocol = options.protocol;
    descriptor.endpoint.port = options.port.value_or(core::defaultPort(options.protocol));
    descriptor.credential = {options.username.value_or(""), options.password.value_or("")};
    descriptor.checkPath = options.checkPath;
    return descriptor;
}

core::ScheduleOptions buildScheduleOptions(const CliOptions& options,
                                           const infra::AppConfig& config) {
    core::ScheduleOptions schedule;
    schedule.concurrency = options.maxWorkers.value_or(config.maxWorkers);
    schedule.timeout = std::chrono::seconds(options.timeoutSeconds.value_or(config.timeoutSeconds));
    return schedule;
}

} // namespace ftpprobe::app
