#include "core/probe/CombinationGenerator.hpp"

#include <utility>

namespace ftpprobe::core {

CombinationGenerator::CombinationGenerator(BruteForceSpec spec) : spec_(std::move(spec)) {
    if (spec_.ports.empty()) {
        spec_.ports.push_back(defaultPort(spec_.protocol));
    }
}

size_t CombinationGenerator::credentialsPerPort() const {
    if (spec_.combos) {
        return spec_.combos->size();
    }
    return spec_.usernames.size() * spec_.passwords.size();
}

Credential CombinationGenerator::credentialAt(size_t index) const {
    if (spec_.combos) {
        return (*spec_.combos)[index];
    }
    const size_t passwordCount = spec_.passwords.size();
    return Credential{spec_.usernames[index / passwordCount],
                      spec_.passwords[index % passwordCount]};
}

size_t CombinationGenerator::totalCount() const {
    return spec_.ports.size() * credentialsPerPort();
}

std::optional<ProbeDescriptor> CombinationGenerator::next() {
    const size_t perPort = credentialsPerPort();
    if (perPort == 0 || portIndex_ >= spec_.ports.size()) {
        return std::nullopt;
    }

    ProbeDescriptor descriptor;
    descriptor.endpoint = Endpoint{spec_.host, spec_.ports[portIndex_], spec_.protocol};
    descriptor.credential = credentialAt(credentialIndex_);
    descriptor.checkPath = spec_.checkPath;

    if (++credentialIndex_ == perPort) {
        credentialIndex_ = 0;
        ++portIndex_;
    }
    return descriptor;
}

} // namespace ftpprobe::core
