#pragma once

#include "core/services/IProbeScheduler.hpp"
#include "core/services/IProtocolChecker.hpp"

#include <memory>

namespace ftpprobe::infra {

/**
 * @brief Runs probes from a descriptor source on a bounded worker pool.
 *
 * The calling thread draws descriptors one at a time and blocks while
 * the configured number of probes is in flight, so even very large
 * brute-force spaces are never materialized. Each descriptor is routed to
 * the checker for its protocol. A checker that throws yields a failed
 * result instead of aborting the run, so the number of results always
 * equals the number of descriptors drawn.
 */
class ProbeScheduler : public core::IProbeScheduler {
public:
    /**
     * @brief Constructs a scheduler with the default FTP and SFTP checkers.
     */
    ProbeScheduler();

    /**
     * @brief Constructs a scheduler with custom checkers.
     * @param ftpChecker Checker for Protocol::Ftp descriptors.
     * @param sftpChecker Checker for Protocol::Sftp descriptors.
     */
    ProbeScheduler(std::shared_ptr<core::IProtocolChecker> ftpChecker,
                   std::shared_ptr<core::IProtocolChecker> sftpChecker);

    std::vector<core::ProbeResult> run(core::IDescriptorSource& source,
                                       const core::ScheduleOptions& options,
                                       ProgressCallback onProgress) override;

private:
    core::ProbeResult probe(const core::ProbeDescriptor& descriptor,
                            std::chrono::seconds timeout);

    std::shared_ptr<core::IProtocolChecker> ftpChecker_;
    std::shared_ptr<core::IProtocolChecker> sftpChecker_;
};

} // namespace ftpprobe::infra
