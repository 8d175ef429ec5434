#include "infrastructure/probe/ProbeScheduler.hpp"

#include "core/probe/ScopeGuard.hpp"
#include "infrastructure/probe/FtpChecker.hpp"
#include "infrastructure/probe/SftpChecker.hpp"
#include "infrastructure/probe/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <semaphore>

namespace ftpprobe::infra {

ProbeScheduler::ProbeScheduler()
    : ProbeScheduler(std::make_shared<FtpChecker>(), std::make_shared<SftpChecker>()) {}

ProbeScheduler::ProbeScheduler(std::shared_ptr<core::IProtocolChecker> ftpChecker,
                               std::shared_ptr<core::IProtocolChecker> sftpChecker)
    : ftpChecker_(std::move(ftpChecker)), sftpChecker_(std::move(sftpChecker)) {}

std::vector<core::ProbeResult> ProbeScheduler::run(core::IDescriptorSource& source,
                                                   const core::ScheduleOptions& options,
                                                   ProgressCallback onProgress) {
    const size_t total = source.totalCount();
    const auto workers = static_cast<size_t>(std::max(1, options.concurrency));

    spdlog::info("Starting {} probes with {} workers", total, workers);

    std::vector<core::ProbeResult> results;
    std::mutex resultsMutex;
    size_t completed = 0;
    std::counting_semaphore<> slots(static_cast<std::ptrdiff_t>(workers));

    WorkerPool pool(workers);

    size_t submitted = 0;
    while (auto next = source.next()) {
        slots.acquire();

        pool.post([&, descriptor = std::move(*next), index = submitted]() {
            auto releaseSlot = core::onScopeExit([&slots] { slots.release(); });
            auto result = probe(descriptor, options.timeout);

            {
                std::lock_guard lock(resultsMutex);
                results.push_back(std::move(result));
                ++completed;
                if (onProgress) {
                    try {
                        onProgress({descriptor, index, results.back(), completed, total});
                    } catch (const std::exception& e) {
                        spdlog::warn("Progress callback failed: {}", e.what());
                    }
                }
            }
        });
        ++submitted;
    }

    pool.drain();

    spdlog::info("Probe run complete: {} results", results.size());
    return results;
}

core::ProbeResult ProbeScheduler::probe(const core::ProbeDescriptor& descriptor,
                                        std::chrono::seconds timeout) {
    const auto& endpoint = descriptor.endpoint;
    auto& checker =
        endpoint.protocol == core::Protocol::Sftp ? *sftpChecker_ : *ftpChecker_;

    try {
        return checker.check(endpoint, descriptor.credential, timeout, descriptor.checkPath);
    } catch (const std::exception& e) {
        spdlog::warn("Probe of {}:{} failed: {}", endpoint.host, endpoint.port, e.what());
        return core::ProbeResult::failure(descriptor, std::string("Check failed: ") + e.what());
    } catch (...) {
        spdlog::warn("Probe of {}:{} failed with a non-standard exception", endpoint.host,
                     endpoint.port);
        return core::ProbeResult::failure(descriptor, "Check failed: unknown error");
    }
}

} // namespace ftpprobe::infra
