/**
 * @file IProbeScheduler.hpp
 * @brief Interfaces for descriptor sources and the probe scheduler.
 *
 * This file defines the work-queue abstraction the scheduler drains and
 * the progress information it reports while probes complete.
 */

#pragma once

#include "core/types/Endpoint.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace ftpprobe::core {

/**
 * @brief A finite, single-pass sequence of probe descriptors.
 *
 * The total is known before the first descriptor is drawn. A source is
 * consumed by one thread only.
 */
class IDescriptorSource {
public:
    virtual ~IDescriptorSource() = default;

    /**
     * @brief Produces the next descriptor.
     * @return The descriptor, or nullopt once the sequence is exhausted.
     */
    virtual std::optional<ProbeDescriptor> next() = 0;

    /**
     * @brief Number of descriptors the full sequence yields.
     */
    virtual size_t totalCount() const = 0;
};

/**
 * @brief Parameters for one scheduler run.
 */
struct ScheduleOptions {
    int concurrency{5};                ///< Number of parallel workers
    std::chrono::seconds timeout{10};  ///< Per-stage network timeout
};

/**
 * @brief Progress information emitted once per completed probe.
 */
struct ProbeProgress {
    const ProbeDescriptor& descriptor; ///< Descriptor that produced the result
    size_t submissionIndex;            ///< Zero-based position in the source
    const ProbeResult& result;         ///< The completed result
    size_t completed;                  ///< Completions so far, including this one
    size_t total;                      ///< Total descriptors in the run

    /**
     * @brief Calculates the completion percentage.
     * @return Percentage of probes completed (0-100).
     */
    [[nodiscard]] double percentComplete() const {
        return total > 0 ? (static_cast<double>(completed) / static_cast<double>(total)) * 100.0
                         : 0.0;
    }
};

/**
 * @brief Interface for the concurrent probe scheduler.
 */
class IProbeScheduler {
public:
    /**
     * @brief Callback invoked once per completed probe.
     *
     * Invocations are serialized; the callback never runs concurrently with
     * itself.
     */
    using ProgressCallback = std::function<void(const ProbeProgress&)>;

    virtual ~IProbeScheduler() = default;

    /**
     * @brief Runs every descriptor of the source and waits for completion.
     * @param source Descriptors to probe.
     * @param options Concurrency bound and timeout.
     * @param onProgress Callback for each completion (may be empty).
     * @return One result per descriptor, in completion order.
     */
    virtual std::vector<ProbeResult> run(IDescriptorSource& source, const ScheduleOptions& options,
                                         ProgressCallback onProgress) = 0;
};

} // namespace ftpprobe::core
