/**
 * @file ResultAggregator.hpp
 * @brief Thread-safe collection of probe results and their summary.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace ftpprobe::core {

/**
 * @brief Counts shared by every report format.
 */
struct ResultSummary {
    size_t total{0};      ///< Number of results
    size_t successful{0}; ///< Results with connection and authentication
    size_t failed{0};     ///< total - successful

    bool operator==(const ResultSummary& other) const = default;
};

/**
 * @brief Computes the summary of a result list.
 */
ResultSummary summarize(const std::vector<ProbeResult>& results);

/**
 * @brief Append-only result store.
 *
 * add() may be called from several threads. results() returns a snapshot
 * in insertion order.
 */
class ResultAggregator {
public:
    void add(ProbeResult result);
    void addAll(std::vector<ProbeResult> results);

    [[nodiscard]] std::vector<ProbeResult> results() const;
    [[nodiscard]] ResultSummary summary() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<ProbeResult> results_;
};

} // namespace ftpprobe::core
