#include "core/probe/ResultAggregator.hpp"

#include <algorithm>
#include <iterator>

namespace ftpprobe::core {

ResultSummary summarize(const std::vector<ProbeResult>& results) {
    ResultSummary summary;
    summary.total = results.size();
    summary.successful = static_cast<size_t>(
        std::count_if(results.begin(), results.end(),
                      [](const ProbeResult& r) { return r.isSuccessful(); }));
    summary.failed = summary.total - summary.successful;
    return summary;
}

void ResultAggregator::add(ProbeResult result) {
    std::lock_guard lock(mutex_);
    results_.push_back(std::move(result));
}

void ResultAggregator::addAll(std::vector<ProbeResult> results) {
    std::lock_guard lock(mutex_);
    results_.insert(results_.end(), std::make_move_iterator(results.begin()),
                    std::make_move_iterator(results.end()));
}

std::vector<ProbeResult> ResultAggregator::results() const {
    std::lock_guard lock(mutex_);
    return results_;
}

ResultSummary ResultAggregator::summary() const {
    std::lock_guard lock(mutex_);
    return summarize(results_);
}

size_t ResultAggregator::size() const {
    std::lock_guard lock(mutex_);
    return results_.size();
}

} // namespace ftpprobe::core
