/**
 * @file ScopeGuard.hpp
 * @brief Scope-exit helpers for session teardown and stage timing.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <optional>
#include <type_traits>
#include <utility>

namespace ftpprobe::core {

/**
 * @brief Runs a callable when the enclosing scope exits, on every path.
 *
 * @tparam F Callable type; must not throw.
 */
template <typename F>
class ScopeExit {
public:
    explicit ScopeExit(F fn) : fn_(std::move(fn)) {}

    ~ScopeExit() {
        if (active_) {
            fn_();
        }
    }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

    /**
     * @brief Prevents the callable from running.
     */
    void dismiss() { active_ = false; }

private:
    F fn_;
    bool active_{true};
};

/**
 * @brief Creates a ScopeExit for @p fn, deducing the callable type.
 *
 * @code
 * auto closeSession = onScopeExit([&session] { session->close(); });
 * @endcode
 */
template <typename F>
ScopeExit<std::decay_t<F>> onScopeExit(F&& fn) {
    return ScopeExit<std::decay_t<F>>(std::forward<F>(fn));
}

/**
 * @brief Measures a probe stage and stores the elapsed milliseconds into
 * the target field when it goes out of scope.
 */
class StageTimer {
public:
    explicit StageTimer(std::optional<double>& target)
        : target_(target), start_(std::chrono::steady_clock::now()) {}

    ~StageTimer() { target_ = roundedMilliseconds(std::chrono::steady_clock::now() - start_); }

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

private:
    std::optional<double>& target_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace ftpprobe::core
