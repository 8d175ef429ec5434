#pragma once

#include "core/types/ClientStatus.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ftpprobe::infra {

/**
 * @brief Runs a single pending asynchronous operation with a deadline.
 *
 * Drives the io_context until @p done is set by the operation's handler or
 * the timeout expires. On expiry @p cancel is invoked and the context is run
 * once more so the aborted handler can complete before the caller's stack
 * frame goes away.
 *
 * @param io Context owning the operation; not shared with other threads.
 * @param done Flag set by the completion handler.
 * @param timeout Deadline for the operation.
 * @param cancel Cancels the pending operation.
 * @return True if the operation completed in time.
 */
bool runWithDeadline(asio::io_context& io, const bool& done, std::chrono::milliseconds timeout,
                     const std::function<void()>& cancel);

/**
 * @brief Resolves @p host and connects @p socket to the first reachable address.
 *
 * Resolution and connect share the same deadline.
 * @return HostResolution, Timeout, ConnectionRefused or Unexpected on failure.
 */
core::ClientStatus connectWithTimeout(asio::io_context& io, asio::ip::tcp::socket& socket,
                                      const std::string& host, uint16_t port,
                                      std::chrono::milliseconds timeout);

/**
 * @brief Maps an asio error to a client status category.
 */
core::ClientStatus statusFromError(const asio::error_code& ec);

} // namespace ftpprobe::infra
