#include "infrastructure/network/TcpConnector.hpp"

#include <spdlog/spdlog.h>

namespace ftpprobe::infra {

bool runWithDeadline(asio::io_context& io, const bool& done, std::chrono::milliseconds timeout,
                     const std::function<void()>& cancel) {
    io.restart();
    io.run_for(timeout);
    if (done) {
        return true;
    }

    cancel();
    io.restart();
    io.run();
    return false;
}

core::ClientStatus connectWithTimeout(asio::io_context& io, asio::ip::tcp::socket& socket,
                                      const std::string& host, uint16_t port,
                                      std::chrono::milliseconds timeout) {
    using core::ClientErrorKind;

    if (host.empty()) {
        return core::ClientStatus::failure(ClientErrorKind::HostResolution, "Empty hostname");
    }

    asio::ip::tcp::resolver resolver(io);
    bool done = false;
    bool resolved = false;
    asio::error_code error;

    resolver.async_resolve(
        host, std::to_string(port),
        [&](const asio::error_code& resolveEc, asio::ip::tcp::resolver::results_type endpoints) {
            if (resolveEc) {
                error = resolveEc;
                done = true;
                return;
            }
            resolved = true;
            asio::async_connect(socket, endpoints,
                                [&](const asio::error_code& connectEc,
                                    const asio::ip::tcp::endpoint& /*endpoint*/) {
                                    error = connectEc;
                                    done = true;
                                });
        });

    bool completed = runWithDeadline(io, done, timeout, [&]() {
        resolver.cancel();
        asio::error_code ignored;
        socket.close(ignored);
    });

    if (!completed) {
        spdlog::debug("Connect to {}:{} timed out after {}ms", host, port, timeout.count());
        return core::ClientStatus::failure(ClientErrorKind::Timeout, "timed out");
    }
    if (error) {
        spdlog::debug("Connect to {}:{} failed: {}", host, port, error.message());
        if (!resolved) {
            return core::ClientStatus::failure(ClientErrorKind::HostResolution, error.message());
        }
        return statusFromError(error);
    }
    return core::ClientStatus::success();
}

core::ClientStatus statusFromError(const asio::error_code& ec) {
    using core::ClientErrorKind;

    if (!ec) {
        return core::ClientStatus::success();
    }
    if (ec == asio::error::timed_out) {
        return core::ClientStatus::failure(ClientErrorKind::Timeout, ec.message());
    }
    if (ec == asio::error::host_not_found || ec == asio::error::host_not_found_try_again ||
        ec == asio::error::no_data) {
        return core::ClientStatus::failure(ClientErrorKind::HostResolution, ec.message());
    }
    if (ec == asio::error::connection_refused || ec == asio::error::network_unreachable ||
        ec == asio::error::host_unreachable) {
        return core::ClientStatus::failure(ClientErrorKind::ConnectionRefused, ec.message());
    }
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::connection_aborted || ec == asio::error::broken_pipe) {
        return core::ClientStatus::failure(ClientErrorKind::Protocol,
                                           "Connection closed: " + ec.message());
    }
    return core::ClientStatus::failure(ClientErrorKind::Unexpected, ec.message());
}

} // namespace ftpprobe::infra
