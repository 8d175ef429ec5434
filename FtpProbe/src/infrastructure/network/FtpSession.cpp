#include "infrastructure/network/FtpSession.hpp"

#include "infrastructure/network/TcpConnector.hpp"

#include <spdlog/spdlog.h>

#include <istream>

namespace ftpprobe::infra {

namespace {

constexpr size_t kMaxControlBuffer = 64 * 1024;

std::string maskSecrets(const std::string& line) {
    if (line.starts_with("PASS ")) {
        return "PASS ****";
    }
    return line;
}

} // namespace

FtpSession::FtpSession() : socket_(io_), buffer_(kMaxControlBuffer) {}

FtpSession::~FtpSession() {
    close();
}

core::ClientStatus FtpSession::connect(const std::string& host, uint16_t port,
                                       std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    host_ = host;

    auto status = connectWithTimeout(io_, socket_, host, port, timeout);
    if (!status.ok()) {
        return status;
    }

    FtpReply greeting;
    status = readReply(greeting);
    if (!status.ok()) {
        return status;
    }
    status = classifyReply(greeting);
    if (!status.ok()) {
        dropConnection();
        return status;
    }

    welcome_ = greeting.text();
    connected_ = true;
    spdlog::debug("Connected to FTP server {}:{}", host, port);
    return core::ClientStatus::success();
}

core::ClientStatus FtpSession::login(const std::string& username, const std::string& password) {
    // Same anonymous defaults as common FTP clients
    const std::string user = username.empty() ? "anonymous" : username;
    std::string pass = password;
    if (user == "anonymous" && (pass.empty() || pass == "-")) {
        pass = "anonymous@";
    }

    FtpReply reply;
    auto status = command("USER " + user, reply);
    if (!status.ok()) {
        return status;
    }
    if (reply.isIntermediate()) {
        status = command("PASS " + pass, reply);
        if (!status.ok()) {
            return status;
        }
    }
    if (reply.isIntermediate()) {
        status = command("ACCT ", reply);
        if (!status.ok()) {
            return status;
        }
    }
    if (!reply.isCompletion()) {
        return core::ClientStatus::failure(core::ClientErrorKind::Protocol, reply.text());
    }
    return core::ClientStatus::success();
}

core::ClientStatus FtpSession::features(std::vector<std::string>& features) {
    FtpReply reply;
    auto status = command("FEAT", reply);
    if (!status.ok()) {
        return status;
    }
    features = parseFeatureReply(reply);
    return core::ClientStatus::success();
}

core::ClientStatus FtpSession::changeDirectory(const std::string& path) {
    FtpReply reply;
    if (path == "..") {
        return command("CDUP", reply);
    }
    return command("CWD " + (path.empty() ? std::string(".") : path), reply);
}

core::ClientStatus FtpSession::listNames(std::vector<std::string>& names) {
    FtpReply reply;
    auto status = command("TYPE A", reply);
    if (!status.ok()) {
        return status;
    }

    asio::ip::tcp::socket data(io_);
    status = openDataConnection(data);
    if (!status.ok()) {
        return status;
    }

    status = command("NLST", reply);
    if (!status.ok()) {
        return status;
    }
    if (reply.isCompletion()) {
        // Some servers send a 2xx before the 1xx transfer reply
        status = readReply(reply);
        if (status.ok()) {
            status = classifyReply(reply);
        }
        if (!status.ok()) {
            return status;
        }
    }
    if (!reply.isPreliminary()) {
        return core::ClientStatus::failure(core::ClientErrorKind::Protocol,
                                           "Unexpected reply: " + reply.text());
    }

    std::string payload;
    status = readAll(data, payload);
    asio::error_code ignored;
    data.close(ignored);
    if (!status.ok()) {
        return status;
    }

    status = readReply(reply);
    if (status.ok()) {
        status = classifyReply(reply);
    }
    if (!status.ok()) {
        return status;
    }

    names = parseNameList(payload);
    return core::ClientStatus::success();
}

void FtpSession::close() {
    if (connected_ && socket_.is_open()) {
        FtpReply reply;
        auto status = command("QUIT", reply);
        if (!status.ok()) {
            spdlog::debug("QUIT to {} failed: {}", host_, status.message);
        }
    }
    dropConnection();
}

void FtpSession::dropConnection() {
    connected_ = false;
    if (socket_.is_open()) {
        asio::error_code ec;
        socket_.close(ec);
        if (ec) {
            spdlog::debug("Closing FTP socket to {} failed: {}", host_, ec.message());
        }
    }
}

core::ClientStatus FtpSession::command(const std::string& line, FtpReply& reply) {
    auto status = sendLine(line);
    if (!status.ok()) {
        return status;
    }
    status = readReply(reply);
    if (!status.ok()) {
        return status;
    }
    return classifyReply(reply);
}

core::ClientStatus FtpSession::sendLine(const std::string& line) {
    if (!socket_.is_open()) {
        return core::ClientStatus::failure(core::ClientErrorKind::Protocol, "Not connected");
    }
    spdlog::trace("FTP {} > {}", host_, maskSecrets(line));

    const std::string data = line + "\r\n";
    bool done = false;
    asio::error_code error;
    asio::async_write(socket_, asio::buffer(data),
                      [&](const asio::error_code& ec, std::size_t /*bytes*/) {
                          error = ec;
                          done = true;
                      });

    if (!runWithDeadline(io_, done, timeout_, [this]() {
            asio::error_code ignored;
            socket_.cancel(ignored);
        })) {
        dropConnection();
        return core::ClientStatus::failure(core::ClientErrorKind::Timeout, "timed out");
    }
    if (error) {
        dropConnection();
        return statusFromError(error);
    }
    return core::ClientStatus::success();
}

core::ClientStatus FtpSession::readLine(std::string& line) {
    if (!socket_.is_open()) {
        return core::ClientStatus::failure(core::ClientErrorKind::Protocol, "Not connected");
    }

    bool done = false;
    asio::error_code error;
    asio::async_read_until(socket_, buffer_, '\n',
                           [&](const asio::error_code& ec, std::size_t /*bytes*/) {
                               error = ec;
                               done = true;
                           });

    if (!runWithDeadline(io_, done, timeout_, [this]() {
            asio::error_code ignored;
            socket_.cancel(ignored);
        })) {
        dropConnection();
        return core::ClientStatus::failure(core::ClientErrorKind::Timeout, "timed out");
    }
    if (error) {
        dropConnection();
        if (error == asio::error::not_found) {
            return core::ClientStatus::failure(core::ClientErrorKind::Protocol,
                                               "Reply line too long");
        }
        return statusFromError(error);
    }

    std::istream stream(&buffer_);
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return core::ClientStatus::success();
}

core::ClientStatus FtpSession::readReply(FtpReply& reply) {
    std::string line;
    auto status = readLine(line);
    if (!status.ok()) {
        return status;
    }

    auto code = parseReplyCode(line);
    if (!code) {
        dropConnection();
        return core::ClientStatus::failure(core::ClientErrorKind::Protocol,
                                           "Invalid reply: " + line);
    }

    reply.code = *code;
    reply.lines.assign(1, line);
    if (line.size() > 3 && line[3] == '-') {
        do {
            status = readLine(line);
            if (!status.ok()) {
                return status;
            }
            reply.lines.push_back(line);
        } while (!isFinalReplyLine(line, reply.code));
    }

    spdlog::trace("FTP {} < {}", host_, reply.lines.front());
    return core::ClientStatus::success();
}

core::ClientStatus FtpSession::openDataConnection(asio::ip::tcp::socket& data) {
    asio::error_code ec;
    auto peer = socket_.remote_endpoint(ec);
    if (ec) {
        return statusFromError(ec);
    }

    FtpReply reply;
    std::optional<uint16_t> port;
    if (peer.address().is_v6()) {
        auto status = command("EPSV", reply);
        if (!status.ok()) {
            return status;
        }
        port = parseExtendedPassiveReply(reply.text());
    } else {
        auto status = command("PASV", reply);
        if (!status.ok()) {
            return status;
        }
        port = parsePassiveReply(reply.text());
    }
    if (!port) {
        return core::ClientStatus::failure(core::ClientErrorKind::Protocol,
                                           "Unexpected passive reply: " + reply.text());
    }

    bool done = false;
    asio::error_code error;
    data.async_connect(asio::ip::tcp::endpoint(peer.address(), *port),
                       [&](const asio::error_code& connectEc) {
                           error = connectEc;
                           done = true;
                       });

    if (!runWithDeadline(io_, done, timeout_, [&data]() {
            asio::error_code ignored;
            data.close(ignored);
        })) {
        return core::ClientStatus::failure(core::ClientErrorKind::Timeout,
                                           "data connection timed out");
    }
    return statusFromError(error);
}

core::ClientStatus FtpSession::readAll(asio::ip::tcp::socket& data, std::string& payload) {
    asio::streambuf received;
    bool done = false;
    asio::error_code error;
    asio::async_read(data, received, asio::transfer_all(),
                     [&](const asio::error_code& ec, std::size_t /*bytes*/) {
                         error = ec;
                         done = true;
                     });

    if (!runWithDeadline(io_, done, timeout_, [&data]() {
            asio::error_code ignored;
            data.close(ignored);
        })) {
        return core::ClientStatus::failure(core::ClientErrorKind::Timeout,
                                           "data transfer timed out");
    }
    if (error && error != asio::error::eof) {
        return statusFromError(error);
    }

    payload.assign(asio::buffers_begin(received.data()), asio::buffers_end(received.data()));
    return core::ClientStatus::success();
}

} // namespace ftpprobe::infra
