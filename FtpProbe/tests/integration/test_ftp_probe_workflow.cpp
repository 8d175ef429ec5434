#include <catch2/catch_test_macros.hpp>

#include "core/probe/CombinationGenerator.hpp"
#include "infrastructure/network/FtpSession.hpp"
#include "infrastructure/probe/FtpChecker.hpp"
#include "infrastructure/probe/ProbeScheduler.hpp"
#include "infrastructure/probe/SftpChecker.hpp"

#include <asio.hpp>
#include <algorithm>
#include <atomic>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

using namespace ftpprobe::core;
using namespace ftpprobe::infra;

namespace {

/**
 * Minimal FTP server on 127.0.0.1 for exercising the real client.
 *
 * Supports USER/PASS, FEAT, CWD, TYPE, PASV and NLST. Each control
 * connection is served on its own thread. Configure the server before
 * calling start().
 */
class ScriptedFtpServer {
public:
    ScriptedFtpServer()
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
    }

    ~ScriptedFtpServer() { stop(); }

    ScriptedFtpServer(const ScriptedFtpServer&) = delete;
    ScriptedFtpServer& operator=(const ScriptedFtpServer&) = delete;

    void addAccount(const std::string& user, const std::string& pass) { accounts_[user] = pass; }
    void allowAnonymous() { allowAnonymous_ = true; }
    void setFeatures(std::vector<std::string> features) { features_ = std::move(features); }
    void addDirectory(const std::string& path, std::vector<std::string> names) {
        directories_[path] = std::move(names);
    }

    void start() {
        acceptThread_ = std::thread([this]() { acceptLoop(); });
    }

    void stop() {
        if (!acceptThread_.joinable()) {
            return;
        }
        stopping_ = true;

        // Wake the blocking accept
        asio::io_context wakeIo;
        asio::ip::tcp::socket wake(wakeIo);
        asio::error_code ec;
        wake.connect({asio::ip::make_address("127.0.0.1"), port_}, ec);
        acceptThread_.join();

        std::vector<std::thread> sessions;
        {
            std::lock_guard lock(mutex_);
            sessions.swap(sessions_);
        }
        for (auto& session : sessions) {
            session.join();
        }
    }

    uint16_t port() const { return port_; }

    std::vector<std::string> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    bool received(const std::string& command) const {
        auto all = commands();
        return std::find(all.begin(), all.end(), command) != all.end();
    }

private:
    void acceptLoop() {
        while (true) {
            auto socket = std::make_shared<asio::ip::tcp::socket>(io_);
            asio::error_code ec;
            acceptor_.accept(*socket, ec);
            if (ec || stopping_) {
                return;
            }
            std::lock_guard lock(mutex_);
            sessions_.emplace_back([this, socket]() { serve(*socket); });
        }
    }

    static void reply(asio::ip::tcp::socket& socket, const std::string& text) {
        asio::error_code ec;
        asio::write(socket, asio::buffer(text + "\r\n"), ec);
    }

    bool acceptsLogin(const std::string& user, const std::string& pass) const {
        if (user == "anonymous") {
            return allowAnonymous_;
        }
        auto it = accounts_.find(user);
        return it != accounts_.end() && it->second == pass;
    }

    void serve(asio::ip::tcp::socket& control) {
        reply(control, "220-Scripted FTP server\r\n220 Ready");

        asio::streambuf buffer;
        std::string user;
        bool loggedIn = false;
        std::string cwd = "/";
        std::optional<asio::ip::tcp::acceptor> passive;

        while (true) {
            asio::error_code ec;
            asio::read_until(control, buffer, "\r\n", ec);
            if (ec) {
                return;
            }
            std::istream stream(&buffer);
            std::string line;
            std::getline(stream, line);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            {
                std::lock_guard lock(mutex_);
                commands_.push_back(line);
            }

            const auto space = line.find(' ');
            const std::string verb = line.substr(0, space);
            const std::string arg = space == std::string::npos ? "" : line.substr(space + 1);

            if (verb == "QUIT") {
                reply(control, "221 Goodbye");
                return;
            } else if (verb == "USER") {
                user = arg;
                reply(control, "331 Please specify the password");
            } else if (verb == "PASS") {
                loggedIn = acceptsLogin(user, arg);
                reply(control, loggedIn ? "230 Login successful" : "530 Login incorrect.");
            } else if (verb == "FEAT") {
                if (features_.empty()) {
                    reply(control, "502 Command not implemented");
                } else {
                    std::string text = "211-Features:";
                    for (const auto& feature : features_) {
                        text += "\r\n " + feature;
                    }
                    reply(control, text + "\r\n211 End");
                }
            } else if (!loggedIn) {
                reply(control, "530 Please login with USER and PASS");
            } else if (verb == "CWD") {
                if (directories_.count(arg) != 0) {
                    cwd = arg;
                    reply(control, "250 Directory successfully changed");
                } else {
                    reply(control, "550 Failed to change directory");
                }
            } else if (verb == "TYPE") {
                reply(control, "200 Switching to ASCII mode");
            } else if (verb == "PASV") {
                passive.emplace(io_,
                                asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
                const auto dataPort = passive->local_endpoint().port();
                reply(control, "227 Entering Passive Mode (127,0,0,1," +
                                   std::to_string(dataPort / 256) + "," +
                                   std::to_string(dataPort % 256) + ")");
            } else if (verb == "NLST") {
                if (!passive) {
                    reply(control, "425 Use PASV first");
                    continue;
                }
                reply(control, "150 Here comes the directory listing");
                asio::ip::tcp::socket data(io_);
                passive->accept(data, ec);
                std::string listing;
                for (const auto& name : directories_[cwd]) {
                    listing += name + "\r\n";
                }
                asio::write(data, asio::buffer(listing), ec);
                data.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
                data.close(ec);
                passive.reset();
                reply(control, "226 Directory send OK");
            } else {
                reply(control, "502 Command not implemented");
            }
        }
    }

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_{0};
    std::thread acceptThread_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::vector<std::thread> sessions_;
    std::vector<std::string> commands_;

    std::map<std::string, std::string> accounts_;
    bool allowAnonymous_{false};
    std::vector<std::string> features_;
    std::map<std::string, std::vector<std::string>> directories_;
};

void populate(ScriptedFtpServer& server) {
    server.allowAnonymous();
    server.addAccount("alice", "wonderland");
    server.addDirectory("/", {"pub", "missing"});
    server.addDirectory("/pub", {"readme.txt", "data.bin"});
    server.addDirectory("/missing", {"other.txt"});
}

const std::chrono::seconds kTimeout{5};

} // namespace

// =============================================================================
// FTP checker against the scripted server
// =============================================================================

TEST_CASE("FTP probe workflow - login and path checks", "[Integration][Ftp]") {
    ScriptedFtpServer server;
    populate(server);
    server.start();

    FtpChecker checker;
    const Endpoint endpoint{"127.0.0.1", server.port(), Protocol::Ftp};

    SECTION("Anonymous login on a server without FEAT") {
        auto result = checker.check(endpoint, {"anonymous", ""}, kTimeout, std::nullopt);

        REQUIRE(result.connection);
        REQUIRE(result.authentication);
        REQUIRE(result.features.empty());
        REQUIRE_FALSE(result.pathExists.has_value());
        REQUIRE(result.errors.empty());
        REQUIRE(result.welcomeMessage ==
                std::optional<std::string>("220-Scripted FTP server\n220 Ready"));

        REQUIRE(server.received("USER anonymous"));
        REQUIRE(server.received("PASS anonymous@"));
        REQUIRE(server.received("FEAT"));
        REQUIRE(server.received("QUIT"));
    }

    SECTION("Wrong password") {
        auto result = checker.check(endpoint, {"alice", "queen"}, kTimeout, std::string("/pub"));

        REQUIRE(result.connection);
        REQUIRE_FALSE(result.authentication);
        REQUIRE(result.errors == std::vector<std::string>{"FTP error: 530 Login incorrect."});
        REQUIRE_FALSE(result.pathExists.has_value());
    }

    SECTION("Missing file in an existing directory") {
        auto result = checker.check(endpoint, {"alice", "wonderland"}, kTimeout,
                                    std::string("/missing/file.txt"));

        REQUIRE(result.isSuccessful());
        REQUIRE(result.pathExists == std::optional<bool>(false));
        REQUIRE(result.pathType == PathType::Unknown);
        REQUIRE(result.errors == std::vector<std::string>{"Path '/missing/file.txt' not found"});
        REQUIRE(server.received("NLST"));
    }

    SECTION("Existing file") {
        auto result = checker.check(endpoint, {"alice", "wonderland"}, kTimeout,
                                    std::string("/pub/readme.txt"));

        REQUIRE(result.pathExists == std::optional<bool>(true));
        REQUIRE(result.pathType == PathType::File);
        REQUIRE(result.errors.empty());
        REQUIRE(result.pathCheckTimeMs.has_value());
    }

    SECTION("Existing directory") {
        auto result =
            checker.check(endpoint, {"alice", "wonderland"}, kTimeout, std::string("/pub"));

        REQUIRE(result.pathExists == std::optional<bool>(true));
        REQUIRE(result.pathType == PathType::Directory);
        REQUIRE_FALSE(server.received("NLST"));
    }

    SECTION("Missing parent directory") {
        auto result = checker.check(endpoint, {"alice", "wonderland"}, kTimeout,
                                    std::string("/nowhere/file.txt"));

        REQUIRE(result.pathExists == std::optional<bool>(false));
        REQUIRE(result.errors == std::vector<std::string>{
                                     "Error accessing parent directory: 550 Failed to change "
                                     "directory"});
    }
}

TEST_CASE("FTP probe workflow - feature discovery", "[Integration][Ftp]") {
    ScriptedFtpServer server;
    populate(server);
    server.setFeatures({"EPSV", "MDTM", "UTF8"});
    server.start();

    FtpChecker checker;
    auto result = checker.check({"127.0.0.1", server.port(), Protocol::Ftp},
                                {"alice", "wonderland"}, kTimeout, std::nullopt);

    REQUIRE(result.isSuccessful());
    REQUIRE(result.features == std::vector<std::string>{"EPSV", "MDTM", "UTF8"});
    REQUIRE(result.errors.empty());
}

TEST_CASE("FTP probe workflow - FtpSession operations", "[Integration][Ftp]") {
    ScriptedFtpServer server;
    populate(server);
    server.start();

    FtpSession session;
    REQUIRE(session.connect("127.0.0.1", server.port(), std::chrono::seconds(5)).ok());
    REQUIRE(session.login("alice", "wonderland").ok());

    SECTION("Listing the current directory") {
        REQUIRE(session.changeDirectory("/pub").ok());
        std::vector<std::string> names;
        REQUIRE(session.listNames(names).ok());
        REQUIRE(names == std::vector<std::string>{"readme.txt", "data.bin"});
    }

    SECTION("Rejected CWD keeps the session usable") {
        auto status = session.changeDirectory("/nope");
        REQUIRE(status.kind == ClientErrorKind::PermissionDenied);
        REQUIRE(status.isServerRejection());
        REQUIRE(session.changeDirectory("/").ok());
    }

    SECTION("Unsupported FEAT") {
        std::vector<std::string> features;
        auto status = session.features(features);
        REQUIRE(status.kind == ClientErrorKind::NotSupported);
        REQUIRE(features.empty());
    }

    session.close();
    session.close();
    REQUIRE(server.received("QUIT"));
}

TEST_CASE("FTP probe workflow - brute force through the scheduler", "[Integration][Ftp]") {
    ScriptedFtpServer server;
    populate(server);
    server.start();

    BruteForceSpec spec;
    spec.host = "127.0.0.1";
    spec.usernames = {"alice", "bob"};
    spec.passwords = {"rabbit", "wonderland", "hatter"};
    spec.ports = {server.port()};

    CombinationGenerator generator(spec);
    REQUIRE(generator.totalCount() == 6);

    ProbeScheduler scheduler(std::make_shared<FtpChecker>(), std::make_shared<SftpChecker>());
    std::vector<std::string> found;
    auto results = scheduler.run(generator, {3, kTimeout}, [&found](const ProbeProgress& p) {
        if (p.result.isSuccessful()) {
            found.push_back(p.result.username + ":" + p.result.password);
        }
    });

    REQUIRE(results.size() == 6);
    REQUIRE(found == std::vector<std::string>{"alice:wonderland"});
    for (const auto& result : results) {
        REQUIRE(result.connection);
        REQUIRE(result.totalTimeMs.has_value());
    }
}
