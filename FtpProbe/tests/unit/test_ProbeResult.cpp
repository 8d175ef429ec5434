#include <catch2/catch_test_macros.hpp>

#include "core/types/Endpoint.hpp"
#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <regex>

using namespace ftpprobe::core;

TEST_CASE("Protocol helpers", "[ProbeResult]") {
    SECTION("Display names") {
        REQUIRE(protocolToString(Protocol::Ftp) == "FTP");
        REQUIRE(protocolToString(Protocol::Sftp) == "SFTP");
    }

    SECTION("Protocol ids") {
        REQUIRE(protocolFromId(0) == Protocol::Ftp);
        REQUIRE(protocolFromId(1) == Protocol::Sftp);
        REQUIRE_FALSE(protocolFromId(2).has_value());
        REQUIRE_FALSE(protocolFromId(-1).has_value());
    }

    SECTION("Default ports") {
        REQUIRE(defaultPort(Protocol::Ftp) == 21);
        REQUIRE(defaultPort(Protocol::Sftp) == 22);
    }
}

TEST_CASE("ProbeResult default values", "[ProbeResult]") {
    ProbeResult result;

    REQUIRE_FALSE(result.connection);
    REQUIRE_FALSE(result.authentication);
    REQUIRE_FALSE(result.connectionTimeMs.has_value());
    REQUIRE_FALSE(result.authTimeMs.has_value());
    REQUIRE_FALSE(result.pathExists.has_value());
    REQUIRE(result.pathType == PathType::Unknown);
    REQUIRE_FALSE(result.welcomeMessage.has_value());
    REQUIRE(result.features.empty());
    REQUIRE(result.errors.empty());
    REQUIRE_FALSE(result.totalTimeMs.has_value());
    REQUIRE_FALSE(result.isSuccessful());
}

TEST_CASE("ProbeResult identity from descriptor", "[ProbeResult]") {
    ProbeDescriptor descriptor{{"sftp.example.test", 2222, Protocol::Sftp},
                               {"deploy", "s3cret"},
                               std::string("/var/www")};

    SECTION("forDescriptor copies the identity") {
        const auto before = std::chrono::system_clock::now();
        auto result = ProbeResult::forDescriptor(descriptor);
        const auto after = std::chrono::system_clock::now();

        REQUIRE(result.host == "sftp.example.test");
        REQUIRE(result.port == 2222);
        REQUIRE(result.protocol == Protocol::Sftp);
        REQUIRE(result.username == "deploy");
        REQUIRE(result.password == "s3cret");
        REQUIRE(result.protocolName() == "SFTP");
        REQUIRE(result.timestamp >= before);
        REQUIRE(result.timestamp <= after);
        REQUIRE(result.errors.empty());
    }

    SECTION("failure carries a single error") {
        auto result = ProbeResult::failure(descriptor, "Check failed: boom");

        REQUIRE_FALSE(result.connection);
        REQUIRE_FALSE(result.authentication);
        REQUIRE(result.errors.size() == 1);
        REQUIRE(result.errors.front() == "Check failed: boom");
        REQUIRE_FALSE(result.pathExists.has_value());
    }
}

TEST_CASE("ProbeResult success requires both stages", "[ProbeResult]") {
    ProbeResult result;

    result.connection = true;
    REQUIRE_FALSE(result.isSuccessful());

    result.authentication = true;
    REQUIRE(result.isSuccessful());
}

TEST_CASE("PathType names", "[ProbeResult]") {
    REQUIRE(ProbeResult::pathTypeToString(PathType::File) == "file");
    REQUIRE(ProbeResult::pathTypeToString(PathType::Directory) == "directory");
    REQUIRE(ProbeResult::pathTypeToString(PathType::Unknown) == "unknown");
}

TEST_CASE("roundedMilliseconds keeps two decimals", "[ProbeResult]") {
    using namespace std::chrono;

    REQUIRE(roundedMilliseconds(steady_clock::duration::zero()) == 0.0);
    REQUIRE(roundedMilliseconds(milliseconds(15)) == 15.0);
    REQUIRE(roundedMilliseconds(microseconds(1500)) == 1.5);
    REQUIRE(roundedMilliseconds(microseconds(1234)) == 1.23);
    REQUIRE(roundedMilliseconds(microseconds(1236)) == 1.24);
}

TEST_CASE("formatIsoTimestamp layout", "[ProbeResult]") {
    const auto now = std::chrono::system_clock::now();
    const auto text = formatIsoTimestamp(now);

    static const std::regex layout(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6})");
    REQUIRE(std::regex_match(text, layout));
}
