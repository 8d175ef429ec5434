#include <catch2/catch_test_macros.hpp>

#include "core/probe/CombinationGenerator.hpp"

#include <set>
#include <tuple>

using namespace ftpprobe::core;

namespace {

std::vector<ProbeDescriptor> drain(IDescriptorSource& source) {
    std::vector<ProbeDescriptor> descriptors;
    while (auto next = source.next()) {
        descriptors.push_back(std::move(*next));
    }
    return descriptors;
}

} // namespace

TEST_CASE("CombinationGenerator cross-product", "[CombinationGenerator]") {
    BruteForceSpec spec;
    spec.host = "ftp.example.test";
    spec.usernames = {"admin", "root"};
    spec.passwords = {"1234"};
    spec.ports = {21};

    SECTION("Two usernames and one password give two descriptors") {
        CombinationGenerator generator(spec);
        REQUIRE(generator.totalCount() == 2);

        auto descriptors = drain(generator);
        REQUIRE(descriptors.size() == 2);
        REQUIRE(descriptors[0].credential == Credential{"admin", "1234"});
        REQUIRE(descriptors[1].credential == Credential{"root", "1234"});
        REQUIRE(descriptors[0].endpoint == Endpoint{"ftp.example.test", 21, Protocol::Ftp});
    }

    SECTION("Ports outer, usernames middle, passwords inner") {
        spec.usernames = {"a", "b"};
        spec.passwords = {"x", "y"};
        spec.ports = {21, 2121};

        CombinationGenerator generator(spec);
        REQUIRE(generator.totalCount() == 8);

        auto descriptors = drain(generator);
        REQUIRE(descriptors.size() == 8);

        const std::vector<std::tuple<uint16_t, std::string, std::string>> expected = {
            {21, "a", "x"},   {21, "a", "y"},   {21, "b", "x"},   {21, "b", "y"},
            {2121, "a", "x"}, {2121, "a", "y"}, {2121, "b", "x"}, {2121, "b", "y"},
        };
        for (size_t i = 0; i < expected.size(); ++i) {
            const auto& [port, user, pass] = expected[i];
            REQUIRE(descriptors[i].endpoint.port == port);
            REQUIRE(descriptors[i].credential.username == user);
            REQUIRE(descriptors[i].credential.password == pass);
        }
    }

    SECTION("No duplicates") {
        spec.usernames = {"a", "b", "c"};
        spec.passwords = {"1", "2", "3", ""};
        spec.ports = {21, 990, 2121};

        CombinationGenerator generator(spec);
        auto descriptors = drain(generator);
        REQUIRE(descriptors.size() == generator.totalCount());

        std::set<std::tuple<uint16_t, std::string, std::string>> seen;
        for (const auto& d : descriptors) {
            seen.insert({d.endpoint.port, d.credential.username, d.credential.password});
        }
        REQUIRE(seen.size() == descriptors.size());
    }

    SECTION("Exhausted generator stays exhausted") {
        CombinationGenerator generator(spec);
        drain(generator);
        REQUIRE_FALSE(generator.next().has_value());
        REQUIRE_FALSE(generator.next().has_value());
    }
}

TEST_CASE("CombinationGenerator defaults and propagation", "[CombinationGenerator]") {
    BruteForceSpec spec;
    spec.host = "10.0.0.5";
    spec.usernames = {"root"};
    spec.passwords = {"toor"};

    SECTION("Empty port list means the FTP default port") {
        CombinationGenerator generator(spec);
        REQUIRE(generator.ports() == std::vector<uint16_t>{21});
        REQUIRE(generator.next()->endpoint.port == 21);
    }

    SECTION("Empty port list means the SFTP default port") {
        spec.protocol = Protocol::Sftp;
        CombinationGenerator generator(spec);
        auto descriptor = generator.next();
        REQUIRE(descriptor->endpoint.port == 22);
        REQUIRE(descriptor->endpoint.protocol == Protocol::Sftp);
    }

    SECTION("Check path is carried by every descriptor") {
        spec.checkPath = "/upload";
        spec.passwords = {"a", "b"};
        CombinationGenerator generator(spec);
        for (const auto& d : drain(generator)) {
            REQUIRE(d.checkPath == std::optional<std::string>("/upload"));
        }
    }

    SECTION("Empty username list yields nothing") {
        spec.usernames.clear();
        CombinationGenerator generator(spec);
        REQUIRE(generator.totalCount() == 0);
        REQUIRE_FALSE(generator.next().has_value());
    }
}

TEST_CASE("CombinationGenerator combo mode", "[CombinationGenerator]") {
    BruteForceSpec spec;
    spec.host = "ftp.example.test";
    spec.usernames = {"ignored"};
    spec.passwords = {"ignored"};
    spec.ports = {21, 2121};
    spec.combos = std::vector<Credential>{{"alice", "pw1"}, {"bob", "pw:2"}};

    CombinationGenerator generator(spec);
    REQUIRE(generator.totalCount() == 4);

    auto descriptors = drain(generator);
    REQUIRE(descriptors.size() == 4);
    REQUIRE(descriptors[0].endpoint.port == 21);
    REQUIRE(descriptors[0].credential == Credential{"alice", "pw1"});
    REQUIRE(descriptors[1].credential == Credential{"bob", "pw:2"});
    REQUIRE(descriptors[2].endpoint.port == 2121);
    REQUIRE(descriptors[2].credential == Credential{"alice", "pw1"});
    REQUIRE(descriptors[3].credential == Credential{"bob", "pw:2"});
}

TEST_CASE("DescriptorList", "[CombinationGenerator]") {
    std::vector<ProbeDescriptor> input = {
        {{"a.example.test", 21, Protocol::Ftp}, {"u", "p"}, std::nullopt},
        {{"b.example.test", 22, Protocol::Sftp}, {"v", "q"}, std::string("/")},
    };
    DescriptorList list(input);

    REQUIRE(list.totalCount() == 2);
    REQUIRE(drain(list) == input);
    REQUIRE_FALSE(list.next().has_value());
}
