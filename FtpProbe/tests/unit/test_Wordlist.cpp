#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "infrastructure/input/Wordlist.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace ftpprobe::core;
using namespace ftpprobe::infra;

namespace {

class TestWordlistFile {
public:
    TestWordlistFile(const std::string& name, const std::string& content)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream file(path_, std::ios::binary);
        file << content;
    }

    ~TestWordlistFile() { std::filesystem::remove(path_); }

    std::filesystem::path path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("parseWordlist", "[Wordlist]") {
    SECTION("Trims entries and drops blanks and comments") {
        auto words = parseWordlist("admin\r\n  root  \n\n# comment\n\t\nguest");
        REQUIRE(words == std::vector<std::string>{"admin", "root", "guest"});
    }

    SECTION("Hash inside an entry is kept") {
        REQUIRE(parseWordlist("pa#ss\n") == std::vector<std::string>{"pa#ss"});
    }

    SECTION("Empty text") {
        REQUIRE(parseWordlist("").empty());
    }
}

TEST_CASE("readWordlist", "[Wordlist]") {
    SECTION("Reads a file") {
        TestWordlistFile file("ftpprobe_users.txt", "alice\nbob\n#carol\n");
        REQUIRE(readWordlist(file.path()) == std::vector<std::string>{"alice", "bob"});
    }

    SECTION("Unreadable file yields an empty list") {
        auto missing = std::filesystem::temp_directory_path() / "ftpprobe_missing_list.txt";
        std::filesystem::remove(missing);
        REQUIRE(readWordlist(missing).empty());
    }
}

TEST_CASE("parseComboLines", "[Wordlist]") {
    auto combos = parseComboLines({"admin:admin", " root : toor ", "nocolon", "user:pa:ss", ":"});

    REQUIRE(combos.size() == 4);
    REQUIRE(combos[0] == Credential{"admin", "admin"});
    REQUIRE(combos[1] == Credential{"root", "toor"});
    REQUIRE(combos[2] == Credential{"user", "pa:ss"});
    REQUIRE(combos[3] == Credential{"", ""});
}

TEST_CASE("parsePort", "[Wordlist]") {
    REQUIRE(parsePort("21") == uint16_t{21});
    REQUIRE(parsePort(" 2222 ") == uint16_t{2222});
    REQUIRE(parsePort("65535") == uint16_t{65535});
    REQUIRE_FALSE(parsePort("0").has_value());
    REQUIRE_FALSE(parsePort("65536").has_value());
    REQUIRE_FALSE(parsePort("-1").has_value());
    REQUIRE_FALSE(parsePort("21a").has_value());
    REQUIRE_FALSE(parsePort("").has_value());
}

TEST_CASE("parsePortList", "[Wordlist]") {
    SECTION("Comma-separated list") {
        REQUIRE(parsePortList("21,2121, 990") == std::vector<uint16_t>{21, 2121, 990});
    }

    SECTION("Empty entries are ignored") {
        REQUIRE(parsePortList("21,,22,") == std::vector<uint16_t>{21, 22});
    }

    SECTION("File of ports") {
        TestWordlistFile file("ftpprobe_ports.txt", "21\n# sftp\n22\n\n2222\n");
        REQUIRE(parsePortList(file.path().string()) == std::vector<uint16_t>{21, 22, 2222});
    }

    SECTION("Invalid entry is fatal") {
        REQUIRE_THROWS_WITH(parsePortList("21,ftp"),
                            Catch::Matchers::ContainsSubstring("Invalid port 'ftp'"));
        REQUIRE_THROWS_AS(parsePortList("99999"), std::runtime_error);
    }

    SECTION("Empty list is fatal") {
        REQUIRE_THROWS_AS(parsePortList(","), std::runtime_error);
    }
}
