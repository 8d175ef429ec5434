#include <catch2/catch_test_macros.hpp>

#include "core/probe/ScopeGuard.hpp"

#include <stdexcept>

using namespace ftpprobe::core;

TEST_CASE("onScopeExit", "[ScopeGuard]") {
    int calls = 0;

    SECTION("Runs on normal exit") {
        {
            auto guard = onScopeExit([&calls] { ++calls; });
        }
        REQUIRE(calls == 1);
    }

    SECTION("Runs when the scope unwinds") {
        REQUIRE_THROWS_AS(
            [&calls]() {
                auto guard = onScopeExit([&calls] { ++calls; });
                throw std::runtime_error("stage failed");
            }(),
            std::runtime_error);
        REQUIRE(calls == 1);
    }

    SECTION("Dismissed guard does nothing") {
        {
            auto guard = onScopeExit([&calls] { ++calls; });
            guard.dismiss();
        }
        REQUIRE(calls == 0);
    }
}

TEST_CASE("StageTimer records on every exit path", "[ScopeGuard]") {
    std::optional<double> elapsed;

    REQUIRE_THROWS([&elapsed]() {
        StageTimer timer(elapsed);
        throw std::runtime_error("listing failed");
    }());

    REQUIRE(elapsed.has_value());
    REQUIRE(*elapsed >= 0.0);
}
