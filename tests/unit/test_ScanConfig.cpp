#include <catch2/catch_test_macros.hpp>

#include "core/types/ScanConfig.hpp"

#include <limits>

using namespace tcpscan::core;

TEST_CASE("ScanConfig default values", "[ScanConfig]") {
    ScanConfig config;

    REQUIRE(config.target == "127.0.0.1");
    REQUIRE(config.workers == 100);
    REQUIRE_FALSE(config.timeout.has_value());
    REQUIRE(config.lanTimeout == std::chrono::milliseconds{70});
    REQUIRE(config.wanTimeout == std::chrono::milliseconds{180});
    REQUIRE(config.interPassDelay == std::chrono::milliseconds{700});
    REQUIRE(config.runtimeStatsInterval.count() == 0);
    REQUIRE(config.loopPolicy == LoopPolicy::FixedCount);
    REQUIRE_FALSE(config.loopRequested());
}

TEST_CASE("ScanConfig effective ports", "[ScanConfig]") {
    ScanConfig config;
    REQUIRE(config.effectivePorts() == kDefaultPortList);

    config.ports = "22,80";
    REQUIRE(config.effectivePorts() == "22,80");
}

TEST_CASE("ScanConfig pass limit", "[ScanConfig]") {
    constexpr auto unbounded = std::numeric_limits<int64_t>::max();
    ScanConfig config;

    SECTION("Single pass when no loop is requested") {
        REQUIRE(config.passLimit() == 1);
    }

    SECTION("Explicit count") {
        config.loopCount = 5;
        REQUIRE(config.passLimit() == 5);
        REQUIRE(config.loopRequested());
    }

    SECTION("Zero means continuous") {
        config.loopCount = 0;
        REQUIRE(config.passLimit() == unbounded);
    }

    SECTION("Until-condition policies are unbounded") {
        config.loopPolicy = LoopPolicy::UntilAllOpen;
        REQUIRE(config.passLimit() == unbounded);
        REQUIRE(config.loopRequested());

        config.loopPolicy = LoopPolicy::UntilAllClosed;
        REQUIRE(config.passLimit() == unbounded);
    }
}
