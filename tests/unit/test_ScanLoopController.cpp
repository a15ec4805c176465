#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ScanLoopController.hpp"
#include "support/FakeConnector.hpp"
#include "support/FakeResolver.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <sstream>
#include <thread>

using namespace tcpscan;
using namespace tcpscan::infra;

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::vector<asio::ip::address_v4> hostsOf(const std::string& network) {
    return Ipv4Network::parse(network).hosts();
}

class LoopFixture {
public:
    explicit LoopFixture(std::set<uint16_t> openPorts) : connector(context, std::move(openPorts)) {
        config.interPassDelay = std::chrono::milliseconds(10);
        context.start();
    }

    ScanLoopController& build() {
        probe = std::make_unique<PortProbe>(config, connector, counters, writer, dnsCache);
        scanner = std::make_unique<HostScanner>(config, *probe, counters);
        controller = std::make_unique<ScanLoopController>(config, *scanner, counters, writer);
        return *controller;
    }

    AsioContext context{2};
    test::FakeConnector connector;
    test::FakeResolver resolver;
    DnsCache dnsCache{context, resolver};
    core::ScanCounters counters;
    std::ostringstream out;
    ResultWriter writer{out};
    core::ScanConfig config;
    std::unique_ptr<PortProbe> probe;
    std::unique_ptr<HostScanner> scanner;
    std::unique_ptr<ScanLoopController> controller;
};

} // namespace

TEST_CASE("ScanLoopController single pass", "[ScanLoopController]") {
    LoopFixture f({22});
    f.config.ports = "22,80";
    auto& controller = f.build();

    auto outcome = controller.run(hostsOf("10.0.0.0/30"));

    REQUIRE(outcome.reason == TerminationReason::PassLimitReached);
    REQUIRE(outcome.passes == 1);
    REQUIRE(f.counters.hostsScanned() == 2);
    REQUIRE(f.counters.portsScanned() == 4);
    REQUIRE(f.counters.portsOpened() == 2);
    REQUIRE(f.out.str().find("completed loops") == std::string::npos);
}

TEST_CASE("ScanLoopController fixed pass count", "[ScanLoopController]") {
    LoopFixture f({});
    f.config.ports = "22";
    f.config.loopCount = 3;
    auto& controller = f.build();

    auto outcome = controller.run(hostsOf("10.0.0.1"));

    REQUIRE(outcome.reason == TerminationReason::PassLimitReached);
    REQUIRE(outcome.passes == 3);
    REQUIRE(f.counters.hostsScanned() == 3);
    REQUIRE(countOccurrences(f.out.str(), "] completed loops:") == 3);
    REQUIRE(f.out.str().find("completed loops:3\n") != std::string::npos);
    REQUIRE(f.out.str().find('\a') == std::string::npos);
}

TEST_CASE("ScanLoopController until-conditions", "[ScanLoopController]") {
    SECTION("Stops after one pass when everything is already open") {
        LoopFixture f({22, 80});
        f.config.ports = "22,80";
        f.config.loopPolicy = core::LoopPolicy::UntilAllOpen;
        auto& controller = f.build();

        auto outcome = controller.run(hostsOf("10.0.0.1"));

        REQUIRE(outcome.reason == TerminationReason::AllOpen);
        REQUIRE(outcome.passes == 1);
        REQUIRE(f.out.str().find("completed loops:1\n\a\n") != std::string::npos);
    }

    SECTION("Stops after one pass when everything is already closed") {
        LoopFixture f({});
        f.config.ports = "22,80";
        f.config.loopPolicy = core::LoopPolicy::UntilAllClosed;
        auto& controller = f.build();

        auto outcome = controller.run(hostsOf("10.0.0.1"));

        REQUIRE(outcome.reason == TerminationReason::AllClosed);
        REQUIRE(outcome.passes == 1);
    }

    SECTION("Keeps scanning until the port opens") {
        LoopFixture f({});
        std::atomic<int> attempts{0};
        f.connector.setPredicate(
            [&attempts](const std::string&, uint16_t) { return ++attempts >= 3; });
        f.config.ports = "8080";
        f.config.loopPolicy = core::LoopPolicy::UntilAllOpen;
        auto& controller = f.build();

        auto outcome = controller.run(hostsOf("10.0.0.1"));

        REQUIRE(outcome.reason == TerminationReason::AllOpen);
        REQUIRE(outcome.passes == 3);
        REQUIRE(countOccurrences(f.out.str(), "] completed loops:") == 3);
        REQUIRE(countOccurrences(f.out.str(), "\a") == 1);
    }

    SECTION("Only the last scanned host decides") {
        LoopFixture f({});
        f.connector.setPredicate(
            [](const std::string& address, uint16_t) { return address == "10.0.0.2"; });
        f.config.ports = "22";
        f.config.loopPolicy = core::LoopPolicy::UntilAllOpen;
        auto& controller = f.build();

        auto outcome = controller.run(hostsOf("10.0.0.0/30"));

        REQUIRE(outcome.reason == TerminationReason::AllOpen);
        REQUIRE(outcome.passes == 1);
    }
}

TEST_CASE("ScanLoopController skips the excluded network", "[ScanLoopController]") {
    LoopFixture f({});
    f.config.ports = "22";
    f.config.verbose = true;
    auto& controller = f.build();

    controller.run(hostsOf("10.0.0.0/29"), Ipv4Network::parse("10.0.0.4/31"));

    REQUIRE(f.counters.hostsSkipped() == 2);
    REQUIRE(f.counters.hostsScanned() == 4);
    REQUIRE(f.out.str().find("10.0.0.4\tn/a\thost-excluded\n") != std::string::npos);
    REQUIRE(f.out.str().find("10.0.0.5\tn/a\thost-excluded\n") != std::string::npos);

    for (const auto& attempt : f.connector.attempts()) {
        REQUIRE(attempt.first != "10.0.0.4");
        REQUIRE(attempt.first != "10.0.0.5");
    }
}

TEST_CASE("ScanLoopController cancel ends a continuous loop", "[ScanLoopController]") {
    LoopFixture f({});
    f.config.ports = "1-20";
    f.config.loopCount = 0;
    auto& controller = f.build();

    auto pending = std::async(std::launch::async,
                              [&controller]() { return controller.run(hostsOf("10.0.0.1")); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    controller.cancel();

    REQUIRE(pending.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    auto outcome = pending.get();

    REQUIRE(outcome.reason == TerminationReason::Interrupted);
    REQUIRE(outcome.passes >= 1);
    REQUIRE(controller.isCancelled());
    REQUIRE(f.scanner->isCancelled());
}

TEST_CASE("ScanLoopController pauses between passes", "[ScanLoopController]") {
    SECTION("Fixed count sleeps between passes but not after the last") {
        LoopFixture f({});
        f.config.ports = "22";
        f.config.loopCount = 3;
        f.config.interPassDelay = std::chrono::milliseconds(200);
        auto& controller = f.build();

        auto started = std::chrono::steady_clock::now();
        auto outcome = controller.run(hostsOf("10.0.0.1"));
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(outcome.passes == 3);
        REQUIRE(elapsed >= std::chrono::milliseconds(400));
        REQUIRE(elapsed < std::chrono::milliseconds(600));
    }

    SECTION("A satisfied until-condition does not sleep") {
        LoopFixture f({22});
        f.config.ports = "22";
        f.config.loopPolicy = core::LoopPolicy::UntilAllOpen;
        f.config.interPassDelay = std::chrono::seconds(5);
        auto& controller = f.build();

        auto started = std::chrono::steady_clock::now();
        auto outcome = controller.run(hostsOf("10.0.0.1"));

        REQUIRE(outcome.reason == TerminationReason::AllOpen);
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
    }

    SECTION("Cancel wakes a sleeping continuous loop") {
        LoopFixture f({});
        f.config.ports = "22";
        f.config.loopCount = 0;
        f.config.interPassDelay = std::chrono::seconds(10);
        auto& controller = f.build();

        auto pending = std::async(std::launch::async,
                                  [&controller]() { return controller.run(hostsOf("10.0.0.1")); });

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (f.counters.hostsScanned() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(f.counters.hostsScanned() == 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto cancelled = std::chrono::steady_clock::now();
        controller.cancel();

        REQUIRE(pending.wait_for(std::chrono::seconds(1)) == std::future_status::ready);
        auto outcome = pending.get();
        REQUIRE(std::chrono::steady_clock::now() - cancelled < std::chrono::seconds(1));
        REQUIRE(outcome.reason == TerminationReason::Interrupted);
        REQUIRE(outcome.passes == 1);
    }
}

TEST_CASE("ScanLoopController connect timeout selection", "[ScanLoopController]") {
    core::ScanConfig config;
    auto lan = asio::ip::make_address_v4("192.168.1.10");
    auto wan = asio::ip::make_address_v4("8.8.8.8");

    REQUIRE(ScanLoopController::selectTimeout(config, lan) == std::chrono::milliseconds(70));
    REQUIRE(ScanLoopController::selectTimeout(config, wan) == std::chrono::milliseconds(180));

    config.timeout = std::chrono::milliseconds(500);
    REQUIRE(ScanLoopController::selectTimeout(config, lan) == std::chrono::milliseconds(500));
    REQUIRE(ScanLoopController::selectTimeout(config, wan) == std::chrono::milliseconds(500));

    SECTION("Chosen from the first scanned host") {
        LoopFixture f({});
        f.config.ports = "22";
        auto& controller = f.build();

        REQUIRE_FALSE(controller.connectTimeout().has_value());
        controller.run(hostsOf("10.0.0.1"));
        REQUIRE(controller.connectTimeout() == std::chrono::milliseconds(70));
    }
}

TEST_CASE("Termination reason names", "[ScanLoopController]") {
    REQUIRE(terminationReasonToString(TerminationReason::PassLimitReached) == "pass limit reached");
    REQUIRE(terminationReasonToString(TerminationReason::AllOpen) == "all ports open");
    REQUIRE(terminationReasonToString(TerminationReason::AllClosed) == "all ports closed");
    REQUIRE(terminationReasonToString(TerminationReason::Interrupted) == "interrupted");
}
