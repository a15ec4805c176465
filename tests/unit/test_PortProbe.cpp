#include <catch2/catch_test_macros.hpp>

#include "core/types/ScanError.hpp"
#include "infrastructure/network/PortProbe.hpp"
#include "support/FakeConnector.hpp"
#include "support/FakeResolver.hpp"

#include <future>
#include <sstream>

using namespace tcpscan;
using namespace tcpscan::infra;

namespace {

class FailingBuffer : public std::streambuf {
protected:
    int_type overflow(int_type /*ch*/) override { return traits_type::eof(); }
};

struct ProbeFixture {
    explicit ProbeFixture(std::set<uint16_t> openPorts) : connector(context, std::move(openPorts)) {
        resolver.addHost("web.lan", "10.0.0.5");
        context.start();
    }

    core::PortScanResult probe(PortProbe& probe, uint16_t port,
                               std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) {
        std::promise<core::PortScanResult> done;
        auto future = done.get_future();
        probe.probe("10.0.0.5", port, timeout,
                    [&done](const core::PortScanResult& result) { done.set_value(result); });
        REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        return future.get();
    }

    AsioContext context{2};
    test::FakeConnector connector;
    test::FakeResolver resolver;
    DnsCache dnsCache{context, resolver};
    core::ScanCounters counters;
    std::ostringstream out;
    ResultWriter writer{out};
    core::ScanConfig config;
};

} // namespace

TEST_CASE("PortProbe classifies ports", "[PortProbe]") {
    ProbeFixture f({80});
    PortProbe probe(f.config, f.connector, f.counters, f.writer, f.dnsCache);

    SECTION("Open port is counted and written") {
        auto result = f.probe(probe, 80);
        REQUIRE(result.state == core::PortState::Open);
        REQUIRE(result.targetAddress == "10.0.0.5");
        REQUIRE(f.counters.portsScanned() == 1);
        REQUIRE(f.counters.portsOpened() == 1);
        REQUIRE(f.out.str() == "10.0.0.5\t80\topen\n");
    }

    SECTION("Closed port is counted but silent") {
        auto result = f.probe(probe, 22);
        REQUIRE(result.state == core::PortState::Closed);
        REQUIRE(f.counters.portsScanned() == 1);
        REQUIRE(f.counters.portsOpened() == 0);
        REQUIRE(f.out.str().empty());
    }
}

TEST_CASE("PortProbe honours output options", "[PortProbe]") {
    ProbeFixture f({80});

    SECTION("Show closed") {
        f.config.showClosed = true;
        PortProbe probe(f.config, f.connector, f.counters, f.writer, f.dnsCache);
        f.probe(probe, 22);
        REQUIRE(f.out.str() == "10.0.0.5\t22\tclosed\n");
    }

    SECTION("Resolve DNS adds the hostname to open ports only") {
        f.config.resolveDns = true;
        f.config.showClosed = true;
        PortProbe probe(f.config, f.connector, f.counters, f.writer, f.dnsCache);

        auto open = f.probe(probe, 80);
        f.probe(probe, 22);

        REQUIRE(open.hostname == "web.lan");
        REQUIRE(f.out.str() == "10.0.0.5\t80\topen\tweb.lan\n10.0.0.5\t22\tclosed\n");
        REQUIRE(f.resolver.reverseLookups == 1);
    }
}

TEST_CASE("PortProbe skips excluded ports", "[PortProbe]") {
    ProbeFixture f({135});
    f.config.skipPorts = "135-139";

    SECTION("No connect attempt is made") {
        PortProbe probe(f.config, f.connector, f.counters, f.writer, f.dnsCache);
        REQUIRE(probe.isExcluded(137));
        REQUIRE_FALSE(probe.isExcluded(140));

        auto result = f.probe(probe, 135);
        REQUIRE(result.state == core::PortState::Excluded);
        REQUIRE(f.counters.portsSkipped() == 1);
        REQUIRE(f.counters.portsScanned() == 0);
        REQUIRE(f.connector.attemptCount() == 0);
        REQUIRE(f.out.str().empty());
    }

    SECTION("Verbose output names the excluded port") {
        f.config.verbose = true;
        PortProbe probe(f.config, f.connector, f.counters, f.writer, f.dnsCache);
        f.probe(probe, 136);
        REQUIRE(f.out.str() == "10.0.0.5\t136\tport-excluded\n");
    }

    SECTION("Malformed skip spec fails at construction") {
        f.config.skipPorts = "139-135";
        REQUIRE_THROWS_AS(PortProbe(f.config, f.connector, f.counters, f.writer, f.dnsCache),
                          core::InvalidSpecError);
    }
}

TEST_CASE("PortProbe bounds the reverse lookup by the connect timeout", "[PortProbe]") {
    ProbeFixture f({80});
    f.config.resolveDns = true;
    f.resolver.setReverseDelay(std::chrono::milliseconds(1000));
    PortProbe probe(f.config, f.connector, f.counters, f.writer, f.dnsCache);

    auto started = std::chrono::steady_clock::now();
    auto result = f.probe(probe, 80, std::chrono::milliseconds(50));

    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500));
    REQUIRE(result.state == core::PortState::Open);
    REQUIRE(result.hostname.empty());
    REQUIRE(f.out.str() == "10.0.0.5\t80\topen\t\n");
}

TEST_CASE("PortProbe reports the outcome when the record cannot be written", "[PortProbe]") {
    ProbeFixture f({80});
    FailingBuffer buffer;
    std::ostream broken(&buffer);
    broken.exceptions(std::ios::badbit);
    ResultWriter writer(broken);

    SECTION("Plain open port") {
        PortProbe probe(f.config, f.connector, f.counters, writer, f.dnsCache);
        auto result = f.probe(probe, 80);
        REQUIRE(result.state == core::PortState::Open);
        REQUIRE(f.counters.portsOpened() == 1);
    }

    SECTION("Open port with its hostname") {
        f.config.resolveDns = true;
        PortProbe probe(f.config, f.connector, f.counters, writer, f.dnsCache);
        auto result = f.probe(probe, 80);
        REQUIRE(result.hostname == "web.lan");
    }

    SECTION("Excluded port") {
        f.config.skipPorts = "135";
        f.config.verbose = true;
        PortProbe probe(f.config, f.connector, f.counters, writer, f.dnsCache);
        auto result = f.probe(probe, 135);
        REQUIRE(result.state == core::PortState::Excluded);
    }
}
