#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/types/PortSpec.hpp"
#include "core/types/ScanCounters.hpp"

#include <string>

using namespace tcpscan::core;

// =============================================================================
// PortSpec Benchmarks
// =============================================================================

TEST_CASE("PortSpec benchmarks", "[benchmark][PortSpec]") {
    BENCHMARK("Parse default port list") {
        return PortSpec::parse(kDefaultPortList).size();
    };

    BENCHMARK("Resolve full range") {
        return resolvePortSpec("all").size();
    };

    BENCHMARK("Resolve short range") {
        return resolvePortSpec("1-1024").size();
    };

    BENCHMARK("Resolve excluded set") {
        return resolveExcludedPorts("135-139").size();
    };

    auto spec = PortSpec::parse("1-65535");

    BENCHMARK("Expand parsed range") {
        return spec.expand().size();
    };
}

// =============================================================================
// ScanCounters Benchmarks
// =============================================================================

TEST_CASE("ScanCounters benchmarks", "[benchmark][ScanCounters]") {
    ScanCounters counters;

    BENCHMARK("portScanned increment") {
        counters.portScanned();
        return counters.portsScanned();
    };

    BENCHMARK("portOpened on one host") {
        counters.portOpened("10.0.0.1", 80);
        return counters.portsOpened();
    };

    BENCHMARK("snapshot") {
        return counters.snapshot();
    };
}
