#include "app/Application.hpp"

#include "core/types/PortSpec.hpp"
#include "core/types/ScanCounters.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/ConnectionListener.hpp"
#include "infrastructure/network/DnsCache.hpp"
#include "infrastructure/network/DnsResolver.hpp"
#include "infrastructure/network/HostEnumerator.hpp"
#include "infrastructure/network/HostScanner.hpp"
#include "infrastructure/network/Ipv4Network.hpp"
#include "infrastructure/network/PortProbe.hpp"
#include "infrastructure/network/RuntimeStatsReporter.hpp"
#include "infrastructure/network/ScanLoopController.hpp"
#include "infrastructure/network/TcpConnector.hpp"
#include "infrastructure/output/ResultWriter.hpp"

#include <asio.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <future>
#include <iostream>

namespace tcpscan::app {

Application::Application(int argc, const char* const argv[]) {
    initializeLogging();

    commandLine_.parse(argc, argv);
    if (commandLine_.debugRequested()) {
        spdlog::set_level(spdlog::level::debug);
    }

    if (auto path = commandLine_.configFile()) {
        infra::ConfigManager manager(*path);
        manager.load();
        config_ = manager.config();
    }

    commandLine_.applyTo(config_);
}

void Application::initializeLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    auto logger = std::make_shared<spdlog::logger>("tcpscan", consoleSink);
    logger->set_pattern("%^%l%$: %v");
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> Application::createStatsLogger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();

    auto logger = std::make_shared<spdlog::logger>("tcpscan.stats", sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S]\t%v");
    logger->set_level(spdlog::level::info);
    return logger;
}

int Application::run() {
    if (commandLine_.helpRequested()) {
        std::cout << commandLine_.usage() << '\n';
        return 0;
    }
    if (commandLine_.versionRequested()) {
        std::cout << "tcpscan version: " << kVersion << '\n';
        return 0;
    }

    return config_.listen ? runListener() : runScan();
}

int Application::runScan() {
    infra::DnsResolver resolver;
    infra::HostEnumerator enumerator(resolver);

    auto hosts = enumerator.enumerate(config_.target, config_.shuffleHosts);

    std::optional<infra::Ipv4Network> excluded;
    if (!config_.skipNetwork.empty()) {
        excluded = infra::Ipv4Network::parse(config_.skipNetwork);
    }

    infra::ResultWriter writer;

    // Declared first so that it is destroyed last: the scanner below waits
    // for in-flight probes, which need the I/O threads to complete.
    infra::AsioContext context(infra::AsioContext::threadCountFor(config_.workers));

    core::ScanCounters counters;
    infra::TcpConnector connector(context);
    infra::DnsCache dnsCache(context, resolver);
    infra::PortProbe probe(config_, connector, counters, writer, dnsCache);
    infra::HostScanner scanner(config_, probe, counters);
    infra::ScanLoopController controller(config_, scanner, counters, writer);

    // Only after the port specs have been validated
    if (!config_.outputPath.empty()) {
        writer.openCsv(config_.outputPath);
    }

    context.start();

    asio::signal_set signals(context.getContext(), SIGINT, SIGTERM);
    signals.async_wait([&controller](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::warn("Interrupted by signal {}, finishing", signal);
        controller.cancel();
    });

    std::unique_ptr<infra::RuntimeStatsReporter> reporter;
    if (config_.runtimeStatsInterval.count() > 0) {
        reporter = std::make_unique<infra::RuntimeStatsReporter>(
            context, counters, config_.runtimeStatsInterval, createStatsLogger());
        reporter->start();
    }

    spdlog::debug("Scanning {} hosts with {} workers", hosts.size(), config_.workers);
    auto outcome = controller.run(hosts, excluded);

    if (reporter) {
        reporter->stop();
        reporter->reportFinal();
    }

    asio::error_code ignored;
    signals.cancel(ignored);

    infra::ScanSummary summary;
    summary.statistics = counters.snapshot();
    summary.elapsed = outcome.elapsed;
    summary.passes = outcome.passes;
    writer.writeSummary(summary, config_.verbose);

    return 0;
}

int Application::runListener() {
    auto ports = core::resolvePortSpec(config_.effectivePorts());

    infra::ResultWriter writer;
    if (!config_.outputPath.empty()) {
        writer.openCsv(config_.outputPath, true, "Timestamp,Local,Remote");
    }

    infra::DnsResolver resolver;
    infra::AsioContext context(infra::AsioContext::threadCountFor(static_cast<int>(ports.size())));
    infra::DnsCache dnsCache(context, resolver);

    auto listener = std::make_shared<infra::ConnectionListener>(
        context, writer, config_.resolveDns ? &dnsCache : nullptr);
    listener->start(ports);

    writer.writeLine("\nPress Ctrl-C to exit.\n");

    std::promise<void> stopRequested;
    auto stopped = stopRequested.get_future();

    asio::signal_set signals(context.getContext(), SIGINT, SIGTERM);
    signals.async_wait([&listener, &stopRequested](const asio::error_code& ec, int /*signal*/) {
        if (ec) {
            return;
        }
        listener->stop();
        stopRequested.set_value();
    });

    context.start();
    stopped.wait();
    context.stop();

    spdlog::debug("Listener handled {} connections", listener->connectionCount());
    return 0;
}

} // namespace tcpscan::app
