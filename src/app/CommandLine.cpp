#include "app/CommandLine.hpp"

#include "core/types/ScanError.hpp"

#include <sstream>

namespace po = boost::program_options;

namespace tcpscan::app {

CommandLine::CommandLine() : options_("tcpscan: a multi-threaded IPv4 TCP port scanner") {
    // clang-format off
    options_.add_options()
        ("help,h", "show this help message and exit")
        ("version", "show the program version and exit")
        ("target", po::value<std::string>()->default_value("."),
            "e.g. 192.168.1.0/24 192.168.1.100 www.example.com")
        ("skipnetblock,x", po::value<std::string>(), "skip a sub-netblock, e.g. 192.168.1.96/28")
        ("skipports,X", po::value<std::string>(), "exclude a subset of ports, e.g. 135-139")
        ("ports,p", po::value<std::string>(),
            "comma separated list or hyphenated range, e.g. 22,80,443 or 80-515 or all "
            "(default: the built-in list of common ports)")
        ("threads,T", po::value<int>(), "number of concurrent connect attempts, default: 100")
        ("timeout,t", po::value<double>(),
            "seconds to wait for a connect, default: 0.07 for lan, 0.18 for wan")
        ("shufflehosts,s", "randomize the order IPs are scanned")
        ("shuffleports,S", "randomize the order ports are scanned")
        ("closed,c", "output ports that are closed")
        ("output,o", po::value<std::string>(), "output to CSV file")
        ("dns,d", "resolve IPs to host names")
        ("verbose,v", "output statistics")
        ("runtime,r", po::value<int>(),
            "periodically display runtime stats every RUNTIME seconds to STDERR")
        ("loop,l", po::value<int64_t>(), "repeat the port scan LOOP times, 0 for continuous")
        ("loopopen", "repeat the port scan until all port(s) are open")
        ("loopclose", "repeat the port scan until all port(s) are closed")
        ("listen,L", "listen on given TCP port(s) for incoming connection(s); works with "
            "--output and --dns")
        ("config", po::value<std::string>(), "JSON file with scanner defaults")
        ("debug", "enable debug logging");
    // clang-format on

    positional_.add("target", 1);
}

void CommandLine::parse(int argc, const char* const argv[]) {
    try {
        po::store(po::command_line_parser(argc, argv).options(options_).positional(positional_).run(),
                  vm_);
        po::notify(vm_);
    } catch (const po::error& e) {
        throw core::ConfigError(e.what());
    }
}

std::optional<std::filesystem::path> CommandLine::configFile() const {
    if (!vm_.count("config")) {
        return std::nullopt;
    }
    return std::filesystem::path(vm_["config"].as<std::string>());
}

void CommandLine::applyTo(core::ScanConfig& config) const {
    auto target = vm_["target"].as<std::string>();
    config.target = target == "." ? "127.0.0.1" : target;

    if (vm_.count("ports")) {
        config.ports = vm_["ports"].as<std::string>();
    }
    if (vm_.count("skipports")) {
        config.skipPorts = vm_["skipports"].as<std::string>();
    }
    if (vm_.count("skipnetblock")) {
        config.skipNetwork = vm_["skipnetblock"].as<std::string>();
    }

    if (vm_.count("threads")) {
        int threads = vm_["threads"].as<int>();
        if (threads < 1) {
            throw core::ConfigError("Unable to set thread count to: " + std::to_string(threads));
        }
        config.workers = threads;
    }

    if (vm_.count("timeout")) {
        double seconds = vm_["timeout"].as<double>();
        auto timeout = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
        if (timeout.count() <= 0) {
            throw core::ConfigError("Timeout must be at least one millisecond");
        }
        config.timeout = timeout;
    }

    if (vm_.count("runtime")) {
        int interval = vm_["runtime"].as<int>();
        if (interval < 1) {
            throw core::ConfigError("Runtime stats interval must be at least one second");
        }
        config.runtimeStatsInterval = std::chrono::seconds(interval);
    }

    bool loopOpen = vm_.count("loopopen") > 0;
    bool loopClose = vm_.count("loopclose") > 0;
    if (loopOpen && loopClose) {
        throw core::ConfigError("--loopopen and --loopclose are mutually exclusive");
    }
    if ((loopOpen || loopClose) && vm_.count("loop")) {
        throw core::ConfigError("--loop cannot be combined with --loopopen or --loopclose");
    }

    if (loopOpen) {
        config.loopPolicy = core::LoopPolicy::UntilAllOpen;
    } else if (loopClose) {
        config.loopPolicy = core::LoopPolicy::UntilAllClosed;
    }

    if (vm_.count("loop")) {
        auto count = vm_["loop"].as<int64_t>();
        if (count < 0) {
            throw core::ConfigError("Loop count cannot be negative");
        }
        config.loopCount = count;
    }

    if (vm_.count("output")) {
        config.outputPath = vm_["output"].as<std::string>();
    }

    config.shuffleHosts = vm_.count("shufflehosts") > 0;
    config.shufflePorts = vm_.count("shuffleports") > 0;
    config.showClosed = vm_.count("closed") > 0;
    config.resolveDns = vm_.count("dns") > 0;
    config.verbose = vm_.count("verbose") > 0;
    config.listen = vm_.count("listen") > 0;
}

std::string CommandLine::usage() const {
    std::ostringstream out;
    out << "Usage: tcpscan [options] [target]\n\n" << options_;
    return out.str();
}

} // namespace tcpscan::app
