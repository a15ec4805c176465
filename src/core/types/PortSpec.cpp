#include "core/types/PortSpec.hpp"

#include "core/types/ScanError.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace tcpscan::core {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

int parseNumber(std::string_view token, std::string_view spec) {
    token = trim(token);
    int value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc() || ptr != token.data() + token.size()) {
        throw InvalidSpecError("Invalid port '" + std::string(token) + "' in port specification '" +
                               std::string(spec) + "'");
    }
    return value;
}

} // namespace

PortSpec PortSpec::parse(std::string_view spec) {
    auto text = trim(spec);
    if (text.empty()) {
        throw InvalidSpecError("Port specification is empty");
    }

    PortSpec result;

    if (equalsIgnoreCase(text, "all")) {
        result.kind = Kind::Range;
        result.first = 1;
        result.last = static_cast<uint16_t>(kMaxPort);
        return result;
    }

    auto hyphen = text.find('-');
    auto comma = text.find(',');

    if (hyphen != std::string_view::npos && comma != std::string_view::npos) {
        throw InvalidSpecError("Port list cannot contain both a port range and list of ports: " +
                               std::string(spec));
    }

    if (hyphen != std::string_view::npos) {
        if (text.find('-', hyphen + 1) != std::string_view::npos) {
            throw InvalidSpecError("Invalid port range: " + std::string(spec));
        }

        int start = parseNumber(text.substr(0, hyphen), spec);
        int end = parseNumber(text.substr(hyphen + 1), spec);

        if (start < 1) {
            throw InvalidSpecError("Starting port must be at least 1: " + std::string(spec));
        }
        if (end < start) {
            throw InvalidSpecError("Ending port is less than starting port: " + std::string(spec));
        }
        if (end > kMaxPort) {
            throw InvalidSpecError("Ending port is greater than 65535: " + std::string(spec));
        }

        result.kind = Kind::Range;
        result.first = static_cast<uint16_t>(start);
        result.last = static_cast<uint16_t>(end);
        return result;
    }

    result.kind = Kind::List;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto next = text.find(',', pos);
        auto token = text.substr(pos, next == std::string_view::npos ? text.size() - pos : next - pos);

        int port = parseNumber(token, spec);
        if (port < 1 || port > kMaxPort) {
            throw InvalidSpecError("Port " + std::to_string(port) + " is outside 1-65535");
        }
        result.ports.push_back(static_cast<uint16_t>(port));

        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }

    return result;
}

std::vector<uint16_t> PortSpec::expand() const {
    if (kind == Kind::List) {
        return ports;
    }

    std::vector<uint16_t> result;
    result.reserve(size());
    for (int p = first; p <= last; ++p) {
        result.push_back(static_cast<uint16_t>(p));
    }
    return result;
}

size_t PortSpec::size() const {
    if (kind == Kind::List) {
        return ports.size();
    }
    return static_cast<size_t>(last - first) + 1;
}

std::vector<uint16_t> resolvePortSpec(std::string_view spec) {
    return PortSpec::parse(spec).expand();
}

std::set<uint16_t> resolveExcludedPorts(std::string_view spec) {
    if (trim(spec).empty()) {
        return {};
    }

    auto ports = resolvePortSpec(spec);
    return {ports.begin(), ports.end()};
}

} // namespace tcpscan::core
