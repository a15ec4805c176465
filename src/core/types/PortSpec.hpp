/**
 * @file PortSpec.hpp
 * @brief Port specification parsing for scan and skip lists.
 *
 * A port specification is either a comma separated list ("22,80,443"),
 * a hyphenated range ("1-1024") or the keyword "all".
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tcpscan::core {

/// Highest valid TCP port number.
inline constexpr int kMaxPort = 65535;

/// Ports scanned when no explicit port specification is given.
inline constexpr std::string_view kDefaultPortList =
    "20,21,22,23,25,47,53,69,80,110,113,123,135,137,138,139,143,161,179,194,201,311,389,427,443,"
    "445,465,500,513,514,515,530,548,554,563,587,593,601,631,636,660,674,691,694,749,751,843,873,"
    "901,902,903,987,990,992,993,994,995,1000,1167,1234,1433,1434,1521,1528,1723,1812,1813,2000,"
    "2049,2375,2376,2077,2078,2082,2083,2086,2087,2095,2096,2222,2433,2483,2484,2638,3000,3260,"
    "3268,3269,3283,3306,3389,3478,3690,4000,5000,5432,5433,6000,6667,7000,8000,8080,8443,8880,"
    "8888,9000,9001,9389,9418,9998,27017,27018,27019,28017,32400";

/**
 * @brief A parsed port specification.
 *
 * Holds either an explicit ordered list of ports or a contiguous range,
 * never both.
 */
struct PortSpec {
    /**
     * @brief Form the specification was written in.
     */
    enum class Kind {
        List, ///< Explicit ports in the given order, duplicates kept
        Range ///< Every port from first to last inclusive
    };

    Kind kind{Kind::List};
    std::vector<uint16_t> ports; ///< Ports of a List specification
    uint16_t first{0};           ///< First port of a Range specification
    uint16_t last{0};            ///< Last port of a Range specification

    /**
     * @brief Parses a port specification string.
     * @param spec Text such as "22,80,443", "135-139" or "all".
     * @return The parsed specification.
     * @throws InvalidSpecError if the text mixes range and list syntax, a range
     *         is reversed or exceeds 65535, or a token is not a valid port.
     */
    static PortSpec parse(std::string_view spec);

    /**
     * @brief Expands the specification into the ports it names.
     * @return Ports in ascending order for a range, in given order for a list.
     */
    [[nodiscard]] std::vector<uint16_t> expand() const;

    /**
     * @brief Number of ports the specification names.
     */
    [[nodiscard]] size_t size() const;

    bool operator==(const PortSpec& other) const = default;
};

/**
 * @brief Parses and expands a port specification in one step.
 * @param spec Port specification text.
 * @return The ordered ports to probe.
 * @throws InvalidSpecError on malformed input.
 */
std::vector<uint16_t> resolvePortSpec(std::string_view spec);

/**
 * @brief Builds the set of ports that must never be probed.
 * @param spec Skip specification text, same grammar as resolvePortSpec().
 * @return The excluded ports; empty for an empty specification.
 * @throws InvalidSpecError on malformed input.
 */
std::set<uint16_t> resolveExcludedPorts(std::string_view spec);

} // namespace tcpscan::core
