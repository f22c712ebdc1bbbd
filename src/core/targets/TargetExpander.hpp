/**
 * @file TargetExpander.hpp
 * @brief Expansion of target specifications into ordered host lists.
 */

#pragma once

#include "core/types/ScanConfig.hpp"
#include "core/types/TargetSpec.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace portsweep::core {

/**
 * @brief Turns a TargetSpec into the concrete host sequence to scan.
 *
 * All functions are deterministic. Malformed input raises
 * ScanError(InvalidTargetSpec); an empty result from expand() raises
 * ScanError(EmptyTargetSpec).
 */
class TargetExpander {
public:
    /**
     * @brief Expands any target specification.
     * @param spec The target specification.
     * @param maxHosts Largest accepted number of hosts.
     * @return Non-empty, duplicate-free, ordered host list.
     * @throws ScanError InvalidTargetSpec or EmptyTargetSpec.
     */
    static std::vector<std::string> expand(const TargetSpec& spec,
                                           std::size_t maxHosts = kDefaultMaxHosts);

    /**
     * @brief Lists the usable host addresses of an IPv4 or IPv6 network.
     *
     * Host bits in the address are masked off. For IPv4, network and
     * broadcast addresses are excluded for prefixes up to /30; a /31 yields
     * both of its addresses and a /32 its single address. For IPv6 only the
     * subnet-router anycast address is excluded, and /127 and /128 are kept
     * whole. A bare address is a single-host network.
     *
     * @param cidr Network such as "192.168.1.0/24" or "2001:db8::/120".
     * @param maxHosts Largest accepted number of hosts.
     * @return Host addresses in ascending order.
     */
    static std::vector<std::string> expandNetwork(const std::string& cidr,
                                                  std::size_t maxHosts = kDefaultMaxHosts);

    /**
     * @brief Lists every IPv4 address between two endpoints, inclusive.
     *
     * Reversed endpoints are swapped.
     *
     * @param start First address.
     * @param end Last address.
     * @param maxHosts Largest accepted number of hosts.
     * @return Addresses in ascending order.
     */
    static std::vector<std::string> expandRange(const std::string& start, const std::string& end,
                                                std::size_t maxHosts = kDefaultMaxHosts);

    /**
     * @brief Reads one host per line from a file.
     *
     * Lines are trimmed; empty lines and lines starting with '#' are skipped.
     * Order is preserved and repeated hosts are kept once.
     *
     * @param path Path to the hosts file.
     * @return Hosts in file order.
     */
    static std::vector<std::string> loadHostsFile(const std::filesystem::path& path);
};

} // namespace portsweep::core
