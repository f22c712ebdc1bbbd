/**
 * @file TargetSpec.hpp
 * @brief The four mutually exclusive ways of naming scan targets.
 */

#pragma once

#include <filesystem>
#include <string>
#include <variant>

namespace portsweep::core {

/**
 * @brief IPv4 network in CIDR notation, e.g. 192.168.1.0/24.
 */
struct CidrTarget {
    std::string cidr;

    bool operator==(const CidrTarget& other) const = default;
};

/**
 * @brief Inclusive IPv4 address range.
 */
struct RangeTarget {
    std::string start;
    std::string end;

    bool operator==(const RangeTarget& other) const = default;
};

/**
 * @brief Newline-delimited file of hosts.
 */
struct HostsFileTarget {
    std::filesystem::path path;

    bool operator==(const HostsFileTarget& other) const = default;
};

/**
 * @brief A single IP literal or hostname.
 */
struct SingleHostTarget {
    std::string host;

    bool operator==(const SingleHostTarget& other) const = default;
};

/**
 * @brief Builds a visitor from a set of lambdas for std::visit.
 */
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

using TargetSpec = std::variant<CidrTarget, RangeTarget, HostsFileTarget, SingleHostTarget>;

/**
 * @brief Describes a target specification for log and error messages.
 * @param spec The target specification.
 * @return Text such as "network 10.0.0.0/24".
 */
std::string describeTarget(const TargetSpec& spec);

} // namespace portsweep::core
