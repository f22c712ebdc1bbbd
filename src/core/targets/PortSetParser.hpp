/**
 * @file PortSetParser.hpp
 * @brief Parsing of textual port specifications such as "22,80,8000-8010".
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace portsweep::core {

/**
 * @brief Converts port specification strings to sorted port sets.
 */
class PortSetParser {
public:
    static constexpr long long kMinPort = 1;
    static constexpr long long kMaxPort = 65535;

    /**
     * @brief Parses a port specification.
     *
     * Tokens are comma separated: a single integer, or two integers joined
     * by '-' (reversed bounds are swapped). Values outside [1, 65535] are
     * dropped without error.
     *
     * @param spec Specification such as "22,80,8000-8010".
     * @return Ascending, duplicate-free ports; may be empty.
     * @throws ScanError InvalidPortSpec if a token is not an integer or range.
     */
    static std::vector<uint16_t> parse(const std::string& spec);

    /**
     * @brief Parses a port specification that must yield at least one port.
     * @param spec Specification string.
     * @return Non-empty ascending port list.
     * @throws ScanError InvalidPortSpec or EmptyPortSpec.
     */
    static std::vector<uint16_t> parseNonEmpty(const std::string& spec);

    /**
     * @brief Renders ports as a comma-joined list, e.g. "22,80,443".
     * @param ports Ports to render.
     * @return Specification string that parses back to the same set.
     */
    static std::string toString(const std::vector<uint16_t>& ports);
};

} // namespace portsweep::core
