#include "core/targets/PortSetParser.hpp"

#include "core/targets/TextUtils.hpp"
#include "core/types/ScanError.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <limits>
#include <set>
#include <string_view>
#include <utility>

namespace portsweep::core {

namespace {

[[noreturn]] void throwInvalid(std::string_view token, const std::string& spec) {
    throw ScanError(ErrorCode::InvalidPortSpec,
                    "Invalid port token '" + std::string(token) + "' in '" + spec + "'");
}

// Integers too large for long long saturate, so they fall outside the port
// range and get discarded like any other out-of-range value.
long long parseInteger(std::string_view text, const std::string& spec) {
    text = trim(text);
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }

    long long value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ptr != digits.data() + digits.size()) {
        throwInvalid(text, spec);
    }
    if (ec == std::errc::result_out_of_range) {
        return digits.front() == '-' ? std::numeric_limits<long long>::min()
                                     : std::numeric_limits<long long>::max();
    }
    if (ec != std::errc{}) {
        throwInvalid(text, spec);
    }
    return value;
}

void addRange(std::set<uint16_t>& ports, long long low, long long high) {
    low = std::max(low, PortSetParser::kMinPort);
    high = std::min(high, PortSetParser::kMaxPort);
    for (long long port = low; port <= high; ++port) {
        ports.insert(static_cast<uint16_t>(port));
    }
}

} // namespace

std::vector<uint16_t> PortSetParser::parse(const std::string& spec) {
    std::set<uint16_t> ports;

    std::string_view rest = spec;
    while (true) {
        auto comma = rest.find(',');
        auto token = trim(rest.substr(0, comma));

        if (!token.empty()) {
            auto dash = token.find('-');
            if (dash == std::string_view::npos) {
                long long port = parseInteger(token, spec);
                addRange(ports, port, port);
            } else {
                long long low = parseInteger(token.substr(0, dash), spec);
                long long high = parseInteger(token.substr(dash + 1), spec);
                if (low > high) {
                    std::swap(low, high);
                }
                addRange(ports, low, high);
            }
        }

        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }

    return {ports.begin(), ports.end()};
}

std::vector<uint16_t> PortSetParser::parseNonEmpty(const std::string& spec) {
    auto ports = parse(spec);
    if (ports.empty()) {
        throw ScanError(ErrorCode::EmptyPortSpec, "No valid ports in '" + spec + "'");
    }
    spdlog::debug("Parsed {} ports from '{}'", ports.size(), spec);
    return ports;
}

std::string PortSetParser::toString(const std::vector<uint16_t>& ports) {
    std::string result;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) {
            result += ',';
        }
        result += std::to_string(ports[i]);
    }
    return result;
}

} // namespace portsweep::core
