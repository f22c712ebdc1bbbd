#include "core/targets/TargetExpander.hpp"

#include "core/targets/TextUtils.hpp"
#include "core/types/ScanError.hpp"

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <unordered_set>
#include <utility>

namespace portsweep::core {

namespace {

uint32_t parseIpv4(std::string_view text, const std::string& context) {
    asio::error_code ec;
    auto address = asio::ip::make_address_v4(std::string(trim(text)), ec);
    if (ec) {
        throw ScanError(ErrorCode::InvalidTargetSpec,
                        "Invalid IPv4 address '" + std::string(text) + "' in " + context);
    }
    return address.to_uint();
}

int parsePrefixLength(std::string_view text, const std::string& cidr, int maxPrefix) {
    text = trim(text);
    int prefix = -1;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), prefix);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || prefix < 0 ||
        prefix > maxPrefix) {
        throw ScanError(ErrorCode::InvalidTargetSpec,
                        "Invalid prefix length '" + std::string(text) + "' in network " + cidr);
    }
    return prefix;
}

std::vector<std::string> enumerate(uint32_t first, uint32_t last, std::size_t maxHosts,
                                   const std::string& context) {
    uint64_t count = static_cast<uint64_t>(last) - first + 1;
    if (count > maxHosts) {
        throw ScanError(ErrorCode::InvalidTargetSpec,
                        context + " expands to " + std::to_string(count) +
                            " hosts, more than the limit of " + std::to_string(maxHosts));
    }

    std::vector<std::string> hosts;
    hosts.reserve(static_cast<std::size_t>(count));
    for (uint64_t value = first; value <= last; ++value) {
        hosts.push_back(asio::ip::address_v4(static_cast<uint32_t>(value)).to_string());
    }
    return hosts;
}

// Every address but the subnet-router anycast (network) address; /127 and
// /128 are kept whole.
std::vector<std::string> expandNetworkV6(const asio::ip::address_v6& address, int prefix,
                                         std::size_t maxHosts, const std::string& context) {
    int hostBits = 128 - prefix;
    bool skipNetwork = prefix < 127;

    uint64_t count = hostBits >= 64 ? 0 : (uint64_t{1} << hostBits) - (skipNetwork ? 1 : 0);
    if (hostBits >= 64 || count > maxHosts) {
        throw ScanError(ErrorCode::InvalidTargetSpec,
                        context + " has 2^" + std::to_string(hostBits) +
                            " addresses, more than the limit of " + std::to_string(maxHosts) +
                            " hosts");
    }

    auto bytes = address.to_bytes();
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        int bitsInByte = std::clamp(prefix - static_cast<int>(i) * 8, 0, 8);
        bytes[i] &= static_cast<unsigned char>(0xFF00 >> bitsInByte);
    }

    auto increment = [&bytes]() {
        for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            if (++*it != 0) {
                break;
            }
        }
    };

    if (skipNetwork) {
        increment();
    }

    std::vector<std::string> hosts;
    hosts.reserve(static_cast<std::size_t>(count));
    for (uint64_t n = 0; n < count; ++n) {
        hosts.push_back(asio::ip::address_v6(bytes).to_string());
        increment();
    }
    return hosts;
}

} // namespace

std::vector<std::string> TargetExpander::expandNetwork(const std::string& cidr,
                                                       std::size_t maxHosts) {
    std::string_view text = trim(cidr);
    auto slash = text.find('/');
    auto addressText = trim(text.substr(0, slash));

    asio::error_code ec;
    auto address = asio::ip::make_address(std::string(addressText), ec);
    if (ec) {
        throw ScanError(ErrorCode::InvalidTargetSpec,
                        "Invalid address '" + std::string(addressText) + "' in network " + cidr);
    }

    int maxPrefix = address.is_v6() ? 128 : 32;
    int prefix = slash == std::string_view::npos
                     ? maxPrefix
                     : parsePrefixLength(text.substr(slash + 1), cidr, maxPrefix);

    if (address.is_v6()) {
        return expandNetworkV6(address.to_v6(), prefix, maxHosts, "network " + cidr);
    }

    uint32_t mask = prefix == 0 ? 0U : ~uint32_t{0} << (32 - prefix);
    uint32_t network = address.to_v4().to_uint() & mask;
    uint32_t broadcast = network | ~mask;

    if (prefix >= 31) {
        return enumerate(network, broadcast, maxHosts, "network " + cidr);
    }
    return enumerate(network + 1, broadcast - 1, maxHosts, "network " + cidr);
}

std::vector<std::string> TargetExpander::expandRange(const std::string& start,
                                                     const std::string& end,
                                                     std::size_t maxHosts) {
    std::string context = "range " + start + " - " + end;
    uint32_t first = parseIpv4(start, context);
    uint32_t last = parseIpv4(end, context);
    if (first > last) {
        std::swap(first, last);
    }
    return enumerate(first, last, maxHosts, context);
}

std::vector<std::string> TargetExpander::loadHostsFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ScanError(ErrorCode::InvalidTargetSpec,
                        "Failed to open hosts file: " + path.string());
    }

    std::vector<std::string> hosts;
    std::unordered_set<std::string> seen;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        auto entry = trim(line);
        if (entry.empty() || entry.front() == '#') {
            continue;
        }
        if (!seen.emplace(entry).second) {
            spdlog::debug("Skipping duplicate host '{}' at {}:{}", entry, path.string(), lineNumber);
            continue;
        }
        hosts.emplace_back(entry);
    }

    if (file.bad()) {
        throw ScanError(ErrorCode::InvalidTargetSpec,
                        "Failed to read hosts file: " + path.string());
    }

    spdlog::debug("Loaded {} hosts from {}", hosts.size(), path.string());
    return hosts;
}

std::vector<std::string> TargetExpander::expand(const TargetSpec& spec, std::size_t maxHosts) {
    auto hosts = std::visit(
        Overloaded{
            [maxHosts](const CidrTarget& t) { return expandNetwork(t.cidr, maxHosts); },
            [maxHosts](const RangeTarget& t) { return expandRange(t.start, t.end, maxHosts); },
            [maxHosts](const HostsFileTarget& t) {
                auto loaded = loadHostsFile(t.path);
                if (loaded.size() > maxHosts) {
                    throw ScanError(ErrorCode::InvalidTargetSpec,
                                    "hosts file " + t.path.string() + " lists " +
                                        std::to_string(loaded.size()) +
                                        " hosts, more than the limit of " +
                                        std::to_string(maxHosts));
                }
                return loaded;
            },
            [](const SingleHostTarget& t) {
                auto host = trim(t.host);
                return host.empty() ? std::vector<std::string>{}
                                    : std::vector<std::string>{std::string(host)};
            },
        },
        spec);

    if (hosts.empty()) {
        throw ScanError(ErrorCode::EmptyTargetSpec,
                        "No target hosts resolved from " + describeTarget(spec));
    }

    spdlog::info("Resolved {} target hosts from {}", hosts.size(), describeTarget(spec));
    return hosts;
}

} // namespace portsweep::core
