#include "core/types/TargetSpec.hpp"

namespace portsweep::core {

std::string describeTarget(const TargetSpec& spec) {
    return std::visit(
        Overloaded{
            [](const CidrTarget& t) { return "network " + t.cidr; },
            [](const RangeTarget& t) { return "range " + t.start + " - " + t.end; },
            [](const HostsFileTarget& t) { return "hosts file " + t.path.string(); },
            [](const SingleHostTarget& t) { return "host " + t.host; },
        },
        spec);
}

} // namespace portsweep::core
