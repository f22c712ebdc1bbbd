#include "core/types/ProbeTask.hpp"

namespace portsweep::core {

std::string ProbeTask::toString() const {
    return host + ":" + std::to_string(port);
}

std::string ProbeResult::outcomeToString(ProbeOutcome outcome) {
    switch (outcome) {
    case ProbeOutcome::Open:
        return "Open";
    case ProbeOutcome::NotOpen:
        return "NotOpen";
    }
    return "NotOpen";
}

std::string ServiceDetector::detectService(uint16_t port) {
    switch (port) {
    case 21: return "ftp";
    case 22: return "ssh";
    case 23: return "telnet";
    case 25: return "smtp";
    case 53: return "dns";
    case 80: return "http";
    case 110: return "pop3";
    case 143: return "imap";
    case 443: return "https";
    case 445: return "smb";
    case 3306: return "mysql";
    case 3389: return "rdp";
    case 5432: return "postgres";
    case 5900: return "vnc";
    case 6379: return "redis";
    case 8080:
    case 8000:
    case 8888: return "http-alt";
    case 8443: return "https-alt";
    case 27017: return "mongodb";
    default: return {};
    }
}

} // namespace portsweep::core
