#include "infrastructure/network/PingService.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <random>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace portsweep::infra {

namespace {

constexpr std::size_t kIpv4MinHeaderSize = 20;
constexpr std::size_t kIcmpHeaderSize = 8;

class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

std::optional<sockaddr_in> resolveIpv4(const std::string& hostname) {
    addrinfo hints{};
    hints.ai_family = AF_INET;

    addrinfo* result = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return std::nullopt;
    }

    sockaddr_in address{};
    std::memcpy(&address, result->ai_addr, sizeof(address));
    freeaddrinfo(result);
    return address;
}

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

std::string pingMethodToString(PingMethod method) {
    switch (method) {
    case PingMethod::RawSocket:
        return "raw socket";
    case PingMethod::DatagramSocket:
        return "datagram socket";
    case PingMethod::SystemCommand:
        return "system ping command";
    }
    return "unknown";
}

namespace icmp {

uint16_t calculateChecksum(const uint8_t* data, std::size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(kPacketSize, 0);

    // ICMP header
    packet[0] = kEchoRequest; // Type
    packet[1] = 0;            // Code
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    // Timestamp as payload
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[kIcmpHeaderSize], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

std::optional<EchoReply> parseEchoReply(const uint8_t* data, std::size_t length,
                                        bool hasIpHeader) {
    std::size_t offset = 0;
    std::optional<int> ttl;

    if (hasIpHeader) {
        if (length < kIpv4MinHeaderSize) {
            return std::nullopt;
        }
        offset = static_cast<std::size_t>((data[0] & 0x0F) * 4);
        ttl = data[8]; // TTL field in IP header
    }

    if (length < offset + kIcmpHeaderSize) {
        return std::nullopt;
    }

    const uint8_t* header = data + offset;
    EchoReply reply;
    reply.type = header[0];
    reply.identifier = static_cast<uint16_t>((header[4] << 8) | header[5]);
    reply.sequence = static_cast<uint16_t>((header[6] << 8) | header[7]);
    reply.ttl = ttl;
    return reply;
}

} // namespace icmp

PingService::PingService() : PingService(detectMethod()) {}

PingService::PingService(PingMethod method) : method_(method) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("PingService using {} with identifier: {}", pingMethodToString(method_),
                  identifier_);
}

PingMethod PingService::detectMethod() {
    int fd = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (fd >= 0) {
        ::close(fd);
        return PingMethod::RawSocket;
    }

    fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd >= 0) {
        ::close(fd);
        return PingMethod::DatagramSocket;
    }

    spdlog::info("No ICMP socket available (need CAP_NET_RAW), falling back to system ping");
    return PingMethod::SystemCommand;
}

core::PingResult PingService::ping(const std::string& address,
                                   std::chrono::milliseconds timeout) {
    if (address.empty()) {
        core::PingResult result;
        result.errorMessage = "Empty host";
        return result;
    }

    switch (method_) {
    case PingMethod::RawSocket:
        return pingWithSocket(address, timeout, true);
    case PingMethod::DatagramSocket:
        return pingWithSocket(address, timeout, false);
    case PingMethod::SystemCommand:
        return pingWithCommand(address, timeout);
    }

    core::PingResult result;
    result.address = address;
    result.errorMessage = "Unknown ping method";
    return result;
}

core::PingResult PingService::pingWithSocket(const std::string& address,
                                             std::chrono::milliseconds timeout, bool raw) {
    core::PingResult result;
    result.address = address;

    auto destination = resolveIpv4(address);
    if (!destination) {
        result.errorMessage = "Failed to resolve " + address;
        return result;
    }

    SocketHandle sock(::socket(AF_INET, raw ? SOCK_RAW : SOCK_DGRAM, IPPROTO_ICMP));
    if (!sock.valid()) {
        result.errorMessage = errnoMessage("Failed to create ICMP socket");
        return result;
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = icmp::buildEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = ::sendto(sock.get(), packet.data(), packet.size(), 0,
                            reinterpret_cast<const sockaddr*>(&*destination),
                            sizeof(*destination));
    if (sent < 0) {
        result.errorMessage = errnoMessage("Failed to send ICMP packet");
        return result;
    }

    // A raw socket sees every ICMP message the host receives, so read until
    // our own reply arrives or the deadline passes.
    std::array<uint8_t, 1024> recvBuffer{};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.errorMessage = "Timeout";
            return result;
        }

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.errorMessage = errnoMessage("poll failed");
            return result;
        }
        if (ready == 0) {
            result.errorMessage = "Timeout";
            return result;
        }

        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        ssize_t received = ::recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                      reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            result.errorMessage = errnoMessage("Receive error");
            return result;
        }

        if (from.sin_addr.s_addr != destination->sin_addr.s_addr) {
            continue;
        }

        auto reply =
            icmp::parseEchoReply(recvBuffer.data(), static_cast<std::size_t>(received), raw);
        if (!reply || reply->type != icmp::kEchoReply || reply->sequence != seq) {
            continue;
        }
        // The kernel rewrites the identifier of datagram ICMP sockets.
        if (raw && reply->identifier != identifier_) {
            continue;
        }

        result.success = true;
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - sendTime);
        result.ttl = reply->ttl;

        spdlog::trace("Ping to {} successful: {:.2f}ms", address, result.latencyMs());
        return result;
    }
}

core::PingResult PingService::pingWithCommand(const std::string& address,
                                              std::chrono::milliseconds timeout) {
    core::PingResult result;
    result.address = address;

    if (address.empty() || address.front() == '-') {
        result.errorMessage = "Invalid host for ping: '" + address + "'";
        return result;
    }

    auto waitSeconds = std::max<long long>(1, (timeout.count() + 999) / 1000);
    std::vector<std::string> args{"ping", "-c", "1", "-W", std::to_string(waitSeconds), address};
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    auto startTime = std::chrono::steady_clock::now();
    pid_t pid = 0;
    int rc = posix_spawnp(&pid, "ping", &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        result.errorMessage = std::string("Failed to run ping: ") + std::strerror(rc);
        return result;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.errorMessage = errnoMessage("waitpid failed");
            return result;
        }
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        result.success = true;
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime);
    } else {
        result.errorMessage = "ping exited with status " +
                              std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
    }
    return result;
}

} // namespace portsweep::infra
