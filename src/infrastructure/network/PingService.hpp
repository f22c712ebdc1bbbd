#pragma once

#include "core/services/ILivenessProbe.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace portsweep::infra {

/**
 * @brief Mechanism used to send ICMP echo requests.
 */
enum class PingMethod : int {
    RawSocket = 0,      ///< SOCK_RAW ICMP socket (needs CAP_NET_RAW or root)
    DatagramSocket = 1, ///< Unprivileged SOCK_DGRAM ICMP socket (Linux ping_group_range)
    SystemCommand = 2   ///< The platform's ping executable, one packet
};

/**
 * @brief Converts a PingMethod to a string.
 */
std::string pingMethodToString(PingMethod method);

namespace icmp {

constexpr uint8_t kEchoRequest = 8;
constexpr uint8_t kEchoReply = 0;
constexpr std::size_t kPacketSize = 64;

/**
 * @brief Fields of an ICMP echo reply relevant to matching it to a request.
 */
struct EchoReply {
    uint8_t type{0};
    uint16_t identifier{0};
    uint16_t sequence{0};
    std::optional<int> ttl; ///< From the IP header, when one is present
};

/**
 * @brief Computes the Internet checksum (RFC 1071) of a buffer.
 */
uint16_t calculateChecksum(const uint8_t* data, std::size_t length);

/**
 * @brief Builds a 64-byte echo request with a timestamp payload and checksum.
 */
std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence);

/**
 * @brief Parses a received ICMP message.
 * @param data Received bytes.
 * @param length Number of received bytes.
 * @param hasIpHeader True for raw sockets, which deliver the IPv4 header too.
 * @return The parsed header, or nullopt if the buffer is too short.
 */
std::optional<EchoReply> parseEchoReply(const uint8_t* data, std::size_t length,
                                        bool hasIpHeader);

} // namespace icmp

/**
 * @brief ICMP ping service used by the liveness prefilter.
 *
 * Sends one echo request per call and waits for the matching reply until a
 * deadline. Prefers a raw socket, falls back to an unprivileged datagram
 * socket, and finally to the system ping command. Every failure is reported
 * as an unsuccessful PingResult. Implements the core::ILivenessProbe interface.
 *
 * @note On Linux, raw sockets require CAP_NET_RAW capability or root privileges.
 */
class PingService : public core::ILivenessProbe {
public:
    /**
     * @brief Constructs a PingService using the best available mechanism.
     */
    PingService();

    /**
     * @brief Constructs a PingService with a fixed mechanism.
     * @param method Mechanism to use for every ping.
     */
    explicit PingService(PingMethod method);

    ~PingService() override = default;

    /**
     * @brief Sends one echo request to the address and waits for the reply.
     * @param address Target hostname or IP address to ping.
     * @param timeout Maximum time to wait for a response.
     * @return PingResult with latency on success or error info on failure.
     */
    core::PingResult ping(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief Returns the mechanism this service uses.
     */
    PingMethod method() const { return method_; }

    /**
     * @brief Probes which ICMP mechanism the current process may use.
     * @return RawSocket, DatagramSocket or SystemCommand, in order of preference.
     */
    static PingMethod detectMethod();

private:
    core::PingResult pingWithSocket(const std::string& address, std::chrono::milliseconds timeout,
                                    bool raw);
    core::PingResult pingWithCommand(const std::string& address, std::chrono::milliseconds timeout);

    PingMethod method_;
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace portsweep::infra
