#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <future>
#include <nlohmann/json.hpp>
#include "RouterNode.hpp"
#include "RoutingTable.hpp"
#include "utils.hpp"

// Point-to-point transport between simulated routers. One TCP connection per
// advertisement: connect, write the JSON payload, half-close, wait for the
// acknowledgement (content is not checked), close. No retries.
class PacketManager
{
public:
    static constexpr const char *ACK = "Data received";
    static constexpr size_t MAX_PAYLOAD_BYTES = 16 * 1024 * 1024;

    explicit PacketManager(const SimulatorConfig &config);

    // Listener body for one node: binds, fulfils ready (false on failure),
    // then accepts until the node's cancellation flag is set.
    void receiveAdvertisements(RouterNode &node, std::promise<bool> &ready);

    // False when the peer could not be reached; the failure is logged.
    bool sendAdvertisement(const std::string &host, int port, const DistanceTable &table);

    std::string encodeAdvertisement(const DistanceTable &table);
    // Throws std::runtime_error (or nlohmann::json::exception) on a malformed payload.
    static DistanceTable decodeAdvertisement(const std::string &payload);

    static std::string compressData(const std::string &data);
    static std::string decompressData(const std::string &compressedHex, size_t originalSize);

    struct TrafficStats
    {
        size_t messagesSent = 0;
        size_t totalBytesSent = 0;
        size_t sendFailures = 0;
        size_t compressedMessages = 0;
        size_t messagesReceived = 0;
        size_t totalBytesReceived = 0;
        size_t malformedDropped = 0;
    };

    TrafficStats getTrafficStats() const;
    void resetTrafficStats();

private:
    void handleConnection(RouterNode &node, int clientFd);
    void applyTimeouts(int fd) const;

    int pollIntervalMs;
    int ioTimeoutMs;
    size_t compressThreshold;

    std::atomic<size_t> messagesSent{0};
    std::atomic<size_t> totalBytesSent{0};
    std::atomic<size_t> sendFailures{0};
    std::atomic<size_t> compressedMessages{0};
    std::atomic<size_t> messagesReceived{0};
    std::atomic<size_t> totalBytesReceived{0};
    std::atomic<size_t> malformedDropped{0};
};
