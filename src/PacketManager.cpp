#include "PacketManager.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstring>
#include <cmath>
#include <stdexcept>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <zlib.h>

using json = nlohmann::json;

namespace
{
    bool resolve(const std::string &host, int port, sockaddr_in &addr)
    {
        addr = sockaddr_in{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        return inet_pton(AF_INET, host.c_str(), &addr.sin_addr) > 0;
    }

    bool sendAll(int fd, const std::string &data)
    {
        size_t offset = 0;
        while (offset < data.size())
        {
            ssize_t n = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            offset += static_cast<size_t>(n);
        }
        return true;
    }

    // Reads until the peer closes its side. False on error, timeout or oversize.
    bool readUntilClosed(int fd, std::string &out, size_t limit)
    {
        char buffer[4096];
        while (true)
        {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n == 0)
                return true;
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            out.append(buffer, static_cast<size_t>(n));
            if (out.size() > limit)
            {
                errno = EMSGSIZE;
                return false;
            }
        }
    }
}

PacketManager::PacketManager(const SimulatorConfig &config)
    : pollIntervalMs(config.pollIntervalMs),
      ioTimeoutMs(config.ioTimeoutMs),
      compressThreshold(config.compressThreshold)
{
}

void PacketManager::applyTimeouts(int fd) const
{
    timeval tv{};
    tv.tv_sec = ioTimeoutMs / 1000;
    tv.tv_usec = (ioTimeoutMs % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void PacketManager::receiveAdvertisements(RouterNode &node, std::promise<bool> &ready)
{
    const std::string &name = node.getName();

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0)
    {
        logErrno("Node " + name + " socket");
        ready.set_value(false);
        return;
    }

    int reuse = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    // Set socket as non-blocking
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    sockaddr_in addr{};
    if (!resolve(node.getHost(), node.getPort(), addr))
    {
        logError("Node " + name + " invalid address: " + node.getHost());
        close(sock);
        ready.set_value(false);
        return;
    }

    if (bind(sock, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
        logErrno("Node " + name + " bind port " + std::to_string(node.getPort()));
        close(sock);
        ready.set_value(false);
        return;
    }

    if (listen(sock, SOMAXCONN) < 0)
    {
        logErrno("Node " + name + " listen");
        close(sock);
        ready.set_value(false);
        return;
    }

    if (node.getPort() == 0)
    {
        sockaddr_in bound{};
        socklen_t boundLen = sizeof(bound);
        if (getsockname(sock, (sockaddr *)&bound, &boundLen) < 0)
        {
            logErrno("Node " + name + " getsockname");
            close(sock);
            ready.set_value(false);
            return;
        }
        node.setPort(ntohs(bound.sin_port));
    }

    logDebug("Node " + name + " listening on " + node.getHost() + ":" + std::to_string(node.getPort()));
    ready.set_value(true);

    while (!node.shutdownRequested())
    {
        pollfd pfd{};
        pfd.fd = sock;
        pfd.events = POLLIN;

        int rc = poll(&pfd, 1, pollIntervalMs);
        if (rc < 0)
        {
            if (errno != EINTR)
                logErrno("Node " + name + " poll");
            continue;
        }
        if (rc == 0)
            continue;

        int client = accept(sock, nullptr, nullptr);
        if (client < 0)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                logErrno("Node " + name + " accept");
            continue;
        }

        handleConnection(node, client);
        close(client);
    }

    close(sock);
    logDebug("Server " + name + " has shut down.");
}

void PacketManager::handleConnection(RouterNode &node, int clientFd)
{
    // The accepted socket must block, bounded by the I/O timeout.
    int flags = fcntl(clientFd, F_GETFL, 0);
    fcntl(clientFd, F_SETFL, flags & ~O_NONBLOCK);
    applyTimeouts(clientFd);

    std::string payload;
    if (!readUntilClosed(clientFd, payload, MAX_PAYLOAD_BYTES))
    {
        logErrno("Node " + node.getName() + " receive");
        malformedDropped++;
        return;
    }
    totalBytesReceived += payload.size();

    DistanceTable advertisement;
    try
    {
        advertisement = decodeAdvertisement(payload);
    }
    catch (const std::exception &e)
    {
        logWarn("Node " + node.getName() + " dropped malformed advertisement: " + e.what());
        malformedDropped++;
        return;
    }

    node.deliver(advertisement);
    messagesReceived++;

    if (!sendAll(clientFd, ACK))
    {
        logDebug("Node " + node.getName() + " could not acknowledge: " + std::strerror(errno));
    }
}

bool PacketManager::sendAdvertisement(const std::string &destHost, int port, const DistanceTable &table)
{
    sockaddr_in addr{};
    if (!resolve(destHost, port, addr))
    {
        logError("Invalid address: " + destHost);
        sendFailures++;
        return false;
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0)
    {
        logErrno("socket");
        sendFailures++;
        return false;
    }
    applyTimeouts(sock);

    if (connect(sock, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
        logErrno("connect " + destHost + ":" + std::to_string(port));
        close(sock);
        sendFailures++;
        return false;
    }

    std::string payload = encodeAdvertisement(table);
    if (!sendAll(sock, payload))
    {
        logErrno("send " + destHost + ":" + std::to_string(port));
        close(sock);
        sendFailures++;
        return false;
    }
    shutdown(sock, SHUT_WR);

    // Wait for the acknowledgement so the advertisement is in the peer's
    // mailbox before this call returns. Its content is not validated.
    std::string reply;
    if (!readUntilClosed(sock, reply, 1024))
    {
        logDebug("No acknowledgement from " + destHost + ":" + std::to_string(port));
    }
    close(sock);

    messagesSent++;
    totalBytesSent += payload.size();
    return true;
}

std::string PacketManager::encodeAdvertisement(const DistanceTable &table)
{
    json rows = json::array();
    for (const auto &entry : table)
    {
        // JSON has no infinity: unreachable is null on the wire.
        json cost = std::isinf(entry.cost) ? json(nullptr) : json(entry.cost);
        rows.push_back(json::array({entry.source, entry.destination, cost}));
    }
    std::string jsonStr = rows.dump();

    if (compressThreshold > 0 && jsonStr.size() > compressThreshold)
    {
        std::string compressed;
        try
        {
            compressed = compressData(jsonStr);
        }
        catch (const std::exception &e)
        {
            logWarn(std::string("Sending uncompressed advertisement: ") + e.what());
            return jsonStr;
        }
        json envelope = {
            {"type", "DV_COMPRESSED"},
            {"size", jsonStr.size()},
            {"data", compressed}};
        std::string envelopeStr = envelope.dump();
        if (envelopeStr.size() < jsonStr.size() * 0.8) // 20% saving minimum
        {
            compressedMessages++;
            return envelopeStr;
        }
    }

    return jsonStr;
}

DistanceTable PacketManager::decodeAdvertisement(const std::string &payload)
{
    json j = json::parse(payload);

    if (j.is_object())
    {
        if (j.value("type", std::string()) != "DV_COMPRESSED" || !j.contains("data") || !j.contains("size"))
        {
            throw std::runtime_error("unknown message object");
        }
        size_t size = j["size"].get<size_t>();
        if (size > MAX_PAYLOAD_BYTES)
        {
            throw std::runtime_error("compressed payload too large");
        }
        j = json::parse(decompressData(j["data"].get<std::string>(), size));
    }

    if (!j.is_array())
    {
        throw std::runtime_error("advertisement is not an array");
    }

    DistanceTable table;
    table.reserve(j.size());
    for (const auto &row : j)
    {
        if (!row.is_array() || row.size() != 3 || !row[0].is_string() || !row[1].is_string())
        {
            throw std::runtime_error("advertisement row is not [source, destination, cost]");
        }

        double cost;
        if (row[2].is_null())
        {
            cost = INFINITE_COST;
        }
        else if (row[2].is_number())
        {
            cost = row[2].get<double>();
            if (std::isnan(cost) || cost < 0)
                throw std::runtime_error("advertised cost is negative");
        }
        else
        {
            throw std::runtime_error("advertised cost is not a number");
        }

        table.push_back(RouteEntry{row[0].get<std::string>(), row[1].get<std::string>(), cost});
    }

    return table;
}

std::string PacketManager::compressData(const std::string &data)
{
    uLongf compressedSize = compressBound(data.size());
    std::vector<Bytef> compressed(compressedSize);

    int result = compress(compressed.data(), &compressedSize,
                          reinterpret_cast<const Bytef *>(data.c_str()), data.size());

    if (result != Z_OK)
    {
        throw std::runtime_error("zlib compress failed: " + std::to_string(result));
    }

    compressed.resize(compressedSize);
    return toHex(std::string(compressed.begin(), compressed.end()));
}

std::string PacketManager::decompressData(const std::string &compressedHex, size_t originalSize)
{
    std::string raw = fromHex(compressedHex);

    uLongf decompressedSize = originalSize;
    std::vector<Bytef> decompressed(originalSize > 0 ? originalSize : 1);

    int result = uncompress(decompressed.data(), &decompressedSize,
                            reinterpret_cast<const Bytef *>(raw.data()), raw.size());

    if (result != Z_OK || decompressedSize != originalSize)
    {
        throw std::runtime_error("zlib uncompress failed: " + std::to_string(result));
    }

    return std::string(decompressed.begin(), decompressed.begin() + decompressedSize);
}

PacketManager::TrafficStats PacketManager::getTrafficStats() const
{
    TrafficStats stats;
    stats.messagesSent = messagesSent.load();
    stats.totalBytesSent = totalBytesSent.load();
    stats.sendFailures = sendFailures.load();
    stats.compressedMessages = compressedMessages.load();
    stats.messagesReceived = messagesReceived.load();
    stats.totalBytesReceived = totalBytesReceived.load();
    stats.malformedDropped = malformedDropped.load();
    return stats;
}

void PacketManager::resetTrafficStats()
{
    messagesSent = 0;
    totalBytesSent = 0;
    sendFailures = 0;
    compressedMessages = 0;
    messagesReceived = 0;
    totalBytesReceived = 0;
    malformedDropped = 0;
}
