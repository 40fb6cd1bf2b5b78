#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <thread>
#include <functional>
#include "RoutingTable.hpp"

struct Edge
{
    std::string source;
    std::string destination;
    double weight;
};

// A simulated router: its links, its distance vector and the mailbox its
// listener fills. The table and the mailbox are shared between the listener
// thread and the controller, so every access goes through the accessors.
class RouterNode
{
public:
    RouterNode(const std::string &name, const std::string &host, int port);
    ~RouterNode();

    RouterNode(const RouterNode &) = delete;
    RouterNode &operator=(const RouterNode &) = delete;

    const std::string &getName() const;
    const std::string &getHost() const;
    int getPort() const;
    void setPort(int port);

    void addEdge(const std::string &destination, double weight);
    // Returns false if there is no edge towards destination.
    bool setEdgeWeight(const std::string &destination, double weight);
    std::vector<Edge> getEdges() const;
    // Weight of the direct edge, infinity if none.
    double edgeWeight(const std::string &destination) const;

    DistanceTable getTable() const;
    void setTable(const DistanceTable &table);
    // Overwrites the cost of an existing entry; false if the entry is absent.
    bool setTableCost(const std::string &destination, double cost);

    void deliver(const DistanceTable &advertisement);
    // Drain: hand over and clear. Otherwise: copy, keep everything.
    std::vector<DistanceTable> takeMailbox(bool drain);
    size_t mailboxSize() const;

    // Clears the cancellation flag, then runs body on the listener thread.
    void startListener(std::function<void()> body);
    void signalShutdown();
    bool shutdownRequested() const;
    void joinListener();
    bool listenerRunning() const;

private:
    std::string name;
    std::string host;
    std::atomic<int> port;

    mutable std::mutex edgeMutex;
    std::vector<Edge> edges;

    mutable std::mutex tableMutex;
    DistanceTable table;

    mutable std::mutex mailboxMutex;
    std::vector<DistanceTable> mailbox;

    std::atomic<bool> shutdown{false};
    std::thread listenerThread;
};
