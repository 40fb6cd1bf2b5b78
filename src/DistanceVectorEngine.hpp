#pragma once
#include <string>
#include <vector>
#include "NetworkGraph.hpp"
#include "PacketManager.hpp"
#include "RoutingTable.hpp"
#include "utils.hpp"

struct UpdateResult
{
    DistanceTable table;
    bool changed = false;
};

class DistanceVectorEngine
{
public:
    DistanceVectorEngine(PacketManager &pm, MailboxPolicy policy);

    // 0 to itself, the direct edge weight to a neighbor, infinity otherwise.
    static DistanceTable initialTable(const NetworkGraph &graph, const RouterNode &node);
    void initTables(NetworkGraph &graph) const;

    // Neighbors reached by a finite, non-zero direct edge, in graph order.
    static std::vector<const RouterNode *> advertisementTargets(const NetworkGraph &graph, const RouterNode &node);

    // Sends every node's current table to its targets. Returns the number of
    // advertisements delivered; failures are logged by the fabric and dropped.
    size_t broadcast(NetworkGraph &graph);

    // Relaxes node's table against the advertisements in its mailbox.
    UpdateResult updateNode(RouterNode &node) const;

    // Bellman-Ford relaxation of one table against a batch of advertisements.
    static UpdateResult relax(const std::string &self, const DistanceTable &own,
                              const std::vector<DistanceTable> &received);

private:
    PacketManager &pm;
    MailboxPolicy policy;
};
