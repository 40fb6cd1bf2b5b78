#include "DistanceVectorEngine.hpp"
#include <cmath>
#include <unordered_map>

DistanceVectorEngine::DistanceVectorEngine(PacketManager &pm, MailboxPolicy policy)
    : pm(pm), policy(policy) {}

DistanceTable DistanceVectorEngine::initialTable(const NetworkGraph &graph, const RouterNode &node)
{
    DistanceTable table;
    const std::string &self = node.getName();

    for (const auto &dest : graph.nodeNames())
    {
        double cost = (dest == self) ? 0.0 : node.edgeWeight(dest);
        table.push_back(RouteEntry{self, dest, cost});
    }
    return table;
}

void DistanceVectorEngine::initTables(NetworkGraph &graph) const
{
    for (auto *node : graph.nodes())
    {
        node->setTable(initialTable(graph, *node));
        // Advertisements from an earlier run are stale once tables restart.
        node->takeMailbox(true);
    }
}

std::vector<const RouterNode *> DistanceVectorEngine::advertisementTargets(const NetworkGraph &graph,
                                                                           const RouterNode &node)
{
    std::vector<const RouterNode *> targets;
    for (const auto *peer : graph.nodes())
    {
        if (peer == &node)
            continue;
        double weight = node.edgeWeight(peer->getName());
        if (!std::isinf(weight) && weight != 0)
        {
            targets.push_back(peer);
        }
    }
    return targets;
}

size_t DistanceVectorEngine::broadcast(NetworkGraph &graph)
{
    size_t delivered = 0;
    for (auto *node : graph.nodes())
    {
        DistanceTable table = node->getTable();
        for (const auto *peer : advertisementTargets(graph, *node))
        {
            if (pm.sendAdvertisement(peer->getHost(), peer->getPort(), table))
            {
                ++delivered;
            }
            else
            {
                logWarn("Advertisement " + node->getName() + " -> " + peer->getName() + " lost");
            }
        }
    }
    return delivered;
}

UpdateResult DistanceVectorEngine::updateNode(RouterNode &node) const
{
    std::vector<DistanceTable> received = node.takeMailbox(policy == MailboxPolicy::Drain);
    UpdateResult result = relax(node.getName(), node.getTable(), received);
    node.setTable(result.table);
    return result;
}

UpdateResult DistanceVectorEngine::relax(const std::string &self, const DistanceTable &own,
                                         const std::vector<DistanceTable> &received)
{
    UpdateResult result;
    result.table = own;

    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < result.table.size(); ++i)
    {
        position[result.table[i].destination] = i;
    }

    for (const auto &advertisement : received)
    {
        for (const auto &row : advertisement)
        {
            if (row.source == self || row.destination == self)
                continue;

            // Only a neighbor we can already reach may teach us anything.
            auto via = position.find(row.source);
            if (via == position.end())
                continue;
            double toAdvertiser = result.table[via->second].cost;
            if (std::isinf(toAdvertiser))
                continue;

            double candidate = toAdvertiser + row.cost;
            auto known = position.find(row.destination);
            if (known == position.end())
            {
                position[row.destination] = result.table.size();
                result.table.push_back(RouteEntry{self, row.destination, candidate});
                result.changed = true;
            }
            else if (candidate < result.table[known->second].cost)
            {
                logDebug("Node " + self + " route to " + row.destination + " changed from " +
                         formatCost(result.table[known->second].cost) + " to " + formatCost(candidate));
                result.table[known->second].cost = candidate;
                result.changed = true;
            }
        }
    }

    return result;
}
