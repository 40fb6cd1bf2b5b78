// LinkStateManager.cpp
#include "LinkStateManager.hpp"
#include "utils.hpp"
#include <cmath>

namespace
{
    bool hasTableEntry(const RouterNode &node, const std::string &destination)
    {
        for (const auto &entry : node.getTable())
        {
            if (entry.source == node.getName() && entry.destination == destination)
                return true;
        }
        return false;
    }
}

const char *toString(LinkEditResult result)
{
    switch (result)
    {
    case LinkEditResult::Success:
        return "success";
    case LinkEditResult::LinkNotFound:
        return "link not found";
    case LinkEditResult::InvalidCost:
        return "invalid cost";
    }
    return "unknown";
}

LinkStateManager::LinkStateManager(NetworkGraph &graph) : graph(graph) {}

bool LinkStateManager::hasLink(const std::string &a, const std::string &b) const
{
    const RouterNode *first = graph.findNode(a);
    const RouterNode *second = graph.findNode(b);
    if (!first || !second || first == second)
        return false;

    bool edges = !std::isinf(first->edgeWeight(b)) && !std::isinf(second->edgeWeight(a));
    return edges && hasTableEntry(*first, b) && hasTableEntry(*second, a);
}

LinkEditResult LinkStateManager::changeLinkCost(const std::string &a, const std::string &b, double cost)
{
    // Infinity is reserved for "no edge".
    if (!std::isfinite(cost) || cost < 0)
    {
        logWarn("Refusing link cost " + formatCost(cost) + " for " + a + " <-> " + b);
        return LinkEditResult::InvalidCost;
    }

    if (!hasLink(a, b))
    {
        logWarn("Link not found: " + a + " <-> " + b);
        return LinkEditResult::LinkNotFound;
    }

    RouterNode &first = graph.node(a);
    RouterNode &second = graph.node(b);

    logDebug("Before adjustment " + a + " -> " + b + " = " + formatCost(first.edgeWeight(b)));

    first.setEdgeWeight(b, cost);
    second.setEdgeWeight(a, cost);
    first.setTableCost(b, cost);
    second.setTableCost(a, cost);

    logInfo("Link cost between " + a + " and " + b + " adjusted to " + formatCost(cost));
    return LinkEditResult::Success;
}
