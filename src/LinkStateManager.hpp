#pragma once
#include <string>
#include "NetworkGraph.hpp"

enum class LinkEditResult
{
    Success,
    LinkNotFound,
    InvalidCost
};

const char *toString(LinkEditResult result);

// Runtime edits of link costs. Both directions change together or not at all.
// Nothing is propagated: the caller re-runs the controller afterwards.
class LinkStateManager
{
public:
    explicit LinkStateManager(NetworkGraph &graph);

    // Requires both nodes, the mirrored edges and the two table entries.
    LinkEditResult changeLinkCost(const std::string &a, const std::string &b, double cost);

    bool hasLink(const std::string &a, const std::string &b) const;

private:
    NetworkGraph &graph;
};
