#include "NetworkGraph.hpp"
#include <stdexcept>

NetworkGraph::NetworkGraph(const std::string &host, int basePort, int portStep)
    : host(host), basePort(basePort), portStep(portStep) {}

RouterNode &NetworkGraph::addNode(const std::string &name)
{
    auto it = index.find(name);
    if (it != index.end())
    {
        return *ordered[it->second];
    }

    // Port 0 leaves the choice to the kernel when the listener binds.
    int port = basePort == 0 ? 0 : basePort + static_cast<int>(ordered.size()) * portStep;
    if (port > 65535)
    {
        throw std::runtime_error("No port left for node " + name);
    }

    index[name] = ordered.size();
    ordered.push_back(std::make_unique<RouterNode>(name, host, port));
    return *ordered.back();
}

void NetworkGraph::addLink(const std::string &a, const std::string &b, double weight)
{
    RouterNode &first = addNode(a);
    RouterNode &second = addNode(b);

    if (!first.setEdgeWeight(b, weight))
        first.addEdge(b, weight);
    if (!second.setEdgeWeight(a, weight))
        second.addEdge(a, weight);
}

bool NetworkGraph::hasNode(const std::string &name) const
{
    return index.count(name) > 0;
}

RouterNode *NetworkGraph::findNode(const std::string &name)
{
    auto it = index.find(name);
    return it == index.end() ? nullptr : ordered[it->second].get();
}

const RouterNode *NetworkGraph::findNode(const std::string &name) const
{
    auto it = index.find(name);
    return it == index.end() ? nullptr : ordered[it->second].get();
}

RouterNode &NetworkGraph::node(const std::string &name)
{
    RouterNode *found = findNode(name);
    if (!found)
    {
        throw std::out_of_range("Unknown node: " + name);
    }
    return *found;
}

std::vector<std::string> NetworkGraph::nodeNames() const
{
    std::vector<std::string> names;
    names.reserve(ordered.size());
    for (const auto &n : ordered)
    {
        names.push_back(n->getName());
    }
    return names;
}

std::vector<RouterNode *> NetworkGraph::nodes()
{
    std::vector<RouterNode *> result;
    for (auto &n : ordered)
    {
        result.push_back(n.get());
    }
    return result;
}

std::vector<const RouterNode *> NetworkGraph::nodes() const
{
    std::vector<const RouterNode *> result;
    for (const auto &n : ordered)
    {
        result.push_back(n.get());
    }
    return result;
}

size_t NetworkGraph::size() const
{
    return ordered.size();
}

bool NetworkGraph::empty() const
{
    return ordered.empty();
}
