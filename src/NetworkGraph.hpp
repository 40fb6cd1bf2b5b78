#pragma once
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include "RouterNode.hpp"

// Fixed set of routers, iterated in insertion order. Links are added in
// mirrored pairs with equal weight.
class NetworkGraph
{
public:
    NetworkGraph(const std::string &host = "127.0.0.1", int basePort = 5000, int portStep = 1);

    // Creates the node with the next endpoint if it does not exist yet.
    RouterNode &addNode(const std::string &name);
    // Adds (a,b) and (b,a); an existing pair gets the new weight.
    void addLink(const std::string &a, const std::string &b, double weight);

    bool hasNode(const std::string &name) const;
    RouterNode *findNode(const std::string &name);
    const RouterNode *findNode(const std::string &name) const;
    RouterNode &node(const std::string &name);

    std::vector<std::string> nodeNames() const;
    std::vector<RouterNode *> nodes();
    std::vector<const RouterNode *> nodes() const;
    size_t size() const;
    bool empty() const;

private:
    std::string host;
    int basePort;
    int portStep;

    std::vector<std::unique_ptr<RouterNode>> ordered;
    std::unordered_map<std::string, size_t> index;
};
