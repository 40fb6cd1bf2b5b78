#pragma once
#include "DistanceVectorEngine.hpp"
#include "NetworkGraph.hpp"
#include "PacketManager.hpp"
#include "RoutingTable.hpp"
#include "utils.hpp"
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace testing_helpers
{
    // Ephemeral ports and a short poll so tests never fight over endpoints.
    inline SimulatorConfig testConfig()
    {
        SimulatorConfig config;
        config.basePort = 0;
        config.pollIntervalMs = 20;
        config.ioTimeoutMs = 2000;
        config.logLevel = LogLevel::Error;
        setLogLevel(config.logLevel);
        return config;
    }

    using Link = std::tuple<std::string, std::string, double>;

    inline std::unique_ptr<NetworkGraph> buildGraph(const std::vector<Link> &links, const SimulatorConfig &config)
    {
        auto graph = std::make_unique<NetworkGraph>(config.host, config.basePort, config.portStep);
        for (const auto &[a, b, w] : links)
        {
            graph->addLink(a, b, w);
        }
        return graph;
    }

    inline std::vector<Link> triangle()
    {
        return {Link{"1", "2", 3}, Link{"2", "3", 1}, Link{"1", "3", 10}};
    }

    inline std::map<std::string, double> costs(const DistanceTable &table)
    {
        std::map<std::string, double> result;
        for (const auto &entry : table)
        {
            result[entry.destination] = entry.cost;
        }
        return result;
    }

    inline std::map<std::string, double> costs(const RouterNode &node)
    {
        return costs(node.getTable());
    }

    // Floyd-Warshall over the current edge weights.
    inline std::map<std::string, std::map<std::string, double>> allPairs(const NetworkGraph &graph)
    {
        std::map<std::string, std::map<std::string, double>> dist;
        auto names = graph.nodeNames();
        for (const auto &a : names)
        {
            for (const auto &b : names)
            {
                dist[a][b] = (a == b) ? 0.0 : graph.findNode(a)->edgeWeight(b);
            }
        }
        for (const auto &k : names)
            for (const auto &i : names)
                for (const auto &j : names)
                    if (dist[i][k] + dist[k][j] < dist[i][j])
                        dist[i][j] = dist[i][k] + dist[k][j];
        return dist;
    }

    inline void startListeners(NetworkGraph &graph, PacketManager &pm)
    {
        std::vector<std::future<bool>> readiness;
        for (auto *node : graph.nodes())
        {
            auto ready = std::make_shared<std::promise<bool>>();
            readiness.push_back(ready->get_future());
            node->startListener([&pm, node, ready]()
                                { pm.receiveAdvertisements(*node, *ready); });
        }
        for (auto &f : readiness)
        {
            if (!f.get())
                throw std::runtime_error("listener failed to start");
        }
    }

    inline void stopListeners(NetworkGraph &graph)
    {
        for (auto *node : graph.nodes())
            node->signalShutdown();
        for (auto *node : graph.nodes())
            node->joinListener();
    }
}
