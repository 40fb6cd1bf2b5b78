#include "RoutingCLI.hpp"
#include "RoutingDaemon.hpp"
#include "TopologyLoader.hpp"
#include "utils.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char *argv[])
{
    std::string topologyFile;
    std::string configFile = "config/simulator.conf";

    if (argc > 1)
    {
        topologyFile = argv[1];
    }
    if (argc > 2)
    {
        configFile = argv[2];
    }

    if (topologyFile.empty())
    {
        std::cout << "Enter filename: " << std::flush;
        if (!std::getline(std::cin, topologyFile) || trim(topologyFile).empty())
        {
            std::cerr << "No topology file given." << std::endl;
            return 1;
        }
        topologyFile = trim(topologyFile);
    }

    try
    {
        SimulatorConfig config = loadSimulatorConfig(configFile);
        setLogLevel(config.logLevel);

        auto graph = loadTopology(topologyFile, config);
        auto daemon = std::make_unique<RoutingDaemon>(std::move(graph), config);

        RoutingCLI cli(std::move(daemon));
        cli.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[fatal] " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
