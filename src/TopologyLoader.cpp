#include "TopologyLoader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cmath>

const char *const TOPOLOGY_SENTINEL = "End of Input";

std::unique_ptr<NetworkGraph> parseTopology(std::istream &in, const SimulatorConfig &config)
{
    auto graph = std::make_unique<NetworkGraph>(config.host, config.basePort, config.portStep);

    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line))
    {
        ++lineNumber;
        line = trim(line);

        if (line == TOPOLOGY_SENTINEL)
            break;
        if (line.empty())
            continue;

        std::istringstream iss(line);
        std::vector<std::string> words;
        std::string word;
        while (iss >> word)
        {
            words.push_back(word);
        }

        if (words.size() != 3)
        {
            logDebug("Skipping topology line " + std::to_string(lineNumber) + ": " + line);
            continue;
        }

        double weight;
        try
        {
            size_t pos = 0;
            weight = std::stod(words[2], &pos);
            if (pos != words[2].size())
                throw std::invalid_argument(words[2]);
        }
        catch (const std::exception &)
        {
            throw std::runtime_error("Invalid weight on topology line " + std::to_string(lineNumber) + ": " + line);
        }

        if (!std::isfinite(weight) || weight < 0)
        {
            throw std::runtime_error("Weight must be finite and non-negative on topology line " + std::to_string(lineNumber) + ": " + line);
        }

        if (words[0] == words[1])
        {
            logWarn("Ignoring self-loop on topology line " + std::to_string(lineNumber) + ": " + line);
            continue;
        }

        graph->addLink(words[0], words[1], weight);
    }

    return graph;
}

std::unique_ptr<NetworkGraph> loadTopology(const std::string &path, const SimulatorConfig &config)
{
    std::ifstream file(path);
    if (!file)
    {
        throw std::runtime_error("Could not read topology file: " + path);
    }
    return parseTopology(file, config);
}
