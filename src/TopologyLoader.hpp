#pragma once
#include <string>
#include <istream>
#include <memory>
#include "NetworkGraph.hpp"
#include "utils.hpp"

// Line that ends a topology file; anything after it is ignored.
extern const char *const TOPOLOGY_SENTINEL;

// Reads "SRC DEST WEIGHT" lines. Throws std::runtime_error on a bad weight.
std::unique_ptr<NetworkGraph> parseTopology(std::istream &in, const SimulatorConfig &config);

std::unique_ptr<NetworkGraph> loadTopology(const std::string &path, const SimulatorConfig &config);
