#pragma once
#include <string>
#include <vector>
#include <limits>
#include <iostream>
#include <iomanip>
#include "utils.hpp"

constexpr double INFINITE_COST = std::numeric_limits<double>::infinity();

struct RouteEntry
{
    std::string source;
    std::string destination;
    double cost;

    bool operator==(const RouteEntry &other) const
    {
        return source == other.source && destination == other.destination && cost == other.cost;
    }
    bool operator!=(const RouteEntry &other) const { return !(*this == other); }
};

// One row per known destination, in graph order.
using DistanceTable = std::vector<RouteEntry>;

inline void printTable(std::ostream &out, const DistanceTable &table)
{
    out << std::left << std::setw(14) << "Source" << std::setw(14) << "Destination" << "Cost" << std::endl;
    for (const auto &entry : table)
    {
        out << "  " << std::setw(12) << entry.source << std::setw(14) << entry.destination
            << formatCost(entry.cost) << std::endl;
    }
    out << std::right;
}
