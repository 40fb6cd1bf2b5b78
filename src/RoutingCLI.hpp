#pragma once
#include "RoutingDaemon.hpp"
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

// Prints tables to a stream as Source/Destination/Cost rows.
class ConsoleDisplay : public DisplaySink
{
public:
    explicit ConsoleDisplay(std::ostream &out);

    void showInitialTables(const NetworkGraph &graph) override;
    void tableChanged(const std::string &node, const DistanceTable &table) override;

private:
    std::ostream &out;
};

class RoutingCLI {
public:
    RoutingCLI(std::unique_ptr<RoutingDaemon> daemon, std::istream &in = std::cin, std::ostream &out = std::cout);
    void run();

    // Returns false when the command asks to leave.
    bool handleCommand(const std::string& command);

private:
    void printHelp();
    bool askContinue(int round);
    void runStepped();
    void runUnattended();
    void changeLink(std::istringstream &args);

    std::unique_ptr<RoutingDaemon> daemon;
    std::istream &in;
    std::ostream &out;
    ConsoleDisplay display;
};
