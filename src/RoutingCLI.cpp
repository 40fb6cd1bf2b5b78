#include "RoutingCLI.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

ConsoleDisplay::ConsoleDisplay(std::ostream &out) : out(out) {}

void ConsoleDisplay::showInitialTables(const NetworkGraph &graph)
{
    out << "=== Initial Distance Vector Tables ===" << std::endl;
    for (const auto *node : graph.nodes())
    {
        out << "Node " << node->getName() << ":" << std::endl;
        printTable(out, node->getTable());
    }
}

void ConsoleDisplay::tableChanged(const std::string &node, const DistanceTable &table)
{
    out << "Node " << node << " updated table:" << std::endl;
    printTable(out, table);
}

RoutingCLI::RoutingCLI(std::unique_ptr<RoutingDaemon> daemon, std::istream &in, std::ostream &out)
    : daemon(std::move(daemon)), in(in), out(out), display(out)
{
    this->daemon->setDisplay(&display);
}

void RoutingCLI::run()
{
    out << "Distance Vector Routing Simulator" << std::endl;

    if (!daemon->isRunning())
    {
        daemon->start();
    }
    out << "Type 'help' for available commands" << std::endl;

    std::string line;
    while (true)
    {
        out << "dv> " << std::flush;
        if (!std::getline(in, line))
        {
            break;
        }

        line = trim(line);
        if (line.empty())
            continue;

        if (!handleCommand(line))
        {
            break;
        }
    }

    if (daemon->isRunning())
    {
        out << "Stopping servers..." << std::endl;
        daemon->stop();
    }
}

bool RoutingCLI::handleCommand(const std::string &command)
{
    std::istringstream iss(command);
    std::string cmd;
    iss >> cmd;

    if (cmd == "quit" || cmd == "exit")
    {
        return false;
    }

    if (cmd == "help")
    {
        printHelp();
        return true;
    }
    if (cmd == "status")
    {
        daemon->getStatus(out);
        return true;
    }

    if (!daemon->isRunning())
    {
        out << "Servers are not running" << std::endl;
        return true;
    }

    if (cmd == "init")
    {
        daemon->showInitialTables();
    }
    else if (cmd == "step")
    {
        runStepped();
    }
    else if (cmd == "run")
    {
        runUnattended();
    }
    else if (cmd == "link")
    {
        changeLink(iss);
    }
    else if (cmd == "tables" || cmd == "routes")
    {
        daemon->showTables(out);
    }
    else if (cmd == "traffic")
    {
        daemon->showTrafficStats(out);
    }
    else if (cmd == "metrics")
    {
        daemon->showConvergenceMetrics(out);
    }
    else if (cmd == "reset")
    {
        daemon->resetStats();
        out << "Traffic and convergence statistics reset" << std::endl;
    }
    else
    {
        out << "Unknown command: " << cmd << std::endl;
        out << "Type 'help' for available commands" << std::endl;
    }
    return true;
}

bool RoutingCLI::askContinue(int round)
{
    out << "Cycle " << round << " changed the tables. Continue to next cycle? (Y/N): " << std::flush;
    std::string answer;
    if (!std::getline(in, answer))
    {
        return false;
    }
    answer = trim(answer);
    return answer == "Y" || answer == "y";
}

void RoutingCLI::runStepped()
{
    auto result = daemon->runStepped([this](int round)
                                     { return askContinue(round); });

    if (result.outcome == ConvergenceOutcome::Halted)
    {
        out << "User halted the algorithm after " << result.rounds << " cycles." << std::endl;
    }
    else if (result.outcome == ConvergenceOutcome::NotConverged)
    {
        out << "Reached maximum cycles without becoming stable" << std::endl;
    }
    else
    {
        out << "Algorithm has reached a stable state. It achieved this in " << result.rounds << " cycles" << std::endl;
    }
}

void RoutingCLI::runUnattended()
{
    auto result = daemon->runUnattended();

    if (result.outcome == ConvergenceOutcome::NotConverged)
    {
        out << "Reached maximum cycles without becoming stable (" << result.rounds << " cycles)" << std::endl;
    }
    else
    {
        out << "Algorithm has reached a stable state, It did so in " << result.rounds << " cycles" << std::endl;
    }
    out << "Total time taken: " << std::fixed << std::setprecision(3) << result.elapsed.count()
        << " seconds." << std::defaultfloat << std::endl;
}

void RoutingCLI::changeLink(std::istringstream &args)
{
    std::string a, b, costStr, mode;
    if (!(args >> a >> b >> costStr))
    {
        out << "Usage: link <source> <destination> <cost> [step|run]" << std::endl;
        out << "Example: link 1 2 3" << std::endl;
        return;
    }
    args >> mode;

    double cost;
    try
    {
        size_t pos = 0;
        cost = std::stod(costStr, &pos);
        if (pos != costStr.size())
            throw std::invalid_argument(costStr);
    }
    catch (const std::exception &)
    {
        out << "Invalid cost value: " << costStr << std::endl;
        return;
    }

    LinkEditResult result = daemon->changeLinkCost(a, b, cost);
    if (result != LinkEditResult::Success)
    {
        out << "Cannot change link " << a << " <-> " << b << ": " << toString(result) << std::endl;
        return;
    }

    out << "Link cost between " << a << " and " << b << " adjusted to " << formatCost(cost) << "." << std::endl;

    if (mode == "step")
    {
        runStepped();
    }
    else if (mode == "run")
    {
        runUnattended();
    }
    else
    {
        out << "Use 'step' or 'run' to propagate the change." << std::endl;
    }
}

void RoutingCLI::printHelp()
{
    out << "Available commands:" << std::endl;
    out << "  init        - Show the initial distance vector table of each node" << std::endl;
    out << "  step        - Run the algorithm one cycle at a time" << std::endl;
    out << "  run         - Run the algorithm without intervention" << std::endl;
    out << "  link <a> <b> <cost> [step|run] - Adjust a link cost, optionally re-run" << std::endl;
    out << "  tables      - Show the current table of every node" << std::endl;
    out << "  status      - Show nodes, endpoints and links" << std::endl;
    out << "  traffic     - Show advertisement traffic statistics" << std::endl;
    out << "  metrics     - Show convergence metrics" << std::endl;
    out << "  reset       - Reset traffic and convergence statistics" << std::endl;
    out << "  help        - Show this help message" << std::endl;
    out << "  quit/exit   - Stop the servers and exit" << std::endl;
}
