#include "RoutingDaemon.hpp"
#include <future>
#include <iomanip>
#include <numeric>
#include <stdexcept>

RoutingDaemon::RoutingDaemon(std::unique_ptr<NetworkGraph> network, const SimulatorConfig &config)
    : config(config), graph(std::move(network)), running(false)
{
    if (!graph || graph->empty())
    {
        throw std::runtime_error("Topology contains no nodes");
    }

    pm = std::make_unique<PacketManager>(config);
    engine = std::make_unique<DistanceVectorEngine>(*pm, config.mailboxPolicy);
    controller = std::make_unique<ConvergenceController>(*graph, *engine, config.maxRoundsPerNode);
    lsm = std::make_unique<LinkStateManager>(*graph);
}

RoutingDaemon::~RoutingDaemon()
{
    stop();
}

bool RoutingDaemon::start()
{
    if (running.load())
    {
        return false;
    }

    std::vector<std::future<bool>> readiness;
    for (auto *node : graph->nodes())
    {
        // Shared so the promise outlives set_value on the listener thread.
        auto ready = std::make_shared<std::promise<bool>>();
        readiness.push_back(ready->get_future());
        node->startListener([this, node, ready]()
                            { pm->receiveAdvertisements(*node, *ready); });
    }

    std::vector<std::string> failed;
    auto nodes = graph->nodes();
    for (size_t i = 0; i < readiness.size(); ++i)
    {
        if (!readiness[i].get())
        {
            failed.push_back(nodes[i]->getName());
        }
    }

    if (!failed.empty())
    {
        stopListeners();
        std::string names;
        for (const auto &name : failed)
            names += " " + name;
        throw std::runtime_error("Listeners failed to start for nodes:" + names);
    }

    logInfo("All servers are ready.");

    engine->initTables(*graph);
    running.store(true);

    if (display)
    {
        display->showInitialTables(*graph);
    }
    return true;
}

void RoutingDaemon::stop()
{
    if (!running.load())
    {
        return;
    }

    running.store(false);
    stopListeners();
}

void RoutingDaemon::stopListeners()
{
    for (auto *node : graph->nodes())
    {
        node->signalShutdown();
    }
    for (auto *node : graph->nodes())
    {
        node->joinListener();
    }
}

bool RoutingDaemon::isRunning() const
{
    return running.load();
}

void RoutingDaemon::setDisplay(DisplaySink *sink)
{
    display = sink;
    controller->setDisplay(sink);
}

void RoutingDaemon::requireRunning() const
{
    if (!running.load())
    {
        throw std::logic_error("Daemon must be running");
    }
}

ConvergenceResult RoutingDaemon::runStepped(const ContinuePredicate &shouldContinue)
{
    requireRunning();
    ConvergenceResult result = controller->runStepped(shouldContinue);
    recordRun(result);
    return result;
}

ConvergenceResult RoutingDaemon::runUnattended()
{
    requireRunning();
    ConvergenceResult result = controller->runUnattended();
    recordRun(result);
    return result;
}

LinkEditResult RoutingDaemon::changeLinkCost(const std::string &a, const std::string &b, double cost)
{
    return lsm->changeLinkCost(a, b, cost);
}

void RoutingDaemon::recordRun(const ConvergenceResult &result)
{
    ++runCount;
    roundsPerRun.push_back(result.rounds);
    if (result.outcome == ConvergenceOutcome::Converged)
    {
        ++convergenceCount;
        convergenceTimes.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(result.elapsed));
    }
}

NetworkGraph &RoutingDaemon::getGraph()
{
    return *graph;
}

const NetworkGraph &RoutingDaemon::getGraph() const
{
    return *graph;
}

const SimulatorConfig &RoutingDaemon::getConfig() const
{
    return config;
}

PacketManager::TrafficStats RoutingDaemon::getTrafficStats() const
{
    return pm->getTrafficStats();
}

void RoutingDaemon::showInitialTables()
{
    if (display)
    {
        display->showInitialTables(*graph);
    }
}

void RoutingDaemon::showTables(std::ostream &out) const
{
    for (const auto *node : graph->nodes())
    {
        out << "Node " << node->getName() << ":" << std::endl;
        printTable(out, node->getTable());
    }
}

void RoutingDaemon::getStatus(std::ostream &out) const
{
    out << "Daemon Status: " << (running.load() ? "Running" : "Stopped") << std::endl;
    out << "Nodes: " << graph->size() << std::endl;
    for (const auto *node : graph->nodes())
    {
        out << "  " << node->getName() << " " << node->getHost() << ":" << node->getPort()
            << " neighbors:";
        for (const auto &edge : node->getEdges())
        {
            out << " " << edge.destination << "(" << formatCost(edge.weight) << ")";
        }
        out << std::endl;
    }
    out << "Max cycles per run: " << controller->maxRounds() << std::endl;
    out << "Mailbox policy: " << (config.mailboxPolicy == MailboxPolicy::Drain ? "drain" : "accumulate") << std::endl;
}

void RoutingDaemon::showTrafficStats(std::ostream &out) const
{
    auto stats = pm->getTrafficStats();
    out << "=== Traffic Statistics ===" << std::endl;
    out << "Advertisements sent:     " << stats.messagesSent << std::endl;
    out << "Bytes sent:              " << stats.totalBytesSent << std::endl;
    out << "Send failures:           " << stats.sendFailures << std::endl;
    out << "Compressed messages:     " << stats.compressedMessages << std::endl;
    out << "Advertisements received: " << stats.messagesReceived << std::endl;
    out << "Bytes received:          " << stats.totalBytesReceived << std::endl;
    out << "Malformed dropped:       " << stats.malformedDropped << std::endl;
}

void RoutingDaemon::showConvergenceMetrics(std::ostream &out) const
{
    out << "=== Convergence Metrics ===" << std::endl;
    out << "Runs: " << runCount << std::endl;
    out << "Converged runs: " << convergenceCount << std::endl;
    if (!roundsPerRun.empty())
    {
        out << "Cycles per run:";
        for (int rounds : roundsPerRun)
            out << " " << rounds;
        out << std::endl;
    }
    if (!convergenceTimes.empty())
    {
        out << "Average convergence time: " << std::fixed << std::setprecision(3)
            << getAverageConvergenceTime() << " s" << std::endl;
        out << std::defaultfloat;
    }
}

void RoutingDaemon::resetStats()
{
    pm->resetTrafficStats();
    runCount = 0;
    convergenceCount = 0;
    roundsPerRun.clear();
    convergenceTimes.clear();
}

int RoutingDaemon::getRunCount() const
{
    return runCount;
}

int RoutingDaemon::getConvergenceCount() const
{
    return convergenceCount;
}

double RoutingDaemon::getAverageConvergenceTime() const
{
    if (convergenceTimes.empty())
        return 0.0;

    auto total = std::accumulate(convergenceTimes.begin(), convergenceTimes.end(), std::chrono::milliseconds(0));
    return total.count() / 1000.0 / convergenceTimes.size();
}
