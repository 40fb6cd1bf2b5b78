#pragma once
#include "ConvergenceController.hpp"
#include "DistanceVectorEngine.hpp"
#include "LinkStateManager.hpp"
#include "NetworkGraph.hpp"
#include "PacketManager.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

// Owns a simulated network: one listener thread per router, the transport,
// the distance-vector engine and the convergence controller.
class RoutingDaemon
{
public:
    RoutingDaemon(std::unique_ptr<NetworkGraph> graph, const SimulatorConfig &config);
    ~RoutingDaemon();

    // Starts every listener and waits until all are accepting, then builds
    // the initial tables. False if already running; throws if a listener
    // cannot bind.
    bool start();
    void stop();
    bool isRunning() const;

    void setDisplay(DisplaySink *sink);

    ConvergenceResult runStepped(const ContinuePredicate &shouldContinue);
    ConvergenceResult runUnattended();
    LinkEditResult changeLinkCost(const std::string &a, const std::string &b, double cost);

    NetworkGraph &getGraph();
    const NetworkGraph &getGraph() const;
    const SimulatorConfig &getConfig() const;
    PacketManager::TrafficStats getTrafficStats() const;

    void showInitialTables();
    void showTables(std::ostream &out) const;
    void getStatus(std::ostream &out) const;
    void showTrafficStats(std::ostream &out) const;
    void showConvergenceMetrics(std::ostream &out) const;
    void resetStats();

    int getRunCount() const;
    int getConvergenceCount() const;
    double getAverageConvergenceTime() const;

private:
    void requireRunning() const;
    void recordRun(const ConvergenceResult &result);
    void stopListeners();

    SimulatorConfig config;
    std::unique_ptr<NetworkGraph> graph;
    std::unique_ptr<PacketManager> pm;
    std::unique_ptr<DistanceVectorEngine> engine;
    std::unique_ptr<ConvergenceController> controller;
    std::unique_ptr<LinkStateManager> lsm;
    DisplaySink *display = nullptr;

    std::atomic<bool> running;

    int runCount = 0;
    int convergenceCount = 0;
    std::vector<int> roundsPerRun;
    std::vector<std::chrono::milliseconds> convergenceTimes;
};
