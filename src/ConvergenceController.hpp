#pragma once
#include <chrono>
#include <functional>
#include <string>
#include "DistanceVectorEngine.hpp"
#include "NetworkGraph.hpp"
#include "RoutingTable.hpp"

// Receives table snapshots; purely a notification target.
class DisplaySink
{
public:
    virtual ~DisplaySink() = default;
    virtual void showInitialTables(const NetworkGraph &graph) = 0;
    virtual void tableChanged(const std::string &node, const DistanceTable &table) = 0;
};

// Asked after each round that changed something in stepped mode; false stops the run.
using ContinuePredicate = std::function<bool(int round)>;

enum class RunMode
{
    Stepped,
    Unattended
};

enum class ControllerState
{
    Init,
    Round,
    Stable,
    Unstable,
    Done
};

enum class ConvergenceOutcome
{
    Converged,
    NotConverged,
    Halted
};

const char *toString(ConvergenceOutcome outcome);

struct ConvergenceResult
{
    ConvergenceOutcome outcome = ConvergenceOutcome::NotConverged;
    int rounds = 0;
    std::chrono::duration<double> elapsed{0};
};

class ConvergenceController
{
public:
    ConvergenceController(NetworkGraph &graph, DistanceVectorEngine &engine, int maxRoundsPerNode = 50);

    void setDisplay(DisplaySink *sink);

    ConvergenceResult runStepped(const ContinuePredicate &shouldContinue);
    ConvergenceResult runUnattended();

    // One broadcast + update pass over every node. True if any table changed.
    bool runRound();

    int maxRounds() const;
    ControllerState getState() const;

private:
    ConvergenceResult run(RunMode mode, const ContinuePredicate &shouldContinue);

    NetworkGraph &graph;
    DistanceVectorEngine &engine;
    DisplaySink *display = nullptr;
    int maxRoundsPerNode;
    ControllerState state = ControllerState::Init;
};
