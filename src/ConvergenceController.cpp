#include "ConvergenceController.hpp"
#include "utils.hpp"
#include <algorithm>

const char *toString(ConvergenceOutcome outcome)
{
    switch (outcome)
    {
    case ConvergenceOutcome::Converged:
        return "converged";
    case ConvergenceOutcome::NotConverged:
        return "did not converge";
    case ConvergenceOutcome::Halted:
        return "halted";
    }
    return "unknown";
}

ConvergenceController::ConvergenceController(NetworkGraph &graph, DistanceVectorEngine &engine, int maxRoundsPerNode)
    : graph(graph), engine(engine), maxRoundsPerNode(maxRoundsPerNode) {}

void ConvergenceController::setDisplay(DisplaySink *sink)
{
    display = sink;
}

int ConvergenceController::maxRounds() const
{
    // At least one round always runs.
    return std::max(1, static_cast<int>(graph.size()) * maxRoundsPerNode);
}

ControllerState ConvergenceController::getState() const
{
    return state;
}

bool ConvergenceController::runRound()
{
    state = ControllerState::Round;
    engine.broadcast(graph);

    bool anyChanged = false;
    for (auto *node : graph.nodes())
    {
        UpdateResult result = engine.updateNode(*node);
        if (result.changed)
        {
            anyChanged = true;
            logInfo("Node " + node->getName() + " updated its table");
            if (display)
            {
                display->tableChanged(node->getName(), result.table);
            }
        }
    }

    state = anyChanged ? ControllerState::Unstable : ControllerState::Stable;
    return anyChanged;
}

ConvergenceResult ConvergenceController::runStepped(const ContinuePredicate &shouldContinue)
{
    return run(RunMode::Stepped, shouldContinue);
}

ConvergenceResult ConvergenceController::runUnattended()
{
    return run(RunMode::Unattended, nullptr);
}

ConvergenceResult ConvergenceController::run(RunMode mode, const ContinuePredicate &shouldContinue)
{
    ConvergenceResult result;
    auto start = std::chrono::steady_clock::now();
    const int limit = maxRounds();

    state = ControllerState::Init;
    while (true)
    {
        ++result.rounds;
        if (!runRound())
        {
            result.outcome = ConvergenceOutcome::Converged;
            logInfo("Algorithm has reached a stable state in " + std::to_string(result.rounds) + " cycles");
            break;
        }

        if (result.rounds >= limit)
        {
            result.outcome = ConvergenceOutcome::NotConverged;
            logWarn("Reached maximum of " + std::to_string(limit) + " cycles without becoming stable");
            break;
        }

        if (mode == RunMode::Stepped && (!shouldContinue || !shouldContinue(result.rounds)))
        {
            result.outcome = ConvergenceOutcome::Halted;
            logInfo("Algorithm halted after " + std::to_string(result.rounds) + " cycles");
            break;
        }
    }

    state = ControllerState::Done;
    result.elapsed = std::chrono::steady_clock::now() - start;
    return result;
}
