#include "ConvergenceController.hpp"
#include "RoutingDaemon.hpp"
#include "TopologyLoader.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace testing_helpers;

namespace
{
    class RecordingDisplay : public DisplaySink
    {
    public:
        void showInitialTables(const NetworkGraph &graph) override
        {
            initialSnapshots += graph.size();
        }
        void tableChanged(const std::string &node, const DistanceTable &table) override
        {
            changes.emplace_back(node, table);
        }

        size_t initialSnapshots = 0;
        std::vector<std::pair<std::string, DistanceTable>> changes;
    };

    void expectShortestPaths(const NetworkGraph &graph)
    {
        auto expected = allPairs(graph);
        for (const auto *node : graph.nodes())
        {
            auto actual = costs(*node);
            for (const auto &[dest, cost] : expected[node->getName()])
            {
                EXPECT_DOUBLE_EQ(actual[dest], cost) << node->getName() << " -> " << dest;
            }
        }
    }

    void expectSelfDistanceZero(const NetworkGraph &graph)
    {
        for (const auto *node : graph.nodes())
        {
            EXPECT_EQ(costs(*node)[node->getName()], 0) << node->getName();
        }
    }
}

class ConvergenceTest : public ::testing::Test
{
protected:
    void start(const std::vector<Link> &links)
    {
        daemon = std::make_unique<RoutingDaemon>(buildGraph(links, config), config);
        daemon->setDisplay(&display);
        ASSERT_TRUE(daemon->start());
    }

    SimulatorConfig config = testConfig();
    RecordingDisplay display;
    std::unique_ptr<RoutingDaemon> daemon;
};

TEST_F(ConvergenceTest, WorkedExampleConvergesInTwoRounds)
{
    start(triangle());
    EXPECT_EQ(display.initialSnapshots, 3u);

    ConvergenceResult result = daemon->runUnattended();

    EXPECT_EQ(result.outcome, ConvergenceOutcome::Converged);
    EXPECT_EQ(result.rounds, 2);

    NetworkGraph &graph = daemon->getGraph();
    EXPECT_EQ(costs(graph.node("1")), (std::map<std::string, double>{{"1", 0}, {"2", 3}, {"3", 4}}));
    EXPECT_EQ(costs(graph.node("2")), (std::map<std::string, double>{{"1", 3}, {"2", 0}, {"3", 1}}));
    EXPECT_EQ(costs(graph.node("3")), (std::map<std::string, double>{{"1", 4}, {"2", 1}, {"3", 0}}));

    // Round one changes nodes 1 and 3, round two nothing.
    ASSERT_EQ(display.changes.size(), 2u);
    EXPECT_EQ(display.changes[0].first, "1");
    EXPECT_EQ(display.changes[1].first, "3");
}

TEST_F(ConvergenceTest, StableNetworkStaysStable)
{
    start(triangle());
    ASSERT_EQ(daemon->runUnattended().outcome, ConvergenceOutcome::Converged);
    size_t events = display.changes.size();

    ConvergenceResult again = daemon->runUnattended();

    EXPECT_EQ(again.outcome, ConvergenceOutcome::Converged);
    EXPECT_EQ(again.rounds, 1);
    EXPECT_EQ(display.changes.size(), events);
    EXPECT_EQ(daemon->getConvergenceCount(), 2);
}

TEST_F(ConvergenceTest, MatchesReferenceShortestPaths)
{
    start({Link{"a", "b", 4}, Link{"a", "c", 1}, Link{"c", "b", 1}, Link{"b", "d", 7},
           Link{"c", "e", 9}, Link{"e", "d", 0.5}, Link{"d", "f", 2}, Link{"f", "g", 3},
           Link{"g", "h", 1}, Link{"a", "h", 30}, Link{"e", "g", 2.5}});

    ConvergenceResult result = daemon->runUnattended();

    EXPECT_EQ(result.outcome, ConvergenceOutcome::Converged);
    EXPECT_LE(result.rounds, static_cast<int>(daemon->getGraph().size()) * config.maxRoundsPerNode);
    expectShortestPaths(daemon->getGraph());
    expectSelfDistanceZero(daemon->getGraph());
}

TEST_F(ConvergenceTest, SampleTopologyFile)
{
    daemon = std::make_unique<RoutingDaemon>(
        loadTopology(std::string(DVSIM_TOPOLOGY_DIR) + "/five_nodes.txt", config), config);
    ASSERT_TRUE(daemon->start());

    EXPECT_EQ(daemon->runUnattended().outcome, ConvergenceOutcome::Converged);
    expectShortestPaths(daemon->getGraph());
}

TEST_F(ConvergenceTest, PartiallyConnectedGraphKeepsInfinity)
{
    start({Link{"1", "2", 1}, Link{"3", "4", 1}});

    EXPECT_EQ(daemon->runUnattended().outcome, ConvergenceOutcome::Converged);

    EXPECT_TRUE(std::isinf(costs(daemon->getGraph().node("1"))["3"]));
    EXPECT_EQ(costs(daemon->getGraph().node("4"))["3"], 1);
}

TEST_F(ConvergenceTest, AccumulatingMailboxReachesSameResult)
{
    config.mailboxPolicy = MailboxPolicy::Accumulate;
    start(triangle());

    ConvergenceResult result = daemon->runUnattended();

    EXPECT_EQ(result.outcome, ConvergenceOutcome::Converged);
    EXPECT_EQ(result.rounds, 2);
    expectShortestPaths(daemon->getGraph());
}

TEST_F(ConvergenceTest, SteppedModeAsksAfterEachChangedRound)
{
    start({Link{"1", "2", 1}, Link{"2", "3", 1}, Link{"3", "4", 1}, Link{"4", "5", 1}});

    std::vector<int> asked;
    ConvergenceResult result = daemon->runStepped([&asked](int round)
                                                  { asked.push_back(round);
                                                    return true; });

    EXPECT_EQ(result.outcome, ConvergenceOutcome::Converged);
    ASSERT_FALSE(asked.empty());
    EXPECT_EQ(static_cast<int>(asked.size()), result.rounds - 1);
    EXPECT_EQ(asked.front(), 1);
    expectShortestPaths(daemon->getGraph());
}

TEST_F(ConvergenceTest, DeclinedContinuationHaltsGracefully)
{
    start(triangle());

    ConvergenceResult result = daemon->runStepped([](int)
                                                  { return false; });

    EXPECT_EQ(result.outcome, ConvergenceOutcome::Halted);
    EXPECT_EQ(result.rounds, 1);
    EXPECT_TRUE(daemon->isRunning());
    EXPECT_EQ(costs(daemon->getGraph().node("1"))["3"], 4);

    // The caller may resume later.
    EXPECT_EQ(daemon->runUnattended().outcome, ConvergenceOutcome::Converged);
}

TEST_F(ConvergenceTest, LinkChangeExample)
{
    start(triangle());
    ASSERT_EQ(daemon->runUnattended().outcome, ConvergenceOutcome::Converged);

    EXPECT_EQ(daemon->changeLinkCost("1", "2", 100), LinkEditResult::Success);

    NetworkGraph &graph = daemon->getGraph();
    EXPECT_EQ(costs(graph.node("1"))["2"], 100);
    EXPECT_EQ(costs(graph.node("2"))["1"], 100);
    EXPECT_EQ(costs(graph.node("1"))["3"], 4);

    EXPECT_EQ(daemon->changeLinkCost("1", "4", 5), LinkEditResult::LinkNotFound);

    ConvergenceResult rerun = daemon->runUnattended();
    EXPECT_EQ(rerun.outcome, ConvergenceOutcome::Converged);
    expectSelfDistanceZero(graph);
    // Without poison reverse node 1 keeps the route to 2 learned through 3's stale vector.
    EXPECT_EQ(costs(graph.node("1"))["2"], 5);
}

TEST_F(ConvergenceTest, CheaperLinkReconvergesToShortestPaths)
{
    start({Link{"1", "2", 3}, Link{"2", "3", 1}, Link{"1", "3", 10}, Link{"3", "4", 2}});
    ASSERT_EQ(daemon->runUnattended().outcome, ConvergenceOutcome::Converged);

    ASSERT_EQ(daemon->changeLinkCost("1", "3", 1), LinkEditResult::Success);
    EXPECT_EQ(daemon->runUnattended().outcome, ConvergenceOutcome::Converged);

    expectShortestPaths(daemon->getGraph());
    EXPECT_EQ(costs(daemon->getGraph().node("4"))["1"], 3);
}

TEST_F(ConvergenceTest, RunsRequireStartedDaemon)
{
    daemon = std::make_unique<RoutingDaemon>(buildGraph(triangle(), config), config);
    EXPECT_THROW(daemon->runUnattended(), std::logic_error);

    ASSERT_TRUE(daemon->start());
    EXPECT_FALSE(daemon->start());
    daemon->stop();
    EXPECT_FALSE(daemon->isRunning());
}

TEST(ConvergenceControllerTest, RoundCapEndsWithoutConverging)
{
    SimulatorConfig config = testConfig();
    auto graph = buildGraph({Link{"1", "2", 1}, Link{"2", "3", 1}, Link{"3", "4", 1}}, config);
    PacketManager pm(config);
    DistanceVectorEngine engine(pm, config.mailboxPolicy);
    startListeners(*graph, pm);
    engine.initTables(*graph);

    ConvergenceController controller(*graph, engine, 0);
    EXPECT_EQ(controller.maxRounds(), 1);

    ConvergenceResult result = controller.runUnattended();

    EXPECT_EQ(result.outcome, ConvergenceOutcome::NotConverged);
    EXPECT_EQ(result.rounds, 1);
    EXPECT_EQ(controller.getState(), ControllerState::Done);
    EXPECT_STREQ(toString(result.outcome), "did not converge");

    stopListeners(*graph);
}

TEST(ConvergenceControllerTest, SteppedRunStopsAtCapBeforeAsking)
{
    SimulatorConfig config = testConfig();
    auto graph = buildGraph({Link{"1", "2", 1}, Link{"2", "3", 1}, Link{"3", "4", 1}}, config);
    PacketManager pm(config);
    DistanceVectorEngine engine(pm, config.mailboxPolicy);
    startListeners(*graph, pm);
    engine.initTables(*graph);

    ConvergenceController controller(*graph, engine, 0);
    int asked = 0;
    ConvergenceResult result = controller.runStepped([&asked](int)
                                                     { ++asked;
                                                       return true; });

    EXPECT_EQ(result.outcome, ConvergenceOutcome::NotConverged);
    EXPECT_EQ(result.rounds, 1);
    EXPECT_EQ(asked, 0);

    stopListeners(*graph);
}

TEST(ConvergenceControllerTest, ExtraRoundAfterStabilityChangesNothing)
{
    SimulatorConfig config = testConfig();
    auto graph = buildGraph(triangle(), config);
    PacketManager pm(config);
    DistanceVectorEngine engine(pm, config.mailboxPolicy);
    startListeners(*graph, pm);
    engine.initTables(*graph);

    ConvergenceController controller(*graph, engine, config.maxRoundsPerNode);
    EXPECT_EQ(controller.maxRounds(), 150);
    ASSERT_EQ(controller.runUnattended().outcome, ConvergenceOutcome::Converged);

    EXPECT_FALSE(controller.runRound());
    EXPECT_EQ(controller.getState(), ControllerState::Stable);

    stopListeners(*graph);
}

TEST(ConvergenceControllerTest, LostAdvertisementsAreTolerated)
{
    SimulatorConfig config = testConfig();
    auto graph = buildGraph(triangle(), config);
    PacketManager pm(config);
    DistanceVectorEngine engine(pm, config.mailboxPolicy);
    startListeners(*graph, pm);
    engine.initTables(*graph);

    // Node 3 goes deaf: every advertisement to it is refused.
    graph->node("3").signalShutdown();
    graph->node("3").joinListener();

    ConvergenceController controller(*graph, engine, config.maxRoundsPerNode);
    ConvergenceResult result = controller.runUnattended();

    EXPECT_EQ(result.outcome, ConvergenceOutcome::Converged);
    EXPECT_GT(pm.getTrafficStats().sendFailures, 0u);
    EXPECT_EQ(costs(graph->node("1"))["3"], 4);
    EXPECT_EQ(costs(graph->node("3"))["1"], 10);

    stopListeners(*graph);
}
