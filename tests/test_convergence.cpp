#include "ConvergenceProbe.hpp"
#include "MeshTestUtils.hpp"
#include <gtest/gtest.h>

TEST(ConvergenceProbeTest, NeedsTwoSamples)
{
    ManualClock clock(testEpoch());
    MeshNetwork network(makeTestSettings(2), clock);
    EXPECT_THROW(ConvergenceProbe(network, 1), std::invalid_argument);
}

TEST(ConvergenceProbeTest, CountsIdenticalSamples)
{
    ManualClock clock(testEpoch());
    MeshNetwork network(makeTestSettings(2), clock);
    network.addSatellite("A");
    network.addSatellite("B");

    ConvergenceProbe probe(network, 3);
    EXPECT_FALSE(probe.sample());
    EXPECT_FALSE(probe.sample());
    EXPECT_TRUE(probe.sample());
    EXPECT_EQ(probe.stableCount(), 3);

    network.connect("A", "B", clock.now(), clock.now() + Millis(60000), 1.0);
    runRounds(network, clock, 2);

    EXPECT_FALSE(probe.sample());
    EXPECT_EQ(probe.stableCount(), 1);
    ASSERT_EQ(probe.lastView().count("A"), 1u);
    EXPECT_EQ(probe.lastView().at("A").count("B"), 1u);
}

TEST(ConvergenceProbeTest, IgnoresTimestampRefreshes)
{
    ManualClock clock(testEpoch());
    MeshNetwork network(makeTestSettings(2), clock);
    network.addSatellite("A");
    network.addSatellite("B");
    network.connect("A", "B", clock.now(), clock.now() + Millis(60000), 1.0);
    runRounds(network, clock, 10);

    ConvergenceProbe probe(network, 2);
    probe.sample();
    runRounds(network, clock, 15);
    EXPECT_TRUE(probe.sample());
}

TEST(ConvergenceProbeTest, WaitGivesUpAtTimeout)
{
    ManualClock clock(testEpoch());
    MeshNetwork network(makeTestSettings(2), clock);

    ConvergenceProbe probe(network, 50);
    ProbeResult result = probe.waitForConvergence(std::chrono::milliseconds(10), std::chrono::milliseconds(100));
    EXPECT_FALSE(result.converged);
    EXPECT_GE(result.samples, 2);
    EXPECT_LE(result.samples, 11);
}

// Real threads and the system clock.
TEST(ConvergenceTest, RunningRingConverges)
{
    SystemClock clock;
    AgentSettings settings = makeTestSettings(2);
    settings.updateInterval = Millis(200);
    settings.livenessInterval = Millis(500);
    settings.maxRouteAge = Millis(1000);
    settings.jitterMin = Millis(10);
    settings.jitterMax = Millis(30);

    MeshNetwork network(settings, clock);
    const std::vector<std::string> ids = {"SAT-1", "SAT-2", "SAT-3", "SAT-4", "SAT-5"};
    for (const auto &id : ids)
        network.addSatellite(id);

    network.startAll();
    EXPECT_TRUE(network.isRunning());
    SimTime now = clock.now();
    for (size_t i = 0; i < ids.size(); ++i)
    {
        network.connect(ids[i], ids[(i + 1) % ids.size()], now, now + Millis(600000), 1.0);
    }

    ConvergenceProbe probe(network, 5);
    ProbeResult result = probe.waitForConvergence(std::chrono::milliseconds(100), std::chrono::seconds(10));
    network.stopAll();

    ASSERT_TRUE(result.converged) << "no convergence after " << result.samples << " samples";
    for (const auto &agent : network.getAllSatellites())
    {
        EXPECT_FALSE(agent->isRunning());
        EXPECT_EQ(agent->routes().size(), 4u) << agent->id();
        EXPECT_GT(agent->counters().messagesProcessed, 0u);
    }
    EXPECT_TRUE(hopsWithinHorizon(network, 2));
    EXPECT_TRUE(routesUseActiveNeighbors(network));
}

TEST(ConvergenceTest, SatelliteAddedWhileRunningStarts)
{
    SystemClock clock;
    MeshNetwork network(makeTestSettings(2), clock);
    network.startAll();
    auto agent = network.addSatellite("LATE");
    EXPECT_TRUE(agent->isRunning());
    network.stopAll();
    EXPECT_FALSE(agent->isRunning());
}
