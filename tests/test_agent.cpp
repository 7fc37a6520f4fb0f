#include "MeshTestUtils.hpp"
#include <gtest/gtest.h>

namespace
{
    const Millis LONG_WINDOW(3600 * 1000);

    std::vector<std::string> ringIds(int n)
    {
        std::vector<std::string> ids;
        for (int i = 1; i <= n; ++i)
            ids.push_back("SAT-" + std::to_string(i));
        return ids;
    }
}

class AgentTest : public ::testing::Test
{
protected:
    void build(int kHops, const std::vector<std::string> &ids)
    {
        network = std::make_unique<MeshNetwork>(makeTestSettings(kHops), clock);
        for (const auto &id : ids)
            network->addSatellite(id);
    }

    void buildLine()
    {
        build(2, {"A", "B", "C"});
        network->connect("A", "B", clock.now(), clock.now() + LONG_WINDOW, 1.0);
        network->connect("B", "C", clock.now(), clock.now() + LONG_WINDOW, 1.0);
    }

    void buildRing(int n, int kHops)
    {
        auto ids = ringIds(n);
        build(kHops, ids);
        for (int i = 0; i < n; ++i)
        {
            network->connect(ids[i], ids[(i + 1) % n], clock.now(), clock.now() + LONG_WINDOW, 1.0);
        }
    }

    void expectRoute(const std::string &at, const std::string &dest, const std::string &via, int hops, double cost)
    {
        auto route = network->getSatellite(at)->routeTo(dest);
        ASSERT_TRUE(route.has_value()) << at << " has no route to " << dest;
        EXPECT_EQ(route->nextHop, via) << at << " -> " << dest;
        EXPECT_EQ(route->hopCount, hops) << at << " -> " << dest;
        EXPECT_DOUBLE_EQ(route->cost, cost) << at << " -> " << dest;
    }

    ManualClock clock{testEpoch()};
    std::unique_ptr<MeshNetwork> network;
};

TEST_F(AgentTest, LineConverges)
{
    buildLine();
    runRounds(*network, clock, 30);

    expectRoute("A", "B", "B", 1, 1.0);
    expectRoute("A", "C", "B", 2, 2.0);
    expectRoute("B", "A", "A", 1, 1.0);
    expectRoute("B", "C", "C", 1, 1.0);
    expectRoute("C", "B", "B", 1, 1.0);
    expectRoute("C", "A", "B", 2, 2.0);

    EXPECT_EQ(network->getSatellite("A")->routes().size(), 2u);
    EXPECT_TRUE(routesUseActiveNeighbors(*network));
    EXPECT_TRUE(hopsWithinHorizon(*network, 2));
}

TEST_F(AgentTest, DisconnectWithdrawsRoutes)
{
    buildLine();
    runRounds(*network, clock, 30);

    network->disconnect("A", "B");
    runRounds(*network, clock, 20);

    EXPECT_TRUE(network->getSatellite("A")->routes().empty());
    EXPECT_TRUE(network->getSatellite("A")->neighbors().empty());
    EXPECT_FALSE(network->getSatellite("B")->routeTo("A").has_value());
    EXPECT_FALSE(network->getSatellite("C")->routeTo("A").has_value());
    expectRoute("C", "B", "B", 1, 1.0);
    EXPECT_TRUE(routesUseActiveNeighbors(*network));
}

TEST_F(AgentTest, RemovedSatelliteIsForgotten)
{
    buildLine();
    runRounds(*network, clock, 30);

    EXPECT_TRUE(network->removeSatellite("B"));
    EXPECT_FALSE(network->removeSatellite("B"));
    runRounds(*network, clock, 10);

    EXPECT_EQ(network->size(), 2u);
    EXPECT_EQ(network->getRegistry().find("B"), nullptr);
    EXPECT_TRUE(network->getSatellite("A")->routes().empty());
    EXPECT_TRUE(network->getSatellite("C")->routes().empty());
}

TEST_F(AgentTest, ReAddedSatelliteIsNotTakenForAReplay)
{
    build(3, {"B", "C", "D"});
    network->connect("B", "C", clock.now(), clock.now() + LONG_WINDOW, 1.0);
    network->connect("C", "D", clock.now(), clock.now() + LONG_WINDOW, 1.0);
    runRounds(*network, clock, 300);
    expectRoute("B", "D", "C", 2, 2.0);

    auto b = network->getSatellite("B");
    size_t duplicatesBefore = b->counters().duplicatesIgnored;

    ASSERT_TRUE(network->removeSatellite("C"));
    network->addSatellite("C");
    network->connect("B", "C", clock.now(), clock.now() + LONG_WINDOW, 1.0);
    network->connect("C", "D", clock.now(), clock.now() + LONG_WINDOW, 1.0);
    runRounds(*network, clock, 100);

    expectRoute("B", "D", "C", 2, 2.0);
    expectRoute("D", "B", "C", 2, 2.0);
    EXPECT_EQ(b->counters().duplicatesIgnored, duplicatesBefore);
    EXPECT_TRUE(routesUseActiveNeighbors(*network));
}

TEST_F(AgentTest, RingWithOneHopHorizonKeepsDirectRoutesOnly)
{
    buildRing(5, 1);
    runRounds(*network, clock, 30);

    for (const auto &agent : network->getAllSatellites())
    {
        auto routes = agent->routes();
        ASSERT_EQ(routes.size(), 2u) << agent->id();
        for (const auto &route : routes)
        {
            EXPECT_EQ(route.hopCount, 1);
            EXPECT_EQ(route.nextHop, route.destination);
        }
    }
    EXPECT_TRUE(hopsWithinHorizon(*network, 1));
}

// Non-adjacent nodes of a 5-ring are two relays away, inside a horizon of 2
TEST_F(AgentTest, RingWithTwoHopHorizonReachesEveryone)
{
    buildRing(5, 2);
    runRounds(*network, clock, 30);

    for (const auto &agent : network->getAllSatellites())
    {
        EXPECT_EQ(agent->routes().size(), 4u) << agent->id();
    }
    expectRoute("SAT-1", "SAT-3", "SAT-2", 2, 2.0);
    expectRoute("SAT-1", "SAT-4", "SAT-5", 2, 2.0);
    EXPECT_TRUE(hopsWithinHorizon(*network, 2));
    EXPECT_TRUE(routesUseActiveNeighbors(*network));
}

TEST_F(AgentTest, HorizonHidesFarSideOfLargerRing)
{
    buildRing(6, 2);
    runRounds(*network, clock, 30);

    auto first = network->getSatellite("SAT-1");
    EXPECT_EQ(first->routes().size(), 4u);
    EXPECT_FALSE(first->routeTo("SAT-4").has_value());
}

TEST_F(AgentTest, ExpiredLinkCascades)
{
    build(2, {"A", "B", "C"});
    SimTime t0 = clock.now();
    network->connect("A", "B", t0, t0 + Millis(10000), 1.0);
    network->connect("B", "C", t0, t0 + LONG_WINDOW, 1.0);

    runRounds(*network, clock, 95);
    expectRoute("A", "C", "B", 2, 2.0);
    EXPECT_EQ(network->getSatellite("A")->linkDuration("B"), Millis(10000));

    runRounds(*network, clock, 20);
    EXPECT_TRUE(network->getSatellite("A")->routes().empty());
    EXPECT_TRUE(network->getSatellite("A")->neighbors().empty());
    EXPECT_FALSE(network->getSatellite("B")->routeTo("A").has_value());
    EXPECT_FALSE(network->getSatellite("C")->routeTo("A").has_value());
    EXPECT_TRUE(routesUseActiveNeighbors(*network));
}

TEST_F(AgentTest, FutureWindowActivatesOnTime)
{
    build(2, {"A", "B"});
    SimTime opens = clock.now() + Millis(2000);
    network->connect("A", "B", opens, opens + LONG_WINDOW, 1.0);

    runRounds(*network, clock, 15);
    auto a = network->getSatellite("A");
    EXPECT_FALSE(a->routeTo("B").has_value());
    ASSERT_EQ(a->neighbors().size(), 1u);
    EXPECT_FALSE(a->neighbors()[0].active);

    runRounds(*network, clock, 10);
    expectRoute("A", "B", "B", 1, 1.0);
    expectRoute("B", "A", "A", 1, 1.0);
}

TEST_F(AgentTest, WindowOpeningMissedByCoarseStepStillActivates)
{
    build(2, {"A", "B"});
    SimTime opens = clock.now() + Millis(1000);
    network->connect("A", "B", opens, opens + LONG_WINDOW, 1.0);

    network->tickAll();
    clock.advance(Millis(5000));
    runRounds(*network, clock, 20);

    auto a = network->getSatellite("A");
    ASSERT_EQ(a->neighbors().size(), 1u);
    EXPECT_TRUE(a->neighbors()[0].active);
    expectRoute("A", "B", "B", 1, 1.0);
    expectRoute("B", "A", "A", 1, 1.0);
}

TEST_F(AgentTest, SilentNeighborGoesInactiveThenRecovers)
{
    build(2, {"A", "B"});
    network->connect("A", "B", clock.now(), clock.now() + LONG_WINDOW, 1.0);
    runRounds(*network, clock, 10);

    auto a = network->getSatellite("A");
    for (int i = 0; i < 40; ++i)
    {
        a->tick();
        clock.advance(Millis(100));
    }

    EXPECT_TRUE(a->routes().empty());
    ASSERT_EQ(a->neighbors().size(), 1u);
    EXPECT_FALSE(a->neighbors()[0].active);

    runRounds(*network, clock, 20);
    expectRoute("A", "B", "B", 1, 1.0);
    EXPECT_TRUE(routesUseActiveNeighbors(*network));
}

TEST_F(AgentTest, LinkUpdateChangesCosts)
{
    buildLine();
    runRounds(*network, clock, 30);

    network->updateLink("A", "B", 0.5);
    runRounds(*network, clock, 80);

    expectRoute("A", "B", "B", 1, 1.2);
    expectRoute("B", "A", "A", 1, 1.2);
    expectRoute("A", "C", "B", 2, 2.2);
    expectRoute("C", "A", "B", 2, 2.2);
}

TEST_F(AgentTest, ZeroQualityUpdateWithdrawsRoutes)
{
    buildLine();
    runRounds(*network, clock, 30);

    network->updateLink("A", "B", 0.0);
    runRounds(*network, clock, 20);

    EXPECT_TRUE(network->getSatellite("A")->routes().empty());
    EXPECT_FALSE(network->getSatellite("B")->routeTo("A").has_value());
    EXPECT_FALSE(network->getSatellite("C")->routeTo("A").has_value());
    expectRoute("C", "B", "B", 1, 1.0);
    EXPECT_TRUE(routesUseActiveNeighbors(*network));
}

TEST_F(AgentTest, InvalidEventsAreCountedAndDropped)
{
    build(2, {"A"});
    auto a = network->getSatellite("A");
    SimTime now = clock.now();

    a->postEvent(NeighborEvent::add("B", now, now + LONG_WINDOW, 1.5));
    a->postEvent(NeighborEvent::add("A", now, now + LONG_WINDOW, 1.0));
    a->postEvent(NeighborEvent::add("B", now + Millis(10), now, 1.0));
    a->postEvent(NeighborEvent::update("B", std::nullopt, std::nullopt, -5.0));
    a->postEvent(NeighborEvent::add("", now, now + LONG_WINDOW, 1.0));
    a->tick();

    AgentCounters counters = a->counters();
    EXPECT_EQ(counters.invalidEvents, 5u);
    EXPECT_EQ(counters.eventsApplied, 0u);
    EXPECT_TRUE(a->neighbors().empty());

    // Valid but unknown neighbor: applied, nothing changes
    a->postEvent(NeighborEvent::update("B", 0.5));
    a->tick();
    EXPECT_EQ(a->counters().eventsApplied, 1u);
    EXPECT_TRUE(a->neighbors().empty());
}

TEST_F(AgentTest, TickIsRejectedWhileRunning)
{
    build(2, {"A"});
    auto a = network->getSatellite("A");

    EXPECT_TRUE(a->start());
    EXPECT_FALSE(a->start());
    EXPECT_THROW(a->tick(), std::logic_error);
    a->stop();
    EXPECT_FALSE(a->isRunning());
    EXPECT_NO_THROW(a->tick());
}

TEST_F(AgentTest, ConstructorValidatesSettings)
{
    AgentRegistry registry;
    AgentSettings bad = makeTestSettings(0);
    EXPECT_THROW(SatelliteAgent("X", bad, clock, registry), std::invalid_argument);

    AgentSettings inverted = makeTestSettings(2);
    inverted.jitterMin = Millis(500);
    inverted.jitterMax = Millis(100);
    EXPECT_THROW(SatelliteAgent("X", inverted, clock, registry), std::invalid_argument);

    EXPECT_THROW(SatelliteAgent("", makeTestSettings(2), clock, registry), std::invalid_argument);
}

TEST_F(AgentTest, SnapshotCarriesState)
{
    buildLine();
    runRounds(*network, clock, 30);

    auto b = network->getSatellite("B");
    b->updateMetadata(nlohmann::json{{"frequency_band", "X"}});
    b->setCoordinates(nlohmann::json{{"latitude", 10.0}, {"longitude", 20.0}, {"altitude", 550.0}});

    nlohmann::json j = b->toJson();
    EXPECT_EQ(j.at("id"), "B");
    EXPECT_EQ(j.at("k_hops"), 2);
    EXPECT_EQ(j.at("cost_model"), "composite");
    EXPECT_EQ(j.at("neighbors").size(), 2u);
    EXPECT_EQ(j.at("routes").size(), 2u);
    EXPECT_EQ(j.at("metadata").at("frequency_band"), "X");
    EXPECT_DOUBLE_EQ(j.at("coordinates").at("altitude").get<double>(), 550.0);
    EXPECT_GT(j.at("counters").at("updates_sent").get<size_t>(), 0u);

    nlohmann::json all = network->toJson();
    EXPECT_EQ(all.at("satellites").size(), 3u);
    EXPECT_EQ(network->snapshots().size(), 3u);
}

TEST_F(AgentTest, UnknownEndpointsAreRejected)
{
    build(2, {"A"});
    EXPECT_THROW(network->connect("A", "Z", clock.now(), clock.now() + LONG_WINDOW), std::invalid_argument);
    EXPECT_THROW(network->disconnect("Z", "A"), std::invalid_argument);
    EXPECT_THROW(network->addSatellite("A"), std::invalid_argument);
}
