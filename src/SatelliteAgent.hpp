#pragma once
#include "AgentRegistry.hpp"
#include "Clock.hpp"
#include "CostModel.hpp"
#include "MessageDispatcher.hpp"
#include "NeighborEvent.hpp"
#include "NeighborTable.hpp"
#include "NodeMetadata.hpp"
#include "RoutingEngine.hpp"
#include "RoutingTable.hpp"
#include "utils.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

struct AgentSettings
{
    int kHops = 3;
    Millis updateInterval{5000};
    Millis livenessInterval{5000};
    Millis maxRouteAge{15000};
    Millis jitterMin{100};
    Millis jitterMax{300};
    std::string authKey;
    unsigned int seed = 0;
    std::shared_ptr<const LinkCostModel> costModel;

    static AgentSettings fromConfig(const MeshConfig &config);
};

struct AgentCounters
{
    size_t messagesProcessed = 0;
    size_t updatesSent = 0;
    size_t failedDeliveries = 0;
    size_t duplicatesIgnored = 0;
    size_t authFailures = 0;
    size_t routesAccepted = 0;
    size_t eventsApplied = 0;
    size_t invalidEvents = 0;
};

struct AgentSnapshot
{
    std::string id;
    SimTime takenAt;
    std::vector<NeighborInfo> neighbors;
    std::vector<RouteEntry> routes;
    AgentCounters counters;
};

void to_json(nlohmann::json &j, const NeighborInfo &neighbor);
void to_json(nlohmann::json &j, const AgentCounters &counters);
void to_json(nlohmann::json &j, const AgentSnapshot &snapshot);

// One satellite: its neighbor and routing state, inbound queues and the
// control loop that drives periodic advertisements, liveness checks and
// stale-route collection.
//
// Each cycle applies queued neighbor events first, then queued routing
// messages, then whichever timers are due.
class SatelliteAgent
{
public:
    SatelliteAgent(std::string id, AgentSettings settings, Clock &clock, AgentRegistry &registry,
                   const SatelliteMetadata &metadata = SatelliteMetadata());
    ~SatelliteAgent();

    SatelliteAgent(const SatelliteAgent &) = delete;
    SatelliteAgent &operator=(const SatelliteAgent &) = delete;

    const std::string &id() const { return selfId; }

    bool start();
    void stop();
    bool isRunning() const;

    // Runs one cycle on the calling thread. Only valid while stopped.
    void tick();

    void postEvent(const NeighborEvent &event);
    void deliver(const RoutingMessage &message);

    std::vector<NeighborInfo> neighbors() const;
    std::vector<std::string> activeNeighbors() const;
    std::vector<RouteEntry> routes() const;
    std::optional<RouteEntry> routeTo(const std::string &destination) const;
    std::optional<Millis> linkDuration(const std::string &neighbor) const;
    AgentCounters counters() const;
    AgentSnapshot snapshot() const;
    nlohmann::json toJson() const;

    SatelliteMetadata metadata() const;
    void updateMetadata(const nlohmann::json &fields);
    Coordinates coordinates() const;
    void setCoordinates(const nlohmann::json &position);

    const AgentSettings &getSettings() const { return settings; }

private:
    void runLoop();
    void runCycle();

    void applyEvent(const NeighborEvent &event, SimTime now);
    bool validateEvent(const NeighborEvent &event) const;
    void handleMessage(const RoutingMessage &message, SimTime now);
    void runLivenessCheck(SimTime now);
    void broadcastRoutes(SimTime now);

    void requestImmediateBroadcast(SimTime now);
    void scheduleJitteredBroadcast(SimTime now);
    SimTime nextDeadline(SimTime now) const;

    std::string selfId;
    AgentSettings settings;
    Clock &clock;

    NeighborTable neighborTable;
    RoutingTable routingTable;
    RoutingEngine engine;
    MessageDispatcher dispatcher;
    NodeMetadata nodeMetadata;

    mutable std::mutex queueMutex;
    std::condition_variable queueCv;
    std::deque<NeighborEvent> eventQueue;
    std::deque<RoutingMessage> inbox;

    std::atomic<bool> running;
    std::atomic<bool> stopRequested;
    std::thread loopThread;

    // Owned by whichever thread runs cycles
    bool timersStarted = false;
    SimTime nextLivenessAt;
    SimTime nextCleanupAt;
    SimTime nextUpdateAt;
    std::optional<SimTime> pendingBroadcastAt;
    std::mt19937 rng;

    std::atomic<size_t> messagesProcessed{0};
    std::atomic<size_t> updatesSent{0};
    std::atomic<size_t> duplicatesIgnored{0};
    std::atomic<size_t> authFailures{0};
    std::atomic<size_t> routesAccepted{0};
    std::atomic<size_t> eventsApplied{0};
    std::atomic<size_t> invalidEvents{0};
};
