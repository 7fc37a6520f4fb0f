#include "SatelliteAgent.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

using json = nlohmann::json;

AgentSettings AgentSettings::fromConfig(const MeshConfig &config)
{
    AgentSettings settings;
    settings.kHops = config.kHops;
    settings.updateInterval = config.updateInterval;
    settings.livenessInterval = config.livenessInterval;
    settings.maxRouteAge = config.maxRouteAge;
    settings.jitterMin = config.jitterMin;
    settings.jitterMax = config.jitterMax;
    settings.authKey = config.authKey;
    settings.seed = config.seed;
    settings.costModel = makeCostModel(config.costModel);
    return settings;
}

void to_json(json &j, const NeighborInfo &neighbor)
{
    j = json{{"id", neighbor.id},
             {"quality", neighbor.quality},
             {"start_ms", toMillis(neighbor.startTime)},
             {"end_ms", toMillis(neighbor.endTime)},
             {"last_seen_ms", toMillis(neighbor.lastSeen)},
             {"signal_strength", neighbor.signalStrength},
             {"bandwidth_available", neighbor.bandwidthAvailable},
             {"active", neighbor.active},
             {"pending", neighbor.pending}};
}

void to_json(json &j, const AgentCounters &counters)
{
    j = json{{"messages_processed", counters.messagesProcessed},
             {"updates_sent", counters.updatesSent},
             {"failed_deliveries", counters.failedDeliveries},
             {"duplicates_ignored", counters.duplicatesIgnored},
             {"auth_failures", counters.authFailures},
             {"routes_accepted", counters.routesAccepted},
             {"events_applied", counters.eventsApplied},
             {"invalid_events", counters.invalidEvents}};
}

void to_json(json &j, const AgentSnapshot &snapshot)
{
    j = json{{"id", snapshot.id},
             {"taken_at_ms", toMillis(snapshot.takenAt)},
             {"neighbors", snapshot.neighbors},
             {"routes", snapshot.routes},
             {"counters", snapshot.counters}};
}

SatelliteAgent::SatelliteAgent(std::string id, AgentSettings agentSettings, Clock &clock,
                               AgentRegistry &registry, const SatelliteMetadata &metadata)
    : selfId(std::move(id)),
      settings(std::move(agentSettings)),
      clock(clock),
      neighborTable(settings.costModel ? settings.costModel : makeCostModel("composite")),
      engine(selfId, settings.kHops, settings.maxRouteAge, neighborTable, routingTable,
             registry.issueSequenceBase()),
      dispatcher(selfId, registry),
      nodeMetadata(metadata),
      running(false),
      stopRequested(false)
{
    if (selfId.empty())
    {
        throw std::invalid_argument("Agent id must not be empty");
    }
    if (settings.kHops < 1)
    {
        throw std::invalid_argument("k_hops must be at least 1");
    }
    if (settings.jitterMin > settings.jitterMax)
    {
        throw std::invalid_argument("jitter range is inverted");
    }

    if (settings.seed == 0)
    {
        std::random_device device;
        rng.seed(device());
    }
    else
    {
        rng.seed(settings.seed + static_cast<unsigned int>(std::hash<std::string>{}(selfId)));
    }
}

SatelliteAgent::~SatelliteAgent()
{
    stop();
}

bool SatelliteAgent::start()
{
    if (running.load())
    {
        return false;
    }

    stopRequested.store(false);
    running.store(true);
    loopThread = std::thread(&SatelliteAgent::runLoop, this);
    logDebug(selfId, "agent started");
    return true;
}

void SatelliteAgent::stop()
{
    if (!running.load())
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopRequested.store(true);
    }
    queueCv.notify_all();

    if (loopThread.joinable())
    {
        loopThread.join();
    }
    running.store(false);
    logDebug(selfId, "agent stopped");
}

bool SatelliteAgent::isRunning() const
{
    return running.load();
}

void SatelliteAgent::tick()
{
    if (running.load())
    {
        throw std::logic_error("tick() called while the agent loop is running");
    }
    runCycle();
}

void SatelliteAgent::postEvent(const NeighborEvent &event)
{
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        eventQueue.push_back(event);
    }
    queueCv.notify_one();
}

void SatelliteAgent::deliver(const RoutingMessage &message)
{
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        inbox.push_back(message);
    }
    queueCv.notify_one();
}

void SatelliteAgent::runLoop()
{
    while (!stopRequested.load())
    {
        try
        {
            runCycle();
        }
        catch (const std::exception &e)
        {
            logError(selfId, std::string("cycle failed: ") + e.what());
        }

        SimTime now = clock.now();
        Millis untilDeadline = std::chrono::duration_cast<Millis>(nextDeadline(now) - now);
        Millis wait = clock.wallWaitFor(untilDeadline);

        std::unique_lock<std::mutex> lock(queueMutex);
        queueCv.wait_for(lock, wait, [this]()
                         { return stopRequested.load() || !eventQueue.empty() || !inbox.empty(); });
    }
}

void SatelliteAgent::runCycle()
{
    SimTime now = clock.now();

    if (!timersStarted)
    {
        timersStarted = true;
        nextLivenessAt = now + settings.livenessInterval;
        nextCleanupAt = now + settings.updateInterval;
        nextUpdateAt = now;
    }

    std::deque<NeighborEvent> events;
    std::deque<RoutingMessage> messages;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        events.swap(eventQueue);
        messages.swap(inbox);
    }

    // Neighbor changes must be visible before messages that depend on them
    for (const auto &event : events)
    {
        applyEvent(event, now);
    }
    for (const auto &message : messages)
    {
        handleMessage(message, now);
    }

    auto edge = neighborTable.nextWindowEdge(now - Millis(1));
    if (now >= nextLivenessAt)
    {
        runLivenessCheck(now);
        nextLivenessAt = now + settings.livenessInterval;
    }
    else if (edge && *edge <= now)
    {
        runLivenessCheck(now);
    }

    if (now >= nextCleanupAt)
    {
        size_t removed = engine.cleanupStaleRoutes(now);
        if (removed > 0)
        {
            logDebug(selfId, "collected " + std::to_string(removed) + " stale route(s)");
        }
        nextCleanupAt = now + settings.updateInterval;
    }

    bool periodic = now >= nextUpdateAt;
    bool triggered = pendingBroadcastAt && now >= *pendingBroadcastAt;
    if (periodic || triggered)
    {
        broadcastRoutes(now);
        pendingBroadcastAt.reset();
        if (periodic)
        {
            nextUpdateAt = now + settings.updateInterval;
        }
    }
}

bool SatelliteAgent::validateEvent(const NeighborEvent &event) const
{
    if (event.neighborId.empty() || event.neighborId == selfId)
        return false;

    if (event.quality && (*event.quality < 0.0 || *event.quality > 1.0))
        return false;

    switch (event.type)
    {
    case NeighborEvent::Type::Add:
        return event.endTime >= event.startTime;
    case NeighborEvent::Type::Update:
        return !event.bandwidth || *event.bandwidth >= 0.0;
    case NeighborEvent::Type::Remove:
        return true;
    }
    return false;
}

void SatelliteAgent::applyEvent(const NeighborEvent &event, SimTime now)
{
    if (!validateEvent(event))
    {
        ++invalidEvents;
        logWarn(selfId, std::string("invalid ") + toString(event.type) + " event for '" +
                            event.neighborId + "' dropped");
        return;
    }
    ++eventsApplied;

    const std::string &id = event.neighborId;
    switch (event.type)
    {
    case NeighborEvent::Type::Add:
    {
        double quality = event.quality.value_or(1.0);
        bool usable = neighborTable.addNeighbor(id, event.startTime, event.endTime, quality, now) &&
                      !std::isinf(neighborTable.linkCost(id));
        if (usable)
        {
            engine.installDirectRoute(id, now);
            requestImmediateBroadcast(now);
            logInfo(selfId, "neighbor " + id + " added (quality " + std::to_string(quality) +
                                ", until " + formatTime(event.endTime) + ")");
        }
        else
        {
            if (engine.dropRoutesVia(id) > 0)
                scheduleJitteredBroadcast(now);
            if (neighborTable.isActive(id))
                logInfo(selfId, "neighbor " + id + " added with an unusable link");
            else
                logInfo(selfId, "neighbor " + id + " added, window opens at " + formatTime(event.startTime));
        }
        break;
    }
    case NeighborEvent::Type::Update:
    {
        if (!neighborTable.updateNeighbor(id, event.quality, event.signalStrength, event.bandwidth, now))
        {
            logWarn(selfId, "UPDATE for unknown neighbor " + id + " ignored");
            break;
        }
        // Inactive or quality 0: nothing may be routed through it
        if (std::isinf(neighborTable.linkCost(id)))
        {
            if (engine.dropRoutesVia(id) > 0)
                scheduleJitteredBroadcast(now);
        }
        else if (engine.installDirectRoute(id, now))
        {
            requestImmediateBroadcast(now);
        }
        logDebug(selfId, "neighbor " + id + " updated");
        break;
    }
    case NeighborEvent::Type::Remove:
    {
        engine.forgetSender(id);
        if (!neighborTable.removeNeighbor(id))
        {
            logDebug(selfId, "REMOVE for unknown neighbor " + id);
            break;
        }
        // Destinations still reachable through others come back with their
        // next advertisements
        size_t dropped = engine.dropRoutesVia(id);
        if (dropped > 0)
            scheduleJitteredBroadcast(now);
        logInfo(selfId, "neighbor " + id + " removed, " + std::to_string(dropped) + " route(s) dropped");
        break;
    }
    }
}

void SatelliteAgent::handleMessage(const RoutingMessage &message, SimTime now)
{
    if (!verifyMessage(message, settings.authKey))
    {
        ++authFailures;
        logWarn(selfId, "HMAC verification failed for update #" + std::to_string(message.sequence) +
                            " from " + message.sender + ", dropped");
        return;
    }
    ++messagesProcessed;

    if (engine.alreadySeen(message))
    {
        ++duplicatesIgnored;
        return;
    }

    // A fresh advertisement is also a sign of life of its sender
    if (neighborTable.touch(message.sender, now))
    {
        if (engine.installDirectRoute(message.sender, now))
            scheduleJitteredBroadcast(now);
    }

    AdvertisementResult result = engine.processAdvertisement(message, now);
    if (result.duplicate)
    {
        ++duplicatesIgnored;
        return;
    }
    if (result.ignored)
    {
        logDebug(selfId, "update from non-neighbor " + message.sender + " ignored");
        return;
    }

    routesAccepted += static_cast<size_t>(result.accepted);
    if (result.changed())
    {
        logDebug(selfId, "update #" + std::to_string(message.sequence) + " from " + message.sender +
                             ": " + std::to_string(result.accepted) + " accepted, " +
                             std::to_string(result.withdrawn) + " withdrawn");
        scheduleJitteredBroadcast(now);
    }
}

void SatelliteAgent::runLivenessCheck(SimTime now)
{
    LivenessReport report = neighborTable.checkLiveness(now, settings.livenessInterval * 2);
    if (report.empty())
        return;

    bool changed = false;
    for (const auto &id : report.expired)
    {
        engine.forgetSender(id);
        size_t dropped = engine.dropRoutesVia(id);
        changed = changed || dropped > 0;
        logInfo(selfId, "link to " + id + " expired, " + std::to_string(dropped) + " route(s) dropped");
    }
    for (const auto &id : report.deactivated)
    {
        size_t dropped = engine.dropRoutesVia(id);
        changed = changed || dropped > 0;
        logInfo(selfId, "neighbor " + id + " silent, marked inactive");
    }
    if (changed)
    {
        scheduleJitteredBroadcast(now);
    }

    for (const auto &id : report.activated)
    {
        engine.installDirectRoute(id, now);
        requestImmediateBroadcast(now);
        logInfo(selfId, "link to " + id + " window opened");
    }
}

void SatelliteAgent::broadcastRoutes(SimTime now)
{
    // Both tables are snapshotted and unlocked before anything is delivered
    auto targets = neighborTable.getActiveNeighbors();
    if (targets.empty())
        return;

    RoutingMessage message = engine.buildAdvertisement(now);
    signMessage(message, settings.authKey);

    size_t delivered = dispatcher.broadcast(targets, message);
    ++updatesSent;
    nodeMetadata.recordTransmission(static_cast<long long>(targets.size()), static_cast<long long>(delivered));

    logDebug(selfId, "update #" + std::to_string(message.sequence) + " with " +
                         std::to_string(message.routes.size()) + " route(s) sent to " +
                         std::to_string(delivered) + "/" + std::to_string(targets.size()) + " neighbor(s)");
}

void SatelliteAgent::requestImmediateBroadcast(SimTime now)
{
    pendingBroadcastAt = now;
}

void SatelliteAgent::scheduleJitteredBroadcast(SimTime now)
{
    std::uniform_int_distribution<long long> jitter(settings.jitterMin.count(), settings.jitterMax.count());
    SimTime at = now + Millis(jitter(rng));
    if (!pendingBroadcastAt || at < *pendingBroadcastAt)
    {
        pendingBroadcastAt = at;
    }
}

SimTime SatelliteAgent::nextDeadline(SimTime now) const
{
    SimTime deadline = std::min({nextLivenessAt, nextCleanupAt, nextUpdateAt});
    if (pendingBroadcastAt)
        deadline = std::min(deadline, *pendingBroadcastAt);
    auto edge = neighborTable.nextWindowEdge(now);
    if (edge)
        deadline = std::min(deadline, *edge);
    return deadline;
}

std::vector<NeighborInfo> SatelliteAgent::neighbors() const
{
    return neighborTable.snapshot();
}

std::vector<std::string> SatelliteAgent::activeNeighbors() const
{
    return neighborTable.getActiveNeighbors();
}

std::vector<RouteEntry> SatelliteAgent::routes() const
{
    return routingTable.entries();
}

std::optional<RouteEntry> SatelliteAgent::routeTo(const std::string &destination) const
{
    return routingTable.find(destination);
}

std::optional<Millis> SatelliteAgent::linkDuration(const std::string &neighbor) const
{
    return neighborTable.linkDuration(neighbor);
}

AgentCounters SatelliteAgent::counters() const
{
    AgentCounters c;
    c.messagesProcessed = messagesProcessed.load();
    c.updatesSent = updatesSent.load();
    c.failedDeliveries = dispatcher.getTrafficStats().failedDeliveries;
    c.duplicatesIgnored = duplicatesIgnored.load();
    c.authFailures = authFailures.load();
    c.routesAccepted = routesAccepted.load();
    c.eventsApplied = eventsApplied.load();
    c.invalidEvents = invalidEvents.load();
    return c;
}

AgentSnapshot SatelliteAgent::snapshot() const
{
    AgentSnapshot snap;
    snap.id = selfId;
    snap.takenAt = clock.now();
    snap.neighbors = neighborTable.snapshot();
    snap.routes = routingTable.entries();
    snap.counters = counters();
    return snap;
}

json SatelliteAgent::toJson() const
{
    json j = snapshot();
    j["metadata"] = nodeMetadata.get();
    j["coordinates"] = nodeMetadata.coordinates();
    j["k_hops"] = settings.kHops;
    j["cost_model"] = neighborTable.costModelName();
    return j;
}

SatelliteMetadata SatelliteAgent::metadata() const
{
    return nodeMetadata.get();
}

void SatelliteAgent::updateMetadata(const json &fields)
{
    nodeMetadata.update(fields);
}

Coordinates SatelliteAgent::coordinates() const
{
    return nodeMetadata.coordinates();
}

void SatelliteAgent::setCoordinates(const json &position)
{
    nodeMetadata.setCoordinates(position);
}
