#include "MeshNetwork.hpp"
#include <stdexcept>

MeshNetwork::MeshNetwork(AgentSettings settings, Clock &clock)
    : settings(std::move(settings)), clock(clock)
{
}

MeshNetwork::~MeshNetwork()
{
    stopAll();
}

std::shared_ptr<SatelliteAgent> MeshNetwork::addSatellite(const std::string &id)
{
    return addSatellite(id, SatelliteMetadata());
}

std::shared_ptr<SatelliteAgent> MeshNetwork::addSatellite(const std::string &id, const SatelliteMetadata &metadata)
{
    auto agent = std::make_shared<SatelliteAgent>(id, settings, clock, registry, metadata);
    registry.add(agent);

    bool startNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        satellites[id] = agent;
        startNow = running;
    }
    if (startNow)
        agent->start();
    return agent;
}

bool MeshNetwork::removeSatellite(const std::string &id)
{
    std::shared_ptr<SatelliteAgent> agent;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = satellites.find(id);
        if (it == satellites.end())
            return false;
        agent = it->second;
        satellites.erase(it);
    }

    agent->stop();
    registry.remove(id);
    for (const auto &other : getAllSatellites())
    {
        other->postEvent(NeighborEvent::remove(id));
    }
    return true;
}

std::shared_ptr<SatelliteAgent> MeshNetwork::getSatellite(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = satellites.find(id);
    if (it == satellites.end())
        return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<SatelliteAgent>> MeshNetwork::getAllSatellites() const
{
    std::vector<std::shared_ptr<SatelliteAgent>> result;
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[id, agent] : satellites)
    {
        result.push_back(agent);
    }
    return result;
}

std::vector<std::string> MeshNetwork::ids() const
{
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[id, agent] : satellites)
    {
        result.push_back(id);
    }
    return result;
}

size_t MeshNetwork::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return satellites.size();
}

std::shared_ptr<SatelliteAgent> MeshNetwork::require(const std::string &id) const
{
    auto agent = getSatellite(id);
    if (!agent)
    {
        throw std::invalid_argument("Unknown satellite: " + id);
    }
    return agent;
}

void MeshNetwork::connect(const std::string &a, const std::string &b, SimTime start, SimTime end, double quality)
{
    auto first = require(a);
    auto second = require(b);
    first->postEvent(NeighborEvent::add(b, start, end, quality));
    second->postEvent(NeighborEvent::add(a, start, end, quality));
}

void MeshNetwork::disconnect(const std::string &a, const std::string &b)
{
    auto first = require(a);
    auto second = require(b);
    first->postEvent(NeighborEvent::remove(b));
    second->postEvent(NeighborEvent::remove(a));
}

void MeshNetwork::updateLink(const std::string &a, const std::string &b, std::optional<double> quality,
                             std::optional<double> signal, std::optional<double> bandwidth)
{
    auto first = require(a);
    auto second = require(b);
    first->postEvent(NeighborEvent::update(b, quality, signal, bandwidth));
    second->postEvent(NeighborEvent::update(a, quality, signal, bandwidth));
}

void MeshNetwork::startAll()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        running = true;
    }
    for (const auto &agent : getAllSatellites())
    {
        agent->start();
    }
}

void MeshNetwork::stopAll()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        running = false;
    }
    for (const auto &agent : getAllSatellites())
    {
        agent->stop();
    }
}

bool MeshNetwork::isRunning() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return running;
}

void MeshNetwork::tickAll()
{
    for (const auto &agent : getAllSatellites())
    {
        agent->tick();
    }
}

std::vector<AgentSnapshot> MeshNetwork::snapshots() const
{
    std::vector<AgentSnapshot> result;
    for (const auto &agent : getAllSatellites())
    {
        result.push_back(agent->snapshot());
    }
    return result;
}

nlohmann::json MeshNetwork::toJson() const
{
    nlohmann::json satellitesJson = nlohmann::json::array();
    for (const auto &agent : getAllSatellites())
    {
        satellitesJson.push_back(agent->toJson());
    }
    return nlohmann::json{{"time_ms", toMillis(clock.now())},
                          {"k_hops", settings.kHops},
                          {"satellites", satellitesJson}};
}
