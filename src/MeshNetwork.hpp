#pragma once
#include "AgentRegistry.hpp"
#include "Clock.hpp"
#include "SatelliteAgent.hpp"
#include "utils.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// One isolated simulation: a registry and the agents registered in it.
class MeshNetwork
{
public:
    MeshNetwork(AgentSettings settings, Clock &clock);
    ~MeshNetwork();

    MeshNetwork(const MeshNetwork &) = delete;
    MeshNetwork &operator=(const MeshNetwork &) = delete;

    std::shared_ptr<SatelliteAgent> addSatellite(const std::string &id);
    std::shared_ptr<SatelliteAgent> addSatellite(const std::string &id, const SatelliteMetadata &metadata);

    // Stops the agent, tells every other agent to drop it, unregisters it.
    bool removeSatellite(const std::string &id);

    std::shared_ptr<SatelliteAgent> getSatellite(const std::string &id) const;
    std::vector<std::shared_ptr<SatelliteAgent>> getAllSatellites() const;
    std::vector<std::string> ids() const;
    size_t size() const;

    // ADD on both ends. Throws std::invalid_argument for unknown endpoints.
    void connect(const std::string &a, const std::string &b, SimTime start, SimTime end, double quality = 1.0);
    void disconnect(const std::string &a, const std::string &b);
    void updateLink(const std::string &a, const std::string &b, std::optional<double> quality,
                    std::optional<double> signal = std::nullopt, std::optional<double> bandwidth = std::nullopt);

    void startAll();
    void stopAll();
    bool isRunning() const;

    // One synchronous cycle of every agent, in id order.
    void tickAll();

    std::vector<AgentSnapshot> snapshots() const;
    nlohmann::json toJson() const;

    AgentRegistry &getRegistry() { return registry; }
    Clock &getClock() { return clock; }
    const AgentSettings &getSettings() const { return settings; }

private:
    std::shared_ptr<SatelliteAgent> require(const std::string &id) const;

    AgentSettings settings;
    Clock &clock;
    AgentRegistry registry;
    bool running = false;
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<SatelliteAgent>> satellites;
};
