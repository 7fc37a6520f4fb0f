#pragma once
#include "CostModel.hpp"
#include "utils.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct NeighborInfo
{
    std::string id;
    double quality = 1.0;
    SimTime startTime;
    SimTime endTime;
    SimTime lastSeen;
    double signalStrength = 0.0;
    double bandwidthAvailable = 0.0;
    bool active = false;
    bool pending = false; // window has not opened yet

    bool windowContains(SimTime t) const { return startTime <= t && t <= endTime; }
};

struct LivenessReport
{
    std::vector<std::string> expired;     // window closed, entry removed
    std::vector<std::string> deactivated; // silent for too long, entry kept
    std::vector<std::string> activated;   // pending window opened since last check

    bool empty() const { return expired.empty() && deactivated.empty() && activated.empty(); }
};

// Per-agent table of links and their visibility windows.
class NeighborTable
{
public:
    explicit NeighborTable(std::shared_ptr<const LinkCostModel> costModel);

    // Creates or overwrites the entry. Returns true when the link is usable now.
    bool addNeighbor(const std::string &id, SimTime start, SimTime end, double quality, SimTime now);

    // Merges the given fields into an existing entry. Returns false for an
    // unknown neighbor.
    bool updateNeighbor(const std::string &id, std::optional<double> quality,
                        std::optional<double> signal, std::optional<double> bandwidth, SimTime now);

    bool removeNeighbor(const std::string &id);

    // Sign of life from a neighbor. Returns true when the neighbor is active
    // afterwards.
    bool touch(const std::string &id, SimTime now);

    LivenessReport checkLiveness(SimTime now, Millis silenceTimeout);

    // Earliest instant after `now` at which a window opens or closes.
    std::optional<SimTime> nextWindowEdge(SimTime now) const;

    double linkCost(const std::string &id) const;
    bool isActive(const std::string &id) const;
    std::vector<std::string> getActiveNeighbors() const;
    std::vector<NeighborInfo> snapshot() const;
    std::optional<NeighborInfo> find(const std::string &id) const;
    std::optional<Millis> linkDuration(const std::string &id) const;
    size_t size() const;

    std::string costModelName() const { return costModel->name(); }

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, NeighborInfo> neighbors;
    std::shared_ptr<const LinkCostModel> costModel;
};
