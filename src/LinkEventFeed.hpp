#pragma once
#include "MeshNetwork.hpp"
#include "utils.hpp"
#include <string>
#include <vector>

struct TopologyRecord
{
    std::string source;
    std::string destination;
    SimTime startTime;
    SimTime endTime;
    std::string linkType;
};

// Turns topology records into ADD events as their windows open. Only
// LEO_LEO links enter the routing mesh.
class LinkEventFeed
{
public:
    static constexpr const char *MESH_LINK_TYPE = "LEO_LEO";

    explicit LinkEventFeed(MeshNetwork &network, double linkQuality = 0.9, bool bidirectional = true);

    void load(const std::vector<TopologyRecord> &records);

    // Satellites named by the loaded mesh links, sorted.
    std::vector<std::string> satelliteIds() const;

    // Creates any satellite the records name that the network does not have yet.
    void createSatellites();

    // Dispatches ADD events for every record whose window has opened by `now`.
    // Returns the number of records dispatched.
    size_t pump(SimTime now);

    size_t pendingCount() const { return pending.size(); }
    size_t filteredCount() const { return filtered; }
    size_t expiredCount() const { return expired; }

    // "SAT-12 Transmitter" -> "SAT-12"
    static std::string nodeIdOf(const std::string &endpoint);

private:
    MeshNetwork &network;
    double linkQuality;
    bool bidirectional;
    std::vector<TopologyRecord> pending;
    size_t filtered = 0;
    size_t expired = 0;
};
