#pragma once
#include "NeighborTable.hpp"
#include "RoutingMessage.hpp"
#include "RoutingTable.hpp"
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

// (sender, sequence) pairs already processed. Sequences far behind the
// newest one seen from a sender count as seen and are pruned.
class SeenSet
{
public:
    static constexpr uint64_t WINDOW = 1024;

    // Returns false if the pair was already seen.
    bool insert(const std::string &sender, uint64_t sequence);
    bool contains(const std::string &sender, uint64_t sequence) const;
    void forget(const std::string &sender);
    size_t size() const;

private:
    struct SenderHistory
    {
        uint64_t highest = 0;
        std::set<uint64_t> sequences;
    };

    mutable std::mutex mutex;
    std::unordered_map<std::string, SenderHistory> history;
};

struct AdvertisementResult
{
    bool duplicate = false;
    bool ignored = false; // sender is not an active neighbor
    int accepted = 0;
    int refreshed = 0;
    int rejected = 0;
    int withdrawn = 0;

    bool changed() const { return accepted > 0 || withdrawn > 0; }
};

class RoutingEngine
{
public:
    // Advertisements are numbered from firstSequence + 1.
    RoutingEngine(std::string selfId, int kHops, Millis maxRouteAge,
                  NeighborTable &neighbors, RoutingTable &routes, uint64_t firstSequence = 0);

    AdvertisementResult processAdvertisement(const RoutingMessage &message, SimTime now);

    bool alreadySeen(const RoutingMessage &message) const;

    // Drops the duplicate history of a sender that left the mesh.
    void forgetSender(const std::string &sender);

    // 1-hop route to a usable neighbor. Returns true if the table changed.
    bool installDirectRoute(const std::string &neighbor, SimTime now);

    // Drops every route through `neighbor`.
    size_t dropRoutesVia(const std::string &neighbor);

    size_t cleanupStaleRoutes(SimTime now);

    // Next sequence number and every route below the horizon.
    RoutingMessage buildAdvertisement(SimTime now);

    uint64_t currentSequence() const { return sequence; }
    int horizon() const { return kHops; }
    Millis routeAgeLimit() const { return maxRouteAge; }

private:
    std::string selfId;
    int kHops;
    Millis maxRouteAge;
    NeighborTable &neighbors;
    RoutingTable &routes;
    SeenSet seen;
    uint64_t sequence;
};
