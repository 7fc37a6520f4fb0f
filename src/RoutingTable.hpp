#pragma once
#include "utils.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RouteEntry
{
    std::string destination;
    std::string nextHop;
    int hopCount = 0;
    double cost = 1.0;
    SimTime timestamp;
};

void to_json(nlohmann::json &j, const RouteEntry &route);

struct Advertised
{
    int hopCount = 0;
    double cost = 0.0;

    bool operator==(const Advertised &other) const
    {
        return hopCount == other.hopCount && cost == other.cost;
    }
};

enum class OfferResult
{
    Installed,
    Refreshed,
    Rejected
};

// Distance-vector table: one entry per destination.
class RoutingTable
{
public:
    // Installs `candidate` if there is no route, it has fewer hops, it has
    // equal hops and lower cost, or the current entry is older than maxAge.
    // An identical offer from the current next hop only refreshes the timestamp.
    OfferResult offer(const RouteEntry &candidate, SimTime now, Millis maxAge);

    // Direct route to a neighbor, replacing whatever was known about it.
    // Returns true if the entry changed beyond its timestamp.
    bool installDirect(const std::string &neighbor, double cost, SimTime now);

    size_t removeVia(const std::string &nextHop);
    bool remove(const std::string &destination);

    // Routes via `nextHop` whose destination is not in `advertised`.
    size_t withdrawMissing(const std::string &nextHop, const std::set<std::string> &advertised);

    size_t removeStale(SimTime now, Millis maxAge);

    std::map<std::string, Advertised> advertisable(int kHops) const;
    std::vector<RouteEntry> entries() const;
    std::optional<RouteEntry> find(const std::string &destination) const;
    size_t size() const;

    void print(std::ostream &out) const;

private:
    mutable std::mutex mutex;
    std::map<std::string, RouteEntry> table;
};
