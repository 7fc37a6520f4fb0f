#include "RoutingTable.hpp"
#include <iomanip>

void to_json(nlohmann::json &j, const RouteEntry &route)
{
    j = nlohmann::json{{"destination", route.destination},
                       {"next_hop", route.nextHop},
                       {"hop_count", route.hopCount},
                       {"cost", route.cost},
                       {"timestamp_ms", toMillis(route.timestamp)}};
}

OfferResult RoutingTable::offer(const RouteEntry &candidate, SimTime now, Millis maxAge)
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = table.find(candidate.destination);
    if (it == table.end())
    {
        table[candidate.destination] = candidate;
        return OfferResult::Installed;
    }

    RouteEntry &current = it->second;
    bool better = candidate.hopCount < current.hopCount ||
                  (candidate.hopCount == current.hopCount && candidate.cost < current.cost);
    bool stale = now - current.timestamp > maxAge;

    if (better || stale)
    {
        current = candidate;
        return OfferResult::Installed;
    }

    if (candidate.nextHop == current.nextHop && candidate.hopCount == current.hopCount &&
        candidate.cost == current.cost)
    {
        current.timestamp = candidate.timestamp;
        return OfferResult::Refreshed;
    }
    return OfferResult::Rejected;
}

bool RoutingTable::installDirect(const std::string &neighbor, double cost, SimTime now)
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = table.find(neighbor);
    bool changed = it == table.end() || it->second.nextHop != neighbor ||
                   it->second.hopCount != 1 || it->second.cost != cost;

    RouteEntry &entry = table[neighbor];
    entry.destination = neighbor;
    entry.nextHop = neighbor;
    entry.hopCount = 1;
    entry.cost = cost;
    entry.timestamp = now;
    return changed;
}

size_t RoutingTable::removeVia(const std::string &nextHop)
{
    std::lock_guard<std::mutex> lock(mutex);
    size_t removed = 0;
    for (auto it = table.begin(); it != table.end();)
    {
        if (it->second.nextHop == nextHop)
        {
            it = table.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

bool RoutingTable::remove(const std::string &destination)
{
    std::lock_guard<std::mutex> lock(mutex);
    return table.erase(destination) > 0;
}

size_t RoutingTable::withdrawMissing(const std::string &nextHop, const std::set<std::string> &advertised)
{
    std::lock_guard<std::mutex> lock(mutex);
    size_t removed = 0;
    for (auto it = table.begin(); it != table.end();)
    {
        // The direct route to the sender is never part of its own advertisement
        bool viaSender = it->second.nextHop == nextHop && it->first != nextHop;
        if (viaSender && !advertised.count(it->first))
        {
            it = table.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

size_t RoutingTable::removeStale(SimTime now, Millis maxAge)
{
    std::lock_guard<std::mutex> lock(mutex);
    size_t removed = 0;
    for (auto it = table.begin(); it != table.end();)
    {
        if (now - it->second.timestamp > maxAge)
        {
            it = table.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::map<std::string, Advertised> RoutingTable::advertisable(int kHops) const
{
    std::map<std::string, Advertised> result;
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[dest, route] : table)
    {
        if (route.hopCount < kHops)
        {
            result[dest] = Advertised{route.hopCount, route.cost};
        }
    }
    return result;
}

std::vector<RouteEntry> RoutingTable::entries() const
{
    std::vector<RouteEntry> result;
    std::lock_guard<std::mutex> lock(mutex);
    result.reserve(table.size());
    for (const auto &[dest, route] : table)
    {
        result.push_back(route);
    }
    return result;
}

std::optional<RouteEntry> RoutingTable::find(const std::string &destination) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = table.find(destination);
    if (it == table.end())
        return std::nullopt;
    return it->second;
}

size_t RoutingTable::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return table.size();
}

void RoutingTable::print(std::ostream &out) const
{
    auto routes = entries();
    out << std::left << std::setw(20) << "Destination"
        << std::setw(15) << "Next Hop"
        << std::setw(6) << "Hops"
        << std::setw(10) << "Cost" << std::endl;
    for (const auto &route : routes)
    {
        out << std::left << std::setw(20) << route.destination
            << std::setw(15) << route.nextHop
            << std::setw(6) << route.hopCount
            << std::setw(10) << std::fixed << std::setprecision(3) << route.cost << std::endl;
    }
}
