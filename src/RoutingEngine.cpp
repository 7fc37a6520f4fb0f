#include "RoutingEngine.hpp"
#include <cmath>

bool SeenSet::insert(const std::string &sender, uint64_t sequence)
{
    std::lock_guard<std::mutex> lock(mutex);
    SenderHistory &h = history[sender];

    if (h.highest > WINDOW && sequence <= h.highest - WINDOW)
        return false;
    if (!h.sequences.insert(sequence).second)
        return false;

    if (sequence > h.highest)
    {
        h.highest = sequence;
        if (h.highest > WINDOW)
        {
            h.sequences.erase(h.sequences.begin(), h.sequences.upper_bound(h.highest - WINDOW));
        }
    }
    return true;
}

bool SeenSet::contains(const std::string &sender, uint64_t sequence) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = history.find(sender);
    if (it == history.end())
        return false;
    const SenderHistory &h = it->second;
    if (h.highest > WINDOW && sequence <= h.highest - WINDOW)
        return true;
    return h.sequences.count(sequence) > 0;
}

void SeenSet::forget(const std::string &sender)
{
    std::lock_guard<std::mutex> lock(mutex);
    history.erase(sender);
}

size_t SeenSet::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    size_t total = 0;
    for (const auto &[sender, h] : history)
    {
        total += h.sequences.size();
    }
    return total;
}

RoutingEngine::RoutingEngine(std::string selfId, int kHops, Millis maxRouteAge,
                             NeighborTable &neighbors, RoutingTable &routes, uint64_t firstSequence)
    : selfId(std::move(selfId)), kHops(kHops), maxRouteAge(maxRouteAge),
      neighbors(neighbors), routes(routes), sequence(firstSequence)
{
}

bool RoutingEngine::alreadySeen(const RoutingMessage &message) const
{
    return seen.contains(message.sender, message.sequence);
}

void RoutingEngine::forgetSender(const std::string &sender)
{
    seen.forget(sender);
}

AdvertisementResult RoutingEngine::processAdvertisement(const RoutingMessage &message, SimTime now)
{
    AdvertisementResult result;
    if (!seen.insert(message.sender, message.sequence))
    {
        result.duplicate = true;
        return result;
    }

    // Neighbor lock is released before the routing table is touched
    double senderCost = neighbors.linkCost(message.sender);
    if (message.sender == selfId || std::isinf(senderCost))
    {
        result.ignored = true;
        return result;
    }

    std::set<std::string> advertised;
    for (const auto &[dest, adv] : message.routes)
    {
        if (dest == selfId)
            continue;
        advertised.insert(dest);

        int newHop = adv.hopCount + 1;
        if (newHop > kHops)
        {
            ++result.rejected;
            continue;
        }

        RouteEntry candidate;
        candidate.destination = dest;
        candidate.nextHop = message.sender;
        candidate.hopCount = newHop;
        candidate.cost = adv.cost + senderCost;
        candidate.timestamp = now;

        switch (routes.offer(candidate, now, maxRouteAge))
        {
        case OfferResult::Installed:
            ++result.accepted;
            break;
        case OfferResult::Refreshed:
            ++result.refreshed;
            break;
        case OfferResult::Rejected:
            ++result.rejected;
            break;
        }
    }

    result.withdrawn = static_cast<int>(routes.withdrawMissing(message.sender, advertised));
    return result;
}

bool RoutingEngine::installDirectRoute(const std::string &neighbor, SimTime now)
{
    double cost = neighbors.linkCost(neighbor);
    if (std::isinf(cost))
        return false;
    return routes.installDirect(neighbor, cost, now);
}

size_t RoutingEngine::dropRoutesVia(const std::string &neighbor)
{
    return routes.removeVia(neighbor);
}

size_t RoutingEngine::cleanupStaleRoutes(SimTime now)
{
    return routes.removeStale(now, maxRouteAge);
}

RoutingMessage RoutingEngine::buildAdvertisement(SimTime now)
{
    RoutingMessage message;
    message.sender = selfId;
    message.sequence = ++sequence;
    message.timestamp = now;
    message.routes = routes.advertisable(kHops);
    return message;
}
