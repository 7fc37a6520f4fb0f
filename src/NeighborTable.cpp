// NeighborTable.cpp
#include "NeighborTable.hpp"
#include <algorithm>
#include <limits>

NeighborTable::NeighborTable(std::shared_ptr<const LinkCostModel> costModel)
    : costModel(std::move(costModel))
{
}

bool NeighborTable::addNeighbor(const std::string &id, SimTime start, SimTime end, double quality, SimTime now)
{
    NeighborInfo info;
    info.id = id;
    info.quality = quality;
    info.startTime = start;
    info.endTime = end;
    // A link announced ahead of its window counts as alive from its start
    info.lastSeen = std::max(now, start);
    info.active = info.windowContains(now);
    info.pending = now < start;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.find(id);
    if (it != neighbors.end())
    {
        // Keep what the link layer reported so far
        info.signalStrength = it->second.signalStrength;
        info.bandwidthAvailable = it->second.bandwidthAvailable;
    }
    neighbors[id] = info;
    return info.active;
}

bool NeighborTable::updateNeighbor(const std::string &id, std::optional<double> quality,
                                   std::optional<double> signal, std::optional<double> bandwidth, SimTime now)
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.find(id);
    if (it == neighbors.end())
    {
        return false;
    }

    NeighborInfo &info = it->second;
    if (quality)
        info.quality = *quality;
    if (signal)
        info.signalStrength = *signal;
    if (bandwidth)
        info.bandwidthAvailable = *bandwidth;
    info.lastSeen = now;
    info.active = info.windowContains(now);
    info.pending = now < info.startTime;
    return true;
}

bool NeighborTable::removeNeighbor(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex);
    return neighbors.erase(id) > 0;
}

bool NeighborTable::touch(const std::string &id, SimTime now)
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.find(id);
    if (it == neighbors.end())
    {
        return false;
    }
    it->second.lastSeen = now;
    it->second.active = it->second.windowContains(now);
    it->second.pending = now < it->second.startTime;
    return it->second.active;
}

LivenessReport NeighborTable::checkLiveness(SimTime now, Millis silenceTimeout)
{
    LivenessReport report;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.begin();

    while (it != neighbors.end())
    {
        NeighborInfo &info = it->second;

        if (now > info.endTime)
        {
            report.expired.push_back(it->first);
            it = neighbors.erase(it);
            continue;
        }

        if (info.pending)
        {
            // Added ahead of its window. Opens however late this pass runs.
            if (now >= info.startTime)
            {
                info.pending = false;
                info.active = true;
                info.lastSeen = now;
                report.activated.push_back(it->first);
            }
        }
        else if (info.active && now - info.lastSeen > silenceTimeout)
        {
            info.active = false;
            report.deactivated.push_back(it->first);
        }
        ++it;
    }

    std::sort(report.expired.begin(), report.expired.end());
    std::sort(report.deactivated.begin(), report.deactivated.end());
    std::sort(report.activated.begin(), report.activated.end());
    return report;
}

std::optional<SimTime> NeighborTable::nextWindowEdge(SimTime now) const
{
    std::optional<SimTime> edge;
    auto consider = [&edge](SimTime t)
    {
        if (!edge || t < *edge)
            edge = t;
    };

    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[id, info] : neighbors)
    {
        // An overdue opening is due right away
        if (info.pending)
            consider(std::max(info.startTime, now + Millis(1)));
        // Expiry is strict: the link is still valid at endTime itself
        SimTime expiry = info.endTime + Millis(1);
        if (expiry > now)
            consider(expiry);
    }
    return edge;
}

double NeighborTable::linkCost(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.find(id);
    if (it == neighbors.end() || !it->second.active)
    {
        return std::numeric_limits<double>::infinity();
    }
    return costModel->cost(it->second);
}

bool NeighborTable::isActive(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.find(id);
    return it != neighbors.end() && it->second.active;
}

std::vector<std::string> NeighborTable::getActiveNeighbors() const
{
    std::vector<std::string> active;
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[id, info] : neighbors)
    {
        if (info.active)
        {
            active.push_back(id);
        }
    }
    std::sort(active.begin(), active.end());
    return active;
}

std::vector<NeighborInfo> NeighborTable::snapshot() const
{
    std::vector<NeighborInfo> result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        result.reserve(neighbors.size());
        for (const auto &[id, info] : neighbors)
        {
            result.push_back(info);
        }
    }
    std::sort(result.begin(), result.end(), [](const NeighborInfo &a, const NeighborInfo &b)
              { return a.id < b.id; });
    return result;
}

std::optional<NeighborInfo> NeighborTable::find(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.find(id);
    if (it == neighbors.end())
        return std::nullopt;
    return it->second;
}

std::optional<Millis> NeighborTable::linkDuration(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = neighbors.find(id);
    if (it == neighbors.end())
        return std::nullopt;
    return std::chrono::duration_cast<Millis>(it->second.endTime - it->second.startTime);
}

size_t NeighborTable::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return neighbors.size();
}
