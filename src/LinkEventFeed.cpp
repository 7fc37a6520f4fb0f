#include "LinkEventFeed.hpp"
#include <algorithm>
#include <set>
#include <sstream>

LinkEventFeed::LinkEventFeed(MeshNetwork &network, double linkQuality, bool bidirectional)
    : network(network), linkQuality(linkQuality), bidirectional(bidirectional)
{
}

std::string LinkEventFeed::nodeIdOf(const std::string &endpoint)
{
    std::istringstream iss(endpoint);
    std::string id;
    iss >> id;
    return id;
}

void LinkEventFeed::load(const std::vector<TopologyRecord> &records)
{
    for (const auto &record : records)
    {
        if (record.linkType != MESH_LINK_TYPE)
        {
            ++filtered;
            continue;
        }
        TopologyRecord normalized = record;
        normalized.source = nodeIdOf(record.source);
        normalized.destination = nodeIdOf(record.destination);
        if (normalized.source.empty() || normalized.destination.empty() ||
            normalized.source == normalized.destination || record.endTime < record.startTime)
        {
            logWarn("feed", "malformed topology record " + record.source + " -> " + record.destination + " skipped");
            ++filtered;
            continue;
        }
        pending.push_back(normalized);
    }

    std::stable_sort(pending.begin(), pending.end(), [](const TopologyRecord &a, const TopologyRecord &b)
                     { return a.startTime < b.startTime; });
}

std::vector<std::string> LinkEventFeed::satelliteIds() const
{
    std::set<std::string> ids;
    for (const auto &record : pending)
    {
        ids.insert(record.source);
        ids.insert(record.destination);
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

void LinkEventFeed::createSatellites()
{
    for (const auto &id : satelliteIds())
    {
        if (!network.getSatellite(id))
        {
            network.addSatellite(id);
        }
    }
}

size_t LinkEventFeed::pump(SimTime now)
{
    size_t dispatched = 0;
    auto it = pending.begin();
    while (it != pending.end() && it->startTime <= now)
    {
        if (now > it->endTime)
        {
            ++expired;
            ++it;
            continue;
        }

        auto source = network.getSatellite(it->source);
        auto destination = network.getSatellite(it->destination);
        if (source)
        {
            source->postEvent(NeighborEvent::add(it->destination, it->startTime, it->endTime, linkQuality));
        }
        if (bidirectional && destination)
        {
            destination->postEvent(NeighborEvent::add(it->source, it->startTime, it->endTime, linkQuality));
        }
        if (!source && !(bidirectional && destination))
        {
            logWarn("feed", "no agent for link " + it->source + " -> " + it->destination);
        }
        ++dispatched;
        ++it;
    }
    pending.erase(pending.begin(), it);
    return dispatched;
}
