#pragma once
#include "utils.hpp"
#include <optional>
#include <string>

struct NeighborEvent
{
    enum class Type
    {
        Add,
        Update,
        Remove
    };

    Type type = Type::Add;
    std::string neighborId;
    SimTime startTime;
    SimTime endTime;
    std::optional<double> quality;
    std::optional<double> signalStrength;
    std::optional<double> bandwidth;

    static NeighborEvent add(const std::string &id, SimTime start, SimTime end,
                             std::optional<double> quality = std::nullopt)
    {
        NeighborEvent event;
        event.type = Type::Add;
        event.neighborId = id;
        event.startTime = start;
        event.endTime = end;
        event.quality = quality;
        return event;
    }

    static NeighborEvent update(const std::string &id, std::optional<double> quality,
                                std::optional<double> signal = std::nullopt,
                                std::optional<double> bandwidth = std::nullopt)
    {
        NeighborEvent event;
        event.type = Type::Update;
        event.neighborId = id;
        event.quality = quality;
        event.signalStrength = signal;
        event.bandwidth = bandwidth;
        return event;
    }

    static NeighborEvent remove(const std::string &id)
    {
        NeighborEvent event;
        event.type = Type::Remove;
        event.neighborId = id;
        return event;
    }
};

inline const char *toString(NeighborEvent::Type type)
{
    switch (type)
    {
    case NeighborEvent::Type::Add:
        return "ADD";
    case NeighborEvent::Type::Update:
        return "UPDATE";
    case NeighborEvent::Type::Remove:
        return "REMOVE";
    }
    return "UNKNOWN";
}
