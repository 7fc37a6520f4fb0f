#include "MessageDispatcher.hpp"
#include "SatelliteAgent.hpp"
#include "utils.hpp"

MessageDispatcher::MessageDispatcher(std::string ownerId, AgentRegistry &registry)
    : ownerId(std::move(ownerId)), registry(registry)
{
}

bool MessageDispatcher::deliver(const std::string &target, const RoutingMessage &message)
{
    auto agent = registry.find(target);
    if (!agent)
    {
        ++failedDeliveries;
        logWarn(ownerId, "delivery to " + target + " failed: not registered, update #" +
                             std::to_string(message.sequence) + " dropped");
        return false;
    }

    agent->deliver(message);
    ++messagesSent;
    routesAdvertised += message.routes.size();
    return true;
}

size_t MessageDispatcher::broadcast(const std::vector<std::string> &targets, const RoutingMessage &message)
{
    size_t delivered = 0;
    for (const auto &target : targets)
    {
        if (deliver(target, message))
            ++delivered;
    }
    return delivered;
}

MessageDispatcher::TrafficStats MessageDispatcher::getTrafficStats() const
{
    TrafficStats stats;
    stats.messagesSent = messagesSent.load();
    stats.failedDeliveries = failedDeliveries.load();
    stats.routesAdvertised = routesAdvertised.load();
    return stats;
}
