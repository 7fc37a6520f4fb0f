#pragma once
#include "AgentRegistry.hpp"
#include "RoutingMessage.hpp"
#include <atomic>
#include <string>
#include <vector>

// Point-to-point delivery of advertisements into other agents' inbound
// queues. Unresolved targets are dropped and counted, never retried.
class MessageDispatcher
{
public:
    MessageDispatcher(std::string ownerId, AgentRegistry &registry);

    bool deliver(const std::string &target, const RoutingMessage &message);

    // Returns how many targets accepted the message.
    size_t broadcast(const std::vector<std::string> &targets, const RoutingMessage &message);

    struct TrafficStats
    {
        size_t messagesSent = 0;
        size_t failedDeliveries = 0;
        size_t routesAdvertised = 0;
    };

    TrafficStats getTrafficStats() const;

private:
    std::string ownerId;
    AgentRegistry &registry;
    std::atomic<size_t> messagesSent{0};
    std::atomic<size_t> failedDeliveries{0};
    std::atomic<size_t> routesAdvertised{0};
};
