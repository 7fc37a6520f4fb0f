#include "AgentRegistry.hpp"
#include "SatelliteAgent.hpp"
#include <algorithm>
#include <stdexcept>

void AgentRegistry::add(const std::shared_ptr<SatelliteAgent> &agent)
{
    if (!agent)
    {
        throw std::invalid_argument("Cannot register a null agent");
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (!agents.emplace(agent->id(), agent).second)
    {
        throw std::invalid_argument("Agent already registered: " + agent->id());
    }
}

bool AgentRegistry::remove(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex);
    return agents.erase(id) > 0;
}

std::shared_ptr<SatelliteAgent> AgentRegistry::find(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = agents.find(id);
    if (it == agents.end())
        return nullptr;
    return it->second;
}

std::vector<std::string> AgentRegistry::ids() const
{
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex);
        result.reserve(agents.size());
        for (const auto &[id, agent] : agents)
        {
            result.push_back(id);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t AgentRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return agents.size();
}

uint64_t AgentRegistry::issueSequenceBase()
{
    return (++incarnations) << SEQUENCE_BITS;
}
