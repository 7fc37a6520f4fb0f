#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

class SatelliteAgent;

// Directory of the agents taking part in one simulation, used to resolve
// delivery targets.
class AgentRegistry
{
public:
    // Throws std::invalid_argument on a null agent or a duplicate id.
    void add(const std::shared_ptr<SatelliteAgent> &agent);
    bool remove(const std::string &id);
    std::shared_ptr<SatelliteAgent> find(const std::string &id) const;
    std::vector<std::string> ids() const;
    size_t size() const;

    // Sequence base for a newly created agent. Every base lies above any
    // sequence an earlier agent of this registry can reach, so a satellite
    // re-added under an old id is never mistaken for a replay.
    uint64_t issueSequenceBase();

private:
    static constexpr int SEQUENCE_BITS = 32;

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<SatelliteAgent>> agents;
    std::atomic<uint64_t> incarnations{0};
};
