#pragma once
#include "MeshNetwork.hpp"
#include "utils.hpp"
#include <chrono>
#include <map>
#include <string>
#include <tuple>
#include <vector>

struct ProbeResult
{
    bool converged = false;
    int samples = 0;
    std::chrono::milliseconds elapsed{0};
};

// Read-only observer: samples every agent's routing table and reports
// convergence once the last `requiredStable` samples are identical.
class ConvergenceProbe
{
public:
    using RouteView = std::tuple<std::string, int, double>; // next hop, hops, cost
    using NetworkView = std::map<std::string, std::map<std::string, RouteView>>;

    ConvergenceProbe(const MeshNetwork &network, int requiredStable);

    // Takes one sample. Returns true if the network counts as converged.
    bool sample();

    // Polls every `interval` of real time until convergence or `timeout`.
    ProbeResult waitForConvergence(std::chrono::milliseconds interval, std::chrono::milliseconds timeout);

    int stableCount() const { return stable; }
    const NetworkView &lastView() const { return last; }

    static NetworkView capture(const MeshNetwork &network);

private:
    const MeshNetwork &network;
    int requiredStable;
    int stable = 0;
    bool hasSample = false;
    NetworkView last;
};
