#include "ConvergenceProbe.hpp"
#include <stdexcept>
#include <thread>

ConvergenceProbe::ConvergenceProbe(const MeshNetwork &network, int requiredStable)
    : network(network), requiredStable(requiredStable)
{
    if (requiredStable < 2)
    {
        throw std::invalid_argument("Convergence needs at least two identical samples");
    }
}

ConvergenceProbe::NetworkView ConvergenceProbe::capture(const MeshNetwork &network)
{
    NetworkView view;
    for (const auto &agent : network.getAllSatellites())
    {
        auto &table = view[agent->id()];
        for (const auto &route : agent->routes())
        {
            table[route.destination] = RouteView(route.nextHop, route.hopCount, route.cost);
        }
    }
    return view;
}

bool ConvergenceProbe::sample()
{
    NetworkView view = capture(network);
    if (hasSample && view == last)
    {
        ++stable;
    }
    else
    {
        stable = 1;
    }
    last = std::move(view);
    hasSample = true;
    return stable >= requiredStable;
}

ProbeResult ConvergenceProbe::waitForConvergence(std::chrono::milliseconds interval, std::chrono::milliseconds timeout)
{
    ProbeResult result;
    auto begin = std::chrono::steady_clock::now();

    while (true)
    {
        ++result.samples;
        if (sample())
        {
            result.converged = true;
            break;
        }

        auto elapsed = std::chrono::steady_clock::now() - begin;
        if (elapsed + interval > timeout)
            break;
        std::this_thread::sleep_for(interval);
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
    return result;
}
