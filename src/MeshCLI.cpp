#include "MeshCLI.hpp"
#include "ConvergenceProbe.hpp"
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

using json = nlohmann::json;

namespace
{
    // "42" -> 42, "2.5" -> 2.5, "true" -> true, anything else stays text
    json parseScalar(const std::string &value)
    {
        if (value == "true" || value == "false")
            return value == "true";

        size_t pos = 0;
        try
        {
            long long integer = std::stoll(value, &pos);
            if (pos == value.size())
                return integer;
            double number = std::stod(value, &pos);
            if (pos == value.size())
                return number;
        }
        catch (const std::invalid_argument &)
        {
            return value;
        }
        catch (const std::out_of_range &)
        {
            return value;
        }
        return value;
    }
}

MeshCLI::MeshCLI(const MeshConfig &config) : config(config)
{
    setVerbose(config.verbose);
    network = std::make_unique<MeshNetwork>(AgentSettings::fromConfig(config), clock);
    buildTopology();
}

void MeshCLI::buildTopology()
{
    std::mt19937 rng(config.seed == 0 ? std::random_device{}() : config.seed);
    for (const auto &id : config.nodes)
    {
        network->addSatellite(id, SatelliteMetadata::randomized(rng));
    }

    SimTime start = clock.now();
    SimTime end = start + config.linkDuration;
    for (const auto &link : config.links)
    {
        for (const auto &endpoint : {link.a, link.b})
        {
            if (!network->getSatellite(endpoint))
                network->addSatellite(endpoint, SatelliteMetadata::randomized(rng));
        }
        network->connect(link.a, link.b, start, end, link.quality);
    }
}

void MeshCLI::run(std::istream &in, std::ostream &out)
{
    out << "Satellite Mesh Routing CLI" << std::endl;
    out << "Type 'help' for available commands" << std::endl;

    std::string line;
    while (true)
    {
        out << "satmesh> ";
        if (!std::getline(in, line))
        {
            break;
        }

        if (line.empty())
            continue;

        if (!handleCommand(line, out))
        {
            break;
        }
    }

    if (network->isRunning())
    {
        out << "Stopping agents..." << std::endl;
        network->stopAll();
    }
}

bool MeshCLI::handleCommand(const std::string &command, std::ostream &out)
{
    std::istringstream iss(command);
    std::string cmd;
    iss >> cmd;

    try
    {
        if (cmd == "quit" || cmd == "exit")
        {
            return false;
        }
        else if (cmd == "help")
        {
            printHelp(out);
        }
        else if (cmd == "start")
        {
            if (network->isRunning())
            {
                out << "Simulation is already running" << std::endl;
            }
            else
            {
                network->startAll();
                out << "Started " << network->size() << " agent(s)" << std::endl;
            }
        }
        else if (cmd == "stop")
        {
            if (network->isRunning())
            {
                network->stopAll();
                out << "Simulation stopped" << std::endl;
            }
            else
            {
                out << "Simulation is not running" << std::endl;
            }
        }
        else if (cmd == "status")
        {
            printStatus(out);
        }
        else if (cmd == "add")
        {
            std::string id;
            if (!(iss >> id))
            {
                out << "Usage: add <id>" << std::endl;
                return true;
            }
            network->addSatellite(id);
            out << "Satellite " << id << " added" << std::endl;
        }
        else if (cmd == "remove")
        {
            std::string id;
            if (!(iss >> id))
            {
                out << "Usage: remove <id>" << std::endl;
                return true;
            }
            out << (network->removeSatellite(id) ? "Satellite removed" : "Unknown satellite") << std::endl;
        }
        else if (cmd == "link")
        {
            std::string a, b;
            long long seconds = config.linkDuration.count();
            double quality = 1.0;
            if (!(iss >> a >> b))
            {
                out << "Usage: link <a> <b> [seconds] [quality]" << std::endl;
                return true;
            }
            long long secondsArg = 0;
            double qualityArg = 0.0;
            if (iss >> secondsArg)
            {
                seconds = secondsArg;
                if (iss >> qualityArg)
                    quality = qualityArg;
            }
            if (seconds <= 0 || quality < 0.0 || quality > 1.0)
            {
                out << "Duration must be positive and quality within [0,1]" << std::endl;
                return true;
            }
            SimTime now = clock.now();
            network->connect(a, b, now, now + std::chrono::seconds(seconds), quality);
            out << "Link " << a << " <-> " << b << " up for " << seconds << "s" << std::endl;
        }
        else if (cmd == "unlink")
        {
            std::string a, b;
            if (!(iss >> a >> b))
            {
                out << "Usage: unlink <a> <b>" << std::endl;
                return true;
            }
            network->disconnect(a, b);
            out << "Link " << a << " <-> " << b << " removed" << std::endl;
        }
        else if (cmd == "neighbors")
        {
            std::string id;
            if (!(iss >> id))
            {
                out << "Usage: neighbors <id>" << std::endl;
                return true;
            }
            printNeighbors(id, out);
        }
        else if (cmd == "routes" || cmd == "table")
        {
            std::string id;
            if (!(iss >> id))
            {
                out << "Usage: routes <id>" << std::endl;
                return true;
            }
            printRoutes(id, out);
        }
        else if (cmd == "metrics")
        {
            printMetrics(out);
        }
        else if (cmd == "snapshot")
        {
            std::string file;
            json snapshot = network->toJson();
            if (iss >> file)
            {
                std::ofstream output(file);
                if (!output)
                {
                    out << "Cannot write " << file << std::endl;
                    return true;
                }
                output << snapshot.dump(2) << std::endl;
                out << "Snapshot written to " << file << std::endl;
            }
            else
            {
                out << snapshot.dump(2) << std::endl;
            }
        }
        else if (cmd == "converge")
        {
            long long timeoutSeconds = 30;
            long long timeoutArg = 0;
            if (iss >> timeoutArg && timeoutArg > 0)
                timeoutSeconds = timeoutArg;
            if (!network->isRunning())
            {
                out << "Simulation must be running to probe convergence" << std::endl;
                return true;
            }
            ConvergenceProbe probe(*network, config.probeStableSamples);
            ProbeResult result = probe.waitForConvergence(config.probeInterval, std::chrono::seconds(timeoutSeconds));
            out << (result.converged ? "Converged" : "Timed out") << " after " << result.samples
                << " sample(s), " << std::fixed << std::setprecision(2) << result.elapsed.count() / 1000.0
                << " seconds" << std::endl;
        }
        else if (cmd == "metadata")
        {
            handleMetadata(iss, out);
        }
        else
        {
            out << "Unknown command: " << cmd << std::endl;
            out << "Type 'help' for available commands" << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        out << "Error: " << e.what() << std::endl;
    }
    return true;
}

void MeshCLI::handleMetadata(std::istringstream &args, std::ostream &out)
{
    std::string id;
    if (!(args >> id))
    {
        out << "Usage: metadata <id> [key=value ...]" << std::endl;
        return;
    }
    auto agent = network->getSatellite(id);
    if (!agent)
    {
        out << "Unknown satellite: " << id << std::endl;
        return;
    }

    json fields = json::object();
    std::string token;
    while (args >> token)
    {
        size_t eq = token.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            out << "Expected key=value, got: " << token << std::endl;
            return;
        }
        fields[token.substr(0, eq)] = parseScalar(token.substr(eq + 1));
    }

    if (!fields.empty())
    {
        agent->updateMetadata(fields);
        out << "Metadata of " << id << " updated" << std::endl;
    }
    out << json(agent->metadata()).dump(2) << std::endl;
}

void MeshCLI::printHelp(std::ostream &out) const
{
    out << "Available commands:" << std::endl;
    out << "  start                        - Start every agent loop" << std::endl;
    out << "  stop                         - Stop every agent loop" << std::endl;
    out << "  status                       - Show simulation status and configuration" << std::endl;
    out << "  add <id>                     - Add a satellite" << std::endl;
    out << "  remove <id>                  - Remove a satellite from the mesh" << std::endl;
    out << "  link <a> <b> [sec] [quality] - Open a link window between two satellites" << std::endl;
    out << "  unlink <a> <b>               - Remove the link between two satellites" << std::endl;
    out << "  neighbors <id>               - List the neighbors of a satellite" << std::endl;
    out << "  routes/table <id>            - Show the routing table of a satellite" << std::endl;
    out << "  metrics                      - Show per-agent counters" << std::endl;
    out << "  snapshot [file]              - Dump the network state as JSON" << std::endl;
    out << "  converge [timeout_s]         - Wait until routing tables stop changing" << std::endl;
    out << "  metadata <id> [key=value...] - Show or update satellite metadata" << std::endl;
    out << "  help                         - Show this help message" << std::endl;
    out << "  quit/exit                    - Exit the CLI" << std::endl;
}

void MeshCLI::printStatus(std::ostream &out) const
{
    const AgentSettings &settings = network->getSettings();
    out << "Simulation Status: " << (network->isRunning() ? "Running" : "Stopped") << std::endl;
    out << "Satellites: " << network->size() << std::endl;
    out << "k_hops: " << settings.kHops << std::endl;
    out << "Update interval: " << settings.updateInterval.count() << " ms" << std::endl;
    out << "Liveness interval: " << settings.livenessInterval.count() << " ms" << std::endl;
    out << "Max route age: " << settings.maxRouteAge.count() << " ms" << std::endl;
    out << "Cost model: " << config.costModel << std::endl;
    out << "Signed updates: " << (settings.authKey.empty() ? "No" : "Yes") << std::endl;
}

void MeshCLI::printNeighbors(const std::string &id, std::ostream &out) const
{
    auto agent = network->getSatellite(id);
    if (!agent)
    {
        out << "Unknown satellite: " << id << std::endl;
        return;
    }

    auto neighbors = agent->neighbors();
    out << "Neighbors of " << id << " (" << neighbors.size() << "):" << std::endl;
    for (const auto &neighbor : neighbors)
    {
        out << "  - " << neighbor.id << " quality=" << std::fixed << std::setprecision(2) << neighbor.quality
            << " until " << formatTime(neighbor.endTime)
            << (neighbor.active ? "" : " [inactive]") << std::endl;
    }
    if (neighbors.empty())
    {
        out << "  No neighbors" << std::endl;
    }
}

void MeshCLI::printRoutes(const std::string &id, std::ostream &out) const
{
    auto agent = network->getSatellite(id);
    if (!agent)
    {
        out << "Unknown satellite: " << id << std::endl;
        return;
    }

    auto routes = agent->routes();
    out << "\n=== Routing Table of " << id << " ===" << std::endl;
    if (routes.empty())
    {
        out << "No routes available" << std::endl;
        return;
    }
    out << std::left << std::setw(20) << "Destination"
        << std::setw(15) << "Next Hop"
        << std::setw(6) << "Hops"
        << std::setw(10) << "Cost" << std::endl;
    out << "----------------------------------------------------" << std::endl;
    for (const auto &route : routes)
    {
        out << std::left << std::setw(20) << route.destination
            << std::setw(15) << route.nextHop
            << std::setw(6) << route.hopCount
            << std::setw(10) << std::fixed << std::setprecision(3) << route.cost << std::endl;
    }
    out << "Total routes: " << routes.size() << std::endl;
}

void MeshCLI::printMetrics(std::ostream &out) const
{
    out << "\n=== Routing Metrics ===" << std::endl;
    out << std::left << std::setw(12) << "Satellite"
        << std::setw(11) << "Neighbors"
        << std::setw(8) << "Routes"
        << std::setw(11) << "Processed"
        << std::setw(9) << "Updates"
        << std::setw(8) << "Failed"
        << std::setw(6) << "Dups" << std::endl;
    for (const auto &snapshot : network->snapshots())
    {
        out << std::left << std::setw(12) << snapshot.id
            << std::setw(11) << snapshot.neighbors.size()
            << std::setw(8) << snapshot.routes.size()
            << std::setw(11) << snapshot.counters.messagesProcessed
            << std::setw(9) << snapshot.counters.updatesSent
            << std::setw(8) << snapshot.counters.failedDeliveries
            << std::setw(6) << snapshot.counters.duplicatesIgnored << std::endl;
    }
    out << "=======================" << std::endl;
}
