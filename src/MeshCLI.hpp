#pragma once
#include "Clock.hpp"
#include "MeshNetwork.hpp"
#include "utils.hpp"
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

class MeshCLI
{
public:
    explicit MeshCLI(const MeshConfig &config);

    void run(std::istream &in = std::cin, std::ostream &out = std::cout);

    // Returns false once the session should end.
    bool handleCommand(const std::string &command, std::ostream &out);

    MeshNetwork &getNetwork() { return *network; }

private:
    void printHelp(std::ostream &out) const;
    void printStatus(std::ostream &out) const;
    void printNeighbors(const std::string &id, std::ostream &out) const;
    void printRoutes(const std::string &id, std::ostream &out) const;
    void printMetrics(std::ostream &out) const;
    void handleMetadata(std::istringstream &args, std::ostream &out);
    void buildTopology();

    MeshConfig config;
    SystemClock clock;
    std::unique_ptr<MeshNetwork> network;
};
