#include "MeshCLI.hpp"
#include "utils.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
    std::string configFile = "config/mesh.conf";
    if (argc > 1)
    {
        configFile = argv[1];
    }

    MeshConfig config;
    try
    {
        config = parseMeshConfig(configFile);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    try
    {
        MeshCLI cli(config);
        cli.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
