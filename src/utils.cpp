#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <atomic>
#include <ctime>

namespace
{
    std::mutex logMutex;
    std::atomic<bool> verboseLogging{false};

    long long parseInteger(const std::string &key, const std::string &value)
    {
        try
        {
            size_t pos = 0;
            long long parsed = std::stoll(value, &pos);
            if (pos != value.size())
                throw std::invalid_argument(value);
            return parsed;
        }
        catch (const std::exception &)
        {
            throw ConfigError("Invalid integer for '" + key + "': " + value);
        }
    }

    double parseDouble(const std::string &key, const std::string &value)
    {
        try
        {
            size_t pos = 0;
            double parsed = std::stod(value, &pos);
            if (pos != value.size())
                throw std::invalid_argument(value);
            return parsed;
        }
        catch (const std::exception &)
        {
            throw ConfigError("Invalid number for '" + key + "': " + value);
        }
    }

    bool parseBool(const std::string &key, const std::string &value)
    {
        if (value == "true" || value == "1" || value == "yes" || value == "on")
            return true;
        if (value == "false" || value == "0" || value == "no" || value == "off")
            return false;
        throw ConfigError("Invalid boolean for '" + key + "': " + value);
    }

    // "A:B" or "A:B:quality"
    LinkSpec parseLink(const std::string &token)
    {
        auto parts = split(token, ':');
        if (parts.size() != 2 && parts.size() != 3)
        {
            throw ConfigError("Invalid link '" + token + "', expected A:B or A:B:quality");
        }

        LinkSpec link;
        link.a = trim(parts[0]);
        link.b = trim(parts[1]);
        if (parts.size() == 3)
        {
            link.quality = parseDouble("links", trim(parts[2]));
        }
        if (link.a.empty() || link.b.empty() || link.a == link.b)
        {
            throw ConfigError("Invalid link endpoints in '" + token + "'");
        }
        return link;
    }

    void applyMeshKey(MeshConfig &config, const std::string &key, const std::string &value,
                      bool &routeAgeGiven)
    {
        if (key == "k_hops")
            config.kHops = static_cast<int>(parseInteger(key, value));
        else if (key == "update_interval_ms")
            config.updateInterval = Millis(parseInteger(key, value));
        else if (key == "liveness_interval_ms")
            config.livenessInterval = Millis(parseInteger(key, value));
        else if (key == "max_route_age_ms")
        {
            config.maxRouteAge = Millis(parseInteger(key, value));
            routeAgeGiven = true;
        }
        else if (key == "jitter_min_ms")
            config.jitterMin = Millis(parseInteger(key, value));
        else if (key == "jitter_max_ms")
            config.jitterMax = Millis(parseInteger(key, value));
        else if (key == "cost_model")
            config.costModel = value;
        else if (key == "auth_key")
            config.authKey = value;
        else if (key == "seed")
            config.seed = static_cast<unsigned int>(parseInteger(key, value));
        else if (key == "probe_interval_ms")
            config.probeInterval = Millis(parseInteger(key, value));
        else if (key == "probe_stable_samples")
            config.probeStableSamples = static_cast<int>(parseInteger(key, value));
        else if (key == "verbose")
            config.verbose = parseBool(key, value);
        else
            throw ConfigError("Unknown key in [mesh]: " + key);
    }

    void applyTopologyKey(MeshConfig &config, const std::string &key, const std::string &value)
    {
        if (key == "nodes")
        {
            config.nodes.clear();
            for (const auto &node : split(value, ','))
            {
                std::string id = trim(node);
                if (!id.empty())
                    config.nodes.push_back(id);
            }
        }
        else if (key == "links")
        {
            config.links.clear();
            for (const auto &token : split(value, ','))
            {
                std::string link = trim(token);
                if (!link.empty())
                    config.links.push_back(parseLink(link));
            }
        }
        else if (key == "link_duration_s")
        {
            config.linkDuration = std::chrono::seconds(parseInteger(key, value));
        }
        else
        {
            throw ConfigError("Unknown key in [topology]: " + key);
        }
    }
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);
    while (std::getline(tokenStream, token, delimiter))
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string &str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

MeshConfig parseMeshConfigText(const std::string &text)
{
    MeshConfig config;
    std::istringstream input(text);
    std::string line;
    std::string currentSection;
    bool routeAgeGiven = false;
    int lineNumber = 0;

    while (std::getline(input, line))
    {
        ++lineNumber;
        line = trim(line);

        if (line.empty() || line[0] == '#' || (line.size() > 1 && line[0] == '/' && line[1] == '/'))
            continue;

        // Check for section header [name]
        if (line.front() == '[' && line.back() == ']')
        {
            currentSection = trim(line.substr(1, line.size() - 2));
            if (currentSection != "mesh" && currentSection != "topology")
            {
                throw ConfigError("Unknown section [" + currentSection + "]");
            }
            continue;
        }

        // Parse key=value pairs
        size_t equalsPos = line.find('=');
        if (equalsPos == std::string::npos)
        {
            throw ConfigError("Malformed line " + std::to_string(lineNumber) + ": " + line);
        }
        std::string key = trim(line.substr(0, equalsPos));
        std::string value = trim(line.substr(equalsPos + 1));

        if (currentSection == "mesh")
            applyMeshKey(config, key, value, routeAgeGiven);
        else if (currentSection == "topology")
            applyTopologyKey(config, key, value);
        else
            throw ConfigError("Key outside of any section: " + key);
    }

    if (!routeAgeGiven)
    {
        config.maxRouteAge = config.updateInterval * 3;
    }

    validateMeshConfig(config);
    return config;
}

MeshConfig parseMeshConfig(const std::string &configFile)
{
    std::ifstream file(configFile);
    if (!file)
    {
        throw ConfigError("Cannot open config file: " + configFile);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseMeshConfigText(buffer.str());
}

void validateMeshConfig(const MeshConfig &config)
{
    if (config.kHops < 1)
        throw ConfigError("k_hops must be at least 1");
    if (config.updateInterval.count() <= 0)
        throw ConfigError("update_interval_ms must be positive");
    if (config.livenessInterval.count() <= 0)
        throw ConfigError("liveness_interval_ms must be positive");
    if (config.maxRouteAge.count() <= 0)
        throw ConfigError("max_route_age_ms must be positive");
    if (config.jitterMin.count() < 0 || config.jitterMin > config.jitterMax)
        throw ConfigError("jitter_min_ms must be non-negative and not above jitter_max_ms");
    if (config.probeInterval.count() <= 0)
        throw ConfigError("probe_interval_ms must be positive");
    if (config.probeStableSamples < 2)
        throw ConfigError("probe_stable_samples must be at least 2");
    if (config.costModel != "composite" && config.costModel != "inverse_quality" && config.costModel != "unit")
        throw ConfigError("Unknown cost_model: " + config.costModel);
    if (config.linkDuration.count() <= 0)
        throw ConfigError("link_duration_s must be positive");
    for (const auto &link : config.links)
    {
        if (link.quality < 0.0 || link.quality > 1.0)
            throw ConfigError("Link quality out of [0,1] for " + link.a + "-" + link.b);
    }
}

std::string formatTime(SimTime t)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    long long ms = toMillis(t) % 1000;
    if (ms < 0)
        ms += 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

void setVerbose(bool verbose)
{
    verboseLogging.store(verbose);
}

bool isVerbose()
{
    return verboseLogging.load();
}

void logLine(LogLevel level, const std::string &node, const std::string &message)
{
    const char *tag = "INFO";
    switch (level)
    {
    case LogLevel::Debug:
        tag = "DEBUG";
        break;
    case LogLevel::Info:
        tag = "INFO";
        break;
    case LogLevel::Warn:
        tag = "WARN";
        break;
    case LogLevel::Error:
        tag = "ERROR";
        break;
    }

    std::lock_guard<std::mutex> lock(logMutex);
    std::ostream &out = (level == LogLevel::Warn || level == LogLevel::Error) ? std::cerr : std::cout;
    out << tag << " " << node << " - " << message << std::endl;
}
