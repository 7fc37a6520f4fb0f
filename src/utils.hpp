#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <openssl/hmac.h>

using SimTime = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;

class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

struct LinkSpec
{
    std::string a;
    std::string b;
    double quality = 1.0;
};

struct MeshConfig
{
    int kHops = 3;
    Millis updateInterval{5000};
    Millis livenessInterval{5000};
    Millis maxRouteAge{15000};
    Millis jitterMin{100};
    Millis jitterMax{300};
    std::string costModel = "composite";
    std::string authKey = "satmesh-shared-advertisement-key";
    unsigned int seed = 0;
    Millis probeInterval{500};
    int probeStableSamples = 3;
    bool verbose = false;

    // [topology]
    std::vector<std::string> nodes;
    std::vector<LinkSpec> links;
    std::chrono::seconds linkDuration{3600};
};

MeshConfig parseMeshConfig(const std::string &configFile);
MeshConfig parseMeshConfigText(const std::string &text);
void validateMeshConfig(const MeshConfig &config);

std::vector<std::string> split(const std::string &str, char delimiter);
std::string trim(const std::string &str);

inline std::string computeHMAC(const std::string &data, const std::string &key)
{
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char *>(data.data()), data.size(), result, &len) == nullptr)
    {
        throw std::runtime_error("HMAC computation failed");
    }
    return std::string(reinterpret_cast<char *>(result), len);
}

inline std::string toHex(const std::string &input)
{
    std::ostringstream oss;
    for (unsigned char c : input)
    {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return oss.str();
}

inline long long toMillis(SimTime t)
{
    return std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
}

std::string formatTime(SimTime t);

// Logging. Agents log from their own threads, so whole lines are written
// under one lock.
enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

void setVerbose(bool verbose);
bool isVerbose();
void logLine(LogLevel level, const std::string &node, const std::string &message);

inline void logDebug(const std::string &node, const std::string &message)
{
    if (isVerbose())
        logLine(LogLevel::Debug, node, message);
}

inline void logInfo(const std::string &node, const std::string &message)
{
    logLine(LogLevel::Info, node, message);
}

inline void logWarn(const std::string &node, const std::string &message)
{
    logLine(LogLevel::Warn, node, message);
}

inline void logError(const std::string &node, const std::string &message)
{
    logLine(LogLevel::Error, node, message);
}
