#pragma once
#include <nlohmann/json.hpp>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

class MetadataError : public std::runtime_error
{
public:
    explicit MetadataError(const std::string &what) : std::runtime_error(what) {}
};

struct SatelliteMetadata
{
    double computationalCapacity = 1000.0; // MIPS
    double bandwidthCapacity = 100.0;      // Mbps
    double processingPower = 1.0;          // GHz
    double communicationRange = 1000.0;    // km

    double packetLossRate = 0.0;     // 0-1
    double transmissionDelay = 0.0;  // ms
    long long bufferSize = 1024;     // KB
    long long queueCapacity = 1000;  // packets

    double maxBandwidthUtilization = 0.8;
    double minSignalStrength = -90.0; // dBm
    std::string frequencyBand = "Ka";
    std::string modulationScheme = "QPSK";

    long long totalPacketsSent = 0;
    long long totalPacketsReceived = 0;
    double successfulTransmissionRate = 1.0;

    double throughput() const { return bandwidthCapacity * maxBandwidthUtilization; }

    static SatelliteMetadata randomized(std::mt19937 &rng);
};

void to_json(nlohmann::json &j, const SatelliteMetadata &m);

struct Coordinates
{
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude = 0.0; // km
};

void to_json(nlohmann::json &j, const Coordinates &c);

// Lock-guarded metadata and position of one satellite.
class NodeMetadata
{
public:
    NodeMetadata() = default;
    explicit NodeMetadata(const SatelliteMetadata &initial);

    SatelliteMetadata get() const;

    // Applies every field of `fields` or none of them. Throws MetadataError on
    // an unknown field or a value of the wrong type.
    void update(const nlohmann::json &fields);

    void recordTransmission(long long sent, long long received);

    Coordinates coordinates() const;

    // Requires latitude, longitude and altitude; throws std::invalid_argument
    // and keeps the previous position otherwise.
    void setCoordinates(const nlohmann::json &position);

private:
    mutable std::mutex mutex;
    SatelliteMetadata data;
    Coordinates position;
};
