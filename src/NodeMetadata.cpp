#include "NodeMetadata.hpp"
#include <functional>
#include <unordered_map>
#include <vector>

using json = nlohmann::json;

namespace
{
    enum class FieldKind
    {
        Number,
        Integer,
        Text
    };

    struct FieldSetter
    {
        FieldKind kind;
        std::function<void(SatelliteMetadata &, const json &)> apply;
    };

    FieldSetter numberField(double SatelliteMetadata::*member)
    {
        return {FieldKind::Number, [member](SatelliteMetadata &m, const json &v)
                { m.*member = v.get<double>(); }};
    }

    FieldSetter integerField(long long SatelliteMetadata::*member)
    {
        return {FieldKind::Integer, [member](SatelliteMetadata &m, const json &v)
                { m.*member = v.get<long long>(); }};
    }

    FieldSetter textField(std::string SatelliteMetadata::*member)
    {
        return {FieldKind::Text, [member](SatelliteMetadata &m, const json &v)
                { m.*member = v.get<std::string>(); }};
    }

    const std::unordered_map<std::string, FieldSetter> &metadataFields()
    {
        static const std::unordered_map<std::string, FieldSetter> fields = {
            {"computational_capacity", numberField(&SatelliteMetadata::computationalCapacity)},
            {"bandwidth_capacity", numberField(&SatelliteMetadata::bandwidthCapacity)},
            {"processing_power", numberField(&SatelliteMetadata::processingPower)},
            {"communication_range", numberField(&SatelliteMetadata::communicationRange)},
            {"packet_loss_rate", numberField(&SatelliteMetadata::packetLossRate)},
            {"transmission_delay", numberField(&SatelliteMetadata::transmissionDelay)},
            {"buffer_size", integerField(&SatelliteMetadata::bufferSize)},
            {"queue_capacity", integerField(&SatelliteMetadata::queueCapacity)},
            {"max_bandwidth_utilization", numberField(&SatelliteMetadata::maxBandwidthUtilization)},
            {"min_signal_strength", numberField(&SatelliteMetadata::minSignalStrength)},
            {"frequency_band", textField(&SatelliteMetadata::frequencyBand)},
            {"modulation_scheme", textField(&SatelliteMetadata::modulationScheme)},
            {"total_packets_sent", integerField(&SatelliteMetadata::totalPacketsSent)},
            {"total_packets_received", integerField(&SatelliteMetadata::totalPacketsReceived)},
            {"successful_transmission_rate", numberField(&SatelliteMetadata::successfulTransmissionRate)}};
        return fields;
    }

    bool matchesKind(FieldKind kind, const json &value)
    {
        switch (kind)
        {
        case FieldKind::Number:
            return value.is_number();
        case FieldKind::Integer:
            return value.is_number_integer();
        case FieldKind::Text:
            return value.is_string();
        }
        return false;
    }
}

SatelliteMetadata SatelliteMetadata::randomized(std::mt19937 &rng)
{
    auto uniform = [&rng](double lo, double hi)
    { return std::uniform_real_distribution<double>(lo, hi)(rng); };
    auto pick = [&rng](const std::vector<std::string> &choices)
    { return choices[std::uniform_int_distribution<size_t>(0, choices.size() - 1)(rng)]; };

    SatelliteMetadata m;
    m.computationalCapacity = uniform(1000, 2000);
    m.bandwidthCapacity = uniform(100, 1000);
    m.processingPower = uniform(1.0, 4.0);
    m.communicationRange = uniform(1000, 2000);
    m.packetLossRate = uniform(0, 0.1);
    m.transmissionDelay = uniform(10, 100);
    const long long buffers[] = {512, 1024, 2048};
    m.bufferSize = buffers[std::uniform_int_distribution<int>(0, 2)(rng)];
    m.queueCapacity = std::uniform_int_distribution<long long>(500, 2000)(rng);
    m.maxBandwidthUtilization = uniform(0.6, 0.9);
    m.minSignalStrength = uniform(-100, -80);
    m.frequencyBand = pick({"Ka", "Ku", "X"});
    m.modulationScheme = pick({"BPSK", "QPSK", "8PSK"});
    return m;
}

void to_json(json &j, const SatelliteMetadata &m)
{
    j = json{{"computational_capacity", m.computationalCapacity},
             {"bandwidth_capacity", m.bandwidthCapacity},
             {"processing_power", m.processingPower},
             {"communication_range", m.communicationRange},
             {"packet_loss_rate", m.packetLossRate},
             {"transmission_delay", m.transmissionDelay},
             {"buffer_size", m.bufferSize},
             {"queue_capacity", m.queueCapacity},
             {"max_bandwidth_utilization", m.maxBandwidthUtilization},
             {"min_signal_strength", m.minSignalStrength},
             {"frequency_band", m.frequencyBand},
             {"modulation_scheme", m.modulationScheme},
             {"total_packets_sent", m.totalPacketsSent},
             {"total_packets_received", m.totalPacketsReceived},
             {"successful_transmission_rate", m.successfulTransmissionRate},
             {"throughput", m.throughput()}};
}

void to_json(json &j, const Coordinates &c)
{
    j = json{{"latitude", c.latitude}, {"longitude", c.longitude}, {"altitude", c.altitude}};
}

NodeMetadata::NodeMetadata(const SatelliteMetadata &initial) : data(initial) {}

SatelliteMetadata NodeMetadata::get() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return data;
}

void NodeMetadata::update(const json &fields)
{
    if (!fields.is_object())
    {
        throw MetadataError("Metadata update must be an object");
    }

    const auto &known = metadataFields();
    for (const auto &[key, value] : fields.items())
    {
        auto it = known.find(key);
        if (it == known.end())
        {
            throw MetadataError("Invalid metadata parameter: " + key);
        }
        if (!matchesKind(it->second.kind, value))
        {
            throw MetadataError("Invalid value type for metadata parameter: " + key);
        }
    }

    std::lock_guard<std::mutex> lock(mutex);
    SatelliteMetadata updated = data;
    for (const auto &[key, value] : fields.items())
    {
        known.at(key).apply(updated, value);
    }
    data = updated;
}

void NodeMetadata::recordTransmission(long long sent, long long received)
{
    std::lock_guard<std::mutex> lock(mutex);
    data.totalPacketsSent += sent;
    data.totalPacketsReceived += received;
    if (data.totalPacketsSent > 0)
    {
        data.successfulTransmissionRate =
            static_cast<double>(data.totalPacketsReceived) / data.totalPacketsSent;
    }
}

Coordinates NodeMetadata::coordinates() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return position;
}

void NodeMetadata::setCoordinates(const json &update)
{
    static const char *required[] = {"latitude", "longitude", "altitude"};
    if (!update.is_object())
    {
        throw std::invalid_argument("Coordinates must be an object");
    }
    for (const char *key : required)
    {
        if (!update.contains(key) || !update[key].is_number())
        {
            throw std::invalid_argument(std::string("Coordinates must contain numeric ") + key);
        }
    }

    Coordinates next;
    next.latitude = update["latitude"].get<double>();
    next.longitude = update["longitude"].get<double>();
    next.altitude = update["altitude"].get<double>();

    std::lock_guard<std::mutex> lock(mutex);
    position = next;
}
