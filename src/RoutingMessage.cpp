#include "RoutingMessage.hpp"

using json = nlohmann::json;

json toJson(const RoutingMessage &message)
{
    json routes = json::object();
    for (const auto &[dest, adv] : message.routes)
    {
        routes[dest] = {{"hop_count", adv.hopCount}, {"cost", adv.cost}};
    }

    return json{{"type", "DV_UPDATE"},
                {"sender", message.sender},
                {"sequence_number", message.sequence},
                {"timestamp_ms", toMillis(message.timestamp)},
                {"routes", routes}};
}

void signMessage(RoutingMessage &message, const std::string &key)
{
    if (key.empty())
    {
        message.hmac.clear();
        return;
    }
    message.hmac = toHex(computeHMAC(toJson(message).dump(), key));
}

bool verifyMessage(const RoutingMessage &message, const std::string &key)
{
    if (key.empty())
        return true;
    if (message.hmac.empty())
        return false;
    return message.hmac == toHex(computeHMAC(toJson(message).dump(), key));
}
